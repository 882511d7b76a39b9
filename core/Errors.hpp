#pragma once

#include <stdexcept>
#include <string>

namespace worktrack {

/// Manual clock-in/out that contradicts the current session state
class ManualCommandConflict : public std::runtime_error {
public:
    explicit ManualCommandConflict(const std::string& reason)
        : std::runtime_error("Manual command rejected: " + reason) {}
};

/// Tracking store could not durably apply a write; prior state is intact
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& what)
        : std::runtime_error("Persistence failure: " + what) {}
};

/// Site definition outside the accepted bounds
class InvalidSiteError : public std::invalid_argument {
public:
    explicit InvalidSiteError(const std::string& what)
        : std::invalid_argument("Invalid site: " + what) {}
};

/// Transition payload that failed boundary validation
class InvalidTransition : public std::invalid_argument {
public:
    explicit InvalidTransition(const std::string& what)
        : std::invalid_argument("Invalid transition: " + what) {}
};

} // namespace worktrack
