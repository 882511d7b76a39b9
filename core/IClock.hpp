#pragma once

#include "Types.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace worktrack {

class IClock {
public:
    virtual ~IClock() = default;
    
    virtual Timestamp now() const = 0;
    
    uint64_t epochSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            now().time_since_epoch()).count();
    }
    
    std::string iso8601() const;
};

class SystemClock : public IClock {
public:
    Timestamp now() const override {
        return std::chrono::system_clock::now();
    }
};

/// Formats as YYYY-MM-DDTHH:MM:SS.mmmZ (UTC)
std::string formatIso8601(Timestamp time);

/// Parses YYYY-MM-DDTHH:MM:SS[.fff][Z]; returns nullopt on malformed input
std::optional<Timestamp> parseIso8601(const std::string& text);

/// UTC calendar date of a time point, YYYY-MM-DD
std::string formatUtcDate(Timestamp time);

/// Midnight UTC of the day containing time
Timestamp startOfUtcDay(Timestamp time);

Timestamp fromEpochMillis(int64_t millis);
/// std::nullopt when millis is not finite or falls outside the Timestamp range
std::optional<Timestamp> tryFromEpochMillis(double millis);
int64_t toEpochMillis(Timestamp time);

} // namespace worktrack
