/**
 * @file TomlConfig.hpp
 * @brief TOML configuration file parser for the desktop tracking daemon
 *
 * Supported Sections:
 * - [tracking]: debounce, confidence and verification tuning
 * - [store]: tracking store file and audit key
 * - [mqtt]: broker connection and topic layout
 * - [[sites]]: work sites seeded into the registry at startup
 *
 * Only the subset of TOML the daemon needs is understood: bare keys,
 * quoted strings, numbers, booleans, flat integer arrays and array-of-table
 * headers. Unknown keys are ignored; malformed values are reported and the
 * default is kept.
 */

#pragma once

#include "../../core/TrackingConfig.hpp"
#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace worktrack {

struct StoreSettings {
    std::string path;               ///< empty selects the in-memory store
    std::string auditKeyBase64;     ///< empty disables the audit chain
};

struct MqttSettings {
    std::string host;               ///< empty disables the broker connection
    std::uint16_t port = 1883;
    std::string clientId = "worktrackd";
    std::string username;
    std::string password;
    bool useTls = false;
    std::string certPath;
    std::string keyPath;
    std::string caPath;
    bool verifyServer = true;
    std::string topicPrefix = "worktrack";
    std::string deviceId = "device";
    int maxFixAgeSeconds = 60;

    bool enabled() const { return !host.empty(); }
};

struct SiteSettings {
    std::string id;
    std::string name;
    double latitude = 0.0;
    double longitude = 0.0;
    double radiusMeters = 0.0;      ///< 0 selects the configured default
    bool active = true;
};

struct AppConfig {
    TrackingConfig tracking;
    StoreSettings store;
    MqttSettings mqtt;
    std::vector<SiteSettings> sites;
};

/**
 * @brief TOML configuration file parser
 * @note Static methods only; no shared state
 */
class TomlConfig {
public:
    /**
     * @brief Load and parse TOML configuration file
     * @param filename Path to TOML configuration file
     * @return Parsed configuration, defaults if the file cannot be opened
     */
    static AppConfig loadFromFile(const std::string& filename) {
        std::ifstream file(filename);

        if (!file.is_open()) {
            std::cerr << "[Config] Could not open config file: " << filename
                      << ", using defaults" << std::endl;
            return AppConfig{};
        }

        return parse(file);
    }

    static AppConfig loadFromString(const std::string& text) {
        std::istringstream stream(text);
        return parse(stream);
    }

    static AppConfig parse(std::istream& input) {
        AppConfig config;
        std::string currentSection;
        std::string line;
        int lineNumber = 0;

        while (std::getline(input, line)) {
            ++lineNumber;
            stripComment(line);
            trim(line);

            if (line.empty()) {
                continue;
            }

            // Array-of-tables header starts a new entry
            if (line.rfind("[[", 0) == 0) {
                if (line.size() > 4 && line.compare(line.size() - 2, 2, "]]") == 0) {
                    currentSection = line.substr(2, line.length() - 4);
                    trim(currentSection);
                    if (currentSection == "sites") {
                        config.sites.emplace_back();
                    }
                }
                continue;
            }

            if (line[0] == '[') {
                if (line.back() == ']') {
                    currentSection = line.substr(1, line.length() - 2);
                    trim(currentSection);
                }
                continue;
            }

            size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                std::cerr << "[Config] Line " << lineNumber << ": expected key = value" << std::endl;
                continue;
            }

            std::string key = line.substr(0, equalPos);
            std::string value = line.substr(equalPos + 1);
            trim(key);
            trim(value);
            unquote(value);

            try {
                if (currentSection == "tracking") {
                    applyTracking(config.tracking, key, value);
                } else if (currentSection == "store") {
                    applyStore(config.store, key, value);
                } else if (currentSection == "mqtt") {
                    applyMqtt(config.mqtt, key, value);
                } else if (currentSection == "sites" && !config.sites.empty()) {
                    applySite(config.sites.back(), key, value);
                }
            } catch (const std::exception& e) {
                std::cerr << "[Config] Line " << lineNumber << ": invalid value for '" << key
                          << "' (" << e.what() << "), keeping default" << std::endl;
            }
        }

        std::string reason;
        if (!config.tracking.validate(reason)) {
            std::cerr << "[Config] Invalid [tracking] section: " << reason
                      << ", using tracking defaults" << std::endl;
            config.tracking = TrackingConfig{};
        }

        return config;
    }

    /**
     * @brief Parse a flat integer array such as "[1, 3, 5]"
     * @throws std::invalid_argument on malformed input
     */
    static std::vector<int> parseIntArray(const std::string& value) {
        if (value.size() < 2 || value.front() != '[' || value.back() != ']') {
            throw std::invalid_argument("expected [a, b, ...]");
        }

        std::vector<int> result;
        std::istringstream ss(value.substr(1, value.size() - 2));
        std::string item;
        while (std::getline(ss, item, ',')) {
            trim(item);
            if (item.empty()) {
                continue;
            }
            result.push_back(parseInt(item));
        }
        return result;
    }

private:
    static void applyTracking(TrackingConfig& tracking, const std::string& key, const std::string& value) {
        if (key == "cooldown_seconds") {
            tracking.cooldownSeconds = parseInt(value);
        } else if (key == "high_confidence_accuracy_meters") {
            tracking.highConfidenceAccuracyMeters = parseDouble(value);
        } else if (key == "verification_offsets_minutes") {
            tracking.verificationOffsetsMinutes = parseIntArray(value);
        } else if (key == "minimum_session_minutes") {
            tracking.minimumSessionMinutes = parseInt(value);
        } else if (key == "poor_accuracy_meters") {
            tracking.poorAccuracyMeters = parseDouble(value);
        } else if (key == "degradation_factor") {
            tracking.degradationFactor = parseDouble(value);
        } else if (key == "exit_margin_meters") {
            tracking.exitMarginMeters = parseDouble(value);
        } else if (key == "stale_grace_minutes") {
            tracking.staleGraceMinutes = parseInt(value);
        } else if (key == "min_radius_meters") {
            tracking.minRadiusMeters = parseDouble(value);
        } else if (key == "max_radius_meters") {
            tracking.maxRadiusMeters = parseDouble(value);
        } else if (key == "default_radius_meters") {
            tracking.defaultRadiusMeters = parseDouble(value);
        }
    }

    static void applyStore(StoreSettings& store, const std::string& key, const std::string& value) {
        if (key == "path") {
            store.path = value;
        } else if (key == "audit_key_base64") {
            store.auditKeyBase64 = value;
        }
    }

    static void applyMqtt(MqttSettings& mqtt, const std::string& key, const std::string& value) {
        if (key == "host") {
            mqtt.host = value;
        } else if (key == "port") {
            int port = parseInt(value);
            if (port <= 0 || port > 65535) {
                throw std::out_of_range("port out of range");
            }
            mqtt.port = static_cast<std::uint16_t>(port);
        } else if (key == "client_id") {
            mqtt.clientId = value;
        } else if (key == "username") {
            mqtt.username = value;
        } else if (key == "password") {
            mqtt.password = value;
        } else if (key == "use_tls") {
            mqtt.useTls = parseBool(value);
        } else if (key == "cert_path") {
            mqtt.certPath = value;
        } else if (key == "key_path") {
            mqtt.keyPath = value;
        } else if (key == "ca_path") {
            mqtt.caPath = value;
        } else if (key == "verify_server_cert") {
            mqtt.verifyServer = parseBool(value);
        } else if (key == "topic_prefix") {
            mqtt.topicPrefix = value;
        } else if (key == "device_id") {
            mqtt.deviceId = value;
        } else if (key == "max_fix_age_seconds") {
            mqtt.maxFixAgeSeconds = parseInt(value);
        }
    }

    static void applySite(SiteSettings& site, const std::string& key, const std::string& value) {
        if (key == "id") {
            site.id = value;
        } else if (key == "name") {
            site.name = value;
        } else if (key == "latitude") {
            site.latitude = parseDouble(value);
        } else if (key == "longitude") {
            site.longitude = parseDouble(value);
        } else if (key == "radius_meters") {
            site.radiusMeters = parseDouble(value);
        } else if (key == "active") {
            site.active = parseBool(value);
        }
    }

    static int parseInt(const std::string& value) {
        size_t consumed = 0;
        int result = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return result;
    }

    static double parseDouble(const std::string& value) {
        size_t consumed = 0;
        double result = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return result;
    }

    static bool parseBool(const std::string& value) {
        if (value == "true" || value == "1") return true;
        if (value == "false" || value == "0") return false;
        throw std::invalid_argument("expected true or false");
    }

    /**
     * @brief Remove a trailing comment that is not inside a quoted string
     */
    static void stripComment(std::string& line) {
        bool inQuotes = false;
        for (size_t i = 0; i < line.size(); ++i) {
            if (line[i] == '"') {
                inQuotes = !inQuotes;
            } else if (line[i] == '#' && !inQuotes) {
                line.erase(i);
                return;
            }
        }
    }

    /**
     * @brief Trim whitespace from both ends of string
     */
    static void trim(std::string& str) {
        str.erase(0, str.find_first_not_of(" \t\r"));
        str.erase(str.find_last_not_of(" \t\r") + 1);
    }

    /**
     * @brief Remove surrounding quotes from string value
     */
    static void unquote(std::string& value) {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
    }
};

} // namespace worktrack
