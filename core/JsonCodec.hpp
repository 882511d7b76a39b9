#pragma once

#include "Types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace worktrack {

class JsonCodec {
public:
    static nlohmann::json siteToJson(const Site& site);
    static Site jsonToSite(const nlohmann::json& json);
    
    static nlohmann::json sessionToJson(const TrackingSession& session);
    static TrackingSession jsonToSession(const nlohmann::json& json);
    
    static nlohmann::json eventToJson(const TransitionEvent& event);
    static TransitionEvent jsonToEvent(const nlohmann::json& json);
    
    /// Canonical text covered by the audit digest (every field except the digest)
    static std::string eventSigningPayload(const TransitionEvent& event);
    
    static nlohmann::json fixToJson(const PositionFix& fix);
    static nlohmann::json transitionToJson(const LocationTransition& transition);
    
    /**
     * @brief Validate a loosely typed transition payload
     *
     * Accepts "eventType" (or "type") as "enter"/"exit" in any case or the
     * platform codes 1/2, and "timestamp" as ISO 8601 text or epoch
     * milliseconds. Coordinates are kept only when both are present and in
     * range; a negative or non-numeric accuracy is treated as unknown.
     *
     * @throws InvalidTransition describing the first problem found
     */
    static LocationTransition parseTransition(const nlohmann::json& json);
    static LocationTransition parseTransition(const std::string& text);
    
    /// Lenient fix parser; nullopt when coordinates or accuracy are unusable
    static std::optional<PositionFix> parsePositionFix(const nlohmann::json& json);
    
    static nlohmann::json notificationToJson(const std::string& kind, const std::string& siteId,
                                             const std::string& summary, Timestamp at);
    
    static nlohmann::json timestampToJson(Timestamp time);
    static std::optional<Timestamp> jsonToTimestamp(const nlohmann::json& json);
    
private:
    static nlohmann::json optionalToJson(const std::optional<double>& value);
    static std::optional<double> jsonToOptional(const nlohmann::json& json, const char* key);
    static Timestamp requireTimestamp(const nlohmann::json& json, const char* key);
};

} // namespace worktrack
