#include "JsonCodec.hpp"
#include "Errors.hpp"
#include "Geo.hpp"
#include "IClock.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace worktrack {

nlohmann::json JsonCodec::siteToJson(const Site& site) {
    nlohmann::json j;
    
    j["id"] = site.id;
    j["name"] = site.name;
    j["latitude"] = site.latitude;
    j["longitude"] = site.longitude;
    j["radiusMeters"] = site.radiusMeters;
    j["active"] = site.active;
    j["createdAt"] = timestampToJson(site.createdAt);
    j["updatedAt"] = timestampToJson(site.updatedAt);
    
    return j;
}

Site JsonCodec::jsonToSite(const nlohmann::json& json) {
    Site site;
    
    site.id = json.at("id").get<std::string>();
    site.name = json.value("name", site.id);
    site.latitude = json.at("latitude").get<double>();
    site.longitude = json.at("longitude").get<double>();
    site.radiusMeters = json.value("radiusMeters", 200.0);
    site.active = json.value("active", true);
    site.createdAt = jsonToTimestamp(json.value("createdAt", nlohmann::json())).value_or(Timestamp{});
    site.updatedAt = jsonToTimestamp(json.value("updatedAt", nlohmann::json())).value_or(site.createdAt);
    
    return site;
}

nlohmann::json JsonCodec::sessionToJson(const TrackingSession& session) {
    nlohmann::json j;
    
    j["id"] = session.id;
    j["siteId"] = session.siteId;
    j["clockIn"] = timestampToJson(session.clockIn);
    j["clockOut"] = session.clockOut ? timestampToJson(*session.clockOut) : nlohmann::json();
    j["trackingMethod"] = trackingMethodToString(session.trackingMethod);
    j["state"] = sessionStateToString(session.state);
    j["pendingExitAt"] = session.pendingExitAt ? timestampToJson(*session.pendingExitAt) : nlohmann::json();
    j["checkinAccuracy"] = optionalToJson(session.checkinAccuracy);
    j["exitAccuracy"] = optionalToJson(session.exitAccuracy);
    j["durationMinutes"] = session.durationMinutes ? nlohmann::json(*session.durationMinutes) : nlohmann::json();
    j["exitResolution"] = exitResolutionToString(session.exitResolution);
    j["belowMinimum"] = session.belowMinimum;
    j["createdAt"] = timestampToJson(session.createdAt);
    j["updatedAt"] = timestampToJson(session.updatedAt);
    
    return j;
}

TrackingSession JsonCodec::jsonToSession(const nlohmann::json& json) {
    TrackingSession session;
    
    session.id = json.at("id").get<std::string>();
    session.siteId = json.at("siteId").get<std::string>();
    session.clockIn = requireTimestamp(json, "clockIn");
    if (json.contains("clockOut")) {
        session.clockOut = jsonToTimestamp(json["clockOut"]);
    }
    
    auto method = stringToTrackingMethod(json.value("trackingMethod", "auto"));
    auto state = stringToSessionState(json.at("state").get<std::string>());
    auto resolution = stringToExitResolution(json.value("exitResolution", "none"));
    if (!method || !state || !resolution) {
        throw std::invalid_argument("session " + session.id + " has an unknown enum value");
    }
    session.trackingMethod = *method;
    session.state = *state;
    session.exitResolution = *resolution;
    
    if (json.contains("pendingExitAt")) {
        session.pendingExitAt = jsonToTimestamp(json["pendingExitAt"]);
    }
    session.checkinAccuracy = jsonToOptional(json, "checkinAccuracy");
    session.exitAccuracy = jsonToOptional(json, "exitAccuracy");
    if (json.contains("durationMinutes") && json["durationMinutes"].is_number()) {
        session.durationMinutes = json["durationMinutes"].get<std::int64_t>();
    }
    session.belowMinimum = json.value("belowMinimum", false);
    session.createdAt = jsonToTimestamp(json.value("createdAt", nlohmann::json())).value_or(session.clockIn);
    session.updatedAt = jsonToTimestamp(json.value("updatedAt", nlohmann::json())).value_or(session.createdAt);
    
    return session;
}

nlohmann::json JsonCodec::eventToJson(const TransitionEvent& event) {
    nlohmann::json j;
    
    j["id"] = event.id;
    j["siteId"] = event.siteId;
    j["eventType"] = transitionTypeToString(event.type);
    j["timestamp"] = timestampToJson(event.timestamp);
    j["latitude"] = optionalToJson(event.latitude);
    j["longitude"] = optionalToJson(event.longitude);
    j["accuracy"] = optionalToJson(event.accuracy);
    j["ignored"] = event.ignored;
    j["ignoreReason"] = ignoreReasonToString(event.ignoreReason);
    if (!event.digest.empty()) {
        j["digest"] = event.digest;
    }
    
    return j;
}

TransitionEvent JsonCodec::jsonToEvent(const nlohmann::json& json) {
    TransitionEvent event;
    
    event.id = json.at("id").get<std::string>();
    event.siteId = json.at("siteId").get<std::string>();
    auto type = stringToTransitionType(json.at("eventType").get<std::string>());
    auto reason = stringToIgnoreReason(json.value("ignoreReason", "none"));
    if (!type || !reason) {
        throw std::invalid_argument("event " + event.id + " has an unknown enum value");
    }
    event.type = *type;
    event.ignoreReason = *reason;
    event.timestamp = requireTimestamp(json, "timestamp");
    event.latitude = jsonToOptional(json, "latitude");
    event.longitude = jsonToOptional(json, "longitude");
    event.accuracy = jsonToOptional(json, "accuracy");
    event.ignored = json.value("ignored", false);
    event.digest = json.value("digest", "");
    
    return event;
}

std::string JsonCodec::eventSigningPayload(const TransitionEvent& event) {
    auto j = eventToJson(event);
    j.erase("digest");
    return j.dump();
}

nlohmann::json JsonCodec::fixToJson(const PositionFix& fix) {
    nlohmann::json j;
    j["latitude"] = fix.latitude;
    j["longitude"] = fix.longitude;
    j["accuracy"] = fix.accuracy;
    j["timestamp"] = timestampToJson(fix.timestamp);
    return j;
}

nlohmann::json JsonCodec::transitionToJson(const LocationTransition& transition) {
    nlohmann::json j;
    j["siteId"] = transition.siteId;
    j["eventType"] = transitionTypeToString(transition.type);
    j["timestamp"] = timestampToJson(transition.timestamp);
    if (transition.position) {
        j["latitude"] = transition.position->latitude;
        j["longitude"] = transition.position->longitude;
    }
    if (transition.accuracy) {
        j["accuracy"] = *transition.accuracy;
    }
    return j;
}

LocationTransition JsonCodec::parseTransition(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw InvalidTransition("payload is not an object");
    }
    
    LocationTransition transition;
    
    auto siteIt = json.find("siteId");
    if (siteIt == json.end() || !siteIt->is_string() || siteIt->get<std::string>().empty()) {
        throw InvalidTransition("missing siteId");
    }
    transition.siteId = siteIt->get<std::string>();
    
    auto typeIt = json.find("eventType");
    if (typeIt == json.end()) {
        typeIt = json.find("type");
    }
    if (typeIt == json.end()) {
        throw InvalidTransition("missing eventType");
    }
    if (typeIt->is_string()) {
        std::string type = typeIt->get<std::string>();
        std::transform(type.begin(), type.end(), type.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        auto parsed = stringToTransitionType(type);
        if (!parsed) {
            throw InvalidTransition("unknown eventType '" + typeIt->get<std::string>() + "'");
        }
        transition.type = *parsed;
    } else if (typeIt->is_number_integer()) {
        int code = typeIt->get<int>();
        if (code == 1) {
            transition.type = TransitionType::Enter;
        } else if (code == 2) {
            transition.type = TransitionType::Exit;
        } else {
            throw InvalidTransition("unknown eventType code " + std::to_string(code));
        }
    } else {
        throw InvalidTransition("eventType must be a string or integer code");
    }
    
    auto tsIt = json.find("timestamp");
    if (tsIt == json.end()) {
        throw InvalidTransition("missing timestamp");
    }
    auto timestamp = jsonToTimestamp(*tsIt);
    if (!timestamp) {
        throw InvalidTransition("unparseable timestamp " + tsIt->dump());
    }
    transition.timestamp = *timestamp;
    
    auto latitude = jsonToOptional(json, "latitude");
    auto longitude = jsonToOptional(json, "longitude");
    if (latitude && longitude && Geo::isValidLatitude(*latitude) && Geo::isValidLongitude(*longitude)) {
        transition.position = Coordinates{*latitude, *longitude};
    }
    
    auto accuracy = jsonToOptional(json, "accuracy");
    if (accuracy && std::isfinite(*accuracy) && *accuracy >= 0.0) {
        transition.accuracy = accuracy;
    }
    
    return transition;
}

LocationTransition JsonCodec::parseTransition(const std::string& text) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidTransition(std::string("malformed JSON: ") + e.what());
    }
    return parseTransition(json);
}

std::optional<PositionFix> JsonCodec::parsePositionFix(const nlohmann::json& json) {
    if (!json.is_object()) {
        return std::nullopt;
    }
    
    auto latitude = jsonToOptional(json, "latitude");
    auto longitude = jsonToOptional(json, "longitude");
    auto accuracy = jsonToOptional(json, "accuracy");
    if (!latitude || !longitude || !accuracy ||
        !Geo::isValidLatitude(*latitude) || !Geo::isValidLongitude(*longitude) ||
        !std::isfinite(*accuracy) || *accuracy < 0.0) {
        return std::nullopt;
    }
    
    auto timestamp = jsonToTimestamp(json.value("timestamp", nlohmann::json()));
    if (!timestamp) {
        return std::nullopt;
    }
    
    PositionFix fix;
    fix.latitude = *latitude;
    fix.longitude = *longitude;
    fix.accuracy = *accuracy;
    fix.timestamp = *timestamp;
    return fix;
}

nlohmann::json JsonCodec::notificationToJson(const std::string& kind, const std::string& siteId,
                                             const std::string& summary, Timestamp at) {
    nlohmann::json j;
    j["kind"] = kind;
    j["siteId"] = siteId;
    j["summary"] = summary;
    j["ts"] = timestampToJson(at);
    return j;
}

nlohmann::json JsonCodec::timestampToJson(Timestamp time) {
    return formatIso8601(time);
}

std::optional<Timestamp> JsonCodec::jsonToTimestamp(const nlohmann::json& json) {
    if (json.is_string()) {
        return parseIso8601(json.get<std::string>());
    }
    if (json.is_number_unsigned()) {
        return tryFromEpochMillis(static_cast<double>(json.get<std::uint64_t>()));
    }
    if (json.is_number()) {
        return tryFromEpochMillis(json.get<double>());
    }
    return std::nullopt;
}

nlohmann::json JsonCodec::optionalToJson(const std::optional<double>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json();
}

std::optional<double> JsonCodec::jsonToOptional(const nlohmann::json& json, const char* key) {
    auto it = json.find(key);
    if (it == json.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<double>();
}

Timestamp JsonCodec::requireTimestamp(const nlohmann::json& json, const char* key) {
    auto timestamp = jsonToTimestamp(json.at(key));
    if (!timestamp) {
        throw std::invalid_argument(std::string("field '") + key + "' is not a timestamp");
    }
    return *timestamp;
}

} // namespace worktrack
