#pragma once

#include "../Types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace worktrack::domain {

enum class WorkSource {
    Geofence,
    Manual,
    Mixed
};

std::string workSourceToString(WorkSource source);

struct DailyTotal {
    std::string date;               ///< UTC calendar day, YYYY-MM-DD
    std::int64_t minutes = 0;
    std::size_t sessionCount = 0;
    WorkSource source = WorkSource::Geofence;

    double hours() const { return static_cast<double>(minutes) / 60.0; }
};

/**
 * @brief Per-day worked minutes over a range
 *
 * Each session contributes the part of [clockIn, clockOut) that falls in
 * the day and in [from, to); open sessions count up to now. Sessions flagged
 * below the minimum duration are skipped. Days without work are omitted.
 */
class HoursCalculator {
public:
    static std::vector<DailyTotal> dailyTotals(const std::vector<TrackingSession>& sessions,
                                               Timestamp from, Timestamp to, Timestamp now);

    static std::int64_t totalMinutes(const std::vector<DailyTotal>& totals);
};

} // namespace worktrack::domain
