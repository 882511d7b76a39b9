#include "HoursCalculator.hpp"
#include "../IClock.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <map>

namespace worktrack::domain {

std::string workSourceToString(WorkSource source) {
    switch (source) {
        case WorkSource::Geofence: return "geofence";
        case WorkSource::Manual: return "manual";
        case WorkSource::Mixed: return "mixed";
    }
    return "geofence";
}

namespace {

struct DayAccumulator {
    std::chrono::milliseconds worked{0};
    std::size_t sessions = 0;
    bool sawAuto = false;
    bool sawManual = false;
};

} // namespace

std::vector<DailyTotal> HoursCalculator::dailyTotals(const std::vector<TrackingSession>& sessions,
                                                     Timestamp from, Timestamp to, Timestamp now) {
    using std::chrono::hours;

    std::map<Timestamp, DayAccumulator> days;

    for (const auto& session : sessions) {
        if (session.belowMinimum) {
            continue;
        }

        Timestamp start = std::max(session.clockIn, from);
        Timestamp end = std::min(session.clockOut.value_or(now), to);
        if (end <= start) {
            continue;
        }

        for (Timestamp day = startOfUtcDay(start); day < end; day += hours(24)) {
            Timestamp sliceStart = std::max(start, day);
            Timestamp sliceEnd = std::min(end, day + hours(24));
            if (sliceEnd <= sliceStart) {
                continue;
            }

            auto& acc = days[day];
            acc.worked += std::chrono::duration_cast<std::chrono::milliseconds>(sliceEnd - sliceStart);
            acc.sessions += 1;
            if (session.trackingMethod == TrackingMethod::Manual) {
                acc.sawManual = true;
            } else {
                acc.sawAuto = true;
            }
        }
    }

    std::vector<DailyTotal> totals;
    totals.reserve(days.size());
    for (const auto& [day, acc] : days) {
        DailyTotal total;
        total.date = formatUtcDate(day);
        total.minutes = static_cast<std::int64_t>(std::llround(acc.worked.count() / 60000.0));
        total.sessionCount = acc.sessions;
        if (acc.sawAuto && acc.sawManual) {
            total.source = WorkSource::Mixed;
        } else if (acc.sawManual) {
            total.source = WorkSource::Manual;
        } else {
            total.source = WorkSource::Geofence;
        }
        totals.push_back(total);
    }
    return totals;
}

std::int64_t HoursCalculator::totalMinutes(const std::vector<DailyTotal>& totals) {
    std::int64_t sum = 0;
    for (const auto& total : totals) {
        sum += total.minutes;
    }
    return sum;
}

} // namespace worktrack::domain
