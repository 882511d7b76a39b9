#include <gtest/gtest.h>
#include "../core/IClock.hpp"
#include "../core/domain/HoursCalculator.hpp"

using namespace worktrack;
using namespace worktrack::domain;

namespace {

Timestamp at(const std::string& iso) {
    return *parseIso8601(iso);
}

TrackingSession completed(const std::string& in, const std::string& out,
                          TrackingMethod method = TrackingMethod::Auto) {
    TrackingSession session;
    session.id = in;
    session.siteId = "office";
    session.clockIn = at(in);
    session.clockOut = at(out);
    session.state = SessionState::Completed;
    session.trackingMethod = method;
    return session;
}

} // namespace

TEST(HoursCalculatorTest, SumsSessionsPerDay) {
    std::vector<TrackingSession> sessions = {
        completed("2025-05-05T08:00:00Z", "2025-05-05T12:00:00Z"),
        completed("2025-05-05T13:00:00Z", "2025-05-05T17:30:00Z"),
        completed("2025-05-06T09:00:00Z", "2025-05-06T10:15:00Z"),
    };

    auto totals = HoursCalculator::dailyTotals(sessions, at("2025-05-05T00:00:00Z"),
                                               at("2025-05-08T00:00:00Z"), at("2025-05-08T00:00:00Z"));

    ASSERT_EQ(totals.size(), 2u);
    EXPECT_EQ(totals[0].date, "2025-05-05");
    EXPECT_EQ(totals[0].minutes, 510);
    EXPECT_EQ(totals[0].sessionCount, 2u);
    EXPECT_DOUBLE_EQ(totals[0].hours(), 8.5);
    EXPECT_EQ(totals[1].date, "2025-05-06");
    EXPECT_EQ(totals[1].minutes, 75);
    EXPECT_EQ(HoursCalculator::totalMinutes(totals), 585);
}

TEST(HoursCalculatorTest, SplitsOvernightSessionAtMidnight) {
    std::vector<TrackingSession> sessions = {
        completed("2025-05-05T22:00:00Z", "2025-05-06T06:00:00Z"),
    };

    auto totals = HoursCalculator::dailyTotals(sessions, at("2025-05-05T00:00:00Z"),
                                               at("2025-05-07T00:00:00Z"), at("2025-05-07T00:00:00Z"));

    ASSERT_EQ(totals.size(), 2u);
    EXPECT_EQ(totals[0].minutes, 120);
    EXPECT_EQ(totals[1].minutes, 360);
}

TEST(HoursCalculatorTest, ClipsToRange) {
    std::vector<TrackingSession> sessions = {
        completed("2025-05-05T08:00:00Z", "2025-05-05T16:00:00Z"),
    };

    auto totals = HoursCalculator::dailyTotals(sessions, at("2025-05-05T12:00:00Z"),
                                               at("2025-05-05T14:00:00Z"), at("2025-05-06T00:00:00Z"));

    ASSERT_EQ(totals.size(), 1u);
    EXPECT_EQ(totals[0].minutes, 120);
}

TEST(HoursCalculatorTest, OpenSessionCountsUntilNow) {
    TrackingSession open;
    open.id = "open";
    open.siteId = "office";
    open.clockIn = at("2025-05-05T08:00:00Z");

    auto totals = HoursCalculator::dailyTotals({open}, at("2025-05-05T00:00:00Z"),
                                               at("2025-05-06T00:00:00Z"), at("2025-05-05T09:45:00Z"));

    ASSERT_EQ(totals.size(), 1u);
    EXPECT_EQ(totals[0].minutes, 105);
}

TEST(HoursCalculatorTest, SkipsShortSessions) {
    auto shortSession = completed("2025-05-05T08:00:00Z", "2025-05-05T08:03:00Z");
    shortSession.belowMinimum = true;

    auto totals = HoursCalculator::dailyTotals({shortSession}, at("2025-05-05T00:00:00Z"),
                                               at("2025-05-06T00:00:00Z"), at("2025-05-06T00:00:00Z"));

    EXPECT_TRUE(totals.empty());
}

TEST(HoursCalculatorTest, ReportsWorkSource) {
    std::vector<TrackingSession> sessions = {
        completed("2025-05-05T08:00:00Z", "2025-05-05T12:00:00Z"),
        completed("2025-05-05T13:00:00Z", "2025-05-05T14:00:00Z", TrackingMethod::Manual),
        completed("2025-05-06T08:00:00Z", "2025-05-06T12:00:00Z", TrackingMethod::Manual),
        completed("2025-05-07T08:00:00Z", "2025-05-07T12:00:00Z"),
    };

    auto totals = HoursCalculator::dailyTotals(sessions, at("2025-05-05T00:00:00Z"),
                                               at("2025-05-08T00:00:00Z"), at("2025-05-08T00:00:00Z"));

    ASSERT_EQ(totals.size(), 3u);
    EXPECT_EQ(totals[0].source, WorkSource::Mixed);
    EXPECT_EQ(totals[1].source, WorkSource::Manual);
    EXPECT_EQ(totals[2].source, WorkSource::Geofence);
    EXPECT_EQ(workSourceToString(totals[0].source), "mixed");
}

TEST(ClockTest, FormatsAndParsesIso8601) {
    auto time = at("2025-05-05T08:09:10.250Z");
    EXPECT_EQ(formatIso8601(time), "2025-05-05T08:09:10.250Z");
    EXPECT_EQ(formatUtcDate(time), "2025-05-05");
    EXPECT_EQ(startOfUtcDay(time), at("2025-05-05T00:00:00Z"));
    EXPECT_EQ(toEpochMillis(fromEpochMillis(1746432550250)), 1746432550250);

    EXPECT_FALSE(parseIso8601("2025-13-01T00:00:00Z"));
    EXPECT_FALSE(parseIso8601("yesterday"));
    EXPECT_FALSE(parseIso8601("2025-05-05T08:09:10Zjunk"));
}
