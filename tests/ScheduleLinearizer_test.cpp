#include <gtest/gtest.h>
#include "capturepush/generic_exception.hpp"
#include "capturepush/schedule_linearizer.hpp"

static std::shared_ptr<Snapshot> scheduleOf(nlohmann::json entries) {
    return Snapshot::FromJSON(RECORD_KIND_SCHEDULE, "10001-alice", entries, 1700000000);
}

static nlohmann::json entry(int weekday, int start, int end, std::string course, nlohmann::json weeks) {
    return {
        {"weekday", weekday},
        {"start_period", start},
        {"end_period", end},
        {"course_name", course},
        {"teacher", "Dr. Wang"},
        {"room", "A-101"},
        {"week_list", weeks},
    };
}

TEST(ScheduleLinearizerTest, ExpandsWeeksAndMergesConsecutivePeriods) {
    nlohmann::json entries = nlohmann::json::array();
    entries.push_back(entry(1, 1, 2, "Linear Algebra", "all"));
    entries.push_back(entry(1, 3, 4, "Linear Algebra", nlohmann::json::array({1})));
    entries.push_back(entry(3, 5, 6, "Operating Systems", nlohmann::json::array({2})));

    ScheduleLinearizer linearizer(2, "2025-09-01");
    nlohmann::json result = linearizer.linearize(*scheduleOf(entries), 1700000000);

    EXPECT_EQ(result["metadata"]["total_courses"], 3);
    EXPECT_EQ(result["metadata"]["weeks"], 2);
    EXPECT_EQ(result["metadata"]["format"], "linear-weeks");
    EXPECT_EQ(result["metadata"]["first_monday"], "2025-09-01");

    nlohmann::json week1 = result["data"]["week 1"];
    EXPECT_EQ(week1["week"], 1);
    ASSERT_EQ(week1["course_count"], 1);
    EXPECT_EQ(week1["courses"][0]["course_name"], "Linear Algebra");
    EXPECT_EQ(week1["courses"][0]["start_period"], 1);
    EXPECT_EQ(week1["courses"][0]["end_period"], 4);
    EXPECT_EQ(week1["courses"][0]["date"], "2025-09-01");

    nlohmann::json week2 = result["data"]["week 2"];
    ASSERT_EQ(week2["course_count"], 2);
    EXPECT_EQ(week2["courses"][0]["course_name"], "Linear Algebra");
    EXPECT_EQ(week2["courses"][0]["end_period"], 2);
    EXPECT_EQ(week2["courses"][1]["course_name"], "Operating Systems");
    EXPECT_EQ(week2["courses"][1]["date"], "2025-09-10");
}

TEST(ScheduleLinearizerTest, GapsBetweenPeriodsAreNotMerged) {
    nlohmann::json entries = nlohmann::json::array();
    entries.push_back(entry(2, 1, 2, "Physics", nlohmann::json::array({1})));
    entries.push_back(entry(2, 5, 6, "Physics", nlohmann::json::array({1})));

    ScheduleLinearizer linearizer(20);
    nlohmann::json week1 = linearizer.linearize(*scheduleOf(entries), 0)["data"]["week 1"];
    ASSERT_EQ(week1["course_count"], 2);
    EXPECT_EQ(week1["courses"][0]["end_period"], 2);
    EXPECT_EQ(week1["courses"][1]["start_period"], 5);
    EXPECT_EQ(week1["courses"][0].count("date"), 0u);
}

TEST(ScheduleLinearizerTest, EmptyScheduleHasNoWeeks) {
    ScheduleLinearizer linearizer(20);
    nlohmann::json result = linearizer.linearize(*scheduleOf(nlohmann::json::array()), 0);
    EXPECT_TRUE(result["data"].is_object());
    EXPECT_TRUE(result["data"].empty());
    EXPECT_EQ(result["metadata"]["total_courses"], 0);
    EXPECT_EQ(result["metadata"].count("first_monday"), 0u);
}

TEST(ScheduleLinearizerTest, DatesFollowTheFirstMonday) {
    ScheduleLinearizer linearizer(20, "2026-02-23");
    EXPECT_EQ(linearizer.dateFor(1, 1), "2026-02-23");
    EXPECT_EQ(linearizer.dateFor(1, 7), "2026-03-01");
    EXPECT_EQ(linearizer.dateFor(3, 2), "2026-03-10");
    EXPECT_EQ(ScheduleLinearizer(20).dateFor(1, 1), "");
}

TEST(ScheduleLinearizerTest, InvalidFirstMondayIsRejected) {
    EXPECT_THROW(ScheduleLinearizer(20, "2025-02-30"), GenericException);
    EXPECT_THROW(ScheduleLinearizer(20, "next monday"), GenericException);
}
