#include <gtest/gtest.h>
#include "capturepush/change_detector.hpp"
#include "capturepush/generic_exception.hpp"
#include "capturepush/message_renderer.hpp"
#include "capturepush/models/grade_record.hpp"
#include "capturepush/models/schedule_entry.hpp"
#include "MockCapture.hpp"

static std::shared_ptr<Snapshot> grades(std::vector<nlohmann::json> items) {
    return Snapshot::FromJSON(RECORD_KIND_GRADES, "10001-alice", nlohmann::json(items), 1000);
}

static std::shared_ptr<Snapshot> schedule(std::vector<nlohmann::json> items) {
    return Snapshot::FromJSON(RECORD_KIND_SCHEDULE, "10001-alice", nlohmann::json(items), 1000);
}

TEST(ChangeDetectorTest, FirstObservationYieldsNoEvents) {
    auto current = grades({MakeGrade("Calculus", "90"), MakeGrade("Physics", "85")});
    EXPECT_TRUE(ChangeDetector::diff(nullptr, current).empty());
}

TEST(ChangeDetectorTest, IdenticalSnapshotsYieldNoEvents) {
    auto a = grades({MakeGrade("Calculus", "90"), MakeGrade("Physics", "85")});
    auto b = grades({MakeGrade("Physics", "85"), MakeGrade("Calculus", "90")});
    EXPECT_TRUE(ChangeDetector::diff(a, b).empty());
    EXPECT_TRUE(ChangeDetector::diff(a, a).empty());
}

TEST(ChangeDetectorTest, WhitespaceAndNumberFormattingAreNotChanges) {
    auto a = grades({MakeGrade("Calculus", "90")});
    nlohmann::json reformatted = {
        {"term", " 2025-2026-1 "},
        {"course_name", "Calculus\t"},
        {"score", "90"},
        {"credit", 3},
    };
    auto b = grades({reformatted});
    EXPECT_TRUE(ChangeDetector::diff(a, b).empty());
}

TEST(ChangeDetectorTest, ScoreChangeIsOneModifiedEvent) {
    auto a = grades({MakeGrade("Calculus", "90"), MakeGrade("Physics", "85")});
    auto b = grades({MakeGrade("Calculus", "95"), MakeGrade("Physics", "85")});

    auto changes = ChangeDetector::diff(a, b);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].kind, ChangeKind::Modified);
    EXPECT_EQ(changes[0].before->textValue("score"), "90");
    EXPECT_EQ(changes[0].after->textValue("score"), "95");

    auto fields = changes[0].fieldChanges();
    ASSERT_EQ(fields.size(), 1u);
    EXPECT_EQ(fields[0].field, "score");
    EXPECT_EQ(fields[0].before, "90");
    EXPECT_EQ(fields[0].after, "95");
}

TEST(ChangeDetectorTest, EventsAreOrderedAddedRemovedModified) {
    auto a = grades({MakeGrade("Calculus", "90"), MakeGrade("History", "70"), MakeGrade("Physics", "85")});
    auto b = grades({MakeGrade("Physics", "86"), MakeGrade("Art", "99"), MakeGrade("Calculus", "90"), MakeGrade("Biology", "80")});

    auto changes = ChangeDetector::diff(a, b);
    ASSERT_EQ(changes.size(), 4u);
    EXPECT_EQ(changes[0].kind, ChangeKind::Added);
    EXPECT_EQ(changes[0].after->textValue("course_name"), "Art");
    EXPECT_EQ(changes[1].kind, ChangeKind::Added);
    EXPECT_EQ(changes[1].after->textValue("course_name"), "Biology");
    EXPECT_EQ(changes[2].kind, ChangeKind::Removed);
    EXPECT_EQ(changes[2].before->textValue("course_name"), "History");
    EXPECT_EQ(changes[3].kind, ChangeKind::Modified);
    EXPECT_EQ(changes[3].after->textValue("course_name"), "Physics");

    // the same inputs always produce the same sequence
    auto again = ChangeDetector::diff(a, b);
    ASSERT_EQ(again.size(), changes.size());
    for (size_t i = 0; i < changes.size(); i++) {
        EXPECT_EQ(again[i].identity, changes[i].identity);
        EXPECT_EQ(again[i].kind, changes[i].kind);
    }
}

TEST(ChangeDetectorTest, ApplyingChangesReproducesCurrent) {
    auto a = grades({MakeGrade("Calculus", "90"), MakeGrade("History", "70"), MakeGrade("Physics", "85")});
    auto b = grades({MakeGrade("Physics", "86"), MakeGrade("Art", "99"), MakeGrade("Calculus", "90")});

    auto applied = ChangeDetector::apply(a, ChangeDetector::diff(a, b));
    EXPECT_EQ(applied->size(), b->size());
    EXPECT_TRUE(ChangeDetector::diff(applied, b).empty());
}

TEST(ChangeDetectorTest, EmptyCurrentRemovesEverything) {
    auto a = grades({MakeGrade("Calculus", "90"), MakeGrade("Physics", "85")});
    auto b = grades({});
    auto changes = ChangeDetector::diff(a, b);
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0].kind, ChangeKind::Removed);
    EXPECT_EQ(changes[1].kind, ChangeKind::Removed);
}

TEST(ChangeDetectorTest, DuplicateIdentitiesKeepFirstOccurrence) {
    auto snapshot = grades({MakeGrade("Calculus", "90"), MakeGrade("Calculus", "40")});
    EXPECT_EQ(snapshot->size(), 1u);
    EXPECT_EQ(snapshot->duplicatesDropped(), 1);
    EXPECT_EQ(snapshot->records()[0]->textValue("score"), "90");
}

TEST(ChangeDetectorTest, SameCourseInDifferentTermsIsDistinct) {
    auto snapshot = grades({MakeGrade("Calculus", "90", "2024-2025-2"), MakeGrade("Calculus", "95", "2025-2026-1")});
    EXPECT_EQ(snapshot->size(), 2u);
}

TEST(ChangeDetectorTest, MismatchedKindsThrow) {
    auto a = grades({MakeGrade("Calculus", "90")});
    nlohmann::json entry = {{"weekday", 1}, {"start_period", 1}, {"course_name", "Calculus"}};
    auto b = schedule({entry});
    EXPECT_THROW(ChangeDetector::diff(a, b), GenericException);
}

TEST(ChangeDetectorTest, InvalidRecordsAreRejected) {
    nlohmann::json noCourse = {{"score", "90"}};
    nlohmann::json badWeekday = {{"weekday", 9}, {"start_period", 1}, {"course_name", "Calculus"}};
    EXPECT_THROW(grades({noCourse}), GenericException);
    EXPECT_THROW(schedule({badWeekday}), GenericException);
    EXPECT_THROW(Snapshot::FromJSON(RECORD_KIND_GRADES, "k", nlohmann::json::object(), 0), GenericException);
    EXPECT_THROW(RecordFromJSON("exams", nlohmann::json::object()), GenericException);
}

TEST(ChangeDetectorTest, WeekListOrderDoesNotMatter) {
    nlohmann::json before = {{"weekday", 2}, {"start_period", 3}, {"course_name", "Physics"}, {"week_list", {3, 1, 2}}};
    nlohmann::json after = {{"weekday", "2"}, {"start_period", 3}, {"course_name", "Physics"}, {"week_list", {1, 2, 3, 3}}};
    auto a = schedule({before});
    auto b = schedule({after});
    EXPECT_TRUE(ChangeDetector::diff(a, b).empty());
}

TEST(ChangeDetectorTest, MalformedWeekListsAreRejected) {
    nlohmann::json range = {{"weekday", 2}, {"start_period", 3}, {"course_name", "Physics"}, {"week_list", "1-16"}};
    nlohmann::json words = {{"weekday", 2}, {"start_period", 3}, {"course_name", "Physics"}, {"week_list", {"1", "odd"}}};
    nlohmann::json object = {{"weekday", 2}, {"start_period", 3}, {"course_name", "Physics"}, {"week_list", {{"from", 1}}}};
    nlohmann::json zero = {{"weekday", 2}, {"start_period", 3}, {"course_name", "Physics"}, {"week_list", {0, 1}}};
    EXPECT_THROW(schedule({range}), GenericException);
    EXPECT_THROW(schedule({words}), GenericException);
    EXPECT_THROW(schedule({object}), GenericException);
    EXPECT_THROW(schedule({zero}), GenericException);

    nlohmann::json before = {{"weekday", 2}, {"start_period", 3}, {"course_name", "Physics"}, {"week_list", {"1", " 2 "}}};
    nlohmann::json after = {{"weekday", 2}, {"start_period", 3}, {"course_name", "Physics"}, {"week_list", "All"}};
    auto changes = ChangeDetector::diff(schedule({before}), schedule({after}));
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].kind, ChangeKind::Modified);
}

TEST(ChangeDetectorTest, RoomChangeIsReported) {
    nlohmann::json before = {{"weekday", 2}, {"start_period", 3}, {"course_name", "Physics"}, {"room", "A-101"}};
    nlohmann::json after = {{"weekday", 2}, {"start_period", 3}, {"course_name", "Physics"}, {"room", "B-202"}};
    auto a = schedule({before});
    auto b = schedule({after});
    auto changes = ChangeDetector::diff(a, b);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(MessageRenderer::describe(changes[0]), "[*] Physics (day 2, period 3): room A-101 -> B-202");
}

TEST(MessageRendererTest, SubjectCountsEachKind) {
    auto a = grades({MakeGrade("Calculus", "90"), MakeGrade("History", "70")});
    auto b = grades({MakeGrade("Calculus", "95"), MakeGrade("Art", "99")});
    auto changes = ChangeDetector::diff(a, b);
    EXPECT_EQ(MessageRenderer::subject(RECORD_KIND_GRADES, changes), "Grades updated: 1 added, 1 removed, 1 modified");
}

TEST(MessageRendererTest, ContentListsBeforeAndAfterValues) {
    auto a = grades({MakeGrade("Calculus", "90")});
    auto b = grades({MakeGrade("Calculus", "95")});
    auto changes = ChangeDetector::diff(a, b);

    std::string content = MessageRenderer::content(RECORD_KIND_GRADES, changes);
    EXPECT_EQ(content, "Grades updated: 1 modified\n\n[*] Calculus (2025-2026-1): score 90 -> 95");
    EXPECT_EQ(content, MessageRenderer::content(RECORD_KIND_GRADES, changes));
}

TEST(MessageRendererTest, AddedAndRemovedLines) {
    auto a = grades({MakeGrade("History", "70")});
    auto b = grades({MakeGrade("Art", "99")});
    auto changes = ChangeDetector::diff(a, b);
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(MessageRenderer::describe(changes[0]), "[+] Art (2025-2026-1): score 99, credit 3, term 2025-2026-1");
    EXPECT_EQ(MessageRenderer::describe(changes[1]), "[-] History (2025-2026-1)");
}

TEST(MessageRendererTest, MissingValuesRenderAsNone) {
    nlohmann::json before = {{"course_name", "Calculus"}};
    nlohmann::json after = {{"course_name", "Calculus"}, {"score", "A"}};
    auto a = grades({before});
    auto b = grades({after});
    auto changes = ChangeDetector::diff(a, b);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(MessageRenderer::describe(changes[0]), "[*] Calculus: score (none) -> A");
}
