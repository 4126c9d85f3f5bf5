#include <gtest/gtest.h>
#include "capturepush/capture_utils.hpp"
#include "capturepush/generic_exception.hpp"
#include "capturepush/spd_log_extensions.hpp"
#include "capturepush/state_store.hpp"
#include "MockCapture.hpp"

class StateStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = MakeTestDir("state");
        store = new StateStore(root, CreateNullLogger("state-test"));
    }

    void TearDown() override {
        delete store;
        RemoveTestDir(root);
    }

    std::shared_ptr<Snapshot> gradesSnapshot(std::string account, std::vector<nlohmann::json> items, time_t capturedAt = 1700000000) {
        return Snapshot::FromJSON(RECORD_KIND_GRADES, account, nlohmann::json(items), capturedAt);
    }

    std::string root;
    StateStore * store;
};

TEST_F(StateStoreTest, MissingSnapshotLoadsAsNull) {
    EXPECT_EQ(store->load("10001-alice", RECORD_KIND_GRADES), nullptr);
    EXPECT_FALSE(CaptureUtils::fileExists(store->pathFor("10001-alice", RECORD_KIND_GRADES)));
}

TEST_F(StateStoreTest, SavedSnapshotLoadsBack) {
    store->save(*gradesSnapshot("10001-alice", {MakeGrade("Calculus", "90"), MakeGrade("Physics", "85")}));

    auto loaded = store->load("10001-alice", RECORD_KIND_GRADES);
    ASSERT_NE(loaded, nullptr);
    EXPECT_EQ(loaded->size(), 2u);
    EXPECT_EQ(loaded->capturedAt(), 1700000000);
    EXPECT_EQ(loaded->accountKey(), "10001-alice");
    EXPECT_EQ(loaded->records()[0]->textValue("course_name"), "Calculus");
}

TEST_F(StateStoreTest, SaveReplacesPreviousSnapshot) {
    store->save(*gradesSnapshot("10001-alice", {MakeGrade("Calculus", "90")}));
    store->save(*gradesSnapshot("10001-alice", {MakeGrade("Calculus", "95")}, 1700000100));

    auto loaded = store->load("10001-alice", RECORD_KIND_GRADES);
    ASSERT_NE(loaded, nullptr);
    EXPECT_EQ(loaded->size(), 1u);
    EXPECT_EQ(loaded->records()[0]->textValue("score"), "95");
    EXPECT_EQ(loaded->capturedAt(), 1700000100);
}

TEST_F(StateStoreTest, EmptySnapshotIsDistinctFromMissing) {
    store->save(*gradesSnapshot("10001-alice", {}));
    auto loaded = store->load("10001-alice", RECORD_KIND_GRADES);
    ASSERT_NE(loaded, nullptr);
    EXPECT_EQ(loaded->size(), 0u);
}

TEST_F(StateStoreTest, AccountsAndKindsAreIsolated) {
    store->save(*gradesSnapshot("10001-alice", {MakeGrade("Calculus", "90")}));
    store->save(*gradesSnapshot("10001-bob", {MakeGrade("Physics", "60")}));

    EXPECT_EQ(store->load("10001-alice", RECORD_KIND_GRADES)->records()[0]->textValue("course_name"), "Calculus");
    EXPECT_EQ(store->load("10001-bob", RECORD_KIND_GRADES)->records()[0]->textValue("course_name"), "Physics");
    EXPECT_EQ(store->load("10001-alice", RECORD_KIND_SCHEDULE), nullptr);
    EXPECT_NE(store->pathFor("10001-alice", RECORD_KIND_GRADES), store->pathFor("10001-alice", RECORD_KIND_SCHEDULE));
}

TEST_F(StateStoreTest, AccountKeysAreEscapedInPaths) {
    std::string path = store->pathFor("10001-../evil", RECORD_KIND_GRADES);
    EXPECT_EQ(path.find("/../"), std::string::npos);
    EXPECT_EQ(path.substr(0, root.size()), root);
}

TEST_F(StateStoreTest, SnapshotsSurviveReopening) {
    store->save(*gradesSnapshot("10001-alice", {MakeGrade("Calculus", "90")}));
    delete store;
    store = new StateStore(root, CreateNullLogger("state-test-reopen"));

    auto loaded = store->load("10001-alice", RECORD_KIND_GRADES);
    ASSERT_NE(loaded, nullptr);
    EXPECT_EQ(loaded->records()[0]->textValue("score"), "90");
}

TEST_F(StateStoreTest, CorruptRowLoadsAsNull) {
    store->save(*gradesSnapshot("10001-alice", {MakeGrade("Calculus", "90")}));
    {
        SQLite::Database db(store->pathFor("10001-alice", RECORD_KIND_GRADES), SQLite::OPEN_READWRITE);
        db.setBusyTimeout(5000);
        db.exec("UPDATE Snapshot SET data = 'not json'");
    }
    EXPECT_EQ(store->load("10001-alice", RECORD_KIND_GRADES), nullptr);
}

TEST_F(StateStoreTest, UnknownKindIsRejected) {
    EXPECT_THROW(store->load("10001-alice", "exams"), GenericException);
}

TEST_F(StateStoreTest, UnreadableDatabaseThrowsInsteadOfLoadingAsNull) {
    CaptureUtils::writeFile(store->pathFor("10001-alice", RECORD_KIND_GRADES), std::string(4096, 'x'));
    EXPECT_THROW(store->load("10001-alice", RECORD_KIND_GRADES), SQLite::Exception);
}

TEST_F(StateStoreTest, QueryFailureThrowsInsteadOfLoadingAsNull) {
    store->save(*gradesSnapshot("10001-alice", {MakeGrade("Calculus", "90")}));
    {
        SQLite::Database db(store->pathFor("10001-alice", RECORD_KIND_GRADES), SQLite::OPEN_READWRITE);
        db.setBusyTimeout(5000);
        db.exec("ALTER TABLE Snapshot RENAME TO SnapshotMoved");
    }
    EXPECT_THROW(store->load("10001-alice", RECORD_KIND_GRADES), SQLite::Exception);
}
