#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "capturepush/account_sync_target.hpp"
#include "capturepush/orchestrator.hpp"
#include "capturepush/polling_scheduler.hpp"
#include "capturepush/spd_log_extensions.hpp"
#include "MockCapture.hpp"

using ::testing::_;
using ::testing::AllOf;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::Throw;

class AccountSyncTargetTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = MakeTestDir("sync");
        logger = CreateNullLogger("sync-test");
        store = std::make_shared<StateStore>(root, logger);
        dispatcher = std::make_shared<NotificationDispatcher>(logger, std::chrono::milliseconds(2000));
        channel = std::make_shared<MockNotificationChannel>();
        dispatcher->registerChannel("mock", channel);
        adapter = std::make_shared<MockSchoolAdapter>("10001");

        account.id = "alice";
        account.schoolCode = "10001";
        account.username = "alice";
        account.password = "secret";
        account.grades = TargetConfig{true, 3600};
        account.schedule = TargetConfig{false, 3600};

        SchedulerOptions options;
        options.maxRetries = 1;
        options.backoffBase = std::chrono::milliseconds(5);
        options.backoffMax = std::chrono::milliseconds(10);
        options.phaseTimeout = std::chrono::milliseconds(2000);
        scheduler = new PollingScheduler(options, logger);

        target = std::make_shared<AccountSyncTarget>(account, RECORD_KIND_GRADES, adapter, store, dispatcher, logger);
        scheduler->start(target, std::chrono::hours(1), std::chrono::milliseconds(0), false);
    }

    void TearDown() override {
        delete scheduler;
        RemoveTestDir(root);
    }

    CycleResult cycle() {
        return scheduler->forceCycle(target->targetId()).get();
    }

    std::string storedScore(std::string course) {
        auto snapshot = store->load(account.accountKey(), RECORD_KIND_GRADES);
        if (!snapshot) {
            return "(missing)";
        }
        for (const auto & record : snapshot->records()) {
            if (record->textValue("course_name") == course) {
                return record->textValue("score");
            }
        }
        return "(absent)";
    }

    std::string root;
    std::shared_ptr<spdlog::logger> logger;
    std::shared_ptr<StateStore> store;
    std::shared_ptr<NotificationDispatcher> dispatcher;
    std::shared_ptr<MockNotificationChannel> channel;
    std::shared_ptr<MockSchoolAdapter> adapter;
    AccountConfig account;
    PollingScheduler * scheduler;
    std::shared_ptr<AccountSyncTarget> target;
};

TEST_F(AccountSyncTargetTest, TargetIdCombinesAccountAndKind) {
    EXPECT_EQ(target->targetId(), "10001-alice/grades");
}

TEST_F(AccountSyncTargetTest, BaselineThenScoreChangeSendsOneNotification) {
    EXPECT_CALL(*adapter, fetchGrades(_, _))
        .WillOnce(Return(MakeRecordList({MakeGrade("Calculus", "90"), MakeGrade("Physics", "85")})))
        .WillOnce(Return(MakeRecordList({MakeGrade("Calculus", "95"), MakeGrade("Physics", "85")})));
    EXPECT_CALL(*channel, send("Grades updated: 1 modified", AllOf(HasSubstr("90"), HasSubstr("95"), HasSubstr("Calculus"))))
        .WillOnce(Return(true));

    CycleResult first = cycle();
    EXPECT_EQ(first.status, CycleStatus::Baseline);
    EXPECT_TRUE(first.deliveries.empty());
    EXPECT_EQ(storedScore("Calculus"), "90");

    CycleResult second = cycle();
    EXPECT_EQ(second.status, CycleStatus::Changed);
    EXPECT_EQ(second.changeCount, 1u);
    EXPECT_TRUE(second.deliveries["mock"]);
    EXPECT_EQ(storedScore("Calculus"), "95");
}

TEST_F(AccountSyncTargetTest, UnchangedDataSendsNothing) {
    EXPECT_CALL(*adapter, fetchGrades(_, _))
        .WillRepeatedly(Return(MakeRecordList({MakeGrade("Calculus", "90")})));
    EXPECT_CALL(*channel, send(_, _)).Times(0);

    EXPECT_EQ(cycle().status, CycleStatus::Baseline);
    EXPECT_EQ(cycle().status, CycleStatus::Unchanged);
    EXPECT_EQ(cycle().status, CycleStatus::Unchanged);
}

TEST_F(AccountSyncTargetTest, MissingResultKeepsTheBaseline) {
    EXPECT_CALL(*adapter, fetchGrades(_, _))
        .WillOnce(Return(MakeRecordList({MakeGrade("Calculus", "90")})))
        .WillRepeatedly(Return(RecordList()));
    EXPECT_CALL(*channel, send(_, _)).Times(0);

    EXPECT_EQ(cycle().status, CycleStatus::Baseline);

    CycleResult failed = cycle();
    EXPECT_EQ(failed.status, CycleStatus::FetchFailed);
    EXPECT_EQ(failed.attempts, 2);
    EXPECT_EQ(storedScore("Calculus"), "90");
}

TEST_F(AccountSyncTargetTest, EmptyResultRemovesEveryRecord) {
    EXPECT_CALL(*adapter, fetchGrades(_, _))
        .WillOnce(Return(MakeRecordList({MakeGrade("Calculus", "90"), MakeGrade("Physics", "85")})))
        .WillOnce(Return(MakeRecordList({})));
    EXPECT_CALL(*channel, send("Grades updated: 2 removed", _)).WillOnce(Return(true));

    EXPECT_EQ(cycle().status, CycleStatus::Baseline);
    CycleResult result = cycle();
    EXPECT_EQ(result.status, CycleStatus::Changed);
    EXPECT_EQ(result.changeCount, 2u);

    auto stored = store->load(account.accountKey(), RECORD_KIND_GRADES);
    ASSERT_NE(stored, nullptr);
    EXPECT_EQ(stored->size(), 0u);
}

TEST_F(AccountSyncTargetTest, InvalidRecordsFailWithoutRetry) {
    nlohmann::json broken = {{"score", "90"}};
    EXPECT_CALL(*adapter, fetchGrades(_, _)).WillOnce(Return(MakeRecordList({broken})));

    CycleResult result = cycle();
    EXPECT_EQ(result.status, CycleStatus::FetchFailed);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(store->load(account.accountKey(), RECORD_KIND_GRADES), nullptr);
}

TEST_F(AccountSyncTargetTest, FailedDeliveryStillCommits) {
    EXPECT_CALL(*adapter, fetchGrades(_, _))
        .WillOnce(Return(MakeRecordList({MakeGrade("Calculus", "90")})))
        .WillRepeatedly(Return(MakeRecordList({MakeGrade("Calculus", "95")})));
    EXPECT_CALL(*channel, send(_, _)).WillOnce(Return(false));

    EXPECT_EQ(cycle().status, CycleStatus::Baseline);

    CycleResult changed = cycle();
    EXPECT_EQ(changed.status, CycleStatus::Changed);
    EXPECT_FALSE(changed.deliveries["mock"]);
    EXPECT_EQ(storedScore("Calculus"), "95");

    // the change is not reported a second time
    EXPECT_EQ(cycle().status, CycleStatus::Unchanged);
}

TEST_F(AccountSyncTargetTest, UnreadableBaselineFailsTheCycleAndIsKept) {
    EXPECT_CALL(*adapter, fetchGrades(_, _))
        .WillOnce(Return(MakeRecordList({MakeGrade("Calculus", "90")})))
        .WillRepeatedly(Return(MakeRecordList({MakeGrade("Calculus", "95")})));
    EXPECT_CALL(*channel, send("Grades updated: 1 modified", HasSubstr("90 -> 95"))).WillOnce(Return(true));

    EXPECT_EQ(cycle().status, CycleStatus::Baseline);

    std::string path = store->pathFor(account.accountKey(), RECORD_KIND_GRADES);
    {
        SQLite::Database db(path, SQLite::OPEN_READWRITE);
        db.setBusyTimeout(5000);
        db.exec("ALTER TABLE Snapshot RENAME TO SnapshotMoved");
    }
    CycleResult failed = cycle();
    EXPECT_EQ(failed.status, CycleStatus::Failed);
    EXPECT_TRUE(failed.deliveries.empty());

    {
        SQLite::Database db(path, SQLite::OPEN_READWRITE);
        db.setBusyTimeout(5000);
        db.exec("ALTER TABLE SnapshotMoved RENAME TO Snapshot");
    }
    EXPECT_EQ(storedScore("Calculus"), "90");

    CycleResult changed = cycle();
    EXPECT_EQ(changed.status, CycleStatus::Changed);
    EXPECT_EQ(storedScore("Calculus"), "95");
}

TEST_F(AccountSyncTargetTest, RetryableAdapterErrorIsRetried) {
    EXPECT_CALL(*adapter, fetchGrades(_, _))
        .WillOnce(Throw(SyncException("fetch_grades-failed", "10001: institution unreachable", true)))
        .WillOnce(Return(MakeRecordList({MakeGrade("Calculus", "90")})));

    CycleResult result = cycle();
    EXPECT_EQ(result.status, CycleStatus::Baseline);
    EXPECT_EQ(result.attempts, 2);
}

TEST_F(AccountSyncTargetTest, ForcedCyclesAskTheAdapterToBypassCaches) {
    EXPECT_CALL(*adapter, fetchGrades(_, true)).WillOnce(Return(MakeRecordList({})));
    EXPECT_EQ(cycle().status, CycleStatus::Baseline);
}

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = MakeTestDir("orchestrator");
        logger = CreateNullLogger("orchestrator-test");
        adapter = std::make_shared<MockSchoolAdapter>("20000");
        channel = std::make_shared<MockNotificationChannel>();

        auto registry = std::make_shared<PluginRegistry>(root + "/plugins", "", std::make_shared<FakePluginTransport>(), logger);
        auto builtin = adapter;
        registry->registerBuiltin("20000", "Built-in University", [builtin]() { return builtin; });

        auto channels = std::make_shared<ChannelFactory>(logger, 5);
        auto mock = channel;
        channels->registerType("mock", [mock](const ChannelConfig &) { return mock; });

        nlohmann::json config = {
            {"accounts", {
                {{"school_code", "20000"}, {"username", "alice"}, {"password", "pw"}, {"schedule", {{"enabled", false}}}},
                {{"school_code", "99999"}, {"username", "bob"}, {"password", "pw"}},
            }},
            {"channels", {
                {{"name", "mock"}},
            }},
        };

        ctx.config = std::make_shared<AppConfig>(config);
        ctx.logger = logger;
        ctx.registry = registry;
        ctx.store = std::make_shared<StateStore>(root + "/state", logger);
        ctx.dispatcher = std::make_shared<NotificationDispatcher>(logger, std::chrono::milliseconds(2000));
        ctx.channels = channels;
    }

    void TearDown() override {
        RemoveTestDir(root);
    }

    std::string root;
    std::shared_ptr<spdlog::logger> logger;
    std::shared_ptr<MockSchoolAdapter> adapter;
    std::shared_ptr<MockNotificationChannel> channel;
    AppContext ctx;
};

TEST_F(OrchestratorTest, RunOnceSkipsUnresolvableAccounts) {
    ASSERT_TRUE(ctx.config->valid());
    EXPECT_CALL(*adapter, fetchGrades(_, _))
        .WillOnce(Return(MakeRecordList({MakeGrade("Calculus", "90")})))
        .WillOnce(Return(MakeRecordList({MakeGrade("Calculus", "92")})));
    EXPECT_CALL(*adapter, fetchCourseSchedule(_, _)).Times(0);
    EXPECT_CALL(*channel, send("Grades updated: 1 modified", HasSubstr("90 -> 92"))).WillOnce(Return(true));

    Orchestrator orchestrator(ctx);
    auto first = orchestrator.runOnce();
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].targetId, "20000-alice/grades");
    EXPECT_EQ(first[0].status, CycleStatus::Baseline);

    nlohmann::json skipped = orchestrator.skippedAccounts();
    EXPECT_EQ(skipped.count("99999-bob"), 1u);
    EXPECT_EQ(skipped["99999-bob"]["type"], "not-found");

    auto second = orchestrator.runOnce();
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].status, CycleStatus::Changed);
    EXPECT_TRUE(second[0].deliveries["mock"]);

    orchestrator.stop();
    EXPECT_TRUE(orchestrator.targetIds().empty());
}

TEST_F(OrchestratorTest, ChannelsFromConfigAreRegistered) {
    EXPECT_CALL(*adapter, fetchGrades(_, _)).WillRepeatedly(Return(MakeRecordList({})));

    Orchestrator orchestrator(ctx);
    orchestrator.runOnce();
    auto names = ctx.dispatcher->channelNames();
    ASSERT_EQ(names.size(), 1u);
    EXPECT_EQ(names[0], "mock");
    EXPECT_EQ(orchestrator.targetIds().size(), 1u);
}
