#include <gtest/gtest.h>
#include "sync/progress.hpp"
#include "sync/strategy_registry.hpp"
#include "sync/sync_plan.hpp"
#include "sync/verify_result.hpp"

namespace {

class StubStrategy : public SyncStrategy {
public:
    StubStrategy(const std::string& name, SyncType type, bool incremental)
        : name_(name)
        , type_(type)
        , incremental_(incremental) {
    }

    std::string getName() const override { return name_; }
    SyncType getType() const override { return type_; }
    int64_t estimateSize(const SyncContext&, const Endpoint&) override { return 0; }
    void sync(const SyncContext&, const Endpoint&, const Endpoint&, ProgressQueue&) override {}
    VerifyResult verify(const SyncContext&, const Endpoint&, const Endpoint&) override { return VerifyResult(); }
    bool supportsIncremental() const override { return incremental_; }
    bool supportsResume() const override { return false; }

private:
    std::string name_;
    SyncType type_;
    bool incremental_;
};

} // namespace

TEST(ProgressTest, PercentIsClampedAndZeroWithoutTotal) {
    Progress progress;
    EXPECT_DOUBLE_EQ(progress.percentDone(), 0.0);

    progress.bytesTotal = 200;
    progress.bytesDone = 50;
    EXPECT_DOUBLE_EQ(progress.percentDone(), 25.0);
    EXPECT_EQ(progress.remainingBytes(), 150);

    progress.bytesDone = 500;
    EXPECT_DOUBLE_EQ(progress.percentDone(), 100.0);
    EXPECT_EQ(progress.remainingBytes(), 0);

    progress.itemsTotal = 4;
    progress.itemsDone = 1;
    EXPECT_DOUBLE_EQ(progress.itemPercentDone(), 25.0);
}

TEST(ProgressTest, EtaUnknownWithoutThroughput) {
    Progress progress;
    progress.bytesTotal = 1000;
    EXPECT_EQ(progress.etaSeconds(), -1);
}

TEST(ProgressTest, FormatsBytesAndDurations) {
    EXPECT_EQ(formatBytes(512), "512 B");
    EXPECT_EQ(formatBytes(1536), "1.5 KiB");
    EXPECT_EQ(formatBytes(5LL * 1024 * 1024 * 1024), "5.0 GiB");
    EXPECT_EQ(formatDuration(std::chrono::seconds(42)), "42s");
    EXPECT_EQ(formatDuration(std::chrono::seconds(125)), "2m5s");
    EXPECT_EQ(formatDuration(std::chrono::seconds(3725)), "1h2m5s");
}

TEST(ProgressTest, ReporterDropsUpdatesWhenQueueIsFull) {
    ProgressQueue queue(2);
    ProgressReporter reporter("task-1", &queue);
    reporter.setTotals(100, 3);
    reporter.update(10, 1);
    reporter.addBytes(15);
    reporter.warning("slow source");

    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(reporter.droppedUpdates(), 2u);

    Progress current = reporter.getProgress();
    EXPECT_EQ(current.taskId, "task-1");
    EXPECT_EQ(current.bytesDone, 25);
    EXPECT_EQ(current.itemsDone, 1);
    EXPECT_EQ(current.warnings, 1);
    EXPECT_EQ(current.lastMessage, "warning: slow source");

    // The queue keeps the oldest updates.
    EXPECT_EQ(queue.tryPop()->bytesTotal, 100);
    EXPECT_EQ(queue.tryPop()->bytesDone, 10);
}

TEST(VerifyResultTest, ValidOnlyWithoutMismatches) {
    VerifyResult result;
    result.setCounts(10, 10);
    EXPECT_TRUE(result.isValid());
    EXPECT_TRUE(result.isComplete());
    EXPECT_EQ(result.toString(), "Verification passed: 10 source, 10 target");

    result.addMismatch("missing in target: a.bin");
    EXPECT_FALSE(result.isValid());
    EXPECT_EQ(result.toString(), "Verification failed: 1 mismatches (10 source, 10 target); missing in target: a.bin");
}

TEST(VerifyResultTest, CountsAccumulateAndToStringTruncates) {
    VerifyResult result;
    result.addCounts(3, 2);
    result.addCounts(4, 4);
    EXPECT_EQ(result.getSourceCount(), 7);
    EXPECT_EQ(result.getTargetCount(), 6);
    EXPECT_FALSE(result.isComplete());

    for (int i = 0; i < 7; ++i) {
        result.addMismatch("m" + std::to_string(i));
    }
    std::string text = result.toString();
    EXPECT_NE(text.find("; m4; ..."), std::string::npos);
    EXPECT_EQ(text.find("m5"), std::string::npos);

    result.setChecksums("aa", "bb");
    result.setDetail("sampled_keys", 7);
    auto json = result.toJson();
    EXPECT_EQ(json["details"]["sampled_keys"], 7);
}

class StrategyRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_.registerStrategy(std::make_shared<StubStrategy>("postgres", SyncType::DATABASE, false));
        registry_.registerStrategy(std::make_shared<StubStrategy>("mysql", SyncType::DATABASE, false));
        registry_.registerStrategy(std::make_shared<StubStrategy>("redis", SyncType::CACHE, false));
        registry_.registerStrategy(std::make_shared<StubStrategy>("minio", SyncType::OBJECT_STORAGE, true));
    }

    StrategyRegistry registry_;
};

TEST_F(StrategyRegistryTest, ResolvesEndpointAliases) {
    EXPECT_EQ(registry_.getForEndpoint("postgresql")->getName(), "postgres");
    EXPECT_EQ(registry_.getForEndpoint("MariaDB")->getName(), "mysql");
    EXPECT_EQ(registry_.getForEndpoint("valkey")->getName(), "redis");
    for (const char* type : {"s3", "gcs", "azure-blob", "local", "minio"}) {
        EXPECT_EQ(registry_.getForEndpoint(type)->getName(), "minio") << type;
    }
    EXPECT_EQ(registry_.getForEndpoint("mongodb"), nullptr);
    EXPECT_EQ(StrategyRegistry::resolveAlias("sqlite"), "");
}

TEST_F(StrategyRegistryTest, RegisterReplacesAndUnregisterRemoves) {
    EXPECT_FALSE(registry_.registerStrategy(nullptr));

    registry_.registerStrategy(std::make_shared<StubStrategy>("redis", SyncType::CACHE, true));
    EXPECT_EQ(registry_.listNames().size(), 4u);
    EXPECT_TRUE(registry_.getCapabilities("redis")->supportsIncremental);

    EXPECT_TRUE(registry_.unregisterStrategy("redis"));
    EXPECT_FALSE(registry_.unregisterStrategy("redis"));
    EXPECT_EQ(registry_.get("redis"), nullptr);
    EXPECT_FALSE(registry_.getCapabilities("redis").has_value());
}

TEST_F(StrategyRegistryTest, ListsByTypeAndCapabilities) {
    EXPECT_EQ(registry_.listByType(SyncType::DATABASE).size(), 2u);
    EXPECT_EQ(registry_.listByType(SyncType::CACHE).size(), 1u);

    auto all = registry_.getAllCapabilities();
    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(all[0].name, "minio");
    EXPECT_EQ(all[0].type, SyncType::OBJECT_STORAGE);
}

TEST(SyncTaskTest, RetryIsBoundedByMaxRetries) {
    SyncTask task;
    task.maxRetries = 2;
    EXPECT_FALSE(task.retry());

    for (int attempt = 0; attempt < 2; ++attempt) {
        task.start();
        task.fail("boom");
        EXPECT_TRUE(task.canRetry());
        EXPECT_TRUE(task.retry());
        EXPECT_EQ(task.state, SyncTask::State::PENDING);
        EXPECT_TRUE(task.errorMessage.empty());
    }
    task.start();
    task.fail("boom");
    EXPECT_FALSE(task.canRetry());

    task.reset();
    EXPECT_EQ(task.retries, 0);
    EXPECT_EQ(task.state, SyncTask::State::PENDING);
}

TEST(SyncTaskTest, PlanCountsFinishedTasks) {
    std::vector<SyncTask> tasks(4);
    for (size_t i = 0; i < tasks.size(); ++i) {
        tasks[i].id = "task-" + std::to_string(i);
    }
    tasks[0].complete();
    tasks[1].fail("x");
    SyncPlan plan("plan-1", "nightly", tasks);

    EXPECT_EQ(plan.completedCount(), 1u);
    EXPECT_EQ(plan.failedCount(), 1u);
    EXPECT_TRUE(plan.hasFailures());
    EXPECT_DOUBLE_EQ(plan.overallProgress(), 50.0);
    ASSERT_NE(plan.findTask("task-3"), nullptr);
    EXPECT_EQ(plan.findTask("task-9"), nullptr);

    auto json = plan.toJson();
    EXPECT_EQ(json["tasks"].size(), 4u);
    EXPECT_EQ(json["tasks"][1]["status"], "failed");
}

TEST(EndpointTest, ConnectionStringsPerType) {
    Endpoint pg;
    pg.type = "postgresql";
    pg.host = "db";
    pg.database = "shop";
    pg.credentials.username = "app";
    pg.credentials.password = "p@ss";
    EXPECT_EQ(pg.connectionString(), "postgres://app:p%40ss@db:5432/shop?sslmode=disable");

    Endpoint redis;
    redis.type = "redis";
    redis.host = "cache";
    redis.ssl = true;
    EXPECT_EQ(redis.connectionString(), "rediss://cache:6379/0");

    Endpoint bucket;
    bucket.type = "s3";
    bucket.bucket = "assets";
    bucket.path = "img";
    EXPECT_EQ(bucket.connectionString(), "s3://assets/img");
    EXPECT_EQ(bucket.describe(), "s3:///assets/img");
}

TEST(EndpointTest, ParsesSyncTypes) {
    SyncType type = SyncType::CACHE;
    EXPECT_TRUE(parseSyncType("Object-Storage", type));
    EXPECT_EQ(type, SyncType::OBJECT_STORAGE);
    EXPECT_TRUE(parseSyncType("relational", type));
    EXPECT_EQ(syncTypeToString(type), "database");
    EXPECT_FALSE(parseSyncType("queue", type));
}
