#include <gtest/gtest.h>
#include "common/utils.hpp"
#include "database/mysql_client_connection.hpp"
#include "database/mysql_sync.hpp"
#include "database/postgres_sync.hpp"
#include "sync/sync_engine.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <regex>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace {

bool contains(const std::vector<std::string>& args, const std::string& value) {
    return std::find(args.begin(), args.end(), value) != args.end();
}

CommandSpec shell(const std::string& script, const std::string& program = "sh") {
    CommandSpec command;
    command.program = program;
    command.args = {"-c", script};
    return command;
}

// Databases and per-table row counts shared by every fake connection.
struct FakeCatalog {
    std::map<std::string, std::map<std::string, int64_t>> databases;
    std::vector<std::string> statements;
    bool failSize{false};
};

// Understands the statements FakeRelationalSync generates: "SIZE <db>",
// "EXISTS <db>", "TABLES <db>", "COUNT <table>" and "CREATE <db>".
class FakeConnection : public SqlConnection {
public:
    FakeConnection(FakeCatalog& catalog, const std::string& database)
        : catalog_(catalog)
        , database_(database) {
    }

    std::vector<std::string> queryColumn(const std::string& sql) override {
        std::istringstream in(sql);
        std::string verb;
        std::string argument;
        in >> verb >> argument;

        if (verb == "SIZE") {
            if (catalog_.failSize) {
                throw SyncError(SyncError::Category::PROTOCOL, "size unavailable");
            }
            return {"4096"};
        }
        if (verb == "EXISTS") {
            return {catalog_.databases.count(argument) ? "1" : "0"};
        }
        if (verb == "TABLES") {
            std::vector<std::string> tables;
            for (const auto& table : catalog_.databases[argument]) {
                tables.push_back(table.first);
            }
            return tables;
        }
        if (verb == "COUNT") {
            auto& tables = catalog_.databases[database_];
            auto it = tables.find(argument);
            if (it == tables.end()) {
                throw SyncError(SyncError::Category::PROTOCOL, "relation " + argument + " does not exist");
            }
            return {std::to_string(it->second)};
        }
        throw SyncError(SyncError::Category::PROTOCOL, "unexpected query: " + sql);
    }

    void execute(const std::string& sql) override {
        catalog_.statements.push_back(sql);
        std::istringstream in(sql);
        std::string verb;
        std::string argument;
        in >> verb >> argument;
        if (verb == "CREATE") {
            catalog_.databases[argument];
        }
    }

    std::string quoteIdentifier(const std::string& identifier) const override { return identifier; }
    std::string quoteLiteral(const std::string& value) const override { return value; }

private:
    FakeCatalog& catalog_;
    std::string database_;
};

// Shell pipelines stand in for the dump and restore tools; the restore
// side appends whatever it reads to `outputFile`.
class FakeRelationalSync : public RelationalSync {
public:
    FakeRelationalSync(FakeCatalog& catalog, const std::string& outputFile)
        : catalog_(catalog)
        , outputFile_(outputFile) {
        setProgressInterval(std::chrono::milliseconds(50));
    }

    std::string getName() const override { return "fake-sql"; }

    CommandSpec buildDumpCommand(const Endpoint& source) const override {
        return shell(dumpScript.empty() ? "echo 'dumping table orders' >&2; printf '" + source.database + "\\n'"
                                        : dumpScript);
    }
    // A custom restore runs as /bin/sh so failures name it apart from the dump.
    CommandSpec buildRestoreCommand(const Endpoint&) const override {
        if (!restoreScript.empty()) {
            return shell(restoreScript, "/bin/sh");
        }
        return shell("cat >> '" + outputFile_ + "'");
    }
    CommandSpec buildTableDumpCommand(const Endpoint&, const std::string& table) const override {
        return shell("printf 'rows of " + table + "\\n'");
    }
    CommandSpec buildTableRestoreCommand(const Endpoint&, const std::string&) const override {
        return shell("cat >> '" + outputFile_ + "'");
    }
    std::optional<std::string> parseProgressLine(const std::string& line) const override {
        static const std::regex pattern("dumping table (\\w+)");
        std::smatch match;
        if (std::regex_search(line, match, pattern)) {
            return match[1].str();
        }
        return std::nullopt;
    }

    std::string dumpScript;
    std::string restoreScript;

protected:
    std::unique_ptr<SqlConnection> openConnection(const SyncContext& ctx, const Endpoint&,
                                                  const std::string& database) override {
        ctx.throwIfCancelled();
        return std::make_unique<FakeConnection>(catalog_, database);
    }
    std::string adminDatabase() const override { return "admin"; }
    std::string sizeQuery(SqlConnection&, const std::string& database) const override { return "SIZE " + database; }
    std::string databaseExistsQuery(SqlConnection&, const std::string& database) const override {
        return "EXISTS " + database;
    }
    std::string createDatabaseStatement(SqlConnection&, const std::string& database) const override {
        return "CREATE " + database;
    }
    std::string listTablesQuery(SqlConnection&, const std::string& database) const override {
        return "TABLES " + database;
    }
    std::string countRowsQuery(SqlConnection&, const std::string& table) const override { return "COUNT " + table; }

private:
    FakeCatalog& catalog_;
    std::string outputFile_;
};

std::string readFile(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

Progress lastProgress(ProgressQueue& queue) {
    Progress last;
    while (auto update = queue.tryPop()) {
        last = *update;
    }
    return last;
}

} // namespace

class RelationalSyncTest : public ::testing::Test {
protected:
    void SetUp() override {
        output_ = fs::temp_directory_path() / ("datasync-restore-" + utils::generateId() + ".sql");
        catalog_.databases["shop"] = {{"orders", 3}, {"users", 2}};
        strategy_ = std::make_shared<FakeRelationalSync>(catalog_, output_.string());

        source_.type = "postgres";
        source_.host = "db-a";
        source_.database = "shop";
        target_.type = "postgres";
        target_.host = "db-b";
        target_.database = "shop_copy";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(output_, ec);
    }

    FakeCatalog catalog_;
    fs::path output_;
    std::shared_ptr<FakeRelationalSync> strategy_;
    Endpoint source_;
    Endpoint target_;
};

TEST_F(RelationalSyncTest, DumpStreamsIntoRestoreAndCreatesTarget) {
    SyncContext ctx(CancellationToken::create(), SyncOptions(), "task-db");
    ProgressQueue queue(200);
    strategy_->sync(ctx, source_, target_, queue);

    EXPECT_EQ(readFile(output_), "shop\n");
    ASSERT_EQ(catalog_.statements.size(), 1u);
    EXPECT_EQ(catalog_.statements[0], "CREATE shop_copy");

    Progress last = lastProgress(queue);
    EXPECT_EQ(last.phase, "completed");
    EXPECT_EQ(last.bytesTotal, 4096);
    EXPECT_EQ(last.bytesDone, 4096);
    EXPECT_EQ(last.currentItem, "orders");
}

TEST_F(RelationalSyncTest, ExistingTargetIsNotRecreated) {
    catalog_.databases["shop_copy"];
    SyncContext ctx;
    ProgressQueue queue(200);
    strategy_->sync(ctx, source_, target_, queue);
    EXPECT_TRUE(catalog_.statements.empty());
}

TEST_F(RelationalSyncTest, TablesModeCopiesEachTable) {
    SyncOptions options;
    options.mode = "tables";
    SyncContext ctx(CancellationToken::create(), options);
    ProgressQueue queue(200);
    strategy_->sync(ctx, source_, target_, queue);

    EXPECT_EQ(readFile(output_), "rows of orders\nrows of users\n");
    Progress last = lastProgress(queue);
    EXPECT_EQ(last.itemsTotal, 2);
    EXPECT_EQ(last.itemsDone, 2);
}

TEST_F(RelationalSyncTest, SizeEstimateFailureIsOnlyAWarning) {
    catalog_.failSize = true;
    SyncContext ctx;
    ProgressQueue queue(200);
    strategy_->sync(ctx, source_, target_, queue);

    Progress last = lastProgress(queue);
    EXPECT_EQ(last.phase, "completed");
    EXPECT_EQ(last.warnings, 1);
    EXPECT_EQ(last.bytesTotal, 0);
}

TEST_F(RelationalSyncTest, DryRunLeavesTargetAlone) {
    SyncOptions options;
    options.dryRun = true;
    SyncContext ctx(CancellationToken::create(), options);
    ProgressQueue queue(200);
    strategy_->sync(ctx, source_, target_, queue);

    EXPECT_FALSE(fs::exists(output_));
    EXPECT_TRUE(catalog_.statements.empty());
}

TEST_F(RelationalSyncTest, FailedDumpFailsTheTask) {
    strategy_->dumpScript = "echo 'pg_dump: error: connection refused' >&2; exit 1";

    auto registry = std::make_shared<StrategyRegistry>();
    registry->registerStrategy(strategy_);
    SyncEngine engine(registry);

    SyncTask task("db copy", SyncType::DATABASE, "fake-sql", std::make_shared<Endpoint>(source_),
                  std::make_shared<Endpoint>(target_));
    auto plan = engine.createPlan("db", {task});

    std::mutex mutex;
    std::vector<SyncEvent> events;
    ASSERT_TRUE(engine.start(plan.getId(), [&](const SyncEvent& event) {
        std::lock_guard<std::mutex> lock(mutex);
        if (event.type != SyncEvent::Type::TASK_PROGRESS) {
            events.push_back(event);
        }
    }));
    ASSERT_TRUE(engine.waitForCompletion(plan.getId(), std::chrono::seconds(30)));

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[1].type, SyncEvent::Type::TASK_ERROR);
    EXPECT_NE(events[1].error.find("sh exited with status 1"), std::string::npos);
    EXPECT_NE(events[1].error.find("connection refused"), std::string::npos);
    EXPECT_EQ(events[2].status, "failed");
    EXPECT_EQ(engine.getPlan(plan.getId())->state, PlanState::FAILED);
}

TEST_F(RelationalSyncTest, FailedRestoreFailsWithRestoreDiagnostics) {
    strategy_->restoreScript = "cat > /dev/null; echo 'pg_restore: error: relation \"orders\" already exists' >&2; exit 1";
    SyncContext ctx;
    ProgressQueue queue(200);

    try {
        strategy_->sync(ctx, source_, target_, queue);
        FAIL() << "expected SyncError";
    } catch (const SyncError& e) {
        std::string message = e.what();
        EXPECT_EQ(e.getCategory(), SyncError::Category::TRANSFER);
        EXPECT_EQ(message.rfind("/bin/sh exited with status 1", 0), 0u) << message;
        EXPECT_NE(message.find("relation \"orders\" already exists"), std::string::npos);
        // The dump exited cleanly, so only the restore is named.
        EXPECT_EQ(message.find(';'), std::string::npos);
    }
    EXPECT_GE(lastProgress(queue).errors, 1);
    EXPECT_EQ(readFile(output_), "");
}

TEST_F(RelationalSyncTest, CancellationStopsTheDump) {
    strategy_->dumpScript = "sleep 30";
    auto token = CancellationToken::create();
    SyncContext ctx(token, SyncOptions());
    ProgressQueue queue(200);

    std::thread canceller([token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        token->cancel("user requested");
    });

    auto started = std::chrono::steady_clock::now();
    try {
        strategy_->sync(ctx, source_, target_, queue);
        ADD_FAILURE() << "expected SyncError";
    } catch (const SyncError& e) {
        EXPECT_TRUE(e.isCancellation());
    }
    canceller.join();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
}

TEST_F(RelationalSyncTest, VerifyComparesRowCounts) {
    catalog_.databases["shop_copy"] = {{"orders", 3}};
    SyncContext ctx;

    auto result = strategy_->verify(ctx, source_, target_);
    EXPECT_FALSE(result.isValid());
    EXPECT_EQ(result.getSourceCount(), 5);
    EXPECT_EQ(result.getTargetCount(), 3);
    ASSERT_EQ(result.getMismatches().size(), 1u);
    EXPECT_EQ(result.getMismatches()[0], "table users: missing in target");
    EXPECT_EQ(result.getDetails().at("table_count"), 2);

    catalog_.databases["shop_copy"]["users"] = 1;
    auto differing = strategy_->verify(ctx, source_, target_);
    ASSERT_EQ(differing.getMismatches().size(), 1u);
    EXPECT_EQ(differing.getMismatches()[0], "table users: source=2 target=1");

    catalog_.databases["shop_copy"]["users"] = 2;
    EXPECT_TRUE(strategy_->verify(ctx, source_, target_).isValid());
}

TEST_F(RelationalSyncTest, RejectsIncompleteEndpointsAndUnknownMode) {
    Endpoint noDatabase = source_;
    noDatabase.database.clear();
    SyncContext ctx;
    ProgressQueue queue(10);
    try {
        strategy_->sync(ctx, noDatabase, target_, queue);
        FAIL() << "expected SyncError";
    } catch (const SyncError& e) {
        EXPECT_EQ(e.getCategory(), SyncError::Category::CONFIGURATION);
    }

    SyncOptions options;
    options.mode = "logical";
    SyncContext modeCtx(CancellationToken::create(), options);
    try {
        strategy_->sync(modeCtx, source_, target_, queue);
        FAIL() << "expected SyncError";
    } catch (const SyncError& e) {
        EXPECT_EQ(e.getCategory(), SyncError::Category::CONFIGURATION);
    }
}

class PostgresCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        endpoint_.type = "postgres";
        endpoint_.host = "pg.internal";
        endpoint_.database = "shop";
        endpoint_.credentials.username = "app";
        endpoint_.credentials.password = "secret";
        endpoint_.ssl = true;
    }

    PostgresSync strategy_;
    Endpoint endpoint_;
};

TEST_F(PostgresCommandTest, DumpAndRestoreCommands) {
    CommandSpec dump = strategy_.buildDumpCommand(endpoint_);
    EXPECT_EQ(dump.program, "pg_dump");
    std::vector<std::string> expected = {"-h", "pg.internal", "-p", "5432", "-U", "app", "--no-password",
                                         "-Fc", "-v", "shop"};
    EXPECT_EQ(dump.args, expected);
    EXPECT_EQ(dump.env.at("PGPASSWORD"), "secret");
    EXPECT_EQ(dump.env.at("PGSSLMODE"), "require");
    EXPECT_EQ(dump.toString().find("secret"), std::string::npos);

    CommandSpec restore = strategy_.buildRestoreCommand(endpoint_);
    EXPECT_EQ(restore.program, "pg_restore");
    EXPECT_TRUE(contains(restore.args, "--clean"));
    EXPECT_TRUE(contains(restore.args, "--if-exists"));
    EXPECT_TRUE(contains(restore.args, "--no-owner"));

    auto schema = strategy_.buildSchemaCommands(endpoint_, endpoint_);
    ASSERT_TRUE(schema.has_value());
    EXPECT_TRUE(contains(schema->first.args, "--schema-only"));
}

TEST_F(PostgresCommandTest, TableCommandsUseCopy) {
    strategy_.setTools("/opt/pg/bin/pg_dump", "/opt/pg/bin/pg_restore", "/opt/pg/bin/psql");
    CommandSpec out = strategy_.buildTableDumpCommand(endpoint_, "public.users");
    EXPECT_EQ(out.program, "/opt/pg/bin/psql");
    EXPECT_EQ(out.args.back(), "COPY \"public\".\"users\" TO STDOUT");

    CommandSpec in = strategy_.buildTableRestoreCommand(endpoint_, "public.users");
    EXPECT_EQ(in.args.back(), "COPY \"public\".\"users\" FROM STDIN");

    EXPECT_EQ(PostgresSync::quoteQualifiedName("odd\"name"), "\"odd\"\"name\"");
}

TEST_F(PostgresCommandTest, ParsesVerboseProgressLines) {
    EXPECT_EQ(strategy_.parseProgressLine("pg_dump: dumping contents of table \"public.users\"").value_or(""),
              "public.users");
    EXPECT_EQ(strategy_.parseProgressLine("pg_restore: processing data for table \"public.orders\"").value_or(""),
              "public.orders");
    EXPECT_FALSE(strategy_.parseProgressLine("pg_dump: reading schemas").has_value());
}

TEST(MysqlCommandTest, ConnectionArgsAndDumpCommand) {
    Endpoint endpoint;
    endpoint.type = "mysql";
    endpoint.host = "mysql.internal";
    endpoint.database = "shop";
    endpoint.credentials.username = "root";
    endpoint.credentials.password = "pw";
    endpoint.sslMode = "require";

    std::vector<std::string> expected = {"-h", "mysql.internal", "-P", "3306", "-u", "root", "--ssl-mode=REQUIRED"};
    EXPECT_EQ(mysqlConnectionArgs(endpoint), expected);
    EXPECT_EQ(mysqlEnvironment(endpoint).at("MYSQL_PWD"), "pw");

    MysqlSync strategy;
    CommandSpec dump = strategy.buildDumpCommand(endpoint);
    EXPECT_EQ(dump.program, "mysqldump");
    EXPECT_TRUE(contains(dump.args, "--single-transaction"));
    EXPECT_FALSE(contains(dump.args, "--databases"));
    EXPECT_EQ(dump.args.back(), "shop");
    EXPECT_FALSE(contains(dump.args, "pw"));

    CommandSpec table = strategy.buildTableDumpCommand(endpoint, "users");
    EXPECT_EQ(table.args.back(), "users");
    EXPECT_EQ(strategy.buildTableRestoreCommand(endpoint, "users").args.back(), "shop");

    EXPECT_EQ(strategy.parseProgressLine("-- Retrieving table structure for table `users`...").value_or(""),
              "users");
    EXPECT_EQ(strategy.parseProgressLine("-- Dumping data for table `orders`").value_or(""), "orders");
    EXPECT_FALSE(strategy.parseProgressLine("-- Connecting to localhost...").has_value());
}

TEST(MysqlCommandTest, UnreachableServerIsConnectivityError) {
    Endpoint endpoint;
    endpoint.type = "mysql";
    endpoint.host = "mysql.internal";

    try {
        MysqlClientConnection conn(endpoint, "shop", "false");
        FAIL() << "expected SyncError";
    } catch (const SyncError& e) {
        EXPECT_EQ(e.getCategory(), SyncError::Category::CONNECTIVITY);
    }
}
