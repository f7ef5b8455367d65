#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "PostgreSQLDriver.hpp"
#include "ErrorHandler.hpp"
#include <algorithm>
#include <cstdlib>

using namespace dbbridge;
using ::testing::HasSubstr;
using ::testing::StartsWith;

namespace {

// DBBRIDGE_TEST_POSTGRES=user:password@host:port/database
std::optional<ConnectionConfig> liveConfig() {
    const char* env = std::getenv("DBBRIDGE_TEST_POSTGRES");
    if (!env || !*env) return std::nullopt;

    std::string target = env;
    ConnectionConfig config;
    config.db_type = DatabaseType::Postgres;
    config.database = "postgres";

    auto at = target.rfind('@');
    if (at != std::string::npos) {
        std::string credentials = target.substr(0, at);
        target = target.substr(at + 1);
        auto colon = credentials.find(':');
        config.username = credentials.substr(0, colon);
        if (colon != std::string::npos) config.password = credentials.substr(colon + 1);
    }
    auto slash = target.find('/');
    if (slash != std::string::npos) {
        config.database = target.substr(slash + 1);
        target = target.substr(0, slash);
    }
    auto colon = target.find(':');
    config.host = target.substr(0, colon);
    config.port = colon != std::string::npos ? static_cast<uint16_t>(std::stoi(target.substr(colon + 1))) : 5432;
    return config;
}

}  // namespace

class PostgreSQLDriverTest : public ::testing::Test {
protected:
    DriverSettings settings_;
};

TEST_F(PostgreSQLDriverTest, ConstructionDoesNotConnect) {
    ConnectionConfig config;
    config.host = "127.0.0.1";
    config.port = 1;

    PostgreSQLDriver driver(config, settings_);

    EXPECT_EQ(driver.type(), DatabaseType::Postgres);
    EXPECT_EQ(driver.config().port, 1);
}

TEST_F(PostgreSQLDriverTest, RefusedPortFailsTest) {
    ConnectionConfig config;
    config.host = "127.0.0.1";
    config.port = 1;
    config.database = "postgres";
    config.username = "postgres";
    settings_.timeouts.postgres_connect = std::chrono::seconds(2);

    PostgreSQLDriver driver(config, settings_);
    TestConnectionResult result = driver.testConnection();

    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.message, StartsWith("Connection failed: "));
}

TEST_F(PostgreSQLDriverTest, RefusedPortThrowsConnectionError) {
    ConnectionConfig config;
    config.host = "127.0.0.1";
    config.port = 1;
    settings_.timeouts.postgres_connect = std::chrono::seconds(2);

    PostgreSQLDriver driver(config, settings_);

    EXPECT_THROW(driver.listTables(), ConnectionError);
}

// Live server tests
class PostgreSQLLiveTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto config = liveConfig();
        if (!config) {
            GTEST_SKIP() << "DBBRIDGE_TEST_POSTGRES not set";
        }
        driver_ = std::make_unique<PostgreSQLDriver>(*config, settings_);

        QueryResult setup = driver_->executeQuery(
            "DROP TABLE IF EXISTS dbbridge_items;"
            "CREATE TABLE dbbridge_items (id SERIAL PRIMARY KEY, label TEXT NOT NULL, "
            "price NUMERIC(10,2), meta JSONB, active BOOLEAN DEFAULT true);"
            "INSERT INTO dbbridge_items (label, price, meta) VALUES "
            "('a', 1.50, '{\"k\":1}'), ('b', 2.50, NULL), ('c', 3.50, NULL), "
            "('d', 4.50, NULL), ('e', 5.50, NULL)");
        ASSERT_FALSE(setup.error.has_value()) << *setup.error;
    }

    void TearDown() override {
        if (driver_) {
            QueryResult result = driver_->executeQuery("DROP TABLE IF EXISTS dbbridge_items");
            EXPECT_FALSE(result.error.has_value());
        }
    }

    DriverSettings settings_;
    std::unique_ptr<PostgreSQLDriver> driver_;
};

TEST_F(PostgreSQLLiveTest, TestConnection) {
    TestConnectionResult result = driver_->testConnection();

    EXPECT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.message, "Connection successful!");
}

TEST_F(PostgreSQLLiveTest, ListTablesIncludesCreatedTable) {
    auto tables = driver_->listTables();

    auto it = std::find_if(tables.begin(), tables.end(),
                           [](const TableInfo& t) { return t.name == "dbbridge_items"; });
    ASSERT_NE(it, tables.end());
    EXPECT_EQ(it->schema, "public");
}

TEST_F(PostgreSQLLiveTest, PagedTableData) {
    TableDataRequest request;
    request.schema = "public";
    request.table = "dbbridge_items";
    request.page = 2;
    request.limit = 2;
    request.sortColumn = "id";

    TableDataResponse response = driver_->getTableData(request);

    EXPECT_EQ(response.total, 5u);
    ASSERT_EQ(response.data.size(), 2u);
    EXPECT_EQ(response.data[0]["label"], "c");
    EXPECT_DOUBLE_EQ(response.data[0]["price"].get<double>(), 3.5);
    EXPECT_EQ(response.data[0]["active"], true);
}

TEST_F(PostgreSQLLiveTest, TableStructure) {
    TableStructure structure = driver_->getTableStructure("public", "dbbridge_items");

    ASSERT_EQ(structure.columns.size(), 5u);
    EXPECT_EQ(structure.columns[0].name, "id");
    EXPECT_TRUE(structure.columns[0].primaryKey);
    EXPECT_FALSE(structure.columns[1].nullable);
}

TEST_F(PostgreSQLLiveTest, JsonbDecoded) {
    QueryResult result = driver_->executeQuery("SELECT meta FROM dbbridge_items WHERE label = 'a'");

    ASSERT_FALSE(result.error.has_value());
    ASSERT_EQ(result.data.size(), 1u);
    EXPECT_EQ(result.data[0]["meta"]["k"], 1);
}

TEST_F(PostgreSQLLiveTest, QueryErrorIsInline) {
    QueryResult result = driver_->executeQuery("SELECT * FROM dbbridge_missing_table");

    ASSERT_TRUE(result.error.has_value());
    EXPECT_THAT(*result.error, HasSubstr("dbbridge_missing_table"));
}
