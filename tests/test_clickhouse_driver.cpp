#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "ClickHouseDriver.hpp"
#include "ErrorHandler.hpp"
#include <cstdlib>

using namespace dbbridge;
using ::testing::StartsWith;

class ClickHouseDriverTest : public ::testing::Test {
protected:
    ClickHouseDriverTest() {
        config_.db_type = DatabaseType::ClickHouse;
        config_.host = "127.0.0.1";
        config_.port = 1;
        settings_.timeouts.clickhouse_connect = std::chrono::seconds(2);
        settings_.timeouts.clickhouse_request = std::chrono::seconds(5);
    }

    ConnectionConfig config_;
    DriverSettings settings_;
};

TEST_F(ClickHouseDriverTest, ReadQueryDetection) {
    EXPECT_TRUE(ClickHouseDriver::isReadQuery("SELECT 1"));
    EXPECT_TRUE(ClickHouseDriver::isReadQuery("  select * from t"));
    EXPECT_TRUE(ClickHouseDriver::isReadQuery("show tables"));
    EXPECT_TRUE(ClickHouseDriver::isReadQuery("DESCRIBE TABLE t"));
    EXPECT_TRUE(ClickHouseDriver::isReadQuery("WITH x AS (SELECT 1) SELECT * FROM x"));

    EXPECT_FALSE(ClickHouseDriver::isReadQuery("INSERT INTO t VALUES (1)"));
    EXPECT_FALSE(ClickHouseDriver::isReadQuery("CREATE TABLE t (x UInt8) ENGINE = Memory"));
    EXPECT_FALSE(ClickHouseDriver::isReadQuery(""));
}

TEST_F(ClickHouseDriverTest, RowFormatAppended) {
    EXPECT_EQ(ClickHouseHttpClient::withRowFormat("SELECT 1"), "SELECT 1 FORMAT JSONEachRow");
    EXPECT_EQ(ClickHouseHttpClient::withRowFormat("  SELECT 1 ;; "), "SELECT 1 FORMAT JSONEachRow");
}

TEST_F(ClickHouseDriverTest, ExistingFormatKept) {
    EXPECT_EQ(ClickHouseHttpClient::withRowFormat("SELECT 1 FORMAT CSV;"), "SELECT 1 FORMAT CSV");
    EXPECT_EQ(ClickHouseHttpClient::withRowFormat("select 1 format TSV"), "select 1 format TSV");
}

TEST_F(ClickHouseDriverTest, DefaultsApplied) {
    ClickHouseDriver driver(config_, settings_);

    EXPECT_EQ(driver.type(), DatabaseType::ClickHouse);
    EXPECT_EQ(driver.client().database(), "default");
    EXPECT_EQ(driver.client().url(), "http://127.0.0.1:1/?database=default");
}

TEST_F(ClickHouseDriverTest, DatabaseIsUrlEncoded) {
    config_.database = "my db";
    config_.ssl = true;
    config_.port = 8443;

    ClickHouseDriver driver(config_, settings_);

    EXPECT_EQ(driver.client().url(), "https://127.0.0.1:8443/?database=my%20db");
}

TEST_F(ClickHouseDriverTest, RefusedPortFailsTest) {
    ClickHouseDriver driver(config_, settings_);

    TestConnectionResult result = driver.testConnection();

    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.message, StartsWith("Connection failed: "));
}

TEST_F(ClickHouseDriverTest, TransportFailureThrows) {
    ClickHouseDriver driver(config_, settings_);

    EXPECT_THROW(driver.executeQuery("SELECT 1"), ConnectionError);
    EXPECT_THROW(driver.listTables(), ConnectionError);
}

// Live server tests
class ClickHouseLiveTest : public ::testing::Test {
protected:
    void SetUp() override {
        // DBBRIDGE_TEST_CLICKHOUSE=host:port
        const char* env = std::getenv("DBBRIDGE_TEST_CLICKHOUSE");
        if (!env || !*env) {
            GTEST_SKIP() << "DBBRIDGE_TEST_CLICKHOUSE not set";
        }

        std::string target = env;
        ConnectionConfig config;
        config.db_type = DatabaseType::ClickHouse;
        auto colon = target.find(':');
        config.host = target.substr(0, colon);
        config.port = colon != std::string::npos ? static_cast<uint16_t>(std::stoi(target.substr(colon + 1))) : 8123;

        driver_ = std::make_unique<ClickHouseDriver>(config, settings_);
        exec("DROP TABLE IF EXISTS dbbridge_events");
        exec("CREATE TABLE dbbridge_events (id UInt32, name String) ENGINE = MergeTree ORDER BY id");
        exec("INSERT INTO dbbridge_events VALUES (1, 'a'), (2, 'b'), (3, 'c')");
    }

    void TearDown() override {
        if (driver_) exec("DROP TABLE IF EXISTS dbbridge_events");
    }

    void exec(const std::string& sql) {
        QueryResult result = driver_->executeQuery(sql);
        ASSERT_FALSE(result.error.has_value()) << *result.error;
    }

    DriverSettings settings_;
    std::unique_ptr<ClickHouseDriver> driver_;
};

TEST_F(ClickHouseLiveTest, TestConnection) {
    TestConnectionResult result = driver_->testConnection();

    EXPECT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.message, "Connection successful!");
}

TEST_F(ClickHouseLiveTest, CommandConfirmation) {
    QueryResult result = driver_->executeQuery("INSERT INTO dbbridge_events VALUES (4, 'd')");

    EXPECT_EQ(result.rowCount, 0u);
    ASSERT_EQ(result.data.size(), 1u);
    EXPECT_EQ(result.data[0]["result"], "Query executed successfully");
}

TEST_F(ClickHouseLiveTest, PagedTableData) {
    TableDataRequest request;
    request.table = "dbbridge_events";
    request.page = 2;
    request.limit = 2;
    request.sortColumn = "id";

    TableDataResponse response = driver_->getTableData(request);

    EXPECT_EQ(response.total, 3u);
    ASSERT_EQ(response.data.size(), 1u);
    EXPECT_EQ(response.data[0]["name"], "c");
}

TEST_F(ClickHouseLiveTest, ServerErrorIsInline) {
    QueryResult result = driver_->executeQuery("SELECT * FROM dbbridge_missing");

    ASSERT_TRUE(result.error.has_value());
    EXPECT_TRUE(result.data.empty());
}
