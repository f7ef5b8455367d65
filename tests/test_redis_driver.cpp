#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "RedisDriver.hpp"
#include "ErrorHandler.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cstdlib>
#include <set>
#include <thread>

using namespace dbbridge;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::StartsWith;

class RedisDriverTest : public ::testing::Test {
protected:
    RedisDriverTest() {
        config_.db_type = DatabaseType::Redis;
        config_.host = "127.0.0.1";
        config_.port = 1;
        settings_.timeouts.redis_connect = std::chrono::seconds(2);
    }

    ConnectionConfig config_;
    DriverSettings settings_;
};

// Command tokenizer tests
TEST_F(RedisDriverTest, TokenizeWhitespace) {
    EXPECT_THAT(RedisDriver::tokenizeCommand("  GET   user:1 "), ElementsAre("GET", "user:1"));
}

TEST_F(RedisDriverTest, TokenizeQuotedArgument) {
    EXPECT_THAT(RedisDriver::tokenizeCommand("SET greeting \"hello world\""),
                ElementsAre("SET", "greeting", "hello world"));
}

TEST_F(RedisDriverTest, TokenizeEscapedQuoteAndEmptyString) {
    EXPECT_THAT(RedisDriver::tokenizeCommand("SET k \"say \\\"hi\\\"\""), ElementsAre("SET", "k", "say \"hi\""));
    EXPECT_THAT(RedisDriver::tokenizeCommand("SET k \"\""), ElementsAre("SET", "k", ""));
}

TEST_F(RedisDriverTest, TokenizeEmpty) {
    EXPECT_TRUE(RedisDriver::tokenizeCommand("   ").empty());
}

// Construction tests
TEST_F(RedisDriverTest, DatabaseIndexParsed) {
    config_.database = "3";
    RedisDriver driver(config_, settings_);

    EXPECT_EQ(driver.database(), 3);
    EXPECT_EQ(driver.type(), DatabaseType::Redis);
}

TEST_F(RedisDriverTest, InvalidDatabaseIndexRejected) {
    config_.database = "cache";
    EXPECT_THROW(RedisDriver(config_, settings_), ValidationError);

    config_.database = "-1";
    EXPECT_THROW(RedisDriver(config_, settings_), ValidationError);
}

TEST_F(RedisDriverTest, TlsRefusedPortFailsTest) {
    config_.ssl = true;
    RedisDriver driver(config_, settings_);

    TestConnectionResult result = driver.testConnection();

    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.message, StartsWith("Connection failed: "));
}

TEST_F(RedisDriverTest, TlsHandshakeWithPlainPeerFails) {
    // A peer that accepts and hangs up never completes a TLS handshake
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ASSERT_EQ(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    ASSERT_EQ(::listen(fd, 1), 0);
    socklen_t len = sizeof(addr);
    ASSERT_EQ(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len), 0);

    std::thread peer([fd]() {
        int client = ::accept(fd, nullptr, nullptr);
        if (client >= 0) ::close(client);
    });

    config_.ssl = true;
    config_.port = ntohs(addr.sin_port);
    RedisDriver driver(config_, settings_);
    TestConnectionResult result = driver.testConnection();

    peer.join();
    ::close(fd);

    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.message, HasSubstr("TLS"));
}

// Behavior without a server
TEST_F(RedisDriverTest, RefusedPortFailsTest) {
    RedisDriver driver(config_, settings_);

    TestConnectionResult result = driver.testConnection();

    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.message, StartsWith("Connection failed: "));
}

TEST_F(RedisDriverTest, KeyspaceListing) {
    RedisDriver driver(config_, settings_);

    auto tables = driver.listTables();

    ASSERT_EQ(tables.size(), 1u);
    EXPECT_EQ(tables[0].type, "keyspace");
    EXPECT_TRUE(driver.getSchemaOverview().tables.empty());
}

TEST_F(RedisDriverTest, EmptyCommandReportedInline) {
    RedisDriver driver(config_, settings_);

    QueryResult result = driver.executeQuery("   ");

    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, "Empty query");
}

TEST_F(RedisDriverTest, ArgumentsValidatedBeforeConnecting) {
    RedisDriver driver(config_, settings_);

    EXPECT_THROW(driver.searchKeys("*", 0), ValidationError);
    EXPECT_THROW(driver.searchKeys("*", 10, "not-a-cursor"), ValidationError);
    EXPECT_THROW(driver.getKeyDetails(""), ValidationError);
    EXPECT_THROW(driver.setStringKey("k", "v", 0), ValidationError);
    EXPECT_THROW(driver.setListKey("k", {}, std::nullopt), ValidationError);
    EXPECT_THROW(driver.setHashKey("k", {}, std::nullopt), ValidationError);
    EXPECT_THROW(driver.updateTtl("", 10), ValidationError);
}

// Live server tests
class RedisLiveTest : public ::testing::Test {
protected:
    void SetUp() override {
        // DBBRIDGE_TEST_REDIS=host:port
        const char* env = std::getenv("DBBRIDGE_TEST_REDIS");
        if (!env || !*env) {
            GTEST_SKIP() << "DBBRIDGE_TEST_REDIS not set";
        }

        std::string target = env;
        ConnectionConfig config;
        config.db_type = DatabaseType::Redis;
        auto colon = target.find(':');
        config.host = target.substr(0, colon);
        config.port = colon != std::string::npos ? static_cast<uint16_t>(std::stoi(target.substr(colon + 1))) : 6379;
        config.database = "15";

        driver_ = std::make_unique<RedisDriver>(config, settings_);
        for (int i = 0; i < 5; ++i) {
            driver_->setStringKey(prefix_ + std::to_string(i), "v" + std::to_string(i), std::nullopt);
        }
    }

    void TearDown() override {
        if (!driver_) return;
        for (int i = 0; i < 5; ++i) {
            driver_->deleteKey(prefix_ + std::to_string(i));
        }
        for (const char* suffix : {"list", "hash", "zset"}) {
            driver_->deleteKey(prefix_ + suffix);
        }
    }

    DriverSettings settings_;
    std::unique_ptr<RedisDriver> driver_;
    std::string prefix_ = "dbbridge:test:";
};

TEST_F(RedisLiveTest, Ping) {
    EXPECT_TRUE(driver_->testConnection().success);
}

TEST_F(RedisLiveTest, SearchStopsAtLimit) {
    RedisKeyListResponse response = driver_->searchKeys(prefix_ + "?", 2);

    EXPECT_LE(response.keys.size(), 2u);
    EXPECT_FALSE(response.scanComplete);
    EXPECT_NE(response.cursor, "0");
}

TEST_F(RedisLiveTest, SearchResumesFromCursor) {
    std::set<std::string> seen;
    std::string cursor;
    bool complete = false;

    for (int page = 0; page < 10 && !complete; ++page) {
        RedisKeyListResponse response = driver_->searchKeys(prefix_ + "?", 2, cursor);
        for (const auto& key : response.keys) {
            EXPECT_EQ(key.type, "string");
            seen.insert(key.key);
        }
        cursor = response.cursor;
        complete = response.scanComplete;
    }

    EXPECT_TRUE(complete);
    EXPECT_EQ(seen.size(), 5u);
}

TEST_F(RedisLiveTest, ProgressReported) {
    int calls = 0;
    driver_->searchKeys(prefix_ + "*", 100, "",
                        [&calls](uint32_t iteration, uint32_t maxIterations, size_t, const std::vector<std::string>&) {
                            EXPECT_LE(iteration, maxIterations);
                            calls++;
                        });

    EXPECT_GE(calls, 1);
}

TEST_F(RedisLiveTest, KeyDetailsForEachType) {
    driver_->setListKey(prefix_ + "list", {"a", "b", "c"}, std::nullopt);
    driver_->setHashKey(prefix_ + "hash", {{"f1", "x"}, {"f2", "y"}}, 120);
    driver_->setZsetKey(prefix_ + "zset", {{"alice", 1.5}, {"bob", 2.0}}, std::nullopt);

    RedisKeyDetails list = driver_->getKeyDetails(prefix_ + "list");
    EXPECT_EQ(list.type, "list");
    EXPECT_EQ(list.value.size(), 3u);
    EXPECT_EQ(list.length.value_or(0), 3);

    RedisKeyDetails hash = driver_->getKeyDetails(prefix_ + "hash");
    EXPECT_EQ(hash.type, "hash");
    EXPECT_EQ(hash.value["f2"], "y");
    EXPECT_GT(hash.ttl, 0);

    RedisKeyDetails zset = driver_->getKeyDetails(prefix_ + "zset");
    EXPECT_EQ(zset.type, "zset");
    ASSERT_EQ(zset.value.size(), 2u);
    EXPECT_EQ(zset.value[0][0], "alice");
}

TEST_F(RedisLiveTest, ReplaceListIsAtomic) {
    driver_->setListKey(prefix_ + "list", {"old1", "old2"}, std::nullopt);
    driver_->setListKey(prefix_ + "list", {"new"}, std::nullopt);

    RedisKeyDetails list = driver_->getKeyDetails(prefix_ + "list");
    EXPECT_EQ(list.value, Value::array({"new"}));
}

TEST_F(RedisLiveTest, UpdateTtl) {
    std::string key = prefix_ + "0";

    driver_->updateTtl(key, 300);
    EXPECT_GT(driver_->getKeyDetails(key).ttl, 0);

    driver_->updateTtl(key, std::nullopt);
    EXPECT_EQ(driver_->getKeyDetails(key).ttl, -1);
}

TEST_F(RedisLiveTest, MissingKey) {
    EXPECT_THROW(driver_->getKeyDetails(prefix_ + "missing"), QueryError);
    EXPECT_FALSE(driver_->deleteKey(prefix_ + "missing"));
}

TEST_F(RedisLiveTest, ExecuteCommand) {
    QueryResult result = driver_->executeQuery("GET " + prefix_ + "1");

    ASSERT_FALSE(result.error.has_value());
    ASSERT_EQ(result.data.size(), 1u);
    EXPECT_EQ(result.data[0], "v1");
}

TEST_F(RedisLiveTest, CommandErrorReportedInline) {
    QueryResult result = driver_->executeQuery("LPUSH " + prefix_ + "1 x");

    ASSERT_TRUE(result.error.has_value());
    EXPECT_THAT(*result.error, HasSubstr("WRONGTYPE"));
}
