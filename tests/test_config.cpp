#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "Config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>

using namespace dbbridge;
using namespace std::chrono_literals;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create temp directory for test files
        tempDir_ = std::filesystem::temp_directory_path() / "dbbridge_config_test";
        std::filesystem::create_directories(tempDir_);
        unsetenv("DBBRIDGE_PASSWORD");
        unsetenv("DBBRIDGE_SSH_PASSWORD");
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
        unsetenv("DBBRIDGE_PASSWORD");
        unsetenv("DBBRIDGE_SSH_PASSWORD");
    }

    std::filesystem::path tempDir_;

    void writeConfigFile(const std::string& filename, const std::string& content) {
        std::ofstream file(tempDir_ / filename);
        file << content;
    }

    static Config configWith(const std::string& id, const ConnectionConfig& conn) {
        Config config;
        config.connection_id = id;
        config.connections[id] = conn;
        return config;
    }
};

// Default configuration tests
TEST_F(ConfigTest, DefaultConnectionConfig) {
    ConnectionConfig config;

    EXPECT_EQ(config.db_type, DatabaseType::Postgres);
    EXPECT_TRUE(config.host.empty());
    EXPECT_EQ(config.port, 0);
    EXPECT_TRUE(config.username.empty());
    EXPECT_TRUE(config.password.empty());
    EXPECT_FALSE(config.ssl);
    EXPECT_FALSE(config.ssh.enabled);
    EXPECT_EQ(config.ssh.port, 22);
}

TEST_F(ConfigTest, DefaultDriverSettings) {
    DriverSettings settings;

    EXPECT_EQ(settings.pool.postgres_max_connections, 5u);
    EXPECT_EQ(settings.pool.postgres_idle_timeout, 600s);
    EXPECT_EQ(settings.timeouts.postgres_connect, 15s);
    EXPECT_EQ(settings.timeouts.redis_connect, 10s);
    EXPECT_EQ(settings.timeouts.tunnel, 20s);
    EXPECT_EQ(settings.timeouts.clickhouse_request, 300s);
    EXPECT_EQ(settings.redis.scan_count, 100u);
    EXPECT_EQ(settings.redis.scan_max_iterations, 50u);
}

TEST_F(ConfigTest, DefaultConfig) {
    Config config;

    EXPECT_TRUE(config.connections.empty());
    EXPECT_EQ(config.connection_id, "cli");
    EXPECT_FALSE(config.debug);
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_TRUE(config.logging.file.empty());
}

// Database type helpers
TEST_F(ConfigTest, ParseDatabaseTypeAliases) {
    EXPECT_EQ(parseDatabaseType("postgres"), DatabaseType::Postgres);
    EXPECT_EQ(parseDatabaseType("PostgreSQL"), DatabaseType::Postgres);
    EXPECT_EQ(parseDatabaseType("sqlite3"), DatabaseType::SQLite);
    EXPECT_EQ(parseDatabaseType(" Redis "), DatabaseType::Redis);
    EXPECT_EQ(parseDatabaseType("CLICKHOUSE"), DatabaseType::ClickHouse);
    EXPECT_FALSE(parseDatabaseType("mysql").has_value());
    EXPECT_FALSE(parseDatabaseType("").has_value());
}

TEST_F(ConfigTest, DatabaseTypeToString) {
    EXPECT_EQ(databaseTypeToString(DatabaseType::Postgres), "postgres");
    EXPECT_EQ(databaseTypeToString(DatabaseType::SQLite), "sqlite");
    EXPECT_EQ(databaseTypeToString(DatabaseType::Redis), "redis");
    EXPECT_EQ(databaseTypeToString(DatabaseType::ClickHouse), "clickhouse");
}

TEST_F(ConfigTest, EffectivePortFallsBackToBackendDefault) {
    ConnectionConfig conn;
    conn.db_type = DatabaseType::Postgres;
    EXPECT_EQ(conn.effectivePort(), 5432);

    conn.db_type = DatabaseType::Redis;
    EXPECT_EQ(conn.effectivePort(), 6379);

    conn.db_type = DatabaseType::ClickHouse;
    EXPECT_EQ(conn.effectivePort(), 8123);

    conn.port = 9000;
    EXPECT_EQ(conn.effectivePort(), 9000);
}

TEST_F(ConfigTest, EffectiveHostDefaultsToLocalhost) {
    ConnectionConfig conn;
    EXPECT_EQ(conn.effectiveHost(), "localhost");

    conn.host = "db.internal";
    EXPECT_EQ(conn.effectiveHost(), "db.internal");
}

// Config file loading tests
TEST_F(ConfigTest, LoadFromValidFile) {
    writeConfigFile("valid.conf", R"(
[connection.main]
type = postgresql
name = Main database
host = pg.example.com
port = 5433
database = app
user = testuser
password = testpass
ssl = true

[pool]
postgres_max_connections = 8
postgres_idle_timeout = 120

[timeouts]
postgres_connect = 5
tunnel = 30

[redis]
scan_count = 500
scan_max_iterations = 10

[logging]
level = debug
file = /tmp/dbbridge.log
)");

    auto config = Config::loadFromFile(tempDir_ / "valid.conf");

    ASSERT_TRUE(config.has_value());
    ASSERT_EQ(config->connections.count("main"), 1u);
    const auto& conn = config->connections.at("main");
    EXPECT_EQ(conn.db_type, DatabaseType::Postgres);
    EXPECT_EQ(conn.name, "Main database");
    EXPECT_EQ(conn.host, "pg.example.com");
    EXPECT_EQ(conn.port, 5433);
    EXPECT_EQ(conn.database, "app");
    EXPECT_EQ(conn.username, "testuser");
    EXPECT_EQ(conn.password, "testpass");
    EXPECT_TRUE(conn.ssl);
    EXPECT_EQ(config->driver.pool.postgres_max_connections, 8u);
    EXPECT_EQ(config->driver.pool.postgres_idle_timeout, 120s);
    EXPECT_EQ(config->driver.timeouts.postgres_connect, 5s);
    EXPECT_EQ(config->driver.timeouts.tunnel, 30s);
    EXPECT_EQ(config->driver.redis.scan_count, 500u);
    EXPECT_EQ(config->driver.redis.scan_max_iterations, 10u);
    EXPECT_EQ(config->logging.level, "debug");
    EXPECT_EQ(config->logging.file, "/tmp/dbbridge.log");
}

TEST_F(ConfigTest, LoadFromNonExistentFile) {
    auto config = Config::loadFromFile("/nonexistent/path/config.conf");

    EXPECT_FALSE(config.has_value());
}

TEST_F(ConfigTest, LoadFromEmptyFile) {
    writeConfigFile("empty.conf", "");

    auto config = Config::loadFromFile(tempDir_ / "empty.conf");

    // Should still return a config with defaults
    ASSERT_TRUE(config.has_value());
    EXPECT_TRUE(config->connections.empty());
}

TEST_F(ConfigTest, LoadMultipleConnections) {
    writeConfigFile("multi.conf", R"(
[connection.cache]
type = redis
database = 2

[connection.local]
type = sqlite
file_path = "/var/lib/app/data.db"

[connection.olap]
type = clickhouse
host = ch.internal
)");

    auto config = Config::loadFromFile(tempDir_ / "multi.conf");

    ASSERT_TRUE(config.has_value());
    ASSERT_EQ(config->connections.size(), 3u);
    EXPECT_EQ(config->connections.at("cache").db_type, DatabaseType::Redis);
    EXPECT_EQ(config->connections.at("cache").database, "2");
    EXPECT_EQ(config->connections.at("local").db_type, DatabaseType::SQLite);
    EXPECT_EQ(config->connections.at("local").file_path, "/var/lib/app/data.db");
    EXPECT_EQ(config->connections.at("olap").effectivePort(), 8123);
}

TEST_F(ConfigTest, LoadSshSection) {
    writeConfigFile("ssh.conf", R"(
[connection.remote]
type = postgres
host = 10.0.0.5

[ssh.remote]
enabled = yes
host = bastion.example.com
port = 2222
user = deploy
key_path = ~/.ssh/id_ed25519
)");

    auto config = Config::loadFromFile(tempDir_ / "ssh.conf");

    ASSERT_TRUE(config.has_value());
    const auto& ssh = config->connections.at("remote").ssh;
    EXPECT_TRUE(ssh.enabled);
    EXPECT_EQ(ssh.host, "bastion.example.com");
    EXPECT_EQ(ssh.port, 2222);
    EXPECT_EQ(ssh.user, "deploy");
    EXPECT_EQ(ssh.key_path, "~/.ssh/id_ed25519");
}

TEST_F(ConfigTest, ConfigWithCommentsAndWhitespace) {
    writeConfigFile("comments.conf", R"(
# This is a comment
[connection.main]
; Another comment
  type = redis
  host = localhost
)");

    auto config = Config::loadFromFile(tempDir_ / "comments.conf");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->connections.at("main").db_type, DatabaseType::Redis);
    EXPECT_EQ(config->connections.at("main").host, "localhost");
}

TEST_F(ConfigTest, ConfigWithInvalidPort) {
    writeConfigFile("invalid.conf", R"(
[connection.main]
port = not_a_number
)");

    auto config = Config::loadFromFile(tempDir_ / "invalid.conf");
    EXPECT_FALSE(config.has_value());
}

TEST_F(ConfigTest, ConfigWithPortOutOfRange) {
    writeConfigFile("range.conf", R"(
[connection.main]
port = 70000
)");

    EXPECT_FALSE(Config::loadFromFile(tempDir_ / "range.conf").has_value());
}

TEST_F(ConfigTest, ConfigWithUnknownType) {
    writeConfigFile("type.conf", R"(
[connection.main]
type = mysql
)");

    EXPECT_FALSE(Config::loadFromFile(tempDir_ / "type.conf").has_value());
}

// Config validation tests
TEST_F(ConfigTest, ValidateWithConnection) {
    ConnectionConfig conn;
    conn.db_type = DatabaseType::Postgres;
    Config config = configWith("cli", conn);

    EXPECT_TRUE(config.validate());
}

TEST_F(ConfigTest, ValidateWithoutConnection) {
    Config config;

    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, ValidateSqliteWithoutFile) {
    ConnectionConfig conn;
    conn.db_type = DatabaseType::SQLite;

    EXPECT_FALSE(configWith("cli", conn).validate());

    conn.file_path = "/tmp/app.db";
    EXPECT_TRUE(configWith("cli", conn).validate());
}

TEST_F(ConfigTest, ValidateSshRequiresHostAndUser) {
    ConnectionConfig conn;
    conn.db_type = DatabaseType::Postgres;
    conn.ssh.enabled = true;
    conn.ssh.host = "bastion";

    EXPECT_FALSE(configWith("cli", conn).validate());

    conn.ssh.user = "deploy";
    EXPECT_TRUE(configWith("cli", conn).validate());
}

TEST_F(ConfigTest, ValidateRejectsSshForSqlite) {
    ConnectionConfig conn;
    conn.db_type = DatabaseType::SQLite;
    conn.file_path = "/tmp/app.db";
    conn.ssh.enabled = true;
    conn.ssh.host = "bastion";
    conn.ssh.user = "deploy";

    EXPECT_FALSE(configWith("cli", conn).validate());
}

TEST_F(ConfigTest, ValidateRejectsZeroLimit) {
    ConnectionConfig conn;
    Config config = configWith("cli", conn);
    config.command.limit = 0;

    EXPECT_FALSE(config.validate());
}

// Password resolution tests
TEST_F(ConfigTest, ResolvePasswordFromEnv) {
    ConnectionConfig conn;
    Config config = configWith("cli", conn);

    setenv("DBBRIDGE_PASSWORD", "env_password", 1);
    setenv("DBBRIDGE_SSH_PASSWORD", "env_ssh_password", 1);

    config.resolvePassword();

    EXPECT_EQ(config.connections.at("cli").password, "env_password");
    EXPECT_EQ(config.connections.at("cli").ssh.password, "env_ssh_password");
}

TEST_F(ConfigTest, ResolvePasswordKeepsExisting) {
    ConnectionConfig conn;
    conn.password = "existing_password";
    Config config = configWith("cli", conn);

    setenv("DBBRIDGE_PASSWORD", "env_password", 1);

    config.resolvePassword();

    // Should keep existing password
    EXPECT_EQ(config.connections.at("cli").password, "existing_password");
}

TEST_F(ConfigTest, ResolvePasswordNoEnvVar) {
    ConnectionConfig conn;
    Config config = configWith("cli", conn);

    config.resolvePassword();

    // Should remain empty
    EXPECT_TRUE(config.connections.at("cli").password.empty());
    EXPECT_TRUE(config.connections.at("cli").ssh.password.empty());
}
