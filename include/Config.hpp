#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <optional>
#include <filesystem>
#include <cstdint>

namespace dbbridge {

enum class DatabaseType {
    Postgres,
    SQLite,
    Redis,
    ClickHouse
};

// Accepts postgres|postgresql, sqlite|sqlite3, redis, clickhouse (case-insensitive)
std::optional<DatabaseType> parseDatabaseType(const std::string& str);
std::string databaseTypeToString(DatabaseType type);
uint16_t defaultPort(DatabaseType type);

struct SshConfig {
    bool enabled = false;
    std::string host;
    uint16_t port = 22;
    std::string user;
    std::string password;
    std::string key_path;
};

// Snapshot of one persisted connection record
struct ConnectionConfig {
    DatabaseType db_type = DatabaseType::Postgres;
    std::string name;
    std::string host;      // empty selects the backend default
    uint16_t port = 0;     // 0 selects the backend default
    std::string database;
    std::string username;
    std::string password;
    bool ssl = false;
    std::string file_path; // SQLite only
    SshConfig ssh;

    std::string effectiveHost() const;
    uint16_t effectivePort() const;
};

struct PoolConfig {
    size_t postgres_max_connections = 5;
    std::chrono::seconds postgres_idle_timeout{600};
    std::chrono::seconds postgres_acquire_timeout{30};
};

struct TimeoutConfig {
    std::chrono::seconds postgres_connect{15};
    std::chrono::seconds redis_connect{10};
    std::chrono::seconds tunnel{20};
    std::chrono::seconds clickhouse_connect{10};
    std::chrono::seconds clickhouse_request{300};
};

struct RedisScanConfig {
    size_t scan_count = 100;
    uint32_t scan_max_iterations = 50;
};

// Tunables handed to driver construction
struct DriverSettings {
    PoolConfig pool;
    TimeoutConfig timeouts;
    RedisScanConfig redis;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

// Operation selected on the command line
struct CommandOptions {
    std::string name;
    std::string schema;
    std::string table;
    uint32_t page = 1;
    uint32_t limit = 100;
    std::optional<std::string> filter;
    std::optional<std::string> sort_column;
    std::optional<std::string> sort_direction;
    std::string sql;
    std::string pattern = "*";
    std::string key;
    std::string cursor;
    std::string mutation_file;
    bool execute = false;
};

struct Config {
    std::map<std::string, ConnectionConfig> connections;
    DriverSettings driver;
    LoggingConfig logging;
    CommandOptions command;

    std::string connection_id = "cli";
    bool debug = false;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments
    static Config parseArgs(int argc, char* argv[]);

    // Validate configuration
    bool validate() const;

    // Get passwords from environment if not set
    void resolvePassword();
};

}  // namespace dbbridge
