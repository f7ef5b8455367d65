#include "Config.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>
#include <algorithm>
#include <cctype>

namespace dbbridge {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

bool parseBool(const std::string& value) {
    std::string lower = toLower(value);
    return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
}

uint16_t parsePort(const std::string& value) {
    int port = std::stoi(value);
    if (port < 0 || port > 65535) {
        throw std::out_of_range("port out of range: " + value);
    }
    return static_cast<uint16_t>(port);
}

// "connection.abc" -> {"connection", "abc"}
std::pair<std::string, std::string> splitSection(const std::string& section) {
    auto dot = section.find('.');
    if (dot == std::string::npos) {
        return {section, ""};
    }
    return {section.substr(0, dot), section.substr(dot + 1)};
}

void applyConnectionKey(ConnectionConfig& conn, const std::string& key, const std::string& value) {
    if (key == "type") {
        auto type = parseDatabaseType(value);
        if (!type) {
            throw std::invalid_argument("unknown database type: " + value);
        }
        conn.db_type = *type;
    }
    else if (key == "name") conn.name = value;
    else if (key == "host") conn.host = value;
    else if (key == "port") conn.port = parsePort(value);
    else if (key == "database") conn.database = value;
    else if (key == "user" || key == "username") conn.username = value;
    else if (key == "password") conn.password = value;
    else if (key == "ssl") conn.ssl = parseBool(value);
    else if (key == "file_path") conn.file_path = value;
    else spdlog::warn("Unknown connection option '{}'", key);
}

void applySshKey(SshConfig& ssh, const std::string& key, const std::string& value) {
    if (key == "enabled") ssh.enabled = parseBool(value);
    else if (key == "host") ssh.host = value;
    else if (key == "port") ssh.port = parsePort(value);
    else if (key == "user") ssh.user = value;
    else if (key == "password") ssh.password = value;
    else if (key == "key_path") ssh.key_path = value;
    else spdlog::warn("Unknown ssh option '{}'", key);
}

}  // namespace

// ============================================================================
// Database Type Helpers
// ============================================================================

std::optional<DatabaseType> parseDatabaseType(const std::string& str) {
    std::string lower = toLower(trim(str));
    if (lower == "postgres" || lower == "postgresql") return DatabaseType::Postgres;
    if (lower == "sqlite" || lower == "sqlite3") return DatabaseType::SQLite;
    if (lower == "redis") return DatabaseType::Redis;
    if (lower == "clickhouse") return DatabaseType::ClickHouse;
    return std::nullopt;
}

std::string databaseTypeToString(DatabaseType type) {
    switch (type) {
        case DatabaseType::Postgres: return "postgres";
        case DatabaseType::SQLite: return "sqlite";
        case DatabaseType::Redis: return "redis";
        case DatabaseType::ClickHouse: return "clickhouse";
    }
    return "unknown";
}

uint16_t defaultPort(DatabaseType type) {
    switch (type) {
        case DatabaseType::Postgres: return 5432;
        case DatabaseType::Redis: return 6379;
        case DatabaseType::ClickHouse: return 8123;
        case DatabaseType::SQLite: return 0;
    }
    return 0;
}

std::string ConnectionConfig::effectiveHost() const {
    return host.empty() ? "localhost" : host;
}

uint16_t ConnectionConfig::effectivePort() const {
    return port != 0 ? port : defaultPort(db_type);
}

// ============================================================================
// Configuration File
// ============================================================================

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;
    size_t line_number = 0;

    while (std::getline(file, line)) {
        ++line_number;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        // Key-value pair
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        auto [section, id] = splitSection(current_section);

        try {
            if (section == "connection" && !id.empty()) {
                applyConnectionKey(config.connections[id], key, value);
            }
            else if (section == "ssh" && !id.empty()) {
                applySshKey(config.connections[id].ssh, key, value);
            }
            else if (section == "pool") {
                if (key == "postgres_max_connections")
                    config.driver.pool.postgres_max_connections = static_cast<size_t>(std::stoul(value));
                else if (key == "postgres_idle_timeout")
                    config.driver.pool.postgres_idle_timeout = std::chrono::seconds(std::stoi(value));
                else if (key == "postgres_acquire_timeout")
                    config.driver.pool.postgres_acquire_timeout = std::chrono::seconds(std::stoi(value));
            }
            else if (section == "timeouts") {
                if (key == "postgres_connect")
                    config.driver.timeouts.postgres_connect = std::chrono::seconds(std::stoi(value));
                else if (key == "redis_connect")
                    config.driver.timeouts.redis_connect = std::chrono::seconds(std::stoi(value));
                else if (key == "tunnel")
                    config.driver.timeouts.tunnel = std::chrono::seconds(std::stoi(value));
                else if (key == "clickhouse_connect")
                    config.driver.timeouts.clickhouse_connect = std::chrono::seconds(std::stoi(value));
                else if (key == "clickhouse_request")
                    config.driver.timeouts.clickhouse_request = std::chrono::seconds(std::stoi(value));
            }
            else if (section == "redis") {
                if (key == "scan_count")
                    config.driver.redis.scan_count = static_cast<size_t>(std::stoul(value));
                else if (key == "scan_max_iterations")
                    config.driver.redis.scan_max_iterations = static_cast<uint32_t>(std::stoul(value));
            }
            else if (section == "logging") {
                if (key == "level") config.logging.level = value;
                else if (key == "file") config.logging.file = value;
            }
        } catch (const std::exception& e) {
            spdlog::error("{}:{}: invalid value for '{}': {}", path.string(), line_number, key, e.what());
            return std::nullopt;
        }
    }

    return config;
}

// ============================================================================
// Command Line
// ============================================================================

Config Config::parseArgs(int argc, char* argv[]) {
    Config config;
    ConnectionConfig cli_conn;

    CLI::App app{"dbbridge - query PostgreSQL, SQLite, Redis and ClickHouse through one interface"};
    app.require_subcommand(1);

    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");
    app.add_option("--id", config.connection_id, "Connection identifier from the configuration file");

    // Connection options
    std::string type_str;
    app.add_option("-t,--type", type_str, "Database type (postgres, sqlite, redis, clickhouse)");
    app.add_option("-H,--host", cli_conn.host, "Database server host");
    app.add_option("-P,--port", cli_conn.port, "Database server port (default depends on type)");
    app.add_option("-D,--database", cli_conn.database, "Database name (Redis: db index)");
    app.add_option("-u,--user", cli_conn.username, "Database username");
    app.add_option("-p,--password", cli_conn.password, "Database password (or DBBRIDGE_PASSWORD)");
    app.add_flag("--ssl", cli_conn.ssl, "Require TLS");
    app.add_option("--file", cli_conn.file_path, "SQLite database file");

    // SSH options
    app.add_option("--ssh-host", cli_conn.ssh.host, "SSH bastion host (enables tunneling)");
    app.add_option("--ssh-port", cli_conn.ssh.port, "SSH port")->default_val(22);
    app.add_option("--ssh-user", cli_conn.ssh.user, "SSH username");
    app.add_option("--ssh-password", cli_conn.ssh.password, "SSH password (or DBBRIDGE_SSH_PASSWORD)");
    app.add_option("--ssh-key", cli_conn.ssh.key_path, "SSH private key path");

    // Logging
    std::string log_level;
    std::string log_file;
    app.add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error)");
    app.add_option("--log-file", log_file, "Also write logs to this file");
    app.add_flag("-d,--debug", config.debug, "Enable debug output");

    CommandOptions& cmd = config.command;

    app.add_subcommand("test", "Test the connection");
    app.add_subcommand("tables", "List tables");
    app.add_subcommand("overview", "Print the schema overview");

    auto* data = app.add_subcommand("data", "Read a page of table rows");
    data->add_option("table", cmd.table, "Table name")->required();
    data->add_option("-s,--schema", cmd.schema, "Schema name");
    data->add_option("--page", cmd.page, "Page number (1-based)")->default_val(1);
    data->add_option("--limit", cmd.limit, "Rows per page")->default_val(100);
    std::string filter;
    std::string sort_column;
    std::string sort_direction;
    data->add_option("--filter", filter, "WHERE expression");
    data->add_option("--sort", sort_column, "Sort column");
    data->add_option("--direction", sort_direction, "ASC or DESC");

    auto* structure = app.add_subcommand("structure", "Describe a table");
    structure->add_option("table", cmd.table, "Table name")->required();
    structure->add_option("-s,--schema", cmd.schema, "Schema name");

    auto* query = app.add_subcommand("query", "Execute a statement");
    query->add_option("sql", cmd.sql, "SQL text or Redis command")->required();

    auto* keys = app.add_subcommand("keys", "Scan Redis keys");
    keys->add_option("pattern", cmd.pattern, "MATCH pattern")->default_val("*");
    keys->add_option("--limit", cmd.limit, "Maximum keys to return")->default_val(100);
    keys->add_option("--cursor", cmd.cursor, "Continuation cursor from a previous scan");

    auto* key = app.add_subcommand("key", "Show one Redis key");
    key->add_option("key", cmd.key, "Key name")->required();

    auto* mutate = app.add_subcommand("mutate", "Build SQL for a JSON row edit");
    mutate->add_option("file", cmd.mutation_file, "JSON edit request ('-' for stdin)")->required();
    mutate->add_flag("--execute", cmd.execute, "Execute the generated statement");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    for (auto* sub : app.get_subcommands()) {
        cmd.name = sub->get_name();
    }
    if (!filter.empty()) cmd.filter = filter;
    if (!sort_column.empty()) cmd.sort_column = sort_column;
    if (!sort_direction.empty()) cmd.sort_direction = sort_direction;

    // Load config file if specified
    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            config.connections = std::move(file_config->connections);
            config.driver = file_config->driver;
            config.logging = file_config->logging;
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    // Command line connection overrides the file entry with the same id
    if (!type_str.empty()) {
        auto type = parseDatabaseType(type_str);
        if (!type) {
            spdlog::error("Unknown database type '{}'", type_str);
            std::exit(2);
        }
        cli_conn.db_type = *type;
        cli_conn.ssh.enabled = !cli_conn.ssh.host.empty();
        if (cli_conn.name.empty()) {
            cli_conn.name = config.connection_id;
        }
        config.connections[config.connection_id] = cli_conn;
    }

    if (!log_level.empty()) config.logging.level = log_level;
    if (!log_file.empty()) config.logging.file = log_file;
    if (config.debug) config.logging.level = "debug";

    // Resolve passwords from environment if not set
    config.resolvePassword();

    return config;
}

bool Config::validate() const {
    auto it = connections.find(connection_id);
    if (it == connections.end()) {
        spdlog::error("No connection '{}' (use --type or a [connection.{}] section)",
                      connection_id, connection_id);
        return false;
    }

    const ConnectionConfig& conn = it->second;

    if (conn.db_type == DatabaseType::SQLite && conn.file_path.empty()) {
        spdlog::error("File path is required for SQLite connections (use --file)");
        return false;
    }

    if (conn.ssh.enabled) {
        if (conn.ssh.host.empty()) {
            spdlog::error("SSH tunneling enabled but no SSH host given");
            return false;
        }
        if (conn.ssh.user.empty()) {
            spdlog::error("SSH tunneling enabled but no SSH user given");
            return false;
        }
        if (conn.db_type == DatabaseType::SQLite) {
            spdlog::error("SSH tunneling is not available for SQLite connections");
            return false;
        }
    }

    if (command.page == 0 || command.limit == 0) {
        spdlog::error("Page and limit must be greater than zero");
        return false;
    }

    if (driver.pool.postgres_max_connections == 0) {
        spdlog::error("postgres_max_connections must be greater than zero");
        return false;
    }

    return true;
}

void Config::resolvePassword() {
    const char* env_pwd = std::getenv("DBBRIDGE_PASSWORD");
    const char* env_ssh_pwd = std::getenv("DBBRIDGE_SSH_PASSWORD");

    for (auto& [id, conn] : connections) {
        if (conn.password.empty() && env_pwd) {
            conn.password = env_pwd;
        }
        if (conn.ssh.password.empty() && env_ssh_pwd) {
            conn.ssh.password = env_ssh_pwd;
        }
    }
}

}  // namespace dbbridge
