#include "DriverFactory.hpp"
#include "ErrorHandler.hpp"
#include "SshTunnel.hpp"
#include "PostgreSQLDriver.hpp"
#include "SQLiteDriver.hpp"
#include "RedisDriver.hpp"
#include "ClickHouseDriver.hpp"
#include <spdlog/spdlog.h>

namespace dbbridge {

namespace {

// Member order matters: the driver is destroyed before the tunnel it uses.
struct DriverBundle {
    std::unique_ptr<SshTunnel> tunnel;
    std::unique_ptr<DatabaseDriver> driver;
};

}  // namespace

DefaultDriverFactory::DefaultDriverFactory(DriverSettings settings)
    : m_settings(std::move(settings)) {}

ConnectionConfig DefaultDriverFactory::applyDefaults(ConnectionConfig config) {
    switch (config.db_type) {
        case DatabaseType::SQLite:
            if (config.file_path.empty()) {
                throw ValidationError("File path is required for SQLite connections");
            }
            break;
        case DatabaseType::Redis:
            if (config.database.empty()) config.database = "0";
            break;
        case DatabaseType::ClickHouse:
            if (config.database.empty()) config.database = "default";
            if (config.username.empty()) config.username = "default";
            break;
        case DatabaseType::Postgres:
            break;
    }

    if (config.db_type != DatabaseType::SQLite) {
        config.host = config.effectiveHost();
        config.port = config.effectivePort();
    }
    if (config.ssh.enabled && config.ssh.port == 0) {
        config.ssh.port = 22;
    }
    return config;
}

ManagedDriver DefaultDriverFactory::create(const ConnectionConfig& source) {
    ConnectionConfig config = applyDefaults(source);
    auto bundle = std::make_shared<DriverBundle>();

    if (config.ssh.enabled) {
        if (config.db_type == DatabaseType::SQLite) {
            spdlog::warn("SSH tunnel ignored for SQLite connection '{}'", config.name);
        } else {
            bundle->tunnel = openTunnel(config);
            config.host = "127.0.0.1";
            config.port = bundle->tunnel->localPort();
        }
    }

    bundle->driver = createDriver(config);
    spdlog::debug("Created {} driver for {}:{}", databaseTypeToString(config.db_type),
                  config.db_type == DatabaseType::SQLite ? config.file_path : config.host, config.port);

    DatabaseDriver* driver = bundle->driver.get();
    return ManagedDriver(std::move(bundle), driver);
}

std::unique_ptr<SshTunnel> DefaultDriverFactory::openTunnel(const ConnectionConfig& config) const {
    if (config.ssh.host.empty() || config.ssh.user.empty()) {
        throw ValidationError("SSH host and user are required when SSH is enabled");
    }

    try {
        return std::make_unique<SshTunnel>(config.ssh, config.host, config.port, m_settings.timeouts.tunnel);
    } catch (const TimeoutError& e) {
        spdlog::error("SSH tunnel to {} timed out: {}", config.ssh.host, e.what());
        throw TimeoutError("SSH tunnel connection timed out after " +
                           std::to_string(m_settings.timeouts.tunnel.count()) + " seconds");
    } catch (const DatabaseError& e) {
        spdlog::error("SSH tunnel to {} failed: {}", config.ssh.host, e.what());
        throw ConnectionError(std::string("SSH tunnel failed: ") + e.what());
    }
}

std::unique_ptr<DatabaseDriver> DefaultDriverFactory::createDriver(const ConnectionConfig& config) const {
    switch (config.db_type) {
        case DatabaseType::Postgres:
            return std::make_unique<PostgreSQLDriver>(config, m_settings);
        case DatabaseType::SQLite:
            return std::make_unique<SQLiteDriver>(config);
        case DatabaseType::Redis:
            return std::make_unique<RedisDriver>(config, m_settings);
        case DatabaseType::ClickHouse:
            return std::make_unique<ClickHouseDriver>(config, m_settings);
    }
    throw UnsupportedOperationError("Unsupported database type");
}

}  // namespace dbbridge
