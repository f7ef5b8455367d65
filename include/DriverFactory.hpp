#pragma once

/**
 * @file DriverFactory.hpp
 * @brief Builds drivers, and the SSH tunnels they run through, from a ConnectionConfig.
 */

#include "Config.hpp"
#include "DatabaseDriver.hpp"
#include <memory>

namespace dbbridge {

class SshTunnel;

/**
 * @brief Shared handle to a driver.
 *
 * When the connection goes through SSH the handle also owns the tunnel. The
 * driver is destroyed first and the tunnel closes when the last handle is
 * released.
 */
using ManagedDriver = std::shared_ptr<DatabaseDriver>;

class DriverFactory {
public:
    virtual ~DriverFactory() = default;

    /**
     * @brief Create a driver; opens the tunnel first when SSH is enabled.
     *
     * @throws ValidationError for an unusable configuration.
     * @throws ConnectionError / TimeoutError if the tunnel cannot be opened.
     */
    virtual ManagedDriver create(const ConnectionConfig& config) = 0;
};

/**
 * @class DefaultDriverFactory
 * @brief Factory for the built-in PostgreSQL, SQLite, Redis and ClickHouse drivers.
 */
class DefaultDriverFactory : public DriverFactory {
public:
    explicit DefaultDriverFactory(DriverSettings settings = {});

    ManagedDriver create(const ConnectionConfig& config) override;

    /**
     * @brief Fill per-backend defaults (host, port, database, user).
     *
     * @throws ValidationError if an SQLite connection has no file path.
     */
    static ConnectionConfig applyDefaults(ConnectionConfig config);

    const DriverSettings& settings() const { return m_settings; }

private:
    std::unique_ptr<SshTunnel> openTunnel(const ConnectionConfig& config) const;
    std::unique_ptr<DatabaseDriver> createDriver(const ConnectionConfig& config) const;

    DriverSettings m_settings;
};

}  // namespace dbbridge
