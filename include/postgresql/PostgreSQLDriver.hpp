#pragma once

/**
 * @file PostgreSQLDriver.hpp
 * @brief DatabaseDriver backed by a lazily created libpq connection pool.
 */

#include "DatabaseDriver.hpp"
#include "PostgreSQLConnectionPool.hpp"
#include <memory>
#include <shared_mutex>

namespace dbbridge {

/**
 * @class PostgreSQLDriver
 * @brief PostgreSQL implementation of the driver capability set.
 *
 * Pool Lifecycle:
 * - The pool is created on first use and shared by concurrent callers
 * - A transport failure (reset, broken pipe, closed socket) discards the
 *   failing connection and the whole pool; the next call builds a new one
 * - A failed pool initialization is reset and attempted once more
 *
 * Errors:
 * - Unreachable server: ConnectionError "Failed to connect to PostgreSQL: ..."
 * - Connect deadline: TimeoutError "Connection timed out after N seconds"
 * - executeQuery() reports statement errors inline in QueryResult::error
 */
class PostgreSQLDriver : public DatabaseDriver {
public:
    /**
     * @param config Connection settings with host and port already resolved
     *        (tunnel endpoint when an SSH tunnel is in use).
     */
    PostgreSQLDriver(ConnectionConfig config, const DriverSettings& settings);
    ~PostgreSQLDriver() override;

    DatabaseType type() const override { return DatabaseType::Postgres; }

    TestConnectionResult testConnection() override;
    std::vector<TableInfo> listTables() override;
    TableDataResponse getTableData(const TableDataRequest& request) override;
    TableStructure getTableStructure(const std::string& schema, const std::string& table) override;
    QueryResult executeQuery(const std::string& sql) override;
    SchemaOverview getSchemaOverview() override;

    /**
     * @brief Drain and forget the current pool.
     */
    void resetPool();

    const ConnectionConfig& config() const { return m_config; }

private:
    std::shared_ptr<PostgreSQLConnectionPool> getPool();
    std::unique_ptr<PostgreSQLConnection> acquireConnection();

    template<typename Func>
    auto withConnection(const char* operation, Func&& fn);

    ConnectionConfig m_config;
    PostgreSQLPoolOptions m_poolOptions;

    std::shared_ptr<PostgreSQLConnectionPool> m_pool;
    mutable std::shared_mutex m_poolMutex;
};

}  // namespace dbbridge
