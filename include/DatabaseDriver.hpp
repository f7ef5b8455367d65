#pragma once

#include "Config.hpp"
#include "Models.hpp"
#include <string>
#include <vector>

namespace dbbridge {

/**
 * Capability interface shared by the PostgreSQL, SQLite, Redis and
 * ClickHouse drivers.
 *
 * Error contract:
 * - testConnection() never throws; failures are reported in the result
 * - executeQuery() reports statement errors in QueryResult::error
 * - every other failure is thrown as a DatabaseError subclass
 *
 * A driver instance may be used from several threads at once.
 */
class DatabaseDriver {
public:
    virtual ~DatabaseDriver() = default;

    DatabaseDriver(const DatabaseDriver&) = delete;
    DatabaseDriver& operator=(const DatabaseDriver&) = delete;

    virtual DatabaseType type() const = 0;

    virtual TestConnectionResult testConnection() = 0;

    virtual std::vector<TableInfo> listTables() = 0;

    virtual TableDataResponse getTableData(const TableDataRequest& request) = 0;

    virtual TableStructure getTableStructure(const std::string& schema, const std::string& table) = 0;

    virtual QueryResult executeQuery(const std::string& sql) = 0;

    virtual SchemaOverview getSchemaOverview() = 0;

protected:
    DatabaseDriver() = default;
};

}  // namespace dbbridge
