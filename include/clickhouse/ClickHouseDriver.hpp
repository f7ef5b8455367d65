#pragma once

/**
 * @file ClickHouseDriver.hpp
 * @brief DatabaseDriver for ClickHouse over its HTTP interface.
 */

#include "DatabaseDriver.hpp"
#include "ClickHouseHttpClient.hpp"

namespace dbbridge {

/**
 * @class ClickHouseDriver
 * @brief ClickHouse implementation of the driver capability set.
 *
 * Requests are independent HTTP calls; the driver keeps no connection.
 * Read-like statements (SELECT, SHOW, DESCRIBE, WITH) are sent with
 * FORMAT JSONEachRow and return rows. Anything else is sent as a command and
 * returns a single confirmation row.
 *
 * Defaults: database "default", user "default".
 */
class ClickHouseDriver : public DatabaseDriver {
public:
    ClickHouseDriver(ConnectionConfig config, const DriverSettings& settings);

    DatabaseType type() const override { return DatabaseType::ClickHouse; }

    TestConnectionResult testConnection() override;
    std::vector<TableInfo> listTables() override;
    TableDataResponse getTableData(const TableDataRequest& request) override;
    TableStructure getTableStructure(const std::string& schema, const std::string& table) override;
    QueryResult executeQuery(const std::string& sql) override;
    SchemaOverview getSchemaOverview() override;

    /**
     * @brief True for statements that produce rows.
     */
    static bool isReadQuery(const std::string& sql);

    const ClickHouseHttpClient& client() const { return m_client; }

private:
    ConnectionConfig m_config;
    ClickHouseHttpClient m_client;
};

}  // namespace dbbridge
