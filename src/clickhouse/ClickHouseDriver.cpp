/**
 * @file ClickHouseDriver.cpp
 * @brief Implementation of the ClickHouse driver.
 */

#include "ClickHouseDriver.hpp"
#include "ClickHouseFormatConverter.hpp"
#include "ClickHouseSchemaManager.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace dbbridge {

namespace {

ConnectionConfig withDefaults(ConnectionConfig config) {
    if (config.database.empty()) config.database = "default";
    if (config.username.empty()) config.username = "default";
    return config;
}

uint64_t elapsedSince(std::chrono::steady_clock::time_point start) {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count());
}

}  // namespace

ClickHouseDriver::ClickHouseDriver(ConnectionConfig config, const DriverSettings& settings)
    : m_config(withDefaults(std::move(config))),
      m_client(m_config.effectiveHost(), m_config.effectivePort(), m_config.ssl,
               m_config.database, m_config.username, m_config.password,
               settings.timeouts.clickhouse_connect, settings.timeouts.clickhouse_request) {
    spdlog::debug("ClickHouse driver for {} (database {})", m_client.url(), m_config.database);
}

bool ClickHouseDriver::isReadQuery(const std::string& sql) {
    std::string upper = FormatConverter::toUpper(FormatConverter::trim(sql));
    for (const char* prefix : {"SELECT", "SHOW", "DESCRIBE", "WITH"}) {
        if (upper.rfind(prefix, 0) == 0) return true;
    }
    return false;
}

// ============================================================================
// Driver Operations
// ============================================================================

TestConnectionResult ClickHouseDriver::testConnection() {
    try {
        m_client.query("SELECT 1");
        return {true, "Connection successful!"};
    } catch (const DatabaseError& e) {
        spdlog::debug("ClickHouse connection test failed: {}", e.what());
        return {false, std::string("Connection failed: ") + e.what()};
    }
}

std::vector<TableInfo> ClickHouseDriver::listTables() {
    return ClickHouseSchemaManager::listTables(m_client);
}

TableDataResponse ClickHouseDriver::getTableData(const TableDataRequest& request) {
    std::string database = request.schema.empty() ? m_config.database : request.schema;
    std::string tableName = ClickHouseFormatConverter::qualifiedName(database, request.table);

    std::string whereClause;
    if (request.filter && !FormatConverter::trim(*request.filter).empty()) {
        whereClause = " WHERE " + FormatConverter::normalizeFilter(*request.filter);
    }

    std::string orderClause;
    if (request.sortColumn && !request.sortColumn->empty()) {
        orderClause = " ORDER BY " + ClickHouseFormatConverter::escapeIdentifier(*request.sortColumn) +
                      " " + FormatConverter::normalizeSortDirection(request.sortDirection);
    }

    TableDataResponse response;
    response.page = request.page;
    response.limit = request.limit;

    std::vector<Value> count = m_client.query("SELECT count() AS count FROM " + tableName + whereClause);
    if (!count.empty()) {
        response.total = FormatConverter::countFromValue(count.front().value("count", Value()));
    }

    response.data = m_client.query("SELECT * FROM " + tableName + whereClause + orderClause +
                                   " LIMIT " + std::to_string(request.limit) +
                                   " OFFSET " + std::to_string(request.offset()));
    return response;
}

TableStructure ClickHouseDriver::getTableStructure(const std::string& schema, const std::string& table) {
    std::string database = schema.empty() ? m_config.database : schema;

    TableStructure structure;
    structure.columns = ClickHouseSchemaManager::getColumns(m_client, database, table);
    structure.indexes = ClickHouseSchemaManager::getIndexes(m_client, database, table);
    return structure;
}

QueryResult ClickHouseDriver::executeQuery(const std::string& sql) {
    auto start = std::chrono::steady_clock::now();

    QueryResult result;
    try {
        if (isReadQuery(sql)) {
            result.data = m_client.query(sql);
            result.rowCount = result.data.size();
        } else {
            m_client.command(sql);
            result.data.push_back({{"result", "Query executed successfully"}});
            result.rowCount = 0;
        }
    } catch (const QueryError& e) {
        result.data.clear();
        result.rowCount = 0;
        result.error = e.what();
    }

    result.timeTakenMs = elapsedSince(start);
    return result;
}

SchemaOverview ClickHouseDriver::getSchemaOverview() {
    return ClickHouseSchemaManager::getSchemaOverview(m_client);
}

}  // namespace dbbridge
