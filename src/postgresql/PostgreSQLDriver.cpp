/**
 * @file PostgreSQLDriver.cpp
 * @brief Implementation of the PostgreSQL driver.
 */

#include "PostgreSQLDriver.hpp"
#include "PostgreSQLFormatConverter.hpp"
#include "PostgreSQLResultSet.hpp"
#include "PostgreSQLSchemaManager.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <mutex>

namespace dbbridge {

PostgreSQLDriver::PostgreSQLDriver(ConnectionConfig config, const DriverSettings& settings)
    : m_config(std::move(config)) {
    m_poolOptions.maxConnections = settings.pool.postgres_max_connections;
    m_poolOptions.idleTimeout = settings.pool.postgres_idle_timeout;
    m_poolOptions.acquireTimeout = settings.pool.postgres_acquire_timeout;
    m_poolOptions.connectTimeout = settings.timeouts.postgres_connect;
}

PostgreSQLDriver::~PostgreSQLDriver() {
    resetPool();
}

// ============================================================================
// Pool Management
// ============================================================================

std::shared_ptr<PostgreSQLConnectionPool> PostgreSQLDriver::getPool() {
    {
        std::shared_lock<std::shared_mutex> lock(m_poolMutex);
        if (m_pool) return m_pool;
    }

    std::unique_lock<std::shared_mutex> lock(m_poolMutex);
    if (!m_pool) {
        m_pool = PostgreSQLConnectionPool::create(m_config, m_poolOptions);
    }
    return m_pool;
}

void PostgreSQLDriver::resetPool() {
    std::shared_ptr<PostgreSQLConnectionPool> old;
    {
        std::unique_lock<std::shared_mutex> lock(m_poolMutex);
        old.swap(m_pool);
    }
    if (old) {
        old->drain();
    }
}

std::unique_ptr<PostgreSQLConnection> PostgreSQLDriver::acquireConnection() {
    try {
        return getPool()->acquire();
    } catch (const ConnectionError& e) {
        spdlog::warn("[Postgres] Pool initialization failed: {}, resetting...", e.what());
        resetPool();
        return getPool()->acquire();
    }
}

// Runs fn on a pooled connection. A QueryError caused by a dead socket is
// turned into a ConnectionError after the pool has been reset.
template<typename Func>
auto PostgreSQLDriver::withConnection(const char* operation, Func&& fn) {
    auto conn = acquireConnection();
    try {
        return fn(*conn);
    } catch (const QueryError& e) {
        if (conn->isValid() && !ErrorHandler::isTransportError(e.what())) {
            throw;
        }
        spdlog::warn("[Postgres] Connection error in {}, resetting pool: {}", operation, e.what());
        conn->invalidate();
        conn.reset();
        resetPool();
        throw ConnectionError(e.what());
    }
}

// ============================================================================
// Driver Operations
// ============================================================================

TestConnectionResult PostgreSQLDriver::testConnection() {
    try {
        withConnection("test_connection", [](PostgreSQLConnection& conn) {
            PostgreSQLResultSet result(conn.execute("SELECT 1"));
            if (!result.hasData()) {
                throw QueryError(FormatConverter::trim(result.errorMessage()));
            }
        });
        return {true, "Connection successful!"};
    } catch (const std::exception& e) {
        spdlog::debug("PostgreSQL connection test failed: {}", e.what());
        return {false, std::string("Connection failed: ") + e.what()};
    }
}

std::vector<TableInfo> PostgreSQLDriver::listTables() {
    return withConnection("list_tables", [](PostgreSQLConnection& conn) {
        return PostgreSQLSchemaManager::listTables(conn);
    });
}

TableDataResponse PostgreSQLDriver::getTableData(const TableDataRequest& request) {
    std::string tableName = PostgreSQLFormatConverter::qualifiedName(request.schema, request.table);

    std::string whereClause;
    if (request.filter && !FormatConverter::trim(*request.filter).empty()) {
        whereClause = " WHERE " + FormatConverter::normalizeFilter(*request.filter);
    }

    std::string orderClause;
    if (request.sortColumn && !request.sortColumn->empty()) {
        orderClause = " ORDER BY " + PostgreSQLFormatConverter::escapeIdentifier(*request.sortColumn) +
                      " " + FormatConverter::normalizeSortDirection(request.sortDirection);
    }

    std::string countQuery = "SELECT COUNT(*) AS count FROM " + tableName + whereClause;
    std::string dataQuery = "SELECT * FROM " + tableName + whereClause + orderClause +
                            " LIMIT " + std::to_string(request.limit) +
                            " OFFSET " + std::to_string(request.offset());

    return withConnection("get_table_data", [&](PostgreSQLConnection& conn) {
        TableDataResponse response;
        response.page = request.page;
        response.limit = request.limit;

        PostgreSQLResultSet count(conn.execute(countQuery));
        if (!count.hasData()) {
            throw QueryError(FormatConverter::trim(count.errorMessage()));
        }
        if (count.numRows() > 0) {
            response.total = FormatConverter::parseUInt64(count.getValue(0, 0)).value_or(0);
        }

        PostgreSQLResultSet rows(conn.execute(dataQuery));
        if (!rows.hasData()) {
            throw QueryError(FormatConverter::trim(rows.errorMessage()));
        }
        response.data = PostgreSQLFormatConverter::toValues(rows);
        return response;
    });
}

TableStructure PostgreSQLDriver::getTableStructure(const std::string& schema, const std::string& table) {
    return withConnection("get_table_structure", [&](PostgreSQLConnection& conn) {
        TableStructure structure;
        structure.columns = PostgreSQLSchemaManager::getColumns(conn, schema, table);
        structure.indexes = PostgreSQLSchemaManager::getIndexes(conn, schema, table);
        structure.foreignKeys = PostgreSQLSchemaManager::getForeignKeys(conn, schema, table);
        return structure;
    });
}

QueryResult PostgreSQLDriver::executeQuery(const std::string& sql) {
    auto start = std::chrono::steady_clock::now();
    auto elapsedMs = [&start]() {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count());
    };

    auto conn = acquireConnection();
    PostgreSQLResultSet result(conn->execute(sql));

    QueryResult queryResult;
    if (!result.isOk()) {
        std::string error = FormatConverter::trim(result.errorMessage());
        if (error.empty()) error = FormatConverter::trim(conn->error());

        if (!conn->isValid() || ErrorHandler::isTransportError(error)) {
            spdlog::warn("[Postgres] Connection error detected, resetting pool: {}", error);
            conn->invalidate();
            conn.reset();
            resetPool();
        }

        queryResult.error = error;
        queryResult.timeTakenMs = elapsedMs();
        return queryResult;
    }

    if (result.status() == PGRES_TUPLES_OK) {
        queryResult.data = PostgreSQLFormatConverter::toValues(result);
        queryResult.rowCount = queryResult.data.size();
    } else {
        queryResult.rowCount = conn->affectedRows(result.get());
    }
    queryResult.timeTakenMs = elapsedMs();
    return queryResult;
}

SchemaOverview PostgreSQLDriver::getSchemaOverview() {
    return withConnection("get_schema_overview", [](PostgreSQLConnection& conn) {
        return PostgreSQLSchemaManager::getSchemaOverview(conn);
    });
}

}  // namespace dbbridge
