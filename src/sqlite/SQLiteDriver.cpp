/**
 * @file SQLiteDriver.cpp
 * @brief Implementation of the SQLite driver.
 */

#include "SQLiteDriver.hpp"
#include "SQLiteFormatConverter.hpp"
#include "SQLiteResultSet.hpp"
#include "SQLiteSchemaManager.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace dbbridge {

SQLiteDriver::SQLiteDriver(ConnectionConfig config) : m_config(std::move(config)) {
    if (m_config.file_path.empty()) {
        throw ValidationError("File path is required for SQLite connections");
    }
}

SQLiteConnection SQLiteDriver::open() const {
    return SQLiteConnection(m_config.file_path);
}

// ============================================================================
// Driver Operations
// ============================================================================

TestConnectionResult SQLiteDriver::testConnection() {
    try {
        SQLiteConnection conn = open();
        SQLiteResultSet rs(conn.prepare("SELECT 1"));
        rs.step();
        return {true, "Connection successful!"};
    } catch (const DatabaseError& e) {
        spdlog::debug("SQLite connection test failed: {}", e.what());
        return {false, std::string("Connection failed: ") + e.what()};
    }
}

std::vector<TableInfo> SQLiteDriver::listTables() {
    SQLiteConnection conn = open();
    return SQLiteSchemaManager::listTables(conn);
}

TableDataResponse SQLiteDriver::getTableData(const TableDataRequest& request) {
    std::string tableName = SQLiteFormatConverter::escapeIdentifier(request.table);

    std::string whereClause;
    if (request.filter && !FormatConverter::trim(*request.filter).empty()) {
        whereClause = " WHERE " + FormatConverter::normalizeFilter(*request.filter);
    }

    std::string orderClause;
    if (request.sortColumn && !request.sortColumn->empty()) {
        orderClause = " ORDER BY " + SQLiteFormatConverter::escapeIdentifier(*request.sortColumn) +
                      " " + FormatConverter::normalizeSortDirection(request.sortDirection);
    }

    SQLiteConnection conn = open();

    TableDataResponse response;
    response.page = request.page;
    response.limit = request.limit;

    {
        SQLiteResultSet count(conn.prepare("SELECT COUNT(*) AS count FROM " + tableName + whereClause));
        if (count.step()) {
            response.total = static_cast<uint64_t>(count.getInt64(0));
        }
    }

    SQLiteResultSet rows(conn.prepare("SELECT * FROM " + tableName + whereClause + orderClause +
                                      " LIMIT " + std::to_string(request.limit) +
                                      " OFFSET " + std::to_string(request.offset())));
    response.data = SQLiteFormatConverter::toValues(rows);
    return response;
}

TableStructure SQLiteDriver::getTableStructure(const std::string& /*schema*/, const std::string& table) {
    SQLiteConnection conn = open();

    TableStructure structure;
    structure.columns = SQLiteSchemaManager::getColumns(conn, table);
    structure.indexes = SQLiteSchemaManager::getIndexes(conn, table);
    structure.foreignKeys = SQLiteSchemaManager::getForeignKeys(conn, table);
    return structure;
}

QueryResult SQLiteDriver::executeQuery(const std::string& sql) {
    auto start = std::chrono::steady_clock::now();
    auto elapsedMs = [&start]() {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count());
    };

    SQLiteConnection conn = open();

    QueryResult result;
    try {
        // Run every statement of the script; rows from all of them are returned
        bool producedRows = false;
        uint64_t affected = 0;
        const char* tail = sql.c_str();
        while (sqlite3_stmt* stmt = conn.prepareNext(tail)) {
            SQLiteResultSet rs(stmt);
            if (rs.columnCount() > 0) {
                producedRows = true;
                auto rows = SQLiteFormatConverter::toValues(rs);
                result.data.insert(result.data.end(),
                                   std::make_move_iterator(rows.begin()),
                                   std::make_move_iterator(rows.end()));
            } else {
                rs.step();
                affected = static_cast<uint64_t>(conn.changes());
            }
        }
        result.rowCount = producedRows ? result.data.size() : affected;
    } catch (const QueryError& e) {
        result.data.clear();
        result.rowCount = 0;
        result.error = e.what();
    }

    result.timeTakenMs = elapsedMs();
    return result;
}

SchemaOverview SQLiteDriver::getSchemaOverview() {
    SQLiteConnection conn = open();
    return SQLiteSchemaManager::getSchemaOverview(conn);
}

}  // namespace dbbridge
