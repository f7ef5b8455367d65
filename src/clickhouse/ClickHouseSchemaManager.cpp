/**
 * @file ClickHouseSchemaManager.cpp
 * @brief Implementation of ClickHouse catalog queries.
 */

#include "ClickHouseSchemaManager.hpp"
#include "ClickHouseFormatConverter.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <map>

namespace dbbridge {

namespace {

using CH = ClickHouseFormatConverter;

std::string columnsOverviewQuery(const std::string& database) {
    return R"SQL(
SELECT c.database AS schema,
       c.table AS name,
       t.engine AS type,
       groupArray(tuple(c.name, c.type, c.default_kind, c.default_expression, c.is_in_primary_key)) AS columns_raw
FROM system.columns c
JOIN system.tables t ON c.database = t.database AND c.table = t.name
WHERE c.database = )SQL" + CH::quoteString(database) + R"SQL(
GROUP BY c.database, c.table, t.engine
ORDER BY c.database, c.table
)SQL";
}

std::string indexesOverviewQuery(const std::string& database) {
    return R"SQL(
SELECT database,
       table,
       groupArray(tuple(name, expr, type)) AS indexes_raw
FROM system.data_skipping_indices
WHERE database = )SQL" + CH::quoteString(database) + R"SQL(
GROUP BY database, table
)SQL";
}

IndexInfo skippingIndex(const std::string& name, const std::string& expression) {
    IndexInfo idx;
    idx.name = name;
    idx.columns.push_back(expression);
    return idx;
}

}  // namespace

// ============================================================================
// Tables
// ============================================================================

std::vector<TableInfo> ClickHouseSchemaManager::listTables(const ClickHouseHttpClient& client) {
    std::vector<Value> rows = client.query(
        "SELECT database, name, engine FROM system.tables WHERE database = " +
        CH::quoteString(client.database()) + " ORDER BY name");

    std::vector<TableInfo> tables;
    tables.reserve(rows.size());
    for (const auto& row : rows) {
        tables.push_back(TableInfo{
            CH::stringOf(row.value("database", Value())),
            CH::stringOf(row.value("name", Value())),
            CH::stringOf(row.value("engine", Value()), "table"),
        });
    }
    return tables;
}

// ============================================================================
// Table Structure
// ============================================================================

std::vector<ColumnInfo> ClickHouseSchemaManager::getColumns(const ClickHouseHttpClient& client,
                                                            const std::string& database,
                                                            const std::string& table) {
    std::vector<Value> rows = client.query(
        "SELECT name, type, default_kind, default_expression, is_in_primary_key "
        "FROM system.columns WHERE database = " + CH::quoteString(database) +
        " AND table = " + CH::quoteString(table) + " ORDER BY position");

    std::vector<ColumnInfo> columns;
    columns.reserve(rows.size());
    for (const auto& row : rows) {
        columns.push_back(CH::toColumn(row.value("name", Value()), row.value("type", Value()),
                                       row.value("default_kind", Value()),
                                       row.value("default_expression", Value()),
                                       row.value("is_in_primary_key", Value())));
    }
    return columns;
}

std::vector<IndexInfo> ClickHouseSchemaManager::getIndexes(const ClickHouseHttpClient& client,
                                                           const std::string& database,
                                                           const std::string& table) {
    std::vector<Value> rows;
    try {
        rows = client.query("SELECT name, expr, type FROM system.data_skipping_indices WHERE database = " +
                            CH::quoteString(database) + " AND table = " + CH::quoteString(table));
    } catch (const QueryError& e) {
        // Servers older than 21.x have no data_skipping_indices table
        spdlog::debug("ClickHouse index lookup unavailable: {}", e.what());
        return {};
    }

    std::vector<IndexInfo> indexes;
    for (const auto& row : rows) {
        indexes.push_back(skippingIndex(CH::stringOf(row.value("name", Value())),
                                        CH::stringOf(row.value("expr", Value()))));
    }
    return indexes;
}

// ============================================================================
// Schema Overview
// ============================================================================

SchemaOverview ClickHouseSchemaManager::getSchemaOverview(const ClickHouseHttpClient& client) {
    const std::string& database = client.database();
    std::vector<Value> columnRows = client.query(columnsOverviewQuery(database));

    std::map<std::pair<std::string, std::string>, std::vector<IndexInfo>> indexesByTable;
    try {
        for (const auto& row : client.query(indexesOverviewQuery(database))) {
            auto& indexes = indexesByTable[{CH::stringOf(row.value("database", Value())),
                                            CH::stringOf(row.value("table", Value()))}];
            const Value raw = row.value("indexes_raw", Value::array());
            for (const auto& tuple : raw) {
                if (!tuple.is_array() || tuple.size() < 3) continue;
                indexes.push_back(skippingIndex(CH::stringOf(tuple[0]), CH::stringOf(tuple[1])));
            }
        }
    } catch (const QueryError& e) {
        spdlog::debug("ClickHouse index overview unavailable: {}", e.what());
    }

    SchemaOverview overview;
    for (const auto& row : columnRows) {
        TableWithStructure table;
        table.schema = CH::stringOf(row.value("schema", Value()));
        table.name = CH::stringOf(row.value("name", Value()));
        table.type = CH::stringOf(row.value("type", Value()), "table");

        const Value raw = row.value("columns_raw", Value::array());
        for (const auto& tuple : raw) {
            if (!tuple.is_array() || tuple.size() < 5) continue;
            table.columns.push_back(CH::toColumn(tuple[0], tuple[1], tuple[2], tuple[3], tuple[4]));
        }

        auto it = indexesByTable.find({table.schema, table.name});
        if (it != indexesByTable.end()) {
            table.indexes = std::move(it->second);
        }
        overview.tables.push_back(std::move(table));
    }

    spdlog::debug("ClickHouse schema overview for {}: {} tables", database, overview.tables.size());
    return overview;
}

}  // namespace dbbridge
