/**
 * @file PostgreSQLSchemaManager.cpp
 * @brief Implementation of PostgreSQL catalog queries.
 */

#include "PostgreSQLSchemaManager.hpp"
#include "PostgreSQLResultSet.hpp"
#include "ErrorHandler.hpp"
#include "FormatConverter.hpp"
#include <spdlog/spdlog.h>

namespace dbbridge {

namespace {

constexpr const char* kListTablesQuery = R"SQL(
SELECT table_schema, table_name,
       CASE WHEN table_type = 'VIEW' THEN 'view' ELSE 'table' END AS type
FROM information_schema.tables
WHERE table_schema NOT IN ('pg_catalog', 'information_schema')
ORDER BY table_schema, table_name
)SQL";

constexpr const char* kColumnsQuery = R"SQL(
SELECT c.column_name,
       c.data_type,
       c.is_nullable = 'YES' AS nullable,
       c.column_default,
       EXISTS (
           SELECT 1
           FROM information_schema.table_constraints tc
           JOIN information_schema.key_column_usage kcu
             ON tc.constraint_name = kcu.constraint_name
            AND tc.table_schema = kcu.table_schema
           WHERE tc.table_schema = c.table_schema
             AND tc.table_name = c.table_name
             AND kcu.column_name = c.column_name
             AND tc.constraint_type = 'PRIMARY KEY'
       ) AS primary_key
FROM information_schema.columns c
WHERE c.table_schema = $1 AND c.table_name = $2
ORDER BY c.ordinal_position
)SQL";

constexpr const char* kIndexesQuery = R"SQL(
SELECT ic.relname AS name,
       json_agg(a.attname ORDER BY array_position(idx.indkey::int2[], a.attnum))::text AS columns,
       idx.indisunique AS is_unique,
       idx.indisprimary AS is_primary
FROM pg_index idx
JOIN pg_class ic ON ic.oid = idx.indexrelid
JOIN pg_class tc ON tc.oid = idx.indrelid
JOIN pg_namespace n ON n.oid = tc.relnamespace
JOIN pg_attribute a ON a.attrelid = tc.oid AND a.attnum = ANY(idx.indkey)
WHERE n.nspname = $1 AND tc.relname = $2
GROUP BY ic.relname, idx.indisunique, idx.indisprimary
ORDER BY ic.relname
)SQL";

constexpr const char* kForeignKeysQuery = R"SQL(
SELECT tc.constraint_name,
       kcu.column_name,
       ccu.table_name AS references_table,
       ccu.column_name AS references_column
FROM information_schema.table_constraints tc
JOIN information_schema.key_column_usage kcu
  ON tc.constraint_name = kcu.constraint_name
 AND tc.table_schema = kcu.table_schema
JOIN information_schema.constraint_column_usage ccu
  ON tc.constraint_name = ccu.constraint_name
WHERE tc.constraint_type = 'FOREIGN KEY'
  AND tc.table_schema = $1
  AND tc.table_name = $2
ORDER BY tc.constraint_name, kcu.ordinal_position
)SQL";

constexpr const char* kSchemaOverviewQuery = R"SQL(
WITH columns_data AS (
    SELECT c.table_schema, c.table_name,
           json_agg(json_build_object(
               'name', c.column_name,
               'type', c.data_type,
               'nullable', c.is_nullable = 'YES',
               'default', c.column_default,
               'primary_key', pk.column_name IS NOT NULL
           ) ORDER BY c.ordinal_position) AS columns
    FROM information_schema.columns c
    LEFT JOIN (
        SELECT ku.table_schema, ku.table_name, ku.column_name
        FROM information_schema.table_constraints tc
        JOIN information_schema.key_column_usage ku
          ON tc.constraint_name = ku.constraint_name
         AND tc.table_schema = ku.table_schema
        WHERE tc.constraint_type = 'PRIMARY KEY'
    ) pk ON c.table_schema = pk.table_schema
        AND c.table_name = pk.table_name
        AND c.column_name = pk.column_name
    WHERE c.table_schema NOT IN ('pg_catalog', 'information_schema')
    GROUP BY c.table_schema, c.table_name
),
foreign_keys_data AS (
    SELECT tc.table_schema, tc.table_name,
           json_agg(json_build_object(
               'name', tc.constraint_name,
               'column', kcu.column_name,
               'references_table', ccu.table_name,
               'references_column', ccu.column_name
           )) AS foreign_keys
    FROM information_schema.table_constraints tc
    JOIN information_schema.key_column_usage kcu
      ON tc.constraint_name = kcu.constraint_name
     AND tc.table_schema = kcu.table_schema
    JOIN information_schema.constraint_column_usage ccu
      ON ccu.constraint_name = tc.constraint_name
    WHERE tc.constraint_type = 'FOREIGN KEY'
      AND tc.table_schema NOT IN ('pg_catalog', 'information_schema')
    GROUP BY tc.table_schema, tc.table_name
),
indexes_data AS (
    SELECT n.nspname AS table_schema, tc.relname AS table_name,
           json_agg(json_build_object(
               'name', ic.relname,
               'columns', (
                   SELECT json_agg(a.attname ORDER BY k.ord)
                   FROM unnest(idx.indkey::int2[]) WITH ORDINALITY AS k(attnum, ord)
                   JOIN pg_attribute a ON a.attrelid = tc.oid AND a.attnum = k.attnum
               ),
               'unique', idx.indisunique,
               'primary', idx.indisprimary
           )) AS indexes
    FROM pg_index idx
    JOIN pg_class ic ON ic.oid = idx.indexrelid
    JOIN pg_class tc ON tc.oid = idx.indrelid
    JOIN pg_namespace n ON n.oid = tc.relnamespace
    WHERE n.nspname NOT IN ('pg_catalog', 'information_schema', 'pg_toast')
    GROUP BY n.nspname, tc.relname
)
SELECT cd.table_schema AS schema,
       cd.table_name AS name,
       CASE WHEN t.table_type = 'VIEW' THEN 'view' ELSE 'table' END AS type,
       cd.columns::text AS columns,
       COALESCE(fk.foreign_keys, '[]'::json)::text AS foreign_keys,
       COALESCE(idx.indexes, '[]'::json)::text AS indexes
FROM columns_data cd
LEFT JOIN information_schema.tables t
  ON t.table_schema = cd.table_schema AND t.table_name = cd.table_name
LEFT JOIN foreign_keys_data fk
  ON cd.table_schema = fk.table_schema AND cd.table_name = fk.table_name
LEFT JOIN indexes_data idx
  ON cd.table_schema = idx.table_schema AND cd.table_name = idx.table_name
ORDER BY cd.table_schema, cd.table_name
)SQL";

PostgreSQLResultSet runQuery(PostgreSQLConnection& conn, const char* sql,
                             const std::vector<std::string>& params = {}) {
    PostgreSQLResultSet result(params.empty() ? conn.execute(sql) : conn.executeParams(sql, params));
    if (!result.hasData()) {
        std::string error = result.errorMessage();
        if (error.empty()) error = conn.error();
        throw QueryError(FormatConverter::trim(error));
    }
    return result;
}

std::string stringOr(const json& obj, const char* key, const std::string& fallback = "") {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

bool boolOr(const json& obj, const char* key, bool fallback = false) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_boolean()) return fallback;
    return it->get<bool>();
}

std::vector<ColumnInfo> columnsFromJson(const json& arr) {
    std::vector<ColumnInfo> columns;
    if (!arr.is_array()) return columns;
    for (const auto& item : arr) {
        ColumnInfo col;
        col.name = stringOr(item, "name");
        col.type = stringOr(item, "type");
        col.nullable = boolOr(item, "nullable", true);
        if (item.contains("default") && item["default"].is_string()) {
            col.defaultValue = item["default"].get<std::string>();
        }
        col.primaryKey = boolOr(item, "primary_key");
        columns.push_back(std::move(col));
    }
    return columns;
}

std::vector<IndexInfo> indexesFromJson(const json& arr) {
    std::vector<IndexInfo> indexes;
    if (!arr.is_array()) return indexes;
    for (const auto& item : arr) {
        IndexInfo idx;
        idx.name = stringOr(item, "name");
        if (item.contains("columns") && item["columns"].is_array()) {
            for (const auto& c : item["columns"]) {
                if (c.is_string()) idx.columns.push_back(c.get<std::string>());
            }
        }
        idx.unique = boolOr(item, "unique");
        idx.primary = boolOr(item, "primary");
        indexes.push_back(std::move(idx));
    }
    return indexes;
}

std::vector<ForeignKeyInfo> foreignKeysFromJson(const json& arr) {
    std::vector<ForeignKeyInfo> keys;
    if (!arr.is_array()) return keys;
    for (const auto& item : arr) {
        keys.push_back(ForeignKeyInfo{
            stringOr(item, "name"),
            stringOr(item, "column"),
            stringOr(item, "references_table"),
            stringOr(item, "references_column"),
        });
    }
    return keys;
}

json parseColumnJson(const PostgreSQLResultSet& result, int row, int col, const char* what) {
    json parsed = json::parse(result.getValue(row, col), nullptr, false);
    if (parsed.is_discarded()) {
        throw QueryError(std::string("Failed to parse ") + what);
    }
    return parsed;
}

}  // namespace

// ============================================================================
// Tables
// ============================================================================

std::vector<TableInfo> PostgreSQLSchemaManager::listTables(PostgreSQLConnection& conn) {
    PostgreSQLResultSet result = runQuery(conn, kListTablesQuery);

    std::vector<TableInfo> tables;
    tables.reserve(static_cast<size_t>(result.numRows()));
    for (int row = 0; row < result.numRows(); ++row) {
        tables.push_back(TableInfo{result.getValue(row, 0), result.getValue(row, 1), result.getValue(row, 2)});
    }
    return tables;
}

// ============================================================================
// Table Structure
// ============================================================================

std::vector<ColumnInfo> PostgreSQLSchemaManager::getColumns(PostgreSQLConnection& conn,
                                                            const std::string& schema,
                                                            const std::string& table) {
    PostgreSQLResultSet result = runQuery(conn, kColumnsQuery, {schema, table});

    std::vector<ColumnInfo> columns;
    for (int row = 0; row < result.numRows(); ++row) {
        ColumnInfo col;
        col.name = result.getValue(row, 0);
        col.type = result.getValue(row, 1);
        col.nullable = result.getBool(row, 2);
        if (!result.isNull(row, 3)) {
            col.defaultValue = result.getValue(row, 3);
        }
        col.primaryKey = result.getBool(row, 4);
        columns.push_back(std::move(col));
    }
    return columns;
}

std::vector<IndexInfo> PostgreSQLSchemaManager::getIndexes(PostgreSQLConnection& conn,
                                                           const std::string& schema,
                                                           const std::string& table) {
    PostgreSQLResultSet result = runQuery(conn, kIndexesQuery, {schema, table});

    std::vector<IndexInfo> indexes;
    for (int row = 0; row < result.numRows(); ++row) {
        IndexInfo idx;
        idx.name = result.getValue(row, 0);
        json columns = parseColumnJson(result, row, 1, "index columns");
        for (const auto& c : columns) {
            if (c.is_string()) idx.columns.push_back(c.get<std::string>());
        }
        idx.unique = result.getBool(row, 2);
        idx.primary = result.getBool(row, 3);
        indexes.push_back(std::move(idx));
    }
    return indexes;
}

std::vector<ForeignKeyInfo> PostgreSQLSchemaManager::getForeignKeys(PostgreSQLConnection& conn,
                                                                    const std::string& schema,
                                                                    const std::string& table) {
    PostgreSQLResultSet result = runQuery(conn, kForeignKeysQuery, {schema, table});

    std::vector<ForeignKeyInfo> keys;
    for (int row = 0; row < result.numRows(); ++row) {
        keys.push_back(ForeignKeyInfo{
            result.getValue(row, 0),
            result.getValue(row, 1),
            result.getValue(row, 2),
            result.getValue(row, 3),
        });
    }
    return keys;
}

// ============================================================================
// Schema Overview
// ============================================================================

SchemaOverview PostgreSQLSchemaManager::getSchemaOverview(PostgreSQLConnection& conn) {
    PostgreSQLResultSet result = runQuery(conn, kSchemaOverviewQuery);

    SchemaOverview overview;
    overview.tables.reserve(static_cast<size_t>(result.numRows()));

    for (int row = 0; row < result.numRows(); ++row) {
        TableWithStructure table;
        table.schema = result.getValue(row, 0);
        table.name = result.getValue(row, 1);
        table.type = result.getValue(row, 2);
        table.columns = columnsFromJson(parseColumnJson(result, row, 3, "columns"));
        table.foreignKeys = foreignKeysFromJson(parseColumnJson(result, row, 4, "foreign_keys"));
        table.indexes = indexesFromJson(parseColumnJson(result, row, 5, "indexes"));
        overview.tables.push_back(std::move(table));
    }

    spdlog::debug("PostgreSQL schema overview: {} tables", overview.tables.size());
    return overview;
}

}  // namespace dbbridge
