/**
 * @file SQLiteSchemaManager.cpp
 * @brief Implementation of SQLite catalog queries.
 */

#include "SQLiteSchemaManager.hpp"
#include "SQLiteFormatConverter.hpp"
#include "SQLiteResultSet.hpp"
#include <spdlog/spdlog.h>
#include <map>

namespace dbbridge {

namespace {

constexpr const char* kMainSchema = "main";

constexpr const char* kTablesQuery = R"SQL(
SELECT name, type FROM sqlite_master
WHERE type IN ('table', 'view') AND name NOT LIKE 'sqlite_%'
ORDER BY name
)SQL";

constexpr const char* kColumnsQuery = R"SQL(
SELECT m.name AS table_name,
       p.name AS column_name,
       p.type AS data_type,
       p."notnull" AS not_null,
       p.dflt_value AS default_value,
       p.pk AS primary_key
FROM sqlite_master m
CROSS JOIN pragma_table_info(m.name) p
WHERE m.type IN ('table', 'view') AND m.name NOT LIKE 'sqlite_%'
ORDER BY m.name, p.cid
)SQL";

constexpr const char* kForeignKeysQuery = R"SQL(
SELECT m.name AS table_name,
       f."from" AS column_name,
       f."table" AS references_table,
       f."to" AS references_column
FROM sqlite_master m
CROSS JOIN pragma_foreign_key_list(m.name) f
WHERE m.type = 'table' AND m.name NOT LIKE 'sqlite_%'
ORDER BY m.name, f.id, f.seq
)SQL";

constexpr const char* kIndexesQuery = R"SQL(
SELECT m.name AS table_name,
       i.name AS index_name,
       i."unique" AS is_unique,
       i.origin AS origin
FROM sqlite_master m
CROSS JOIN pragma_index_list(m.name) i
WHERE m.type = 'table' AND m.name NOT LIKE 'sqlite_%'
ORDER BY m.name, i.name
)SQL";

ColumnInfo readColumn(const SQLiteResultSet& rs, int nameCol) {
    ColumnInfo col;
    col.name = rs.getString(nameCol);
    col.type = FormatConverter::toUpper(rs.getString(nameCol + 1));
    col.nullable = rs.getInt64(nameCol + 2) == 0;
    if (!rs.isNull(nameCol + 3)) {
        col.defaultValue = rs.getString(nameCol + 3);
    }
    col.primaryKey = rs.getInt64(nameCol + 4) > 0;
    return col;
}

}  // namespace

// ============================================================================
// Tables
// ============================================================================

std::vector<TableInfo> SQLiteSchemaManager::listTables(SQLiteConnection& conn) {
    SQLiteResultSet rs(conn.prepare(kTablesQuery));

    std::vector<TableInfo> tables;
    while (rs.step()) {
        tables.push_back(TableInfo{kMainSchema, rs.getString(0), rs.getString(1)});
    }
    return tables;
}

// ============================================================================
// Table Structure
// ============================================================================

std::vector<ColumnInfo> SQLiteSchemaManager::getColumns(SQLiteConnection& conn, const std::string& table) {
    // cid | name | type | notnull | dflt_value | pk
    SQLiteResultSet rs(conn.prepare("PRAGMA table_info(" + SQLiteFormatConverter::escapeIdentifier(table) + ")"));

    std::vector<ColumnInfo> columns;
    while (rs.step()) {
        columns.push_back(readColumn(rs, 1));
    }
    return columns;
}

std::vector<std::string> SQLiteSchemaManager::getIndexColumns(SQLiteConnection& conn, const std::string& index) {
    // seqno | cid | name
    SQLiteResultSet rs(conn.prepare("PRAGMA index_info(" + SQLiteFormatConverter::escapeIdentifier(index) + ")"));

    std::vector<std::string> columns;
    while (rs.step()) {
        if (!rs.isNull(2)) {
            columns.push_back(rs.getString(2));
        }
    }
    return columns;
}

std::vector<IndexInfo> SQLiteSchemaManager::getIndexes(SQLiteConnection& conn, const std::string& table) {
    // seq | name | unique | origin | partial
    std::vector<IndexInfo> indexes;
    {
        SQLiteResultSet rs(conn.prepare("PRAGMA index_list(" + SQLiteFormatConverter::escapeIdentifier(table) + ")"));
        while (rs.step()) {
            IndexInfo idx;
            idx.name = rs.getString(1);
            idx.unique = rs.getInt64(2) == 1;
            idx.primary = rs.getString(3) == "pk";
            indexes.push_back(std::move(idx));
        }
    }

    for (auto& idx : indexes) {
        idx.columns = getIndexColumns(conn, idx.name);
    }
    return indexes;
}

std::vector<ForeignKeyInfo> SQLiteSchemaManager::getForeignKeys(SQLiteConnection& conn, const std::string& table) {
    // id | seq | table | from | to | on_update | on_delete | match
    SQLiteResultSet rs(conn.prepare("PRAGMA foreign_key_list(" + SQLiteFormatConverter::escapeIdentifier(table) + ")"));

    std::vector<ForeignKeyInfo> keys;
    while (rs.step()) {
        ForeignKeyInfo fk;
        fk.referencesTable = rs.getString(2);
        fk.column = rs.getString(3);
        fk.name = "fk_" + table + "_" + fk.column;
        fk.referencesColumn = rs.getString(4);
        keys.push_back(std::move(fk));
    }
    return keys;
}

// ============================================================================
// Schema Overview
// ============================================================================

SchemaOverview SQLiteSchemaManager::getSchemaOverview(SQLiteConnection& conn) {
    SchemaOverview overview;
    std::map<std::string, size_t> positions;

    for (const auto& table : listTables(conn)) {
        positions[table.name] = overview.tables.size();
        overview.tables.push_back(TableWithStructure{table.schema, table.name, table.type, {}, {}, {}});
    }

    {
        SQLiteResultSet rs(conn.prepare(kColumnsQuery));
        while (rs.step()) {
            auto it = positions.find(rs.getString(0));
            if (it == positions.end()) continue;
            overview.tables[it->second].columns.push_back(readColumn(rs, 1));
        }
    }

    {
        SQLiteResultSet rs(conn.prepare(kForeignKeysQuery));
        while (rs.step()) {
            std::string tableName = rs.getString(0);
            auto it = positions.find(tableName);
            if (it == positions.end()) continue;

            ForeignKeyInfo fk;
            fk.column = rs.getString(1);
            fk.name = "fk_" + tableName + "_" + fk.column;
            fk.referencesTable = rs.getString(2);
            fk.referencesColumn = rs.getString(3);
            overview.tables[it->second].foreignKeys.push_back(std::move(fk));
        }
    }

    std::vector<std::pair<size_t, IndexInfo>> indexes;
    {
        SQLiteResultSet rs(conn.prepare(kIndexesQuery));
        while (rs.step()) {
            auto it = positions.find(rs.getString(0));
            if (it == positions.end()) continue;

            IndexInfo idx;
            idx.name = rs.getString(1);
            idx.unique = rs.getInt64(2) > 0;
            idx.primary = rs.getString(3) == "pk";
            indexes.emplace_back(it->second, std::move(idx));
        }
    }

    for (auto& [position, idx] : indexes) {
        idx.columns = getIndexColumns(conn, idx.name);
        overview.tables[position].indexes.push_back(std::move(idx));
    }

    spdlog::debug("SQLite schema overview for {}: {} tables", conn.path(), overview.tables.size());
    return overview;
}

}  // namespace dbbridge
