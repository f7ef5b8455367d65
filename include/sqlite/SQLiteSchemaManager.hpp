#pragma once

/**
 * @file SQLiteSchemaManager.hpp
 * @brief SQLite catalog queries through sqlite_master and PRAGMA functions.
 */

#include "Models.hpp"
#include "SQLiteConnection.hpp"
#include <string>
#include <vector>

namespace dbbridge {

/**
 * @class SQLiteSchemaManager
 * @brief Reads structural metadata of an SQLite database file.
 *
 * SQLite has a single schema per file, reported as "main". Internal
 * sqlite_% objects are never listed.
 *
 * System Tables and PRAGMAs Used:
 * - sqlite_master: tables and views
 * - PRAGMA table_info(table): column definitions
 * - PRAGMA index_list(table) / index_info(index): indexes and their columns
 * - PRAGMA foreign_key_list(table): foreign keys
 *
 * Foreign keys have no names in SQLite. They are reported as fk_<id> for a
 * single table and fk_<table>_<column> in the overview.
 */
class SQLiteSchemaManager {
public:
    static std::vector<TableInfo> listTables(SQLiteConnection& conn);

    static std::vector<ColumnInfo> getColumns(SQLiteConnection& conn, const std::string& table);
    static std::vector<IndexInfo> getIndexes(SQLiteConnection& conn, const std::string& table);
    static std::vector<ForeignKeyInfo> getForeignKeys(SQLiteConnection& conn, const std::string& table);

    static SchemaOverview getSchemaOverview(SQLiteConnection& conn);

private:
    static std::vector<std::string> getIndexColumns(SQLiteConnection& conn, const std::string& index);
};

}  // namespace dbbridge
