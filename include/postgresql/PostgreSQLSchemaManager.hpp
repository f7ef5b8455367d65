#pragma once

/**
 * @file PostgreSQLSchemaManager.hpp
 * @brief Catalog queries for PostgreSQL tables, columns, indexes and foreign keys.
 */

#include "Models.hpp"
#include "PostgreSQLConnection.hpp"
#include <string>
#include <vector>

namespace dbbridge {

/**
 * @class PostgreSQLSchemaManager
 * @brief Reads structural metadata through information_schema and pg_catalog.
 *
 * System catalogs used:
 * - information_schema.tables / columns: table list and column definitions
 * - information_schema.table_constraints / key_column_usage: primary and foreign keys
 * - pg_index, pg_class, pg_attribute: index definitions with ordered columns
 *
 * pg_catalog and information_schema themselves are never listed.
 * Every method throws QueryError when the server rejects a catalog query.
 */
class PostgreSQLSchemaManager {
public:
    static std::vector<TableInfo> listTables(PostgreSQLConnection& conn);

    static std::vector<ColumnInfo> getColumns(PostgreSQLConnection& conn,
                                              const std::string& schema,
                                              const std::string& table);

    static std::vector<IndexInfo> getIndexes(PostgreSQLConnection& conn,
                                             const std::string& schema,
                                             const std::string& table);

    static std::vector<ForeignKeyInfo> getForeignKeys(PostgreSQLConnection& conn,
                                                      const std::string& schema,
                                                      const std::string& table);

    /**
     * @brief Every user table with its structure, in one round trip.
     *
     * Uses json_agg CTEs so the server assembles the nested structure.
     */
    static SchemaOverview getSchemaOverview(PostgreSQLConnection& conn);
};

}  // namespace dbbridge
