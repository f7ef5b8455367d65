#pragma once

/**
 * @file ClickHouseSchemaManager.hpp
 * @brief ClickHouse catalog queries through the system database.
 */

#include "ClickHouseHttpClient.hpp"
#include "Models.hpp"

namespace dbbridge {

/**
 * @class ClickHouseSchemaManager
 * @brief Reads table metadata of one ClickHouse database.
 *
 * System Tables Used:
 * - system.tables: tables and their engines (the engine is the table type)
 * - system.columns: column definitions, defaults and primary key membership
 * - system.data_skipping_indices: secondary indexes
 *
 * ClickHouse has no foreign keys; those lists are always empty.
 */
class ClickHouseSchemaManager {
public:
    static std::vector<TableInfo> listTables(const ClickHouseHttpClient& client);

    static std::vector<ColumnInfo> getColumns(const ClickHouseHttpClient& client,
                                              const std::string& database,
                                              const std::string& table);

    static std::vector<IndexInfo> getIndexes(const ClickHouseHttpClient& client,
                                             const std::string& database,
                                             const std::string& table);

    static SchemaOverview getSchemaOverview(const ClickHouseHttpClient& client);
};

}  // namespace dbbridge
