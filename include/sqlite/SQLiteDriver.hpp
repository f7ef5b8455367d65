#pragma once

/**
 * @file SQLiteDriver.hpp
 * @brief DatabaseDriver for SQLite database files.
 */

#include "DatabaseDriver.hpp"
#include "SQLiteConnection.hpp"

namespace dbbridge {

/**
 * @class SQLiteDriver
 * @brief SQLite implementation of the driver capability set.
 *
 * Every operation opens its own connection to the file and closes it when
 * done, so the driver holds no resources between calls. The schema argument
 * of table operations is ignored; SQLite reports everything as "main".
 */
class SQLiteDriver : public DatabaseDriver {
public:
    /**
     * @param config Connection settings; file_path must be set.
     * @throws ValidationError if file_path is empty.
     */
    explicit SQLiteDriver(ConnectionConfig config);

    DatabaseType type() const override { return DatabaseType::SQLite; }

    TestConnectionResult testConnection() override;
    std::vector<TableInfo> listTables() override;
    TableDataResponse getTableData(const TableDataRequest& request) override;
    TableStructure getTableStructure(const std::string& schema, const std::string& table) override;
    QueryResult executeQuery(const std::string& sql) override;
    SchemaOverview getSchemaOverview() override;

    const std::string& filePath() const { return m_config.file_path; }

private:
    SQLiteConnection open() const;

    ConnectionConfig m_config;
};

}  // namespace dbbridge
