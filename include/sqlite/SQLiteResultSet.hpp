#pragma once

/**
 * @file SQLiteResultSet.hpp
 * @brief RAII wrapper for SQLite prepared statement results.
 */

#include <sqlite3.h>
#include <string>
#include <cstdint>

namespace dbbridge {

/**
 * @class SQLiteResultSet
 * @brief Owns a sqlite3_stmt and finalizes it on destruction.
 *
 * SQLite uses step() to both execute and fetch rows. Each call to step()
 * advances to the next row, or completes the statement for DML.
 *
 * Usage:
 * @code
 *   SQLiteResultSet result(conn.prepare("SELECT id, name FROM employees"));
 *   while (result.step()) {
 *       int64_t id = result.getInt64(0);
 *       std::string name = result.getString(1);
 *   }
 * @endcode
 */
class SQLiteResultSet {
public:
    explicit SQLiteResultSet(sqlite3_stmt* stmt = nullptr);
    ~SQLiteResultSet();

    // Non-copyable
    SQLiteResultSet(const SQLiteResultSet&) = delete;
    SQLiteResultSet& operator=(const SQLiteResultSet&) = delete;

    // Movable
    SQLiteResultSet(SQLiteResultSet&& other) noexcept;
    SQLiteResultSet& operator=(SQLiteResultSet&& other) noexcept;

    sqlite3_stmt* get() const { return m_stmt; }

    explicit operator bool() const { return m_stmt != nullptr; }

    /**
     * @brief Step to the next row.
     * @return true if a row is available, false when the statement is done.
     * @throws QueryError on SQLite step failure.
     */
    bool step();

    int columnCount() const;
    std::string columnName(int index) const;

    /**
     * @brief Declared column type as written in CREATE TABLE, or "".
     *
     * Expression columns (COUNT(*), literals) have no declared type.
     */
    std::string columnDeclType(int index) const;

    /**
     * @brief Storage class of the current value (SQLITE_INTEGER, ...).
     */
    int columnType(int index) const;

    /**
     * @brief Value as text; empty string for NULL.
     */
    std::string getString(int index) const;
    int64_t getInt64(int index) const;
    double getDouble(int index) const;

    /**
     * @brief Raw bytes of a BLOB value.
     */
    const unsigned char* getBlob(int index, int& length) const;

    bool isNull(int index) const;

    void reset();
    void finalize();

private:
    sqlite3_stmt* m_stmt;  ///< SQLite prepared statement handle (owned)
};

}  // namespace dbbridge
