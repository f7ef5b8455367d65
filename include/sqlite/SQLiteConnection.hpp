#pragma once

/**
 * @file SQLiteConnection.hpp
 * @brief RAII wrapper for an SQLite database connection.
 *
 * SQLite connections are not pooled. The driver opens one per call and the
 * wrapper closes it when it goes out of scope.
 */

#include <sqlite3.h>
#include <string>
#include <cstdint>

namespace dbbridge {

/**
 * @class SQLiteConnection
 * @brief RAII wrapper for an SQLite database file connection.
 *
 * SQLite Characteristics:
 * - File-based: one database per file, reported as schema "main"
 * - Opened read-write with create, so a missing file is created
 * - A busy timeout lets concurrent writers wait instead of failing at once
 *
 * Usage:
 * @code
 *   SQLiteConnection conn("/path/to/database.db");
 *   conn.execute("CREATE TABLE IF NOT EXISTS test (id INTEGER)");
 *   SQLiteResultSet result(conn.prepare("SELECT * FROM test"));
 * @endcode
 *
 * Thread Safety:
 * - A connection must be used by one thread at a time
 */
class SQLiteConnection {
public:
    /**
     * @brief Open (or create) an SQLite database file.
     * @throws ConnectionError if the file cannot be opened.
     */
    explicit SQLiteConnection(const std::string& dbPath);

    ~SQLiteConnection();

    // Non-copyable
    SQLiteConnection(const SQLiteConnection&) = delete;
    SQLiteConnection& operator=(const SQLiteConnection&) = delete;

    // Movable
    SQLiteConnection(SQLiteConnection&& other) noexcept;
    SQLiteConnection& operator=(SQLiteConnection&& other) noexcept;

    sqlite3* get() const { return m_db; }

    bool isValid() const { return m_db != nullptr; }

    const std::string& path() const { return m_path; }

    /**
     * @brief Execute one or more statements without returning rows.
     * @throws QueryError with the SQLite message on failure.
     */
    void execute(const std::string& sql);

    /**
     * @brief Prepare a single statement.
     * @return Statement the caller must finalize (wrap it in SQLiteResultSet).
     * @throws QueryError if the statement does not compile.
     */
    sqlite3_stmt* prepare(const std::string& sql);

    /**
     * @brief Prepare the next statement of a multi-statement script.
     * @param tail In: start of the remaining text. Out: text after the statement.
     * @return Statement, or nullptr when only whitespace or comments remain.
     * @throws QueryError if the statement does not compile.
     */
    sqlite3_stmt* prepareNext(const char*& tail);

    const char* error() const;
    int errorCode() const;

    int64_t lastInsertRowId() const;

    /**
     * @brief Rows inserted, updated or deleted by the last statement.
     */
    int changes() const;

private:
    sqlite3* m_db = nullptr;  ///< SQLite database handle
    std::string m_path;       ///< Path to database file
};

}  // namespace dbbridge
