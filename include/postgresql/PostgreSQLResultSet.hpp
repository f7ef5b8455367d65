#pragma once

/**
 * @file PostgreSQLResultSet.hpp
 * @brief RAII wrapper for PGresult.
 */

#include <libpq-fe.h>
#include <string>
#include <vector>

namespace dbbridge {

/**
 * @class PostgreSQLResultSet
 * @brief Owns a PGresult and clears it on destruction.
 *
 * Result Status:
 * - PGRES_TUPLES_OK: statement returned rows (possibly zero)
 * - PGRES_COMMAND_OK: DML/DDL completed
 * - PGRES_FATAL_ERROR: statement failed; see errorMessage()
 *
 * Usage:
 * @code
 *   PostgreSQLResultSet result(conn->execute("SELECT id, name FROM users"));
 *   for (int row = 0; row < result.numRows(); ++row) {
 *       std::string name = result.getValue(row, 1);
 *   }
 * @endcode
 */
class PostgreSQLResultSet {
public:
    explicit PostgreSQLResultSet(PGresult* res = nullptr);
    ~PostgreSQLResultSet();

    // Non-copyable
    PostgreSQLResultSet(const PostgreSQLResultSet&) = delete;
    PostgreSQLResultSet& operator=(const PostgreSQLResultSet&) = delete;

    // Movable
    PostgreSQLResultSet(PostgreSQLResultSet&& other) noexcept;
    PostgreSQLResultSet& operator=(PostgreSQLResultSet&& other) noexcept;

    PGresult* get() const { return m_res; }

    /**
     * @brief True for PGRES_TUPLES_OK, PGRES_COMMAND_OK and PGRES_EMPTY_QUERY.
     */
    bool isOk() const;

    /**
     * @brief True when the statement produced a row set.
     */
    bool hasData() const;

    ExecStatusType status() const;

    /**
     * @brief Server error text, or an empty string.
     */
    std::string errorMessage() const;

    int numFields() const;
    int numRows() const;

    /**
     * @brief Value as text; empty string for NULL.
     */
    std::string getValue(int row, int col) const;
    bool isNull(int row, int col) const;
    bool getBool(int row, int col) const;

    const char* fieldName(int col) const;
    Oid fieldType(int col) const;

    /**
     * @brief Column index by name, or -1.
     */
    int fieldIndex(const char* name) const;

private:
    PGresult* m_res;  ///< Owned result handle
};

}  // namespace dbbridge
