#pragma once

/**
 * @file PostgreSQLConnection.hpp
 * @brief RAII handle for a PGconn checked out of a PostgreSQLConnectionPool.
 *
 * When the handle goes out of scope the PGconn goes back to the pool, unless
 * it was invalidated after a transport failure, in which case it is closed.
 */

#include <libpq-fe.h>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>

namespace dbbridge {

class PostgreSQLConnectionPool;

/**
 * @class PostgreSQLConnection
 * @brief Checked-out PostgreSQL connection.
 *
 * libpq API usage:
 * - PQexec() for ad-hoc statements (may contain several statements)
 * - PQexecParams() for catalog queries with $n parameters
 * - PQstatus() to detect a dropped socket after a failed call
 *
 * The handle keeps its pool alive, so a pool that was reset while the
 * connection was checked out is still valid when the handle is released.
 *
 * Thread Safety:
 * - A connection must be used by one thread at a time
 * - The pool handles thread-safe distribution
 */
class PostgreSQLConnection {
public:
    PostgreSQLConnection(std::shared_ptr<PostgreSQLConnectionPool> pool, PGconn* conn);
    ~PostgreSQLConnection();

    // Non-copyable (connection ownership semantics)
    PostgreSQLConnection(const PostgreSQLConnection&) = delete;
    PostgreSQLConnection& operator=(const PostgreSQLConnection&) = delete;

    PostgreSQLConnection(PostgreSQLConnection&& other) noexcept;
    PostgreSQLConnection& operator=(PostgreSQLConnection&& other) noexcept;

    PGconn* get() const { return m_conn; }

    /**
     * @brief Check PQstatus() == CONNECTION_OK.
     */
    bool isValid() const;

    /**
     * @brief Round-trip "SELECT 1" to the server.
     */
    bool ping();

    /**
     * @brief Execute SQL text.
     * @return PGresult* owned by the caller, or nullptr if the connection is unusable.
     */
    PGresult* execute(const std::string& sql);

    /**
     * @brief Execute a statement with text parameters bound to $1..$n.
     */
    PGresult* executeParams(const std::string& sql, const std::vector<std::string>& params);

    const char* error() const;

    ConnStatusType status() const;

    /**
     * @brief Rows affected by a command, parsed from PQcmdTuples().
     */
    uint64_t affectedRows(PGresult* result) const;

    /**
     * @brief Close instead of returning to the pool on release.
     *
     * Used when a query failed with a transport error and the socket can no
     * longer be trusted.
     */
    void invalidate() { m_invalid = true; }

private:
    void release();

    std::shared_ptr<PostgreSQLConnectionPool> m_pool;  ///< Owning pool
    PGconn* m_conn;                                    ///< libpq handle
    bool m_invalid = false;                            ///< Destroy on release
};

}  // namespace dbbridge
