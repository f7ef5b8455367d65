#pragma once

/**
 * @file PostgreSQLConnectionPool.hpp
 * @brief Bounded, lazily filled pool of libpq connections.
 *
 * Connections are created on demand up to a fixed cap, evicted after sitting
 * idle longer than the idle timeout, and checked with "SELECT 1" before they
 * are handed out again.
 */

#include "Config.hpp"
#include "PostgreSQLConnection.hpp"
#include <libpq-fe.h>
#include <memory>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>

namespace dbbridge {

struct PostgreSQLPoolOptions {
    size_t maxConnections = 5;
    std::chrono::seconds idleTimeout{600};
    std::chrono::seconds acquireTimeout{30};
    std::chrono::seconds connectTimeout{15};
};

/**
 * @class PostgreSQLConnectionPool
 * @brief Thread-safe pool of PGconn handles.
 *
 * Pool Behavior:
 * - acquire() reuses an idle connection, creates one if under the cap, or
 *   waits until one is released or the acquire timeout expires
 * - Idle connections older than idleTimeout are closed instead of reused
 * - Reused connections must pass a liveness check
 * - A failed connection attempt is reported to the caller immediately
 *
 * The pool is always owned through std::shared_ptr; checked-out handles keep
 * it alive.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - Uses mutex and condition_variable for synchronization
 */
class PostgreSQLConnectionPool : public std::enable_shared_from_this<PostgreSQLConnectionPool> {
public:
    /**
     * @brief Create an empty pool. No connection is opened until acquire().
     * @param config Connection settings with host and port already resolved.
     */
    static std::shared_ptr<PostgreSQLConnectionPool> create(const ConnectionConfig& config,
                                                            const PostgreSQLPoolOptions& options);

    ~PostgreSQLConnectionPool();

    PostgreSQLConnectionPool(const PostgreSQLConnectionPool&) = delete;
    PostgreSQLConnectionPool& operator=(const PostgreSQLConnectionPool&) = delete;

    /**
     * @brief Acquire a connection using the configured acquire timeout.
     * @throws ConnectionError if a new connection cannot be established.
     * @throws TimeoutError if the pool stays exhausted past the timeout.
     */
    std::unique_ptr<PostgreSQLConnection> acquire();
    std::unique_ptr<PostgreSQLConnection> acquire(std::chrono::milliseconds timeout);

    /**
     * @brief Return a healthy connection to the idle queue.
     */
    void releaseConnection(PGconn* conn);

    /**
     * @brief Close a connection that must not be reused.
     */
    void discardConnection(PGconn* conn);

    size_t availableCount() const;
    size_t totalCount() const;
    size_t waitingCount() const;

    /**
     * @brief Close all idle connections and refuse further acquisitions.
     *
     * Connections that are checked out are closed when released.
     */
    void drain();

    /**
     * @brief Build a libpq keyword/value connection string.
     *
     * Values are single-quoted with backslash escaping so passwords and
     * database names may contain spaces or quotes.
     */
    static std::string buildConnInfo(const ConnectionConfig& config,
                                     std::chrono::seconds connectTimeout);

private:
    PostgreSQLConnectionPool(const ConnectionConfig& config, const PostgreSQLPoolOptions& options);

    PGconn* createConnection();
    bool validateConnection(PGconn* conn);
    void destroyConnection(PGconn* conn);

    struct IdleConnection {
        PGconn* conn;
        std::chrono::steady_clock::time_point since;
    };

    ConnectionConfig m_config;
    PostgreSQLPoolOptions m_options;

    std::deque<IdleConnection> m_available;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;

    std::atomic<size_t> m_createdCount{0};
    std::atomic<size_t> m_waitingCount{0};
    bool m_shutdown = false;
};

}  // namespace dbbridge
