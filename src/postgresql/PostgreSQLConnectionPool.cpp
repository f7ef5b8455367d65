/**
 * @file PostgreSQLConnectionPool.cpp
 * @brief Implementation of the bounded libpq connection pool.
 */

#include "PostgreSQLConnectionPool.hpp"
#include "ErrorHandler.hpp"
#include "FormatConverter.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace dbbridge {

namespace {

std::string quoteConnValue(const std::string& value) {
    std::string result = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') result += '\\';
        result += c;
    }
    result += "'";
    return result;
}

}  // namespace

// ============================================================================
// Construction and Destruction
// ============================================================================

std::shared_ptr<PostgreSQLConnectionPool> PostgreSQLConnectionPool::create(
    const ConnectionConfig& config, const PostgreSQLPoolOptions& options) {
    return std::shared_ptr<PostgreSQLConnectionPool>(new PostgreSQLConnectionPool(config, options));
}

PostgreSQLConnectionPool::PostgreSQLConnectionPool(const ConnectionConfig& config,
                                                   const PostgreSQLPoolOptions& options)
    : m_config(config), m_options(options) {
    spdlog::debug("PostgreSQL pool for {}:{} created (max {} connections)",
                  m_config.effectiveHost(), m_config.effectivePort(), m_options.maxConnections);
}

PostgreSQLConnectionPool::~PostgreSQLConnectionPool() {
    drain();
}

// ============================================================================
// Connection Creation and Validation
// ============================================================================

std::string PostgreSQLConnectionPool::buildConnInfo(const ConnectionConfig& config,
                                                    std::chrono::seconds connectTimeout) {
    std::ostringstream connInfo;

    connInfo << "host=" << quoteConnValue(config.effectiveHost());
    connInfo << " port=" << config.effectivePort();

    if (!config.username.empty()) {
        connInfo << " user=" << quoteConnValue(config.username);
    }

    if (!config.password.empty()) {
        connInfo << " password=" << quoteConnValue(config.password);
    }

    if (!config.database.empty()) {
        connInfo << " dbname=" << quoteConnValue(config.database);
    }

    connInfo << " connect_timeout=" << connectTimeout.count();
    connInfo << " sslmode=" << (config.ssl ? "require" : "disable");
    connInfo << " application_name=dbbridge";

    return connInfo.str();
}

PGconn* PostgreSQLConnectionPool::createConnection() {
    std::string connInfo = buildConnInfo(m_config, m_options.connectTimeout);

    PGconn* conn = PQconnectdb(connInfo.c_str());
    if (!conn) {
        throw ConnectionError("Failed to allocate PostgreSQL connection");
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        std::string errorMsg = FormatConverter::trim(PQerrorMessage(conn));
        PQfinish(conn);

        if (errorMsg.find("timeout expired") != std::string::npos) {
            throw TimeoutError("Connection timed out after " +
                               std::to_string(m_options.connectTimeout.count()) + " seconds");
        }
        throw ConnectionError("Failed to connect to PostgreSQL: " + errorMsg);
    }

    PQsetClientEncoding(conn, "UTF8");

    spdlog::debug("Created new PostgreSQL connection (total: {})", m_createdCount.load());
    return conn;
}

bool PostgreSQLConnectionPool::validateConnection(PGconn* conn) {
    if (!conn) return false;

    if (PQstatus(conn) != CONNECTION_OK) {
        spdlog::debug("PostgreSQL connection validation failed: bad status");
        return false;
    }

    PGresult* res = PQexec(conn, "SELECT 1");
    bool ok = res && PQresultStatus(res) == PGRES_TUPLES_OK;
    if (res) PQclear(res);

    if (!ok) {
        spdlog::debug("PostgreSQL connection validation failed: ping query failed");
    }
    return ok;
}

void PostgreSQLConnectionPool::destroyConnection(PGconn* conn) {
    if (conn) {
        PQfinish(conn);
        m_createdCount--;
        spdlog::debug("Destroyed PostgreSQL connection (remaining: {})", m_createdCount.load());
    }
}

// ============================================================================
// Connection Acquisition
// ============================================================================

std::unique_ptr<PostgreSQLConnection> PostgreSQLConnectionPool::acquire() {
    return acquire(std::chrono::duration_cast<std::chrono::milliseconds>(m_options.acquireTimeout));
}

std::unique_ptr<PostgreSQLConnection> PostgreSQLConnectionPool::acquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);

    m_waitingCount++;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        if (m_shutdown) {
            m_waitingCount--;
            throw ConnectionError("PostgreSQL connection pool is shutting down");
        }

        // Reuse an idle connection if one is still fresh and alive
        while (!m_available.empty()) {
            IdleConnection idle = m_available.front();
            m_available.pop_front();

            if (std::chrono::steady_clock::now() - idle.since > m_options.idleTimeout) {
                destroyConnection(idle.conn);
                continue;
            }

            lock.unlock();
            if (validateConnection(idle.conn)) {
                m_waitingCount--;
                return std::make_unique<PostgreSQLConnection>(shared_from_this(), idle.conn);
            }
            destroyConnection(idle.conn);
            lock.lock();
        }

        // Open a new connection if under the cap
        if (m_createdCount < m_options.maxConnections) {
            m_createdCount++;
            lock.unlock();
            try {
                PGconn* conn = createConnection();
                m_waitingCount--;
                return std::make_unique<PostgreSQLConnection>(shared_from_this(), conn);
            } catch (const std::exception& e) {
                m_createdCount--;
                m_waitingCount--;
                m_cv.notify_one();
                spdlog::error("Failed to create PostgreSQL connection: {}", e.what());
                throw;
            }
        }

        // Wait for a connection to be released
        if (m_cv.wait_until(lock, deadline) == std::cv_status::timeout) {
            m_waitingCount--;
            throw TimeoutError("Timeout waiting for PostgreSQL connection");
        }
    }
}

// ============================================================================
// Connection Release
// ============================================================================

void PostgreSQLConnectionPool::releaseConnection(PGconn* conn) {
    if (!conn) return;

    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_shutdown) {
        destroyConnection(conn);
        return;
    }

    m_available.push_back({conn, std::chrono::steady_clock::now()});
    m_cv.notify_one();
}

void PostgreSQLConnectionPool::discardConnection(PGconn* conn) {
    if (!conn) return;

    std::lock_guard<std::mutex> lock(m_mutex);
    destroyConnection(conn);
    m_cv.notify_one();
}

// ============================================================================
// Pool Statistics and Management
// ============================================================================

size_t PostgreSQLConnectionPool::availableCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_available.size();
}

size_t PostgreSQLConnectionPool::totalCount() const {
    return m_createdCount.load();
}

size_t PostgreSQLConnectionPool::waitingCount() const {
    return m_waitingCount.load();
}

void PostgreSQLConnectionPool::drain() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_shutdown && m_available.empty()) {
        return;
    }
    m_shutdown = true;

    while (!m_available.empty()) {
        destroyConnection(m_available.front().conn);
        m_available.pop_front();
    }

    m_cv.notify_all();
    spdlog::debug("PostgreSQL connection pool drained");
}

}  // namespace dbbridge
