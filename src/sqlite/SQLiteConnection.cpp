/**
 * @file SQLiteConnection.cpp
 * @brief Implementation of RAII SQLite connection wrapper.
 */

#include "SQLiteConnection.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace dbbridge {

namespace {
constexpr int kBusyTimeoutMs = 5000;
}

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteConnection::SQLiteConnection(const std::string& dbPath) : m_path(dbPath) {
    int rc = sqlite3_open_v2(dbPath.c_str(), &m_db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string message = m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc);
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
        spdlog::error("Failed to open SQLite database '{}': {}", dbPath, message);
        throw ConnectionError("Failed to open SQLite database '" + dbPath + "': " + message);
    }

    sqlite3_busy_timeout(m_db, kBusyTimeoutMs);
}

SQLiteConnection::~SQLiteConnection() {
    if (m_db) {
        sqlite3_close(m_db);
    }
}

// ============================================================================
// Move Operations
// ============================================================================

SQLiteConnection::SQLiteConnection(SQLiteConnection&& other) noexcept
    : m_db(other.m_db), m_path(std::move(other.m_path)) {
    other.m_db = nullptr;
}

SQLiteConnection& SQLiteConnection::operator=(SQLiteConnection&& other) noexcept {
    if (this != &other) {
        if (m_db) {
            sqlite3_close(m_db);
        }
        m_db = other.m_db;
        m_path = std::move(other.m_path);
        other.m_db = nullptr;
    }
    return *this;
}

// ============================================================================
// Query Execution
// ============================================================================

void SQLiteConnection::execute(const std::string& sql) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string message = errMsg ? errMsg : error();
        if (errMsg) sqlite3_free(errMsg);
        spdlog::debug("SQLite exec failed: {}", message);
        throw QueryError(message);
    }
}

sqlite3_stmt* SQLiteConnection::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = error();
        if (stmt) sqlite3_finalize(stmt);
        spdlog::debug("SQLite prepare failed: {}", message);
        throw QueryError(message);
    }
    return stmt;
}

sqlite3_stmt* SQLiteConnection::prepareNext(const char*& tail) {
    // Blank trailing text compiles to a null statement; skip until real SQL
    while (tail && *tail) {
        sqlite3_stmt* stmt = nullptr;
        const char* next = nullptr;
        int rc = sqlite3_prepare_v2(m_db, tail, -1, &stmt, &next);
        if (rc != SQLITE_OK) {
            std::string message = error();
            if (stmt) sqlite3_finalize(stmt);
            throw QueryError(message);
        }
        tail = next;
        if (stmt) return stmt;
    }
    return nullptr;
}

// ============================================================================
// Error and Status Information
// ============================================================================

const char* SQLiteConnection::error() const {
    return m_db ? sqlite3_errmsg(m_db) : "no connection";
}

int SQLiteConnection::errorCode() const {
    return m_db ? sqlite3_errcode(m_db) : SQLITE_ERROR;
}

int64_t SQLiteConnection::lastInsertRowId() const {
    return m_db ? sqlite3_last_insert_rowid(m_db) : 0;
}

int SQLiteConnection::changes() const {
    return m_db ? sqlite3_changes(m_db) : 0;
}

}  // namespace dbbridge
