/**
 * @file SQLiteResultSet.cpp
 * @brief Implementation of RAII SQLite result set wrapper.
 */

#include "SQLiteResultSet.hpp"
#include "ErrorHandler.hpp"

namespace dbbridge {

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteResultSet::SQLiteResultSet(sqlite3_stmt* stmt) : m_stmt(stmt) {}

SQLiteResultSet::~SQLiteResultSet() {
    finalize();
}

// ============================================================================
// Move Operations
// ============================================================================

SQLiteResultSet::SQLiteResultSet(SQLiteResultSet&& other) noexcept
    : m_stmt(other.m_stmt) {
    other.m_stmt = nullptr;
}

SQLiteResultSet& SQLiteResultSet::operator=(SQLiteResultSet&& other) noexcept {
    if (this != &other) {
        finalize();
        m_stmt = other.m_stmt;
        other.m_stmt = nullptr;
    }
    return *this;
}

// ============================================================================
// Row Iteration
// ============================================================================

bool SQLiteResultSet::step() {
    if (!m_stmt) return false;

    int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;

    throw QueryError(sqlite3_errmsg(sqlite3_db_handle(m_stmt)));
}

// ============================================================================
// Column Access
// ============================================================================

int SQLiteResultSet::columnCount() const {
    return m_stmt ? sqlite3_column_count(m_stmt) : 0;
}

std::string SQLiteResultSet::columnName(int index) const {
    if (!m_stmt) return "";
    const char* name = sqlite3_column_name(m_stmt, index);
    return name ? name : "";
}

std::string SQLiteResultSet::columnDeclType(int index) const {
    if (!m_stmt) return "";
    const char* type = sqlite3_column_decltype(m_stmt, index);
    return type ? type : "";
}

int SQLiteResultSet::columnType(int index) const {
    return m_stmt ? sqlite3_column_type(m_stmt, index) : SQLITE_NULL;
}

std::string SQLiteResultSet::getString(int index) const {
    if (!m_stmt || isNull(index)) return "";
    const unsigned char* text = sqlite3_column_text(m_stmt, index);
    int length = sqlite3_column_bytes(m_stmt, index);
    return text ? std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(length)) : "";
}

int64_t SQLiteResultSet::getInt64(int index) const {
    if (!m_stmt) return 0;
    return sqlite3_column_int64(m_stmt, index);
}

double SQLiteResultSet::getDouble(int index) const {
    if (!m_stmt) return 0.0;
    return sqlite3_column_double(m_stmt, index);
}

const unsigned char* SQLiteResultSet::getBlob(int index, int& length) const {
    length = 0;
    if (!m_stmt) return nullptr;
    const void* data = sqlite3_column_blob(m_stmt, index);
    length = sqlite3_column_bytes(m_stmt, index);
    return static_cast<const unsigned char*>(data);
}

bool SQLiteResultSet::isNull(int index) const {
    if (!m_stmt) return true;
    return sqlite3_column_type(m_stmt, index) == SQLITE_NULL;
}

// ============================================================================
// Statement Management
// ============================================================================

void SQLiteResultSet::reset() {
    if (m_stmt) {
        sqlite3_reset(m_stmt);
    }
}

void SQLiteResultSet::finalize() {
    if (m_stmt) {
        sqlite3_finalize(m_stmt);
        m_stmt = nullptr;
    }
}

}  // namespace dbbridge
