#include "PostgreSQLConnection.hpp"
#include "PostgreSQLConnectionPool.hpp"
#include <cstdlib>

namespace dbbridge {

PostgreSQLConnection::PostgreSQLConnection(std::shared_ptr<PostgreSQLConnectionPool> pool, PGconn* conn)
    : m_pool(std::move(pool)), m_conn(conn) {
}

PostgreSQLConnection::~PostgreSQLConnection() {
    release();
}

PostgreSQLConnection::PostgreSQLConnection(PostgreSQLConnection&& other) noexcept
    : m_pool(std::move(other.m_pool)), m_conn(other.m_conn), m_invalid(other.m_invalid) {
    other.m_conn = nullptr;
}

PostgreSQLConnection& PostgreSQLConnection::operator=(PostgreSQLConnection&& other) noexcept {
    if (this != &other) {
        release();
        m_pool = std::move(other.m_pool);
        m_conn = other.m_conn;
        m_invalid = other.m_invalid;
        other.m_conn = nullptr;
    }
    return *this;
}

bool PostgreSQLConnection::isValid() const {
    return m_conn != nullptr && PQstatus(m_conn) == CONNECTION_OK;
}

bool PostgreSQLConnection::ping() {
    if (!m_conn) return false;

    PGresult* res = PQexec(m_conn, "SELECT 1");
    bool ok = res && PQresultStatus(res) == PGRES_TUPLES_OK;
    if (res) PQclear(res);
    return ok;
}

PGresult* PostgreSQLConnection::execute(const std::string& sql) {
    if (!m_conn) return nullptr;
    return PQexec(m_conn, sql.c_str());
}

PGresult* PostgreSQLConnection::executeParams(const std::string& sql,
                                              const std::vector<std::string>& params) {
    if (!m_conn) return nullptr;

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p.c_str());
    }

    return PQexecParams(m_conn, sql.c_str(), static_cast<int>(values.size()), nullptr,
                        values.data(), nullptr, nullptr, 0);
}

const char* PostgreSQLConnection::error() const {
    if (!m_conn) return "No connection";
    return PQerrorMessage(m_conn);
}

ConnStatusType PostgreSQLConnection::status() const {
    if (!m_conn) return CONNECTION_BAD;
    return PQstatus(m_conn);
}

uint64_t PostgreSQLConnection::affectedRows(PGresult* result) const {
    if (!result) return 0;
    const char* affected = PQcmdTuples(result);
    if (!affected || !*affected) return 0;
    return std::strtoull(affected, nullptr, 10);
}

void PostgreSQLConnection::release() {
    if (!m_conn) return;

    if (m_pool) {
        if (m_invalid || PQstatus(m_conn) != CONNECTION_OK) {
            m_pool->discardConnection(m_conn);
        } else {
            m_pool->releaseConnection(m_conn);
        }
    } else {
        PQfinish(m_conn);
    }
    m_conn = nullptr;
}

}  // namespace dbbridge
