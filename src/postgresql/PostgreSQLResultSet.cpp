#include "PostgreSQLResultSet.hpp"

namespace dbbridge {

PostgreSQLResultSet::PostgreSQLResultSet(PGresult* res) : m_res(res) {}

PostgreSQLResultSet::~PostgreSQLResultSet() {
    if (m_res) {
        PQclear(m_res);
    }
}

PostgreSQLResultSet::PostgreSQLResultSet(PostgreSQLResultSet&& other) noexcept
    : m_res(other.m_res) {
    other.m_res = nullptr;
}

PostgreSQLResultSet& PostgreSQLResultSet::operator=(PostgreSQLResultSet&& other) noexcept {
    if (this != &other) {
        if (m_res) PQclear(m_res);
        m_res = other.m_res;
        other.m_res = nullptr;
    }
    return *this;
}

bool PostgreSQLResultSet::isOk() const {
    if (!m_res) return false;
    ExecStatusType s = PQresultStatus(m_res);
    return s == PGRES_TUPLES_OK || s == PGRES_COMMAND_OK || s == PGRES_EMPTY_QUERY;
}

bool PostgreSQLResultSet::hasData() const {
    return m_res && PQresultStatus(m_res) == PGRES_TUPLES_OK;
}

ExecStatusType PostgreSQLResultSet::status() const {
    return m_res ? PQresultStatus(m_res) : PGRES_FATAL_ERROR;
}

std::string PostgreSQLResultSet::errorMessage() const {
    if (!m_res) return "";
    const char* msg = PQresultErrorMessage(m_res);
    return msg ? msg : "";
}

int PostgreSQLResultSet::numFields() const {
    return m_res ? PQnfields(m_res) : 0;
}

int PostgreSQLResultSet::numRows() const {
    return m_res ? PQntuples(m_res) : 0;
}

std::string PostgreSQLResultSet::getValue(int row, int col) const {
    if (!m_res || PQgetisnull(m_res, row, col)) return "";
    return std::string(PQgetvalue(m_res, row, col), PQgetlength(m_res, row, col));
}

bool PostgreSQLResultSet::isNull(int row, int col) const {
    return !m_res || PQgetisnull(m_res, row, col);
}

bool PostgreSQLResultSet::getBool(int row, int col) const {
    std::string value = getValue(row, col);
    return value == "t" || value == "true" || value == "1";
}

const char* PostgreSQLResultSet::fieldName(int col) const {
    return m_res ? PQfname(m_res, col) : "";
}

Oid PostgreSQLResultSet::fieldType(int col) const {
    return m_res ? PQftype(m_res, col) : 0;
}

int PostgreSQLResultSet::fieldIndex(const char* name) const {
    return m_res ? PQfnumber(m_res, name) : -1;
}

}  // namespace dbbridge
