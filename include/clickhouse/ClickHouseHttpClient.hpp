#pragma once

/**
 * @file ClickHouseHttpClient.hpp
 * @brief Minimal ClickHouse HTTP interface client built on libcurl.
 */

#include "FormatConverter.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace dbbridge {

struct ClickHouseResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @class ClickHouseHttpClient
 * @brief Sends SQL to ClickHouse over HTTP(S).
 *
 * Every request is a POST of the SQL text to
 * `http(s)://host:port/?database=<db>` with basic authentication. A fresh
 * curl easy handle is used per request, so the client is stateless and may be
 * shared between threads.
 *
 * Errors:
 * - curl could not complete the request: ConnectionError (TimeoutError when
 *   a connect or request deadline expired)
 * - server answered with a non-2xx status: QueryError carrying the body
 */
class ClickHouseHttpClient {
public:
    ClickHouseHttpClient(const std::string& host, uint16_t port, bool ssl,
                         std::string database, std::string user, std::string password,
                         std::chrono::seconds connectTimeout, std::chrono::seconds requestTimeout);

    /**
     * @brief POST raw SQL and return status and body without interpreting them.
     */
    ClickHouseResponse post(const std::string& sql) const;

    /**
     * @brief Run a row-returning query in JSONEachRow format.
     */
    std::vector<Value> query(const std::string& sql) const;

    /**
     * @brief Run a statement whose output is ignored.
     */
    void command(const std::string& sql) const;

    /**
     * @brief Strip whitespace and trailing ';' and append FORMAT JSONEachRow
     *        unless the statement names a format already.
     */
    static std::string withRowFormat(const std::string& sql);

    const std::string& url() const { return m_url; }
    const std::string& database() const { return m_database; }

private:
    std::string m_url;
    std::string m_database;
    std::string m_user;
    std::string m_password;
    std::chrono::seconds m_connectTimeout;
    std::chrono::seconds m_requestTimeout;
};

}  // namespace dbbridge
