/**
 * @file ClickHouseHttpClient.cpp
 * @brief Implementation of the ClickHouse HTTP client.
 */

#include "ClickHouseHttpClient.hpp"
#include "ErrorHandler.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <mutex>

namespace dbbridge {

namespace {

std::once_flag g_curlInit;

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

std::string urlEncode(const std::string& value) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw ConnectionError("Failed to initialize curl");
    }
    char* escaped = curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        throw ValidationError("Failed to encode URL parameter: " + value);
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

}  // namespace

ClickHouseHttpClient::ClickHouseHttpClient(const std::string& host, uint16_t port, bool ssl,
                                           std::string database, std::string user, std::string password,
                                           std::chrono::seconds connectTimeout,
                                           std::chrono::seconds requestTimeout)
    : m_database(std::move(database)),
      m_user(std::move(user)),
      m_password(std::move(password)),
      m_connectTimeout(connectTimeout),
      m_requestTimeout(requestTimeout) {
    std::call_once(g_curlInit, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });

    m_url = std::string(ssl ? "https" : "http") + "://" + host + ":" + std::to_string(port) +
            "/?database=" + urlEncode(m_database);
}

// ============================================================================
// Requests
// ============================================================================

ClickHouseResponse ClickHouseHttpClient::post(const std::string& sql) const {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw ConnectionError("Failed to initialize curl");
    }

    ClickHouseResponse response;
    std::string credentials = m_user + ":" + m_password;

    curl_easy_setopt(curl.get(), CURLOPT_URL, m_url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, sql.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(sql.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
    curl_easy_setopt(curl.get(), CURLOPT_USERPWD, credentials.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(m_connectTimeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(m_requestTimeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "dbbridge");

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        std::string error = curl_easy_strerror(res);
        spdlog::error("ClickHouse request to {} failed: {}", m_url, error);
        if (res == CURLE_OPERATION_TIMEDOUT) {
            throw TimeoutError("ClickHouse request timed out: " + error);
        }
        throw ConnectionError("Failed to connect to ClickHouse: " + error);
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

std::vector<Value> ClickHouseHttpClient::query(const std::string& sql) const {
    ClickHouseResponse response = post(withRowFormat(sql));
    if (!response.ok()) {
        throw QueryError(FormatConverter::trim(response.body));
    }
    return FormatConverter::parseJSONEachRow(response.body);
}

void ClickHouseHttpClient::command(const std::string& sql) const {
    ClickHouseResponse response = post(sql);
    if (!response.ok()) {
        throw QueryError(FormatConverter::trim(response.body));
    }
}

std::string ClickHouseHttpClient::withRowFormat(const std::string& sql) {
    std::string cleaned = FormatConverter::trim(sql);
    while (!cleaned.empty() && cleaned.back() == ';') {
        cleaned.pop_back();
        cleaned = FormatConverter::trim(cleaned);
    }

    if (FormatConverter::toUpper(cleaned).find("FORMAT ") != std::string::npos) {
        return cleaned;
    }
    return cleaned + " FORMAT JSONEachRow";
}

}  // namespace dbbridge
