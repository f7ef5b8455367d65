#pragma once

/**
 * @file RedisDriver.hpp
 * @brief DatabaseDriver for Redis plus key-level browsing and editing.
 */

#include "DatabaseDriver.hpp"
#include "RedisConnection.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace dbbridge {

/**
 * @class RedisDriver
 * @brief Redis implementation of the driver capability set.
 *
 * Redis has no tables. listTables() reports a single "keyspace" entry and the
 * structure calls return empty results; keys are browsed and edited through
 * the key operations instead.
 *
 * Connection Model:
 * - One shared connection, opened on first use
 * - Calls are serialized on it with a mutex
 * - Any transport failure drops the connection; the next call reconnects
 *
 * With ssl set the connection is negotiated over TLS (the rediss:// scheme).
 */
class RedisDriver : public DatabaseDriver {
public:
    /**
     * @brief Scan progress: (iteration, maxIterations, keysFound, batch).
     */
    using ScanProgress = std::function<void(uint32_t, uint32_t, size_t, const std::vector<std::string>&)>;

    /**
     * @param config Connection settings; database holds the db index.
     * @throws ValidationError if database is not a valid index.
     */
    RedisDriver(ConnectionConfig config, const DriverSettings& settings);
    ~RedisDriver() override;

    DatabaseType type() const override { return DatabaseType::Redis; }

    TestConnectionResult testConnection() override;
    std::vector<TableInfo> listTables() override;
    TableDataResponse getTableData(const TableDataRequest& request) override;
    TableStructure getTableStructure(const std::string& schema, const std::string& table) override;
    QueryResult executeQuery(const std::string& sql) override;
    SchemaOverview getSchemaOverview() override;

    // ----- Key operations -----

    /**
     * @brief Bounded, resumable SCAN over keys matching a glob pattern.
     *
     * Stops after `limit` keys or scan_max_iterations SCAN calls, whichever
     * comes first. The returned cursor resumes the scan; "0" with
     * scanComplete means the keyspace has been exhausted.
     *
     * @param cursor "" or "0" to start, otherwise a cursor from a previous call.
     */
    RedisKeyListResponse searchKeys(const std::string& pattern, size_t limit,
                                    const std::string& cursor = "",
                                    const ScanProgress& progress = nullptr);

    /**
     * @throws QueryError "Key '<k>' does not exist" for a missing key.
     */
    RedisKeyDetails getKeyDetails(const std::string& key);

    /**
     * @return true if the key existed.
     */
    bool deleteKey(const std::string& key);

    void setStringKey(const std::string& key, const std::string& value, std::optional<int64_t> ttl);

    // Replace the key atomically. Empty input is rejected with ValidationError.
    void setListKey(const std::string& key, const std::vector<std::string>& values, std::optional<int64_t> ttl);
    void setSetKey(const std::string& key, const std::vector<std::string>& members, std::optional<int64_t> ttl);
    void setHashKey(const std::string& key, const std::vector<std::pair<std::string, std::string>>& fields,
                    std::optional<int64_t> ttl);
    void setZsetKey(const std::string& key, const std::vector<std::pair<std::string, double>>& members,
                    std::optional<int64_t> ttl);

    /**
     * @brief EXPIRE with a ttl, PERSIST without one.
     */
    void updateTtl(const std::string& key, std::optional<int64_t> ttl);

    /**
     * @brief Split a command line on whitespace; double quotes group words.
     */
    static std::vector<std::string> tokenizeCommand(const std::string& command);

    int database() const { return m_database; }

private:
    std::unique_ptr<RedisConnection> openConnection() const;
    RedisConnection& connectionLocked();

    template<typename Func>
    auto withConnection(Func&& fn);

    void replaceKey(const std::string& key, std::vector<std::string> write, std::optional<int64_t> ttl);

    ConnectionConfig m_config;
    int m_database = 0;
    RedisScanConfig m_scan;
    std::chrono::seconds m_connectTimeout;

    std::unique_ptr<RedisConnection> m_connection;
    std::mutex m_mutex;
};

}  // namespace dbbridge
