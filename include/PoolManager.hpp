#pragma once

/**
 * @file PoolManager.hpp
 * @brief Cache of live drivers keyed by connection identifier.
 */

#include "ConnectionStore.hpp"
#include "DriverFactory.hpp"
#include "RedisDriver.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace dbbridge {

enum class ConnectionStatus {
    Connected,
    Disconnected,
    Reconnecting
};

std::string connectionStatusToString(ConnectionStatus status);

struct PoolEntry {
    ManagedDriver driver;  // null when the driver could not be built
    ConnectionConfig config;
    ConnectionStatus status = ConnectionStatus::Disconnected;
    std::chrono::steady_clock::time_point lastUsed;
    std::optional<std::string> lastError;
};

/**
 * @class PoolManager
 * @brief Owns one driver (and its SSH tunnel) per connection identifier.
 *
 * Locking:
 * - m_entriesMutex guards the entry map; every access is a short map operation
 * - m_locksMutex guards the map of per-identifier connect mutexes
 * - a per-identifier mutex serializes connect/reconnect for that identifier
 *   and is never taken while m_entriesMutex is held
 *
 * Driver operations run without any manager lock held, so calls on the same
 * identifier proceed concurrently.
 *
 * Operation wrappers (listTables() ... updateTtl()) make sure a driver exists,
 * run the operation, and on failure rebuild the driver and retry exactly once.
 * ValidationError and UnsupportedOperationError are never retried.
 */
class PoolManager {
public:
    PoolManager(std::shared_ptr<DriverFactory> factory, std::shared_ptr<ConnectionStore> store);
    ~PoolManager();

    PoolManager(const PoolManager&) = delete;
    PoolManager& operator=(const PoolManager&) = delete;

    // ----- Connection lifecycle -----

    /**
     * @brief Cached driver if Connected, otherwise connect().
     * @throws ConnectionError if the new driver fails its connection test.
     */
    ManagedDriver getConnection(const std::string& id, const ConnectionConfig& config);

    /**
     * @brief Build a fresh driver, test it and store it, replacing any previous entry.
     *
     * Failures are recorded on the entry and reported in the result.
     * @throws ValidationError if the configuration is unusable.
     */
    TestConnectionResult connect(const std::string& id, const ConnectionConfig& config);

    /**
     * @brief Connect from the connection store unless an entry is already cached.
     *
     * Concurrent callers for the same identifier cause a single connect.
     * @throws ConnectionError "Connection not found" for an unknown identifier,
     *         or the connect failure message.
     */
    void ensureConnection(const std::string& id);

    /**
     * @brief Drop the entry and connect again with the stored config.
     * @throws ConnectionError if the new driver fails its connection test.
     */
    void reconnect(const std::string& id);

    void disconnect(const std::string& id);

    /**
     * @brief Drop every entry, closing all tunnels.
     */
    void shutdown();

    // ----- Entry state -----

    ConnectionStatus getStatus(const std::string& id) const;
    std::optional<std::string> getLastError(const std::string& id) const;
    std::optional<std::chrono::steady_clock::time_point> getLastUsed(const std::string& id) const;
    void touch(const std::string& id);
    void markDisconnected(const std::string& id, std::optional<std::string> error = std::nullopt);

    /**
     * @brief Re-test the cached driver and update the entry in place.
     */
    TestConnectionResult healthCheck(const std::string& id);

    ManagedDriver getCached(const std::string& id) const;
    std::optional<ConnectionConfig> getConfig(const std::string& id) const;
    std::vector<std::string> connectionIds() const;

    // ----- Driver operations -----

    std::vector<TableInfo> listTables(const std::string& id);
    TableDataResponse getTableData(const std::string& id, const TableDataRequest& request);
    TableStructure getTableStructure(const std::string& id, const std::string& schema, const std::string& table);
    QueryResult executeQuery(const std::string& id, const std::string& sql);
    SchemaOverview getSchemaOverview(const std::string& id);

    // ----- Redis key operations -----
    // UnsupportedOperationError when the identifier is not a Redis connection.

    RedisKeyListResponse searchKeys(const std::string& id, const std::string& pattern, size_t limit,
                                    const std::string& cursor = "",
                                    const RedisDriver::ScanProgress& progress = nullptr);
    RedisKeyDetails getKeyDetails(const std::string& id, const std::string& key);
    bool deleteKey(const std::string& id, const std::string& key);
    void setStringKey(const std::string& id, const std::string& key, const std::string& value,
                      std::optional<int64_t> ttl);
    void setListKey(const std::string& id, const std::string& key, const std::vector<std::string>& values,
                    std::optional<int64_t> ttl);
    void setSetKey(const std::string& id, const std::string& key, const std::vector<std::string>& members,
                   std::optional<int64_t> ttl);
    void setHashKey(const std::string& id, const std::string& key,
                    const std::vector<std::pair<std::string, std::string>>& fields, std::optional<int64_t> ttl);
    void setZsetKey(const std::string& id, const std::string& key,
                    const std::vector<std::pair<std::string, double>>& members, std::optional<int64_t> ttl);
    void updateTtl(const std::string& id, const std::string& key, std::optional<int64_t> ttl);

private:
    std::shared_ptr<std::mutex> connectionLock(const std::string& id);
    ManagedDriver findConnected(const std::string& id) const;
    ConnectionConfig storedConfig(const std::string& id) const;
    ManagedDriver requireDriver(const std::string& id) const;

    template<typename Func>
    auto withConnection(const std::string& id, const char* operation, Func&& fn);

    template<typename Func>
    auto withRedis(const std::string& id, const char* operation, Func&& fn);

    std::shared_ptr<DriverFactory> m_factory;
    std::shared_ptr<ConnectionStore> m_store;

    mutable std::shared_mutex m_entriesMutex;
    std::map<std::string, PoolEntry> m_entries;

    mutable std::shared_mutex m_locksMutex;
    std::map<std::string, std::shared_ptr<std::mutex>> m_locks;
};

}  // namespace dbbridge
