/**
 * @file PoolManager.cpp
 * @brief Implementation of the per-identifier driver cache.
 */

#include "PoolManager.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace dbbridge {

std::string connectionStatusToString(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Connected: return "connected";
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Reconnecting: return "reconnecting";
    }
    return "unknown";
}

PoolManager::PoolManager(std::shared_ptr<DriverFactory> factory, std::shared_ptr<ConnectionStore> store)
    : m_factory(std::move(factory)), m_store(std::move(store)) {}

PoolManager::~PoolManager() {
    shutdown();
}

// ============================================================================
// Connection Lifecycle
// ============================================================================

ManagedDriver PoolManager::findConnected(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_entriesMutex);
    auto it = m_entries.find(id);
    if (it != m_entries.end() && it->second.status == ConnectionStatus::Connected && it->second.driver) {
        return it->second.driver;
    }
    return nullptr;
}

ManagedDriver PoolManager::getConnection(const std::string& id, const ConnectionConfig& config) {
    if (ManagedDriver driver = findConnected(id)) {
        return driver;
    }

    // Concurrent callers for the same identifier wait here; only the first connects
    auto mutex = connectionLock(id);
    std::lock_guard<std::mutex> guard(*mutex);

    if (ManagedDriver driver = findConnected(id)) {
        return driver;
    }

    TestConnectionResult result = connect(id, config);
    if (!result.success) {
        throw ConnectionError(result.message);
    }
    return requireDriver(id);
}

TestConnectionResult PoolManager::connect(const std::string& id, const ConnectionConfig& config) {
    {
        std::unique_lock<std::shared_mutex> lock(m_entriesMutex);
        auto it = m_entries.find(id);
        if (it != m_entries.end()) {
            it->second.status = ConnectionStatus::Reconnecting;
        }
    }

    spdlog::debug("[Pool] Connecting '{}' ({})", id, databaseTypeToString(config.db_type));

    PoolEntry entry;
    entry.config = config;
    entry.lastUsed = std::chrono::steady_clock::now();

    TestConnectionResult result;
    try {
        entry.driver = m_factory->create(config);
        result = entry.driver->testConnection();
    } catch (const ValidationError& e) {
        markDisconnected(id, std::string(e.what()));
        throw;
    } catch (const DatabaseError& e) {
        result.success = false;
        result.message = e.what();
    }

    entry.status = result.success ? ConnectionStatus::Connected : ConnectionStatus::Disconnected;
    if (!result.success) {
        entry.lastError = result.message;
        std::string during = ErrorContext::current();
        spdlog::error("[Pool] Connection '{}' failed{}: {}", id,
                      during.empty() ? std::string() : " during " + during, result.message);
    } else {
        spdlog::info("[Pool] Connection '{}' established", id);
    }

    // The previous entry (and its tunnel) is released after the lock is dropped
    PoolEntry previous;
    {
        std::unique_lock<std::shared_mutex> lock(m_entriesMutex);
        auto it = m_entries.find(id);
        if (it != m_entries.end()) {
            previous = std::move(it->second);
            it->second = std::move(entry);
        } else {
            m_entries.emplace(id, std::move(entry));
        }
    }
    return result;
}

void PoolManager::ensureConnection(const std::string& id) {
    auto mutex = connectionLock(id);
    std::lock_guard<std::mutex> guard(*mutex);

    {
        std::shared_lock<std::shared_mutex> lock(m_entriesMutex);
        if (m_entries.count(id) > 0) return;
    }

    TestConnectionResult result = connect(id, storedConfig(id));
    if (!result.success) {
        throw ConnectionError(result.message);
    }
}

void PoolManager::reconnect(const std::string& id) {
    auto mutex = connectionLock(id);
    std::lock_guard<std::mutex> guard(*mutex);

    ConnectionConfig config = storedConfig(id);
    disconnect(id);

    TestConnectionResult result = connect(id, config);
    if (!result.success) {
        throw ConnectionError(result.message);
    }
}

void PoolManager::disconnect(const std::string& id) {
    PoolEntry removed;
    {
        std::unique_lock<std::shared_mutex> lock(m_entriesMutex);
        auto it = m_entries.find(id);
        if (it == m_entries.end()) return;
        removed = std::move(it->second);
        m_entries.erase(it);
    }
    spdlog::debug("[Pool] Disconnected '{}'", id);
}

void PoolManager::shutdown() {
    std::map<std::string, PoolEntry> entries;
    {
        std::unique_lock<std::shared_mutex> lock(m_entriesMutex);
        entries.swap(m_entries);
    }
    if (!entries.empty()) {
        spdlog::info("[Pool] Closing {} connection(s)", entries.size());
    }
}

// ============================================================================
// Entry State
// ============================================================================

ConnectionStatus PoolManager::getStatus(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_entriesMutex);
    auto it = m_entries.find(id);
    return it != m_entries.end() ? it->second.status : ConnectionStatus::Disconnected;
}

std::optional<std::string> PoolManager::getLastError(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_entriesMutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end()) return std::nullopt;
    return it->second.lastError;
}

std::optional<std::chrono::steady_clock::time_point> PoolManager::getLastUsed(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_entriesMutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end()) return std::nullopt;
    return it->second.lastUsed;
}

void PoolManager::touch(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(m_entriesMutex);
    auto it = m_entries.find(id);
    if (it != m_entries.end()) {
        it->second.lastUsed = std::chrono::steady_clock::now();
    }
}

void PoolManager::markDisconnected(const std::string& id, std::optional<std::string> error) {
    std::unique_lock<std::shared_mutex> lock(m_entriesMutex);
    auto it = m_entries.find(id);
    if (it != m_entries.end()) {
        it->second.status = ConnectionStatus::Disconnected;
        it->second.lastError = std::move(error);
    }
}

TestConnectionResult PoolManager::healthCheck(const std::string& id) {
    ManagedDriver driver;
    {
        std::shared_lock<std::shared_mutex> lock(m_entriesMutex);
        auto it = m_entries.find(id);
        if (it == m_entries.end()) {
            return {false, "Connection not found"};
        }
        if (!it->second.driver) {
            return {false, it->second.lastError.value_or("Connection not established")};
        }
        driver = it->second.driver;
    }

    TestConnectionResult result = driver->testConnection();

    std::unique_lock<std::shared_mutex> lock(m_entriesMutex);
    auto it = m_entries.find(id);
    if (it != m_entries.end() && it->second.driver == driver) {
        it->second.status = result.success ? ConnectionStatus::Connected : ConnectionStatus::Disconnected;
        it->second.lastError = result.success ? std::nullopt : std::optional<std::string>(result.message);
    }
    return result;
}

ManagedDriver PoolManager::getCached(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_entriesMutex);
    auto it = m_entries.find(id);
    return it != m_entries.end() ? it->second.driver : nullptr;
}

std::optional<ConnectionConfig> PoolManager::getConfig(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_entriesMutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end()) return std::nullopt;
    return it->second.config;
}

std::vector<std::string> PoolManager::connectionIds() const {
    std::shared_lock<std::shared_mutex> lock(m_entriesMutex);
    std::vector<std::string> ids;
    ids.reserve(m_entries.size());
    for (const auto& [id, entry] : m_entries) {
        ids.push_back(id);
    }
    return ids;
}

// ============================================================================
// Internals
// ============================================================================

std::shared_ptr<std::mutex> PoolManager::connectionLock(const std::string& id) {
    {
        std::shared_lock<std::shared_mutex> lock(m_locksMutex);
        auto it = m_locks.find(id);
        if (it != m_locks.end()) return it->second;
    }

    std::unique_lock<std::shared_mutex> lock(m_locksMutex);
    auto& mutex = m_locks[id];
    if (!mutex) {
        mutex = std::make_shared<std::mutex>();
    }
    return mutex;
}

// The connection store is authoritative; an entry created through connect()
// with an ad-hoc config falls back to that config.
ConnectionConfig PoolManager::storedConfig(const std::string& id) const {
    if (m_store) {
        if (auto config = m_store->find(id)) {
            return *config;
        }
    }
    if (auto config = getConfig(id)) {
        return *config;
    }
    throw ConnectionError("Connection not found");
}

ManagedDriver PoolManager::requireDriver(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_entriesMutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        throw ConnectionError("Connection not found");
    }
    if (!it->second.driver) {
        throw ConnectionError(it->second.lastError.value_or("Connection not established"));
    }
    return it->second.driver;
}

template<typename Func>
auto PoolManager::withConnection(const std::string& id, const char* operation, Func&& fn) {
    ErrorContext context(operation);
    ensureConnection(id);
    touch(id);

    try {
        ManagedDriver driver = requireDriver(id);
        return fn(*driver);
    } catch (const ValidationError&) {
        throw;
    } catch (const UnsupportedOperationError&) {
        throw;
    } catch (const DatabaseError& e) {
        spdlog::warn("[Pool] {} failed: {}, retrying with fresh connection", operation, e.what());
        markDisconnected(id, std::string(e.what()));
    }

    reconnect(id);
    ManagedDriver driver = requireDriver(id);
    return fn(*driver);
}

template<typename Func>
auto PoolManager::withRedis(const std::string& id, const char* operation, Func&& fn) {
    return withConnection(id, operation, [&fn](DatabaseDriver& driver) {
        auto* redis = dynamic_cast<RedisDriver*>(&driver);
        if (!redis) {
            throw UnsupportedOperationError("Key operations require a Redis connection");
        }
        return fn(*redis);
    });
}

// ============================================================================
// Driver Operations
// ============================================================================

std::vector<TableInfo> PoolManager::listTables(const std::string& id) {
    return withConnection(id, "list_tables", [](DatabaseDriver& driver) {
        return driver.listTables();
    });
}

TableDataResponse PoolManager::getTableData(const std::string& id, const TableDataRequest& request) {
    return withConnection(id, "get_table_data", [&request](DatabaseDriver& driver) {
        return driver.getTableData(request);
    });
}

TableStructure PoolManager::getTableStructure(const std::string& id, const std::string& schema,
                                              const std::string& table) {
    return withConnection(id, "get_table_structure", [&](DatabaseDriver& driver) {
        return driver.getTableStructure(schema, table);
    });
}

QueryResult PoolManager::executeQuery(const std::string& id, const std::string& sql) {
    return withConnection(id, "execute_query", [&sql](DatabaseDriver& driver) {
        return driver.executeQuery(sql);
    });
}

SchemaOverview PoolManager::getSchemaOverview(const std::string& id) {
    return withConnection(id, "get_schema_overview", [](DatabaseDriver& driver) {
        return driver.getSchemaOverview();
    });
}

// ============================================================================
// Redis Key Operations
// ============================================================================

RedisKeyListResponse PoolManager::searchKeys(const std::string& id, const std::string& pattern, size_t limit,
                                             const std::string& cursor,
                                             const RedisDriver::ScanProgress& progress) {
    return withRedis(id, "search_keys", [&](RedisDriver& redis) {
        return redis.searchKeys(pattern, limit, cursor, progress);
    });
}

RedisKeyDetails PoolManager::getKeyDetails(const std::string& id, const std::string& key) {
    return withRedis(id, "get_key_details", [&key](RedisDriver& redis) {
        return redis.getKeyDetails(key);
    });
}

bool PoolManager::deleteKey(const std::string& id, const std::string& key) {
    return withRedis(id, "delete_key", [&key](RedisDriver& redis) {
        return redis.deleteKey(key);
    });
}

void PoolManager::setStringKey(const std::string& id, const std::string& key, const std::string& value,
                               std::optional<int64_t> ttl) {
    withRedis(id, "set_string_key", [&](RedisDriver& redis) {
        redis.setStringKey(key, value, ttl);
    });
}

void PoolManager::setListKey(const std::string& id, const std::string& key,
                             const std::vector<std::string>& values, std::optional<int64_t> ttl) {
    withRedis(id, "set_list_key", [&](RedisDriver& redis) {
        redis.setListKey(key, values, ttl);
    });
}

void PoolManager::setSetKey(const std::string& id, const std::string& key,
                            const std::vector<std::string>& members, std::optional<int64_t> ttl) {
    withRedis(id, "set_set_key", [&](RedisDriver& redis) {
        redis.setSetKey(key, members, ttl);
    });
}

void PoolManager::setHashKey(const std::string& id, const std::string& key,
                             const std::vector<std::pair<std::string, std::string>>& fields,
                             std::optional<int64_t> ttl) {
    withRedis(id, "set_hash_key", [&](RedisDriver& redis) {
        redis.setHashKey(key, fields, ttl);
    });
}

void PoolManager::setZsetKey(const std::string& id, const std::string& key,
                             const std::vector<std::pair<std::string, double>>& members,
                             std::optional<int64_t> ttl) {
    withRedis(id, "set_zset_key", [&](RedisDriver& redis) {
        redis.setZsetKey(key, members, ttl);
    });
}

void PoolManager::updateTtl(const std::string& id, const std::string& key, std::optional<int64_t> ttl) {
    withRedis(id, "update_ttl", [&](RedisDriver& redis) {
        redis.updateTtl(key, ttl);
    });
}

}  // namespace dbbridge
