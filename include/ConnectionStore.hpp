#pragma once

#include "Config.hpp"
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

namespace dbbridge {

// Source of persisted connection records, looked up by identifier
class ConnectionStore {
public:
    virtual ~ConnectionStore() = default;

    virtual std::optional<ConnectionConfig> find(const std::string& id) const = 0;
};

// In-memory store filled from the config file or the command line
class StaticConnectionStore : public ConnectionStore {
public:
    StaticConnectionStore() = default;
    explicit StaticConnectionStore(std::map<std::string, ConnectionConfig> connections);

    static std::shared_ptr<StaticConnectionStore> fromConfig(const Config& config);

    std::optional<ConnectionConfig> find(const std::string& id) const override;

    void put(const std::string& id, ConnectionConfig config);
    bool remove(const std::string& id);
    size_t size() const;

private:
    mutable std::shared_mutex m_mutex;
    std::map<std::string, ConnectionConfig> m_connections;
};

}  // namespace dbbridge
