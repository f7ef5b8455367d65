#include "ConnectionStore.hpp"
#include <mutex>

namespace dbbridge {

StaticConnectionStore::StaticConnectionStore(std::map<std::string, ConnectionConfig> connections)
    : m_connections(std::move(connections)) {}

std::shared_ptr<StaticConnectionStore> StaticConnectionStore::fromConfig(const Config& config) {
    return std::make_shared<StaticConnectionStore>(config.connections);
}

std::optional<ConnectionConfig> StaticConnectionStore::find(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_connections.find(id);
    if (it == m_connections.end()) {
        return std::nullopt;
    }
    return it->second;
}

void StaticConnectionStore::put(const std::string& id, ConnectionConfig config) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_connections[id] = std::move(config);
}

bool StaticConnectionStore::remove(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    return m_connections.erase(id) > 0;
}

size_t StaticConnectionStore::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_connections.size();
}

}  // namespace dbbridge
