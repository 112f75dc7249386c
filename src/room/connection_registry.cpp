#include "room/connection_registry.hpp"

#include <plog/Log.h>

#include <algorithm>

namespace meshrtc {

ConnectionRegistry::ConnectionRegistry() = default;

ConnectionRegistry::~ConnectionRegistry() = default;

Connection* ConnectionRegistry::Add(const std::string& peer_id, std::unique_ptr<Connection> connection) {
    if (!connection) {
        return nullptr;
    }
    Connection* added = connection.get();
    connections_[peer_id].push_back({next_sequence_++, std::move(connection)});
    return added;
}

Connection* ConnectionRegistry::Get(const std::string& peer_id, const std::string& connection_id) const {
    auto it = connections_.find(peer_id);
    if (it == connections_.end()) {
        return nullptr;
    }
    for (const auto& entry : it->second) {
        if (entry.connection->id() == connection_id) {
            return entry.connection.get();
        }
    }
    return nullptr;
}

size_t ConnectionRegistry::Remove(const std::string& peer_id) {
    auto it = connections_.find(peer_id);
    if (it == connections_.end()) {
        return 0;
    }
    size_t removed = it->second.size();
    connections_.erase(it);
    PLOG_VERBOSE << "Removed " << removed << " connection(s) of peer: " << peer_id;
    return removed;
}

std::vector<std::unique_ptr<Connection>> ConnectionRegistry::Release(const std::string& peer_id) {
    std::vector<std::unique_ptr<Connection>> released;
    auto it = connections_.find(peer_id);
    if (it == connections_.end()) {
        return released;
    }
    released.reserve(it->second.size());
    for (auto& entry : it->second) {
        released.push_back(std::move(entry.connection));
    }
    connections_.erase(it);
    return released;
}

std::vector<std::unique_ptr<Connection>> ConnectionRegistry::Release() {
    std::vector<Entry> entries;
    for (auto& [peer_id, peer_entries] : connections_) {
        for (auto& entry : peer_entries) {
            entries.push_back(std::move(entry));
        }
    }
    connections_.clear();
    std::sort(entries.begin(), entries.end(), [](const Entry& lhs, const Entry& rhs) {
        return lhs.sequence < rhs.sequence;
    });
    std::vector<std::unique_ptr<Connection>> released;
    released.reserve(entries.size());
    for (auto& entry : entries) {
        released.push_back(std::move(entry.connection));
    }
    return released;
}

std::vector<Connection*> ConnectionRegistry::AllConnections() const {
    std::vector<const Entry*> entries;
    for (const auto& [peer_id, peer_entries] : connections_) {
        for (const auto& entry : peer_entries) {
            entries.push_back(&entry);
        }
    }
    std::sort(entries.begin(), entries.end(), [](const Entry* lhs, const Entry* rhs) {
        return lhs->sequence < rhs->sequence;
    });
    std::vector<Connection*> all;
    all.reserve(entries.size());
    for (const Entry* entry : entries) {
        all.push_back(entry->connection.get());
    }
    return all;
}

std::vector<Connection*> ConnectionRegistry::ConnectionsOf(const std::string& peer_id) const {
    std::vector<Connection*> connections;
    auto it = connections_.find(peer_id);
    if (it != connections_.end()) {
        for (const auto& entry : it->second) {
            connections.push_back(entry.connection.get());
        }
    }
    return connections;
}

bool ConnectionRegistry::Contains(const std::string& peer_id) const {
    return connections_.find(peer_id) != connections_.end();
}

size_t ConnectionRegistry::size() const {
    size_t count = 0;
    for (const auto& [peer_id, entries] : connections_) {
        count += entries.size();
    }
    return count;
}

bool ConnectionRegistry::empty() const {
    return connections_.empty();
}

void ConnectionRegistry::Clear() {
    connections_.clear();
}

} // namespace meshrtc
