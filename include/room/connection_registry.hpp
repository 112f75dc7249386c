#ifndef _ROOM_CONNECTION_REGISTRY_H_
#define _ROOM_CONNECTION_REGISTRY_H_

#include "base/defines.hpp"
#include "connection/connection.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace meshrtc {

// ConnectionRegistry
// Owns the connections of a room, grouped by remote peer id. A peer is present 
// if and only if at least one connection of it is registered.
class MESHRTC_CPP_EXPORT ConnectionRegistry {
public:
    ConnectionRegistry();
    ~ConnectionRegistry();

    // Appends `connection` to the list of `peer_id`, returns the stored connection.
    Connection* Add(const std::string& peer_id, std::unique_ptr<Connection> connection);

    // Returns nullptr if not found.
    Connection* Get(const std::string& peer_id, const std::string& connection_id) const;

    // Forgets all connections of `peer_id` without closing them,
    // returns the number of connections removed.
    size_t Remove(const std::string& peer_id);

    // Hands the connections of `peer_id` over to the caller, in the order of registration.
    std::vector<std::unique_ptr<Connection>> Release(const std::string& peer_id);
    // Hands all connections over to the caller, in the order of registration.
    std::vector<std::unique_ptr<Connection>> Release();

    // All connections in the order of registration.
    std::vector<Connection*> AllConnections() const;

    // Connections of `peer_id` in the order of registration.
    std::vector<Connection*> ConnectionsOf(const std::string& peer_id) const;

    bool Contains(const std::string& peer_id) const;
    size_t size() const;
    bool empty() const;

    void Clear();

private:
    struct Entry {
        // Increased monotonically to keep the registration order across peers.
        uint64_t sequence;
        std::unique_ptr<Connection> connection;
    };

    uint64_t next_sequence_ = 0;
    std::unordered_map<std::string, std::vector<Entry>> connections_;

    DISALLOW_COPY_AND_ASSIGN(ConnectionRegistry);
};

} // namespace meshrtc

#endif
