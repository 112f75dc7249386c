#ifndef _CONNECTION_DATA_CONNECTION_H_
#define _CONNECTION_DATA_CONNECTION_H_

#include "base/defines.hpp"
#include "connection/connection.hpp"

namespace meshrtc {

// DataConnection
class MESHRTC_CPP_EXPORT DataConnection : public Connection {
public:
    using Options = Connection::Options;
    using DataCallback = std::function<void(const nlohmann::json& data)>;
public:
    ~DataConnection() override;

    // Payload received from the remote peer.
    void OnData(DataCallback callback);

protected:
    DataConnection(std::string remote_peer_id, std::string id);

    void TriggerData(const nlohmann::json& data);

private:
    DataCallback data_callback_ = nullptr;
};

} // namespace meshrtc

#endif
