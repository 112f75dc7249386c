#ifndef _CONNECTION_CONNECTION_FACTORY_H_
#define _CONNECTION_CONNECTION_FACTORY_H_

#include "base/defines.hpp"
#include "connection/media_connection.hpp"
#include "connection/data_connection.hpp"

#include <memory>
#include <string>

namespace meshrtc {

// ConnectionFactory
// Implemented by the negotiation layer. A connection MUST NOT invoke any of its 
// callbacks before the factory method returns, the room wires them right after.
class MESHRTC_CPP_EXPORT ConnectionFactory {
public:
    virtual ~ConnectionFactory() = default;

    virtual std::unique_ptr<MediaConnection> CreateMediaConnection(const std::string& remote_peer_id, 
                                                                   MediaConnection::Options options) = 0;
    virtual std::unique_ptr<DataConnection> CreateDataConnection(const std::string& remote_peer_id, 
                                                                 DataConnection::Options options) = 0;
};

} // namespace meshrtc

#endif
