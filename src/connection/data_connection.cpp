#include "connection/data_connection.hpp"

#include <plog/Log.h>

namespace meshrtc {

DataConnection::DataConnection(std::string remote_peer_id, std::string id) 
    : Connection(Type::DATA, std::move(remote_peer_id), std::move(id)) {}

DataConnection::~DataConnection() = default;

void DataConnection::OnData(DataCallback callback) {
    data_callback_ = std::move(callback);
}

void DataConnection::TriggerData(const nlohmann::json& data) {
    if (data_callback_) {
        data_callback_(data);
    } else {
        PLOG_VERBOSE << "No data callback on data connection: " << id();
    }
}

} // namespace meshrtc
