#include "testing/fake_connection_factory.hpp"

namespace meshrtc {
namespace test {

FakeConnectionFactory::FakeConnectionFactory() = default;

FakeConnectionFactory::~FakeConnectionFactory() = default;

std::unique_ptr<MediaConnection> FakeConnectionFactory::CreateMediaConnection(const std::string& remote_peer_id, 
                                                                              MediaConnection::Options options) {
    media_peer_ids_.push_back(remote_peer_id);
    if (failing_peer_ids_.count(remote_peer_id) > 0) {
        return nullptr;
    }
    std::string id = options.connection_id ? *options.connection_id : next_media_connection_id();
    ++media_sequence_;
    auto connection = std::make_unique<::testing::NiceMock<MockMediaConnection>>(remote_peer_id, std::move(id), std::move(options));
    EXPECT_CALL(*connection, Die()).Times(::testing::AnyNumber());
    media_connections_.push_back(connection.get());
    return connection;
}

std::unique_ptr<DataConnection> FakeConnectionFactory::CreateDataConnection(const std::string& remote_peer_id, 
                                                                            DataConnection::Options options) {
    data_peer_ids_.push_back(remote_peer_id);
    if (failing_peer_ids_.count(remote_peer_id) > 0) {
        return nullptr;
    }
    std::string id = options.connection_id ? *options.connection_id : next_data_connection_id();
    ++data_sequence_;
    auto connection = std::make_unique<::testing::NiceMock<MockDataConnection>>(remote_peer_id, std::move(id), std::move(options));
    EXPECT_CALL(*connection, Die()).Times(::testing::AnyNumber());
    data_connections_.push_back(connection.get());
    return connection;
}

void FakeConnectionFactory::FailFor(std::string remote_peer_id) {
    failing_peer_ids_.insert(std::move(remote_peer_id));
}

std::string FakeConnectionFactory::next_media_connection_id() const {
    return "media_" + std::to_string(media_sequence_ + 1);
}

std::string FakeConnectionFactory::next_data_connection_id() const {
    return "data_" + std::to_string(data_sequence_ + 1);
}

} // namespace test
} // namespace meshrtc
