#ifndef _TESTING_FAKE_CONNECTION_FACTORY_H_
#define _TESTING_FAKE_CONNECTION_FACTORY_H_

#include "connection/connection_factory.hpp"
#include "testing/mock_connection.hpp"

#include <set>
#include <string>
#include <vector>

namespace meshrtc {
namespace test {

// FakeConnectionFactory
// Creates nice mocks and keeps track of them, the connections are owned by the room.
// Connections created locally are named as "<type>_<sequence>", starts from 1.
class FakeConnectionFactory : public ConnectionFactory {
public:
    FakeConnectionFactory();
    ~FakeConnectionFactory() override;

    std::unique_ptr<MediaConnection> CreateMediaConnection(const std::string& remote_peer_id, 
                                                           MediaConnection::Options options) override;
    std::unique_ptr<DataConnection> CreateDataConnection(const std::string& remote_peer_id, 
                                                         DataConnection::Options options) override;

    // Returns nullptr for `remote_peer_id` from now on.
    void FailFor(std::string remote_peer_id);

    std::string next_media_connection_id() const;
    std::string next_data_connection_id() const;

    const std::vector<std::string>& media_peer_ids() const { return media_peer_ids_; }
    const std::vector<std::string>& data_peer_ids() const { return data_peer_ids_; }
    const std::vector<MockMediaConnection*>& media_connections() const { return media_connections_; }
    const std::vector<MockDataConnection*>& data_connections() const { return data_connections_; }

    size_t created_count() const { return media_connections_.size() + data_connections_.size(); }

private:
    size_t media_sequence_ = 0;
    size_t data_sequence_ = 0;
    std::set<std::string> failing_peer_ids_;

    // All the peer ids requested, including the failed ones.
    std::vector<std::string> media_peer_ids_;
    std::vector<std::string> data_peer_ids_;
    std::vector<MockMediaConnection*> media_connections_;
    std::vector<MockDataConnection*> data_connections_;
};

} // namespace test
} // namespace meshrtc

#endif
