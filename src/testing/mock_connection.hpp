#ifndef _TESTING_MOCK_CONNECTION_H_
#define _TESTING_MOCK_CONNECTION_H_

#include "connection/media_connection.hpp"
#include "connection/data_connection.hpp"

#include <gmock/gmock.h>

namespace meshrtc {
namespace test {

// MockMediaConnection
class MockMediaConnection : public MediaConnection {
public:
    MockMediaConnection(std::string remote_peer_id, std::string id, Options options)
        : MediaConnection(std::move(remote_peer_id), std::move(id)),
          options_(std::move(options)) {}
    ~MockMediaConnection() override { Die(); }

    const Options& options() const { return options_; }

    MOCK_METHOD(bool, is_open, (), (const, override));
    MOCK_METHOD(void, Close, (), (override));
    MOCK_METHOD(void, HandleAnswer, (const nlohmann::json&), (override));
    MOCK_METHOD(void, HandleCandidate, (const nlohmann::json&), (override));
    // Called on destruction.
    MOCK_METHOD(void, Die, ());
    MOCK_METHOD(void, ReplaceStream, (std::shared_ptr<MediaStream>), (override));

    // Simulates the events raised by the negotiation layer.
    using MediaConnection::TriggerOffer;
    using MediaConnection::TriggerAnswer;
    using MediaConnection::TriggerCandidate;
    using MediaConnection::TriggerStream;

private:
    const Options options_;
};

// MockDataConnection
class MockDataConnection : public DataConnection {
public:
    MockDataConnection(std::string remote_peer_id, std::string id, Options options)
        : DataConnection(std::move(remote_peer_id), std::move(id)),
          options_(std::move(options)) {}
    ~MockDataConnection() override { Die(); }

    const Options& options() const { return options_; }

    MOCK_METHOD(bool, is_open, (), (const, override));
    MOCK_METHOD(void, Close, (), (override));
    MOCK_METHOD(void, HandleAnswer, (const nlohmann::json&), (override));
    MOCK_METHOD(void, HandleCandidate, (const nlohmann::json&), (override));
    // Called on destruction.
    MOCK_METHOD(void, Die, ());

    using DataConnection::TriggerOffer;
    using DataConnection::TriggerAnswer;
    using DataConnection::TriggerCandidate;
    using DataConnection::TriggerData;

private:
    const Options options_;
};

} // namespace test
} // namespace meshrtc

#endif
