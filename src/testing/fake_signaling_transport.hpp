#ifndef _TESTING_FAKE_SIGNALING_TRANSPORT_H_
#define _TESTING_FAKE_SIGNALING_TRANSPORT_H_

#include "signaling/signaling_transport.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace meshrtc {
namespace test {

// FakeSignalingTransport
class FakeSignalingTransport : public SignalingTransport {
public:
    ~FakeSignalingTransport() override = default;

    void Send(std::string text) override {
        sent_messages_.push_back(nlohmann::json::parse(text));
    }

    const std::vector<nlohmann::json>& sent_messages() const { return sent_messages_; }

    // Returns the messages of `type` in the order of sending.
    std::vector<nlohmann::json> SentMessagesOf(const std::string& type) const {
        std::vector<nlohmann::json> messages;
        for (const auto& message : sent_messages_) {
            if (message.value("type", "") == type) {
                messages.push_back(message);
            }
        }
        return messages;
    }

    void Clear() { sent_messages_.clear(); }

private:
    std::vector<nlohmann::json> sent_messages_;
};

} // namespace test
} // namespace meshrtc

#endif
