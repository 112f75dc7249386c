#ifndef _CONNECTION_CONNECTION_H_
#define _CONNECTION_CONNECTION_H_

#include "base/defines.hpp"
#include "pc/rtc_configuration.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace meshrtc {

// Connection
// One negotiated channel to one remote peer. The negotiation itself (ICE gathering,
// SDP exchange, channel binding) is done by the concrete implementation, the room 
// only consumes the events and commands declared here.
class MESHRTC_CPP_EXPORT Connection {
public:
    // Type
    enum class Type {
        DATA,
        MEDIA
    };

    // Options
    struct Options {
        RtcConfiguration rtc_config;
        // Set when the connection is created in response to a remote offer.
        std::optional<std::string> connection_id = std::nullopt;
        std::optional<nlohmann::json> offer = std::nullopt;
    };

    // The payload of a locally generated offer, answer or candidate 
    // which should be delivered to the remote peer.
    using NegotiationCallback = std::function<void(const nlohmann::json& payload)>;

    static std::string ToString(Type type);
    // Returns std::nullopt for an unknown type.
    static std::optional<Type> TypeFromString(std::string_view type);

public:
    virtual ~Connection();

    const std::string id() const { return id_; }
    Type type() const { return type_; }
    const std::string remote_peer_id() const { return remote_peer_id_; }

    virtual bool is_open() const = 0;

    virtual void Close() = 0;
    virtual void HandleAnswer(const nlohmann::json& answer) = 0;
    virtual void HandleCandidate(const nlohmann::json& candidate) = 0;

    void OnOffer(NegotiationCallback callback);
    void OnAnswer(NegotiationCallback callback);
    void OnCandidate(NegotiationCallback callback);

protected:
    Connection(Type type, std::string remote_peer_id, std::string id);

    void TriggerOffer(const nlohmann::json& offer);
    void TriggerAnswer(const nlohmann::json& answer);
    void TriggerCandidate(const nlohmann::json& candidate);

private:
    const Type type_;
    const std::string remote_peer_id_;
    const std::string id_;

    NegotiationCallback offer_callback_ = nullptr;
    NegotiationCallback answer_callback_ = nullptr;
    NegotiationCallback candidate_callback_ = nullptr;

    DISALLOW_COPY_AND_ASSIGN(Connection);
};

MESHRTC_CPP_EXPORT std::ostream& operator<<(std::ostream& out, Connection::Type type);

} // namespace meshrtc

#endif
