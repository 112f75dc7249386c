#ifndef _PC_ICE_SERVER_H_
#define _PC_ICE_SERVER_H_

#include "base/defines.hpp"

#include <string>
#include <ostream>

namespace meshrtc {

// IceServer
class MESHRTC_CPP_EXPORT IceServer {
public:
    enum class Type { STUN, TURN };
    enum class RelayType { TURN_UDP, TURN_TCP, TURN_TLS };

    // eg: stun:stun.l.google.com:19302
    // eg: turn:192.158.29.39:3478?transport=tcp
    // Throws std::invalid_argument if the url can not be parsed.
    explicit IceServer(const std::string& url);
    IceServer(const std::string& url, std::string username, std::string credential);

    const std::string hostname() const { return hostname_; }
    uint16_t port() const { return port_; }
    Type type() const { return type_; }
    RelayType relay_type() const { return relay_type_; }
    // True for stuns and turns.
    bool is_tls() const { return tls_; }
    const std::string username() const { return username_; }
    const std::string credential() const { return credential_; }

    void set_username(std::string username) { username_ = std::move(username); }
    void set_credential(std::string credential) { credential_ = std::move(credential); }

    // Reassembles the url form, credentials excluded.
    std::string url() const;

    static std::string ToString(Type type);
    static std::string ToString(RelayType relay_type);

private:
    void ParseUrl(const std::string& url);

private:
    std::string hostname_;
    uint16_t port_ = 0;
    Type type_ = Type::STUN;
    RelayType relay_type_ = RelayType::TURN_UDP;
    bool tls_ = false;
    std::string username_;
    std::string credential_;
};

MESHRTC_CPP_EXPORT std::ostream& operator<<(std::ostream& out, const IceServer& ice_server);

} // namespace meshrtc

#endif
