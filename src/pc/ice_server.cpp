#include "pc/ice_server.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace meshrtc {
namespace {

constexpr uint16_t kDefaultTurnPort = 3478;
constexpr uint16_t kDefaultTurnTlsPort = 5349;

uint16_t ParsePort(const std::string& service) {
    size_t pos = 0;
    unsigned long port = 0;
    try {
        port = std::stoul(service, &pos);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid ICE server port: " + service);
    }
    if (pos != service.size() || port == 0 || port > 65535) {
        throw std::invalid_argument("Invalid ICE server port: " + service);
    }
    return static_cast<uint16_t>(port);
}

} // namespace

IceServer::IceServer(const std::string& url) {
    ParseUrl(url);
}

IceServer::IceServer(const std::string& url, std::string username, std::string credential) {
    ParseUrl(url);
    // Credentials given explicitly take precedence over the ones embedded in url.
    if (!username.empty()) {
        username_ = std::move(username);
    }
    if (!credential.empty()) {
        credential_ = std::move(credential);
    }
}

void IceServer::ParseUrl(const std::string& url) {
    // Modified regex from RFC 3986, see https://tools.ietf.org/html/rfc3986#appendix-B
    static const char* rs =
        R"(^(([^:.@/?#]+):)?(/{0,2}((([^:@]*)(:([^@]*))?)@)?(([^:/?#]*)(:([^/?#]*))?))?([^?#]*)(\?([^#]*))?(#(.*))?)";
    static const std::regex r(rs, std::regex::extended);

    std::smatch m;
    if (!std::regex_match(url, m, r) || m[10].length() == 0) {
        throw std::invalid_argument("Invalid ICE server url: " + url);
    }

    std::vector<std::optional<std::string>> components(m.size());
    std::transform(m.begin(), m.end(), components.begin(), [](const auto& component) {
        return component.length() > 0 ? std::make_optional(std::string(component)) : std::nullopt;
    });

    std::string scheme = components[2].value_or("stun");
    std::transform(scheme.begin(), scheme.end(), scheme.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    relay_type_ = RelayType::TURN_UDP;
    tls_ = false;
    if (scheme == "stun") {
        type_ = Type::STUN;
    } else if (scheme == "stuns") {
        type_ = Type::STUN;
        tls_ = true;
    } else if (scheme == "turn") {
        type_ = Type::TURN;
    } else if (scheme == "turns") {
        type_ = Type::TURN;
        relay_type_ = RelayType::TURN_TLS;
        tls_ = true;
    } else {
        throw std::invalid_argument("Unknown ICE server protocol: " + scheme);
    }

    if (const auto& query = components[15]) {
        if (query->find("transport=udp") != std::string::npos) {
            relay_type_ = RelayType::TURN_UDP;
        } else if (query->find("transport=tcp") != std::string::npos) {
            // turns with transport=tcp is still TLS
            if (relay_type_ != RelayType::TURN_TLS) {
                relay_type_ = RelayType::TURN_TCP;
            }
        }
    }

    username_ = components[6].value_or("");
    credential_ = components[8].value_or("");

    hostname_ = components[10].value();
    while (!hostname_.empty() && hostname_.front() == '[') {
        hostname_.erase(hostname_.begin());
    }
    while (!hostname_.empty() && hostname_.back() == ']') {
        hostname_.pop_back();
    }
    if (hostname_.empty()) {
        throw std::invalid_argument("Invalid ICE server hostname in url: " + url);
    }

    if (const auto& service = components[12]) {
        port_ = ParsePort(*service);
    } else {
        port_ = tls_ ? kDefaultTurnTlsPort : kDefaultTurnPort;
    }
}

std::string IceServer::url() const {
    std::ostringstream oss;
    if (type_ == Type::STUN) {
        oss << (tls_ ? "stuns:" : "stun:");
    } else {
        oss << (tls_ ? "turns:" : "turn:");
    }
    if (hostname_.find(':') != std::string::npos) {
        oss << "[" << hostname_ << "]";
    } else {
        oss << hostname_;
    }
    oss << ":" << port_;
    if (type_ == Type::TURN && relay_type_ == RelayType::TURN_TCP) {
        oss << "?transport=tcp";
    }
    return oss.str();
}

std::string IceServer::ToString(Type type) {
    switch (type) {
    case Type::STUN:
        return "STUN";
    case Type::TURN:
        return "TURN";
    default:
        return "";
    }
}

std::string IceServer::ToString(RelayType relay_type) {
    switch (relay_type) {
    case RelayType::TURN_UDP:
        return "TURN_UDP";
    case RelayType::TURN_TCP:
        return "TURN_TCP";
    case RelayType::TURN_TLS:
        return "TURN_TLS";
    default:
        return "";
    }
}

std::ostream& operator<<(std::ostream& out, const IceServer& ice_server) {
    out << "hostname: " << ice_server.hostname()
        << " port: " << ice_server.port()
        << " type: " << IceServer::ToString(ice_server.type());
    if (ice_server.type() == IceServer::Type::TURN) {
        out << " username: " << ice_server.username()
            << " relay type: " << IceServer::ToString(ice_server.relay_type());
    }
    return out;
}

} // namespace meshrtc
