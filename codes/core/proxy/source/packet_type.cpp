#include "proxy/packet_type.hpp"

namespace rpc_snoop {
namespace proxy {

bool scope_matches(config::SuppressScope scope, Direction direction) {
    switch (scope) {
        case config::SuppressScope::REQUEST_ONLY:
            return direction == Direction::REQUEST;
        case config::SuppressScope::RESPONSE_ONLY:
            return direction == Direction::RESPONSE;
        case config::SuppressScope::ALL:
            return true;
    }
    return false;
}

PacketType::PacketType(Kind kind, double delay_seconds)
    : kind_(kind)
    , delay_seconds_(delay_seconds)
{
}

PacketType PacketType::request() {
    return PacketType(Kind::REQUEST, 0.0);
}

PacketType PacketType::response() {
    return PacketType(Kind::RESPONSE, 0.0);
}

PacketType PacketType::request_dropped(double delay_seconds) {
    return PacketType(Kind::REQUEST_DROPPED, delay_seconds);
}

PacketType PacketType::response_dropped(double delay_seconds) {
    return PacketType(Kind::RESPONSE_DROPPED, delay_seconds);
}

Direction PacketType::direction() const {
    switch (kind_) {
        case Kind::REQUEST:
        case Kind::REQUEST_DROPPED:
            return Direction::REQUEST;
        case Kind::RESPONSE:
        case Kind::RESPONSE_DROPPED:
            return Direction::RESPONSE;
    }
    return Direction::REQUEST;
}

bool PacketType::is_dropped() const {
    switch (kind_) {
        case Kind::REQUEST_DROPPED:
        case Kind::RESPONSE_DROPPED:
            return true;
        case Kind::REQUEST:
        case Kind::RESPONSE:
            return false;
    }
    return false;
}

const char* PacketType::label() const {
    switch (kind_) {
        case Kind::REQUEST:
            return "REQUEST";
        case Kind::RESPONSE:
            return "RESPONSE";
        case Kind::REQUEST_DROPPED:
            return "DROPPED REQUEST";
        case Kind::RESPONSE_DROPPED:
            return "DROPPED RESPONSE";
    }
    return "";
}

bool PacketType::operator==(const PacketType& other) const {
    return kind_ == other.kind_ && delay_seconds_ == other.delay_seconds_;
}

} // namespace proxy
} // namespace rpc_snoop
