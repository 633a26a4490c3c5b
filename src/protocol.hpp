#pragma once
#include <string_view>

#include "config.hpp"
#include "net/serde/serde.hpp"

namespace proto {
struct PacketType {
    enum : uint8_t {
        Success = 0,
        Error,
        Join,      // => Ready
        Ready,
        Text,      // => TextReply
        TextReply,
    };
};

struct Success {
    constexpr static auto pt = PacketType::Success;
};

struct Error {
    constexpr static auto pt = PacketType::Error;
};

struct Join {
    constexpr static auto pt = PacketType::Join;

    SerdeFieldsBegin;
    std::string SerdeField(name);
    uint16_t    SerdeField(port); // udp port receiving AUDIO: datagrams
    SerdeFieldsEnd;
};

struct Ready {
    constexpr static auto pt = PacketType::Ready;

    SerdeFieldsBegin;
    uint8_t  SerdeField(peer_id);
    uint32_t SerdeField(playback_rate);
    SerdeFieldsEnd;
};

struct Text {
    constexpr static auto pt = PacketType::Text;

    SerdeFieldsBegin;
    std::string SerdeField(text);
    SerdeFieldsEnd;
};

struct TextReply {
    constexpr static auto pt = PacketType::TextReply;

    SerdeFieldsBegin;
    std::string SerdeField(text);
    SerdeFieldsEnd;
};

// UDP
// upstream: raw frames of config::samples_per_packet int16le samples, no header
// downstream: audio_marker followed by int16le samples at config::playback_rate
constexpr auto audio_marker = std::string_view("AUDIO:");

constexpr auto max_audio_payload = config::max_mtu - audio_marker.size();
} // namespace proto
