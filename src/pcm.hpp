#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>

// int16 <-> float conversions shared by both directions
namespace pcm {
// asymmetric: -1.0 maps to -32768, 1.0 to 32767
inline auto quantize(float sample) -> int16_t {
    sample = std::clamp(sample, -1.0f, 1.0f);
    return int16_t(sample < 0 ? sample * 32768.0f : sample * 32767.0f);
}

inline auto normalize(const int16_t sample) -> float {
    return std::clamp(float(sample) / 32767.0f, -1.0f, 1.0f);
}

inline auto decode_le(const std::byte* const ptr) -> int16_t {
    return int16_t(uint16_t(ptr[0]) | uint16_t(ptr[1]) << 8);
}

inline auto encode_le(const int16_t sample, std::byte* const ptr) -> void {
    ptr[0] = std::byte(uint16_t(sample) & 0xff);
    ptr[1] = std::byte(uint16_t(sample) >> 8);
}
} // namespace pcm
