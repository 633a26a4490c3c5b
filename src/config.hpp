#pragma once
#include <cstddef>
#include <cstdint>

namespace config {
// capture side
constexpr auto capture_rate       = 48000; // Hz, default native rate
constexpr auto encode_rate        = 16000; // Hz
constexpr auto samples_per_packet = 512;
constexpr auto bytes_per_packet   = samples_per_packet * sizeof(int16_t);

// playback side
constexpr auto playback_rate       = 24000; // Hz
constexpr auto ring_buffer_seconds = 5;
constexpr auto initial_buffer_ms   = 300;
constexpr auto rebuffer_ms         = 150;
constexpr auto stats_interval_ms   = 500;

constexpr auto ring_buffer_samples = playback_rate * ring_buffer_seconds;
constexpr auto initial_buffer_size = playback_rate * initial_buffer_ms / 1000;
constexpr auto rebuffer_threshold  = playback_rate * rebuffer_ms / 1000;

// networking
constexpr auto max_mtu                     = 1500;
constexpr auto default_server_control_port = 8000;
constexpr auto default_server_data_port    = 8001;
constexpr auto default_client_data_port    = 8010; // client side

static_assert(bytes_per_packet <= max_mtu);
} // namespace config
