#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <span>
#include <variant>
#include <vector>

#include "config.hpp"
#include "macros/logger.hpp"

// single-producer/single-consumer ring between the network arrival context (push)
// and the audio output callback (pull). wait-free on both sides.
struct PlaybackBuffer {
    static inline auto logger = Logger("LIVETALK_PB");

    using Clock = std::chrono::steady_clock;

    enum class State : uint8_t {
        Buffering,
        Playing,
    };

    struct BufferStats {
        bool   is_buffering;
        size_t buffered_samples;
        size_t ms_buffered;
    };

    struct StateChange {
        enum class Kind : uint8_t {
            PlayingStart,
            BufferingRestart,
        };

        Kind   kind;
        size_t buffered_samples;
    };

    using Event = std::variant<BufferStats, StateChange>;

    struct Params {
        size_t                    sample_rate         = config::playback_rate;
        size_t                    capacity            = config::ring_buffer_samples;
        size_t                    initial_buffer_size = config::initial_buffer_size;
        size_t                    rebuffer_threshold  = config::rebuffer_threshold;
        std::chrono::milliseconds stats_interval      = std::chrono::milliseconds(config::stats_interval_ms);
    };

    Params                          params;
    std::vector<std::atomic<float>> ring;
    std::atomic<uint64_t>           written         = 0; // total samples stored, owned by the writer
    std::atomic<uint64_t>           consumed        = 0; // total samples read or evicted
    std::atomic<uint64_t>           dropped         = 0; // evicted by overflow, owned by the writer
    std::atomic<State>              state           = State::Buffering;
    std::atomic_bool                muted           = false;
    std::atomic<float>              volume          = 1.0f;
    std::atomic_bool                reset_requested = false;
    Clock::time_point               last_report;

    // called from both the writer and the reader context
    std::function<void(const Event&)> on_event;

    auto init() -> bool;
    auto init(const Params& params) -> bool;

    // writer side
    auto push(std::span<const std::byte> chunk) -> size_t;

    // reader side
    auto pull(std::span<float> output) -> void;
    auto pull(std::span<float> output, Clock::time_point now) -> void;
    auto clear() -> void;

    // control
    auto set_muted(bool flag) -> void;
    auto set_volume(float value) -> void;

    // the caller must keep the writer idle until is_reset_pending() turns false.
    // the next pull performs reset() on the reader side.
    auto request_reset() -> void;
    auto is_reset_pending() const -> bool;

    // both sides must be idle
    auto reset() -> void;

    auto count_buffered() const -> size_t;
    auto count_dropped() const -> size_t;
    auto is_buffering() const -> bool;
    auto get_write_index() const -> size_t;
    auto get_read_index() const -> size_t;

    auto switch_state(State from, State to, StateChange::Kind kind) -> void;
    auto emit(const Event& event) const -> void;
};
