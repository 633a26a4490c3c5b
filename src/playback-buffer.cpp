#include <algorithm>

#include "macros/assert.hpp"
#include "pcm.hpp"
#include "playback-buffer.hpp"

auto PlaybackBuffer::init() -> bool {
    return init(Params());
}

auto PlaybackBuffer::init(const Params& params) -> bool {
    ensure(params.capacity > 0 && params.sample_rate > 0);
    ensure(params.initial_buffer_size <= params.capacity, "initial={} capacity={}", params.initial_buffer_size, params.capacity);
    this->params = params;
    ring         = std::vector<std::atomic<float>>(params.capacity);
    reset();
    reset_requested.store(false);
    LOG_DEBUG(logger, "ring capacity={} initial={} rebuffer={}", params.capacity, params.initial_buffer_size, params.rebuffer_threshold);
    return true;
}

auto PlaybackBuffer::push(const std::span<const std::byte> chunk) -> size_t {
    // odd trailing byte is dropped
    const auto count    = chunk.size() / sizeof(int16_t);
    const auto capacity = ring.size();
    if(capacity == 0) {
        return 0;
    }

    auto head = written.load(std::memory_order_relaxed);
    for(auto i = 0uz; i < count; i += 1) {
        const auto sample = pcm::normalize(pcm::decode_le(&chunk[i * sizeof(int16_t)]));

        auto tail = consumed.load(std::memory_order_acquire);
        while(head - tail >= capacity) {
            // full, evict the oldest unread sample
            if(consumed.compare_exchange_weak(tail, tail + 1, std::memory_order_acq_rel, std::memory_order_acquire)) {
                dropped.store(dropped.load(std::memory_order_relaxed) + 1, std::memory_order_relaxed);
                break;
            }
        }
        ring[head % capacity].store(sample, std::memory_order_relaxed);
        head += 1;
        written.store(head, std::memory_order_release);
    }

    if(state.load(std::memory_order_acquire) == State::Buffering && count_buffered() >= params.initial_buffer_size) {
        switch_state(State::Buffering, State::Playing, StateChange::Kind::PlayingStart);
    }
    return count;
}

auto PlaybackBuffer::pull(const std::span<float> output) -> void {
    pull(output, Clock::now());
}

auto PlaybackBuffer::pull(const std::span<float> output, const Clock::time_point now) -> void {
    if(reset_requested.load(std::memory_order_acquire)) {
        reset();
        // publishes the zeroed counters to the writer
        reset_requested.store(false, std::memory_order_release);
    }

    if(state.load(std::memory_order_acquire) == State::Buffering) {
        std::ranges::fill(output, 0.0f);
    } else {
        const auto capacity = ring.size();
        for(auto& sample : output) {
            sample    = 0.0f; // underrun
            auto tail = consumed.load(std::memory_order_acquire);
            while(tail < written.load(std::memory_order_acquire)) {
                const auto value = ring[tail % capacity].load(std::memory_order_relaxed);
                // fails if the writer evicted this sample meanwhile
                if(consumed.compare_exchange_weak(tail, tail + 1, std::memory_order_acq_rel, std::memory_order_acquire)) {
                    sample = value;
                    break;
                }
            }
        }
        if(count_buffered() < params.rebuffer_threshold) {
            switch_state(State::Playing, State::Buffering, StateChange::Kind::BufferingRestart);
        }
    }

    const auto gain = muted.load(std::memory_order_relaxed) ? 0.0f : volume.load(std::memory_order_relaxed);
    if(gain != 1.0f) {
        for(auto& sample : output) {
            sample *= gain;
        }
    }

    if(last_report == Clock::time_point()) {
        last_report = now;
    } else if(now - last_report >= params.stats_interval) {
        last_report         = now;
        const auto buffered = count_buffered();
        emit(BufferStats{
            .is_buffering     = is_buffering(),
            .buffered_samples = buffered,
            .ms_buffered      = buffered * 1000 / params.sample_rate,
        });
    }
}

auto PlaybackBuffer::clear() -> void {
    const auto head = written.load(std::memory_order_acquire);
    auto       tail = consumed.load(std::memory_order_acquire);
    while(tail < head) {
        if(consumed.compare_exchange_weak(tail, head, std::memory_order_acq_rel, std::memory_order_acquire)) {
            break;
        }
    }
    state.store(State::Buffering, std::memory_order_release);
}

auto PlaybackBuffer::set_muted(const bool flag) -> void {
    muted.store(flag, std::memory_order_relaxed);
}

auto PlaybackBuffer::set_volume(const float value) -> void {
    // also rejects nan
    volume.store(value >= 0.0f ? std::min(value, 1.0f) : 0.0f, std::memory_order_relaxed);
}

auto PlaybackBuffer::request_reset() -> void {
    reset_requested.store(true, std::memory_order_release);
}

auto PlaybackBuffer::is_reset_pending() const -> bool {
    return reset_requested.load(std::memory_order_acquire);
}

auto PlaybackBuffer::reset() -> void {
    written.store(0);
    consumed.store(0);
    dropped.store(0);
    state.store(State::Buffering);
    last_report = Clock::time_point();
}

auto PlaybackBuffer::count_buffered() const -> size_t {
    // consumed first, it never passes written
    const auto tail = consumed.load(std::memory_order_acquire);
    const auto head = written.load(std::memory_order_acquire);
    return std::min<size_t>(head - tail, ring.size());
}

auto PlaybackBuffer::count_dropped() const -> size_t {
    return dropped.load(std::memory_order_relaxed);
}

auto PlaybackBuffer::is_buffering() const -> bool {
    return state.load(std::memory_order_acquire) == State::Buffering;
}

auto PlaybackBuffer::get_write_index() const -> size_t {
    return ring.empty() ? 0 : written.load(std::memory_order_acquire) % ring.size();
}

auto PlaybackBuffer::get_read_index() const -> size_t {
    return ring.empty() ? 0 : consumed.load(std::memory_order_acquire) % ring.size();
}

auto PlaybackBuffer::switch_state(const State from, const State to, const StateChange::Kind kind) -> void {
    auto expected = from;
    if(state.compare_exchange_strong(expected, to, std::memory_order_acq_rel)) {
        emit(StateChange{.kind = kind, .buffered_samples = count_buffered()});
    }
}

auto PlaybackBuffer::emit(const Event& event) const -> void {
    if(on_event) {
        on_event(event);
    }
}
