#pragma once
#include <algorithm>
#include <array>
#include <span>

#include "config.hpp"
#include "pcm.hpp"

// converts capture blocks into fixed size int16 packets at a fixed rate.
// interpolation restarts at 0.0 on every block, so block joins carry a small periodic error.
struct Resampler {
    using Frame    = std::array<int16_t, config::samples_per_packet>;
    using FrameRef = std::span<const int16_t, config::samples_per_packet>;

    double ratio      = 1.0; // input_rate / output_rate
    Frame  frame      = {};
    size_t frame_fill = 0;

    auto init(uint32_t input_rate, uint32_t output_rate = config::encode_rate) -> bool;
    auto reset() -> void; // drops the partial frame

    // input is interleaved, only the first channel is used.
    // emit(FrameRef) is called for every completed frame, the storage is reused right after it returns.
    // returns the number of emitted frames.
    template <class Emit>
    auto process_block(std::span<const float> input, size_t num_channels, Emit&& emit) -> size_t;
};

template <class Emit>
auto Resampler::process_block(const std::span<const float> input, const size_t num_channels, Emit&& emit) -> size_t {
    if(num_channels == 0) {
        return 0;
    }
    const auto len = input.size() / num_channels;
    if(len == 0) {
        return 0;
    }

    auto emitted = 0uz;
    for(auto idx = 0.0; idx < double(len); idx += ratio) {
        const auto low    = size_t(idx);
        const auto high   = std::min(low + 1, len - 1);
        const auto frac   = idx - double(low);
        const auto sample = (1 - frac) * input[low * num_channels] + frac * input[high * num_channels];

        frame[frame_fill] = pcm::quantize(float(sample));
        frame_fill += 1;
        if(frame_fill == frame.size()) {
            emit(FrameRef(frame));
            frame_fill = 0;
            emitted += 1;
        }
    }
    return emitted;
}
