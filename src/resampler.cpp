#include "resampler.hpp"
#include "macros/assert.hpp"

auto Resampler::init(const uint32_t input_rate, const uint32_t output_rate) -> bool {
    ensure(input_rate > 0 && output_rate > 0, "invalid rate input={} output={}", input_rate, output_rate);
    ratio = double(input_rate) / output_rate;
    reset();
    return true;
}

auto Resampler::reset() -> void {
    frame_fill = 0;
}
