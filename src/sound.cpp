#include <algorithm>
#include <array>
#include <bit>
#include <memory>

#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>

#include "macros/autoptr.hpp"
#include "macros/logger.hpp"
#include "sound.hpp"
#include "util/cleaner.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/assert.hpp"

namespace sound {
namespace {
auto logger = Logger("LIVETALK_SOUND");

declare_autoptr(PWMainLoop, pw_main_loop, pw_main_loop_destroy);
declare_autoptr(PWStream, pw_stream, pw_stream_destroy);

constexpr auto playback_channels = 1;
} // namespace

struct Context {
    AutoPWMainLoop main_loop; // destroyed after the streams
    AutoPWStream   capture_stream;
    AutoPWStream   playback_stream;
    spa_audio_info capture_format = {};
};

namespace {
auto capture_on_process(void* const userdata) -> void {
    auto& context = *std::bit_cast<Context*>(userdata);

    const auto pw_buffer = pw_stream_dequeue_buffer(context.capture_stream.get());
    if(pw_buffer == NULL) {
        LOG_WARN(logger, "capture buffer exhausted");
        return;
    }
    auto cleaner = Cleaner{[&] { pw_stream_queue_buffer(context.capture_stream.get(), pw_buffer); }};

    const auto buffer  = pw_buffer->buffer;
    const auto samples = std::bit_cast<float*>(buffer->datas[0].data);
    if(samples == NULL) {
        return;
    }

    const auto num_channels = std::max<size_t>(context.capture_format.info.raw.channels, 1);
    const auto num_samples  = buffer->datas[0].chunk->size / sizeof(float);
    on_capture(samples, num_samples, num_channels);
}

auto capture_on_stream_param_changed(void* const userdata, const uint32_t id, const spa_pod* const param) -> void {
    auto& context = *std::bit_cast<Context*>(userdata);

    if(param == NULL || id != SPA_PARAM_Format) {
        return;
    }

    if(spa_format_parse(param, &context.capture_format.media_type, &context.capture_format.media_subtype) < 0) {
        return;
    }

    if(context.capture_format.media_type != SPA_MEDIA_TYPE_audio || context.capture_format.media_subtype != SPA_MEDIA_SUBTYPE_raw) {
        return;
    }

    if(spa_format_audio_raw_parse(param, &context.capture_format.info.raw) != 0) {
        LOG_ERROR(logger, "failed to parse capture format");
        return;
    }
    LOG_INFO(logger, "capture format rate={} channels={}", context.capture_format.info.raw.rate, context.capture_format.info.raw.channels);
}

auto playback_on_process(void* const userdata) -> void {
    auto& context = *std::bit_cast<Context*>(userdata);

    const auto pw_buffer = pw_stream_dequeue_buffer(context.playback_stream.get());
    if(pw_buffer == NULL) {
        LOG_WARN(logger, "playback buffer exhausted");
        return;
    }
    auto cleaner = Cleaner{[&] { pw_stream_queue_buffer(context.playback_stream.get(), pw_buffer); }};

    const auto buffer  = pw_buffer->buffer;
    const auto samples = std::bit_cast<float*>(buffer->datas[0].data);
    if(samples == NULL) {
        return;
    }

    auto num_samples = buffer->datas[0].maxsize / sizeof(float);
    if(pw_buffer->requested != 0) {
        num_samples = std::min<size_t>(pw_buffer->requested * playback_channels, num_samples);
    }

    const auto copied = on_playback(samples, num_samples);

    const auto chunk = buffer->datas[0].chunk;
    chunk->offset    = 0;
    chunk->stride    = sizeof(float) * playback_channels;
    chunk->size      = copied * sizeof(float);
}

const auto capture_stream_events = pw_stream_events{
    .version       = PW_VERSION_STREAM_EVENTS,
    .param_changed = capture_on_stream_param_changed,
    .process       = capture_on_process,
};

const auto playback_stream_events = pw_stream_events{
    .version = PW_VERSION_STREAM_EVENTS,
    .process = playback_on_process,
};

// stream is stored before connecting, process callbacks may start right after
auto setup_stream(AutoPWStream& stream, pw_loop* const loop, Context& context, pw_properties* const props, const char* const name, const pw_stream_events& events, const spa_audio_info_raw format, const spa_direction direction) -> bool {
    ensure(props != NULL);

    // takes ownership of props
    stream = AutoPWStream(pw_stream_new_simple(loop, name, props, &events, &context));
    ensure(stream.get() != NULL);

    // "The POD start is always aligned to 8 bytes."
    alignas(8) auto pod_builder_buffer = std::array<std::byte, 1024>();
    auto            pod_builder        = spa_pod_builder{.data = pod_builder_buffer.data(), .size = pod_builder_buffer.size()};

    auto params = std::array{
        spa_format_audio_raw_build(&pod_builder, SPA_PARAM_EnumFormat, &format),
    };

    ensure(pw_stream_connect(stream.get(),
                             direction,
                             PW_ID_ANY,
                             pw_stream_flags(PW_STREAM_FLAG_AUTOCONNECT |
                                             PW_STREAM_FLAG_MAP_BUFFERS |
                                             PW_STREAM_FLAG_RT_PROCESS),
                             (const spa_pod**)params.data(), params.size()) == 0);

    return true;
}
} // namespace

auto init(const size_t capture_rate, const size_t playback_rate) -> Context* {
    constexpr auto error_value = nullptr;

    pw_init(NULL, NULL);

    auto context       = std::unique_ptr<Context>(new Context());
    context->main_loop = AutoPWMainLoop(pw_main_loop_new(NULL));
    ensure_v(context->main_loop.get() != NULL);
    const auto loop = pw_main_loop_get_loop(context->main_loop.get());

    ensure_v(setup_stream(
        context->capture_stream, loop, *context,
        pw_properties_new(
            PW_KEY_MEDIA_TYPE, "Audio",
            PW_KEY_MEDIA_CATEGORY, "Capture",
            PW_KEY_MEDIA_ROLE, "Communication",
            NULL),
        "livetalk-capture",
        capture_stream_events,
        {.format = SPA_AUDIO_FORMAT_F32, .rate = uint32_t(capture_rate)},
        SPA_DIRECTION_INPUT));

    ensure_v(setup_stream(
        context->playback_stream, loop, *context,
        pw_properties_new(
            PW_KEY_MEDIA_TYPE, "Audio",
            PW_KEY_MEDIA_CATEGORY, "Playback",
            PW_KEY_MEDIA_ROLE, "Communication",
            NULL),
        "livetalk-playback",
        playback_stream_events,
        {.format = SPA_AUDIO_FORMAT_F32, .rate = uint32_t(playback_rate), .channels = playback_channels},
        SPA_DIRECTION_OUTPUT));

    LOG_INFO(logger, "streams ready capture={}Hz playback={}Hz", capture_rate, playback_rate);
    return context.release();
}

auto run(Context* const context) -> void {
    pw_main_loop_run(context->main_loop.get());
}

auto stop(Context* const context) -> void {
    pw_main_loop_quit(context->main_loop.get());
}

auto finish(Context* const context) -> void {
    delete context;
    pw_deinit();
}
} // namespace sound
