#include <array>
#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <print>
#include <string>
#include <variant>

#include <coop/io.hpp>
#include <coop/task-handle.hpp>
#include <coop/thread.hpp>
#include <coop/timer.hpp>
#include <unistd.h>

#include "config.hpp"
#include "macros/logger.hpp"
#include "net.hpp"
#include "net/packet-parser.hpp"
#include "net/tcp/client.hpp"
#include "pcm.hpp"
#include "playback-buffer.hpp"
#include "protocol.hpp"
#include "resampler.hpp"
#include "sound.hpp"
#include "util/argument-parser.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/coop-unwrap.hpp"

namespace {
auto logger = Logger("LIVETALK");

struct Context {
    net::PacketParser          parser;
    net::tcp::TCPClientBackend control_sock;
    FileDescriptor             data_sock;
    sockaddr_in                upload_addr;
    Resampler                  resampler;
    PlaybackBuffer             playback_buffer;
    coop::TaskHandle           download_task;
    coop::TaskHandle           command_task;
    coop::TaskHandle           report_task;
    sound::Context*            sound_context = nullptr;
    std::atomic_bool           active        = true; // cleared by "stop"

    // written on the output thread, logged by report_main
    std::atomic<uint32_t> rebuffer_count    = 0;
    std::atomic<size_t>   rebuffer_samples  = 0;
    std::atomic<size_t>   stats_ms_buffered = 0;
    std::atomic_bool      stats_buffering   = true;

    auto download_main() -> coop::Async<void>;
    auto command_main() -> coop::Async<void>;
    auto report_main() -> coop::Async<void>;
    auto handle_command(std::string_view line) -> coop::Async<bool>;
    auto on_playback_event(const PlaybackBuffer::Event& event) -> void;

    auto init() -> coop::Async<bool>;
    auto upload_frame(Resampler::FrameRef frame) -> bool;
};

auto server_addr         = "127.0.0.1";
auto server_control_port = uint16_t(config::default_server_control_port);
auto server_data_port    = uint16_t(config::default_server_data_port);
auto client_data_port    = uint16_t(config::default_client_data_port);
auto capture_rate        = uint32_t(config::capture_rate);
auto peer_name           = "peer";

// arrival context: every AUDIO: datagram goes straight into the ring
auto Context::download_main() -> coop::Async<void> {
    auto packet = std::array<std::byte, config::max_mtu>();
loop:
#define error_act goto loop
    ASSERT(!(co_await coop::wait_for_file(data_sock.as_handle(), true, false)).error, "data socket aborted");

    const auto read = recv(data_sock.as_handle(), packet.data(), packet.size(), 0);
    ensure_a(read >= ssize_t(proto::audio_marker.size()), "short datagram read={}", read);
    ensure_a(std::memcmp(packet.data(), proto::audio_marker.data(), proto::audio_marker.size()) == 0, "unknown datagram");
    if(!active || playback_buffer.is_reset_pending()) {
        goto loop;
    }

    const auto payload = std::span{packet}.subspan(proto::audio_marker.size(), read - proto::audio_marker.size());
    LOG_DEBUG(logger, "downloaded {} bytes", payload.size());
    playback_buffer.push(payload);
#undef error_act
    goto loop;
}

auto Context::command_main() -> coop::Async<void> {
    auto pending = std::string();
    auto buf     = std::array<char, 256>();
loop:
#define error_act goto loop
    ASSERT(!(co_await coop::wait_for_file(STDIN_FILENO, true, false)).error, "stdin aborted");

    const auto read = ::read(STDIN_FILENO, buf.data(), buf.size());
    if(read == 0) {
        LOG_INFO(logger, "stdin closed");
        co_return;
    }
    ensure_a(read > 0, "errno={}({})", errno, strerror(errno));
    pending.append(buf.data(), read);

    for(auto pos = pending.find('\n'); pos != std::string::npos; pos = pending.find('\n')) {
        const auto line = pending.substr(0, pos);
        pending.erase(0, pos + 1);
        if(!line.empty() && !co_await handle_command(line)) {
            LOG_WARN(logger, "command failed: {}", line);
        }
    }
#undef error_act
    goto loop;
}

auto Context::handle_command(const std::string_view line) -> coop::Async<bool> {
    const auto space = line.find(' ');
    const auto verb  = line.substr(0, space);
    const auto arg   = space == std::string_view::npos ? std::string_view() : line.substr(space + 1);

    if(verb == "mute" || verb == "unmute") {
        playback_buffer.set_muted(verb == "mute");
        LOG_INFO(logger, "{}", verb == "mute" ? "muted" : "unmuted");
    } else if(verb == "volume") {
        auto percent = 0;
        const auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), percent);
        coop_ensure(ec == std::errc() && percent >= 0 && percent <= 100, "volume must be 0-100");
        playback_buffer.set_volume(percent / 100.0f);
        LOG_INFO(logger, "volume {}%", percent);
    } else if(verb == "stop") {
        // no push is in flight on this runner, so the ring can be zeroed by the output thread
        active = false;
        playback_buffer.request_reset();
        LOG_INFO(logger, "session stopped");
    } else if(verb == "start") {
        // download_main holds off until the pending reset is done
        active = true;
        LOG_INFO(logger, "session started");
    } else if(verb == "text") {
        coop_unwrap(reply, co_await parser.receive_response<proto::TextReply>(proto::Text{std::string(arg)}));
        LOG_INFO(logger, "reply: {}", reply.text);
    } else if(verb == "quit") {
        sound::stop(sound_context);
    } else {
        coop_bail("unknown command {}", verb);
    }
    co_return true;
}

auto Context::report_main() -> coop::Async<void> {
    auto reported = 0u;
loop:
    co_await coop::sleep(std::chrono::milliseconds(config::stats_interval_ms));
    if(const auto count = rebuffer_count.load(); count != reported) {
        LOG_INFO(logger, "playback state: BUFFERING_RESTART x{}, buffered={}", count - reported, rebuffer_samples.load());
        reported = count;
    }
    LOG_DEBUG(logger, "buffer ~{}ms, buffering={} dropped={}", stats_ms_buffered.load(), stats_buffering.load(), playback_buffer.count_dropped());
    goto loop;
}

// PlayingStart is raised by push on the runner, everything else by pull on the output thread
auto Context::on_playback_event(const PlaybackBuffer::Event& event) -> void {
    if(const auto change = std::get_if<PlaybackBuffer::StateChange>(&event)) {
        if(change->kind == PlaybackBuffer::StateChange::Kind::PlayingStart) {
            LOG_INFO(logger, "playback state: PLAYING_START, buffered={}", change->buffered_samples);
        } else {
            rebuffer_samples.store(change->buffered_samples, std::memory_order_relaxed);
            rebuffer_count.fetch_add(1, std::memory_order_relaxed);
        }
    } else if(const auto stats = std::get_if<PlaybackBuffer::BufferStats>(&event)) {
        stats_ms_buffered.store(stats->ms_buffered, std::memory_order_relaxed);
        stats_buffering.store(stats->is_buffering, std::memory_order_relaxed);
    }
}

auto Context::init() -> coop::Async<bool> {
    parser.send_data = [this](const net::BytesRef payload) -> coop::Async<bool> {
        constexpr auto error_value = false;
        co_ensure_v(co_await control_sock.send(payload));
        co_return true;
    };
    control_sock.on_received = [this](net::BytesRef data) -> coop::Async<void> {
        if(const auto p = parser.parse_received(data)) {
            const auto [header, payload] = *p;
            coop_ensure(co_await parser.callbacks.invoke(header, payload));
        }
        co_return;
    };
    control_sock.on_closed = [] {
        LOG_WARN(logger, "disconnected");
        std::quick_exit(1);
    };
    coop_ensure(co_await control_sock.connect(server_addr, server_control_port));
    coop_unwrap(server_addr_v4, get_peer_addr(control_sock.sock.fd));
    coop_unwrap(response, co_await parser.receive_response<proto::Ready>(proto::Join{peer_name, client_data_port}));
    coop_ensure(response.playback_rate == config::playback_rate, "unsupported playback rate {}", response.playback_rate);
    LOG_INFO(logger, "joined as peer {}", int(response.peer_id));

    coop_unwrap_mut(sock, create_udp_socket(0, client_data_port));
    data_sock   = std::move(sock);
    upload_addr = create_sock_addr(server_addr_v4, server_data_port);

    coop_ensure(resampler.init(capture_rate));
    coop_ensure(playback_buffer.init());
    playback_buffer.on_event = [this](const PlaybackBuffer::Event& event) { on_playback_event(event); };

    auto& runner = *co_await coop::reveal_runner();
    runner.push_task(download_main(), &download_task);
    runner.push_task(command_main(), &command_task);
    runner.push_task(report_main(), &report_task);

    co_return true;
}

auto Context::upload_frame(const Resampler::FrameRef frame) -> bool {
    auto bytes = std::array<std::byte, config::bytes_per_packet>();
    for(auto i = 0uz; i < frame.size(); i += 1) {
        pcm::encode_le(frame[i], &bytes[i * sizeof(int16_t)]);
    }
    return send_datagram(data_sock.as_handle(), upload_addr, {}, bytes);
}

auto context = Context();
} // namespace

namespace sound {
auto on_capture(const float* const buffer, const size_t num_samples, const size_t num_channels) -> void {
    if(!context.active) {
        context.resampler.reset();
        return;
    }
    context.resampler.process_block({buffer, num_samples}, num_channels, [](const Resampler::FrameRef frame) {
        if(!context.upload_frame(frame)) {
            LOG_ERROR(logger, "failed to upload frame");
        }
    });
}

auto on_playback(float* const buffer, const size_t num_samples) -> size_t {
    // also performs the reset requested by "stop"
    context.playback_buffer.pull({buffer, num_samples});
    return num_samples;
}
} // namespace sound

namespace {
auto async_main() -> coop::Async<bool> {
    coop_ensure(co_await context.init());
    coop_unwrap_mut(sound_context, sound::init(capture_rate, config::playback_rate));
    context.sound_context = &sound_context;
    co_await coop::run_blocking([&] { sound::run(&sound_context); });
    sound::finish(&sound_context);
    context.sound_context = nullptr;
    context.download_task.cancel();
    context.command_task.cancel();
    context.report_task.cancel();
    LOG_INFO(logger, "bye");
    std::quick_exit(0);
}
} // namespace

auto main(const int argc, const char* const* argv) -> int {
    {
        auto parser = args::Parser<uint16_t, uint32_t>();
        auto help   = false;
        parser.kwarg(&server_addr, {"-s", "--server"}, "ADDRESS", "address of server", {.state = args::State::DefaultValue});
        parser.kwarg(&server_control_port, {"-sc", "--server-control-port"}, "PORT", "control port of server", {.state = args::State::DefaultValue});
        parser.kwarg(&server_data_port, {"-sd", "--server-data-port"}, "PORT", "data port of server", {.state = args::State::DefaultValue});
        parser.kwarg(&client_data_port, {"-cd", "--client-data-port"}, "PORT", "data port to use", {.state = args::State::DefaultValue});
        parser.kwarg(&capture_rate, {"-r", "--capture-rate"}, "HZ", "native capture sample rate", {.state = args::State::DefaultValue});
        parser.kwarg(&peer_name, {"-n", "--name"}, "NAME", "peer name", {.state = args::State::DefaultValue});
        parser.kwflag(&help, {"-h", "--help"}, "print this help message", {.no_error_check = true});
        if(!parser.parse(argc, argv) || help) {
            std::println("usage: livetalk {}", parser.get_help());
            std::println("commands: mute | unmute | volume <0-100> | stop | start | text <message> | quit");
            return 0;
        }
    }
    auto runner = coop::Runner();
    runner.push_task(async_main());
    runner.run();
    return 0;
}
