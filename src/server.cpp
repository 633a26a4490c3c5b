#include <algorithm>
#include <array>
#include <bit>
#include <memory>
#include <print>
#include <vector>

#include <coop/io.hpp>
#include <coop/task-handle.hpp>
#include <netinet/in.h>
#include <sys/socket.h>

#include "config.hpp"
#include "macros/logger.hpp"
#include "net.hpp"
#include "net/packet-parser.hpp"
#include "net/tcp/server.hpp"
#include "pcm.hpp"
#include "protocol.hpp"
#include "resampler.hpp"
#include "util/argument-parser.hpp"
#include "util/fd.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/coop-unwrap.hpp"

namespace {
auto logger = Logger("LIVETALK_SERVER");

struct Peer {
    std::string name;
    sockaddr_in addr;
    Resampler   upsampler; // encode_rate -> playback_rate
};

struct ClientData {
    net::PacketParser     parser;
    std::unique_ptr<Peer> peer; // set by Join
};

auto control_port = uint16_t(config::default_server_control_port);
auto data_port    = uint16_t(config::default_server_data_port);

// stands in for the remote service: plays every peer's voice back to it at the playback rate
struct Echo {
    FileDescriptor     data_sock;
    coop::TaskHandle   data_reader_task;
    std::vector<Peer*> peers; // owned by ClientData
    uint8_t            next_peer_id = 0;

    auto data_reader_main() -> coop::Async<void>;
    auto find_peer(const sockaddr_in& addr) -> Peer*;
    auto echo_frame(Peer& peer, std::span<const std::byte> frame) -> void;

    auto init() -> coop::Async<bool>;
    auto handle_payload(const net::ClientData& client_data, net::Header header, net::BytesRef payload) -> coop::Async<bool>;
    auto remove_client(ClientData& client) -> void;
};

auto Echo::init() -> coop::Async<bool> {
    coop_unwrap_mut(sock, create_udp_socket(0, data_port));
    data_sock = std::move(sock);
    co_return true;
}

auto Echo::data_reader_main() -> coop::Async<void> {
    auto packet = std::array<std::byte, config::max_mtu>();
loop:
#define error_act goto loop
    ASSERT(!(co_await coop::wait_for_file(data_sock.as_handle(), true, false)).error, "data socket aborted");

    auto addr = sockaddr_in();
    auto len  = socklen_t(sizeof(addr));

    const auto read = recvfrom(data_sock.as_handle(), packet.data(), packet.size(), 0, (sockaddr*)&addr, &len);
    ensure_a(read == ssize_t(config::bytes_per_packet), "unexpected frame size {}", read);

    const auto peer = find_peer(addr);
    ensure_a(peer != nullptr, "frame from unknown address {:X}:{}", ntohl(addr.sin_addr.s_addr), ntohs(addr.sin_port));
    LOG_DEBUG(logger, "frame from peer={}", peer->name);
    echo_frame(*peer, std::span{packet}.first(read));
#undef error_act
    goto loop;
}

auto Echo::find_peer(const sockaddr_in& addr) -> Peer* {
    const auto it = std::ranges::find_if(peers, [&addr](const Peer* peer) { return is_same_addr(peer->addr, addr); });
    return it != peers.end() ? *it : nullptr;
}

auto Echo::echo_frame(Peer& peer, const std::span<const std::byte> frame) -> void {
    auto samples = std::array<float, config::samples_per_packet>();
    for(auto i = 0uz; i < samples.size(); i += 1) {
        samples[i] = pcm::normalize(pcm::decode_le(&frame[i * sizeof(int16_t)]));
    }

    const auto marker = std::as_bytes(std::span{proto::audio_marker});
    peer.upsampler.process_block(samples, 1, [this, &peer, marker](const Resampler::FrameRef upsampled) {
        auto bytes = std::array<std::byte, config::bytes_per_packet>();
        for(auto i = 0uz; i < upsampled.size(); i += 1) {
            pcm::encode_le(upsampled[i], &bytes[i * sizeof(int16_t)]);
        }
        if(!send_datagram(data_sock.as_handle(), peer.addr, marker, bytes)) {
            LOG_ERROR(logger, "failed to send audio to peer {}", peer.name);
        }
    });
}

auto Echo::handle_payload(const net::ClientData& client_data, const net::Header header, const net::BytesRef payload) -> coop::Async<bool> {
    auto& client = *(ClientData*)client_data.data;
    switch(header.type) {
    case proto::Join::pt: {
        coop_unwrap_mut(request, (serde::load<net::BinaryFormat, proto::Join>(payload)));
        coop_ensure(!client.peer, "already joined");

        const auto sock_fd = std::bit_cast<net::sock::SocketClientData*>(&client_data)->sock.fd;
        coop_unwrap(addr, get_peer_addr(sock_fd));
        const auto id = next_peer_id;
        next_peer_id += 1;
        LOG_INFO(logger, "new peer name={} id={} addr={:X}:{}", request.name, int(id), addr, request.port);

        auto peer = std::unique_ptr<Peer>(new Peer{
            .name = std::move(request.name),
            .addr = create_sock_addr(addr, request.port),
        });
        coop_ensure(peer->upsampler.init(config::encode_rate, config::playback_rate));
        coop_ensure(co_await client.parser.send_packet(proto::Ready{id, config::playback_rate}, header.id));

        peers.push_back(peer.get());
        client.peer = std::move(peer);
        if(peers.size() == 1) {
            LOG_INFO(logger, "starting data reader");
            auto& runner = *co_await coop::reveal_runner();
            runner.push_task(data_reader_main(), &data_reader_task);
        }
        co_return true;
    }
    case proto::Text::pt: {
        coop_unwrap_mut(request, (serde::load<net::BinaryFormat, proto::Text>(payload)));
        coop_ensure(client.peer, "not joined");
        LOG_INFO(logger, "text from {}: {}", client.peer->name, request.text);
        coop_ensure(co_await client.parser.send_packet(proto::TextReply{std::move(request.text)}, header.id));
        co_return true;
    }
    default:
        coop_bail("unhandled packet type {}", header.type);
    }
}

auto Echo::remove_client(ClientData& client) -> void {
    if(!client.peer) {
        return;
    }
    LOG_INFO(logger, "remove peer name={}", client.peer->name);
    std::erase(peers, client.peer.get());
    if(peers.empty()) {
        LOG_INFO(logger, "stopping data reader");
        data_reader_task.cancel();
    }
}

auto async_main() -> coop::Async<bool> {
    // setup echo
    auto echo = Echo();
    coop_ensure(co_await echo.init());

    // setup control socket
    auto server         = net::tcp::TCPServerBackend();
    server.alloc_client = [&server](net::ClientData& client) -> coop::Async<void> {
        auto data              = new ClientData();
        data->parser.send_data = [&server, &client](const net::BytesRef payload) -> coop::Async<bool> {
            constexpr auto error_value = false;
            co_ensure_v(co_await server.send(client, payload));
            co_return true;
        };
        client.data = data;
        co_return;
    };
    server.free_client = [&echo](void* ptr) -> coop::Async<void> {
        auto& client = *(ClientData*)ptr;
        echo.remove_client(client);
        delete &client;
        co_return;
    };
    server.on_received = [&echo](const net::ClientData& client, net::BytesRef data) -> coop::Async<void> {
        auto& c = *(ClientData*)client.data;
        if(const auto p = c.parser.parse_received(data)) {
            if(!co_await echo.handle_payload(client, p->header, p->payload)) {
                co_await c.parser.send_packet(proto::Error(), p->header.id);
            }
        }
    };
    coop_ensure(co_await server.start(control_port));
    LOG_INFO(logger, "listening control={} data={}", control_port, data_port);

    // wait until finished
    co_await server.task.join();
    co_return true;
}
} // namespace

auto main(const int argc, const char* const* argv) -> int {
    {
        auto parser = args::Parser<uint16_t>();
        auto help   = false;
        parser.kwarg(&control_port, {"-sc", "--control-port"}, "PORT", "control port to use", {.state = args::State::DefaultValue});
        parser.kwarg(&data_port, {"-sd", "--data-port"}, "PORT", "data port to use", {.state = args::State::DefaultValue});
        parser.kwflag(&help, {"-h", "--help"}, "print this help message", {.no_error_check = true});
        if(!parser.parse(argc, argv) || help) {
            std::println("usage: livetalk-server {}", parser.get_help());
            return 0;
        }
    }

    auto runner = coop::Runner();
    runner.push_task(async_main());
    runner.run();
    return 0;
}
