#include <array>
#include <cstring>

#include <sys/socket.h>
#include <sys/uio.h>

#include "macros/assert.hpp"
#include "net.hpp"

auto get_peer_addr(const int fd) -> std::optional<uint32_t> {
    auto addr = sockaddr_storage();
    auto len  = socklen_t(sizeof(addr));
    ensure(getpeername(fd, (sockaddr*)&addr, &len) == 0, "errno={}({})", errno, strerror(errno));
    if(addr.ss_family == AF_INET) {
        return ntohl(((sockaddr_in*)&addr)->sin_addr.s_addr);
    } else {
        bail("unimplemented address family {}", addr.ss_family);
    }
}

auto create_sock_addr(const uint32_t addr, const uint16_t port) -> sockaddr_in {
    auto sockaddr            = sockaddr_in();
    sockaddr.sin_family      = AF_INET;
    sockaddr.sin_port        = htons(port);
    sockaddr.sin_addr.s_addr = htonl(addr);
    return sockaddr;
}

auto create_udp_socket(const uint32_t addr, const uint16_t port) -> std::optional<FileDescriptor> {
    auto sock = FileDescriptor(socket(AF_INET, SOCK_DGRAM, 0));
    ensure(sock.as_handle() >= 0, "errno={}({})", errno, strerror(errno));
    auto sockaddr = create_sock_addr(addr, port);
    ensure(bind(sock.as_handle(), (struct sockaddr*)&sockaddr, sizeof(sockaddr)) == 0, "port={} errno={}({})", port, errno, strerror(errno));
    return sock;
}

auto is_same_addr(const sockaddr_in& a, const sockaddr_in& b) -> bool {
    return a.sin_family == b.sin_family && a.sin_port == b.sin_port && a.sin_addr.s_addr == b.sin_addr.s_addr;
}

auto send_datagram(const int fd, const sockaddr_in& addr, const std::span<const std::byte> head, const std::span<const std::byte> body) -> bool {
    // gather write, no staging copy
    auto iov = std::array{
        iovec{.iov_base = (void*)head.data(), .iov_len = head.size()},
        iovec{.iov_base = (void*)body.data(), .iov_len = body.size()},
    };
    auto msg = msghdr{
        .msg_name    = (void*)&addr,
        .msg_namelen = sizeof(addr),
        .msg_iov     = iov.data(),
        .msg_iovlen  = iov.size(),
    };
    const auto total = head.size() + body.size();
    const auto ret   = sendmsg(fd, &msg, 0);
    ensure(ret == ssize_t(total), "ret={} errno={}({})", ret, errno, strerror(errno));
    return true;
}
