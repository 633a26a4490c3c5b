#pragma once
#include <optional>
#include <span>

#include <netinet/in.h>

#include "util/fd.hpp"

auto get_peer_addr(int fd) -> std::optional<uint32_t>;
auto create_sock_addr(uint32_t addr, uint16_t port) -> sockaddr_in;
auto create_udp_socket(uint32_t addr, uint16_t port) -> std::optional<FileDescriptor>;
auto is_same_addr(const sockaddr_in& a, const sockaddr_in& b) -> bool;

// sends one datagram made of the concatenated parts
auto send_datagram(int fd, const sockaddr_in& addr, std::span<const std::byte> head, std::span<const std::byte> body) -> bool;
