#pragma once

#include "file_descriptor.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace fastxfer {

constexpr std::chrono::milliseconds kConnectTimeout{10000};
constexpr int kListenBacklog = 8;

struct HostPort {
    std::string host;
    std::uint16_t port{};
};

// "host:port"; an empty host is accepted (wildcard address)
bool parse_host_port(const std::string &input, HostPort &out);

// throws TransferError(Connect)
FileDescriptor connect_with_timeout(const std::string &address, std::chrono::milliseconds timeout = kConnectTimeout);

// throws TransferError(Connect)
FileDescriptor create_listen_socket(const std::string &address);

std::uint16_t local_port(int fd);
std::string peer_address(int fd);

// SO_SNDBUF / SO_RCVBUF tuning; failure is only a warning
bool tune_socket_buffer(int fd, int option, int size, const std::string &log_prefix = "");

} // namespace fastxfer
