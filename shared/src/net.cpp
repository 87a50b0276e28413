#include "fastxfer/net.hpp"
#include "fastxfer/errors.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace fastxfer {

namespace {

class AddrInfo {
public:
    AddrInfo(const std::string &host, std::uint16_t port, bool passive) {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_flags = passive ? AI_PASSIVE : 0;

        std::string service = std::to_string(port);
        int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(), &hints, &this->info);
        if (rc != 0) {
            throw TransferError(ErrorKind::Connect,
                                "failed to resolve '" + host + "': " + std::string(::gai_strerror(rc)));
        }
    }

    ~AddrInfo() {
        if (this->info != nullptr) {
            ::freeaddrinfo(this->info);
        }
    }

    AddrInfo(const AddrInfo &) = delete;
    AddrInfo &operator=(const AddrInfo &) = delete;

    addrinfo *get() const { return this->info; }

private:
    addrinfo *info = nullptr;
};

HostPort split_address(const std::string &address) {
    HostPort hp;
    if (!parse_host_port(address, hp)) {
        throw TransferError(ErrorKind::Setup, "invalid address (expected host:port): " + address);
    }
    return hp;
}

// non-blocking connect bounded by `timeout`; returns 0 or an errno value
int connect_one(int fd, const addrinfo *ai, std::chrono::milliseconds timeout) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return errno;
    }

    int err = 0;
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) != 0) {
        if (errno != EINPROGRESS) {
            return errno;
        }
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        int rc;
        do {
            rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        } while (rc < 0 && errno == EINTR);
        if (rc < 0) {
            return errno;
        }
        if (rc == 0) {
            return ETIMEDOUT;
        }
        socklen_t len = sizeof(err);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0) {
            return errno;
        }
        if (err != 0) {
            return err;
        }
    }

    // body transfer uses blocking I/O
    if (::fcntl(fd, F_SETFL, flags) < 0) {
        return errno;
    }
    return 0;
}

} // namespace

bool parse_host_port(const std::string &input, HostPort &out) {
    auto colon = input.rfind(':');
    if (colon == std::string::npos) return false;
    std::string host = input.substr(0, colon);
    std::string port_str = input.substr(colon + 1);
    if (port_str.empty()) return false;
    // [::1]:8080
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    char *end = nullptr;
    long p = std::strtol(port_str.c_str(), &end, 10);
    if (*end != '\0' || p < 0 || p > 65535) return false;
    out.host = std::move(host);
    out.port = static_cast<std::uint16_t>(p);
    return true;
}

FileDescriptor connect_with_timeout(const std::string &address, std::chrono::milliseconds timeout) {
    HostPort hp = split_address(address);
    AddrInfo info(hp.host.empty() ? "localhost" : hp.host, hp.port, false);

    int last_err = ECONNREFUSED;
    for (addrinfo *ai = info.get(); ai != nullptr; ai = ai->ai_next) {
        FileDescriptor sock(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!sock.valid()) {
            last_err = errno;
            continue;
        }
        int err = connect_one(sock.get(), ai, timeout);
        if (err == 0) {
            return sock;
        }
        last_err = err;
    }
    throw TransferError(ErrorKind::Connect, errno_message("failed to connect to " + address, last_err));
}

FileDescriptor create_listen_socket(const std::string &address) {
    HostPort hp = split_address(address);
    AddrInfo info(hp.host, hp.port, true);

    int last_err = EADDRNOTAVAIL;
    for (addrinfo *ai = info.get(); ai != nullptr; ai = ai->ai_next) {
        FileDescriptor sock(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!sock.valid()) {
            last_err = errno;
            continue;
        }

        int enable = 1;
        if (::setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) < 0) {
            last_err = errno;
            continue;
        }
        if (::bind(sock.get(), ai->ai_addr, ai->ai_addrlen) < 0) {
            last_err = errno;
            continue;
        }
        // a small backlog lets senders queue while one transfer is in progress
        if (::listen(sock.get(), kListenBacklog) < 0) {
            last_err = errno;
            continue;
        }
        return sock;
    }
    throw TransferError(ErrorKind::Connect, errno_message("failed to listen on " + address, last_err));
}

std::uint16_t local_port(int fd) {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len) != 0) {
        return 0;
    }
    if (addr.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<sockaddr_in *>(&addr)->sin_port);
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6 *>(&addr)->sin6_port);
    }
    return 0;
}

std::string peer_address(int fd) {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getpeername(fd, reinterpret_cast<sockaddr *>(&addr), &len) != 0) {
        return "unknown";
    }
    char ipbuf[INET6_ADDRSTRLEN];
    if (addr.ss_family == AF_INET) {
        auto *in = reinterpret_cast<sockaddr_in *>(&addr);
        if (::inet_ntop(AF_INET, &in->sin_addr, ipbuf, sizeof(ipbuf))) {
            return std::string(ipbuf) + ":" + std::to_string(ntohs(in->sin_port));
        }
    } else if (addr.ss_family == AF_INET6) {
        auto *in6 = reinterpret_cast<sockaddr_in6 *>(&addr);
        if (::inet_ntop(AF_INET6, &in6->sin6_addr, ipbuf, sizeof(ipbuf))) {
            return "[" + std::string(ipbuf) + "]:" + std::to_string(ntohs(in6->sin6_port));
        }
    }
    return "unknown";
}

bool tune_socket_buffer(int fd, int option, int size, const std::string &log_prefix) {
    const char *label = option == SO_SNDBUF ? "send" : "receive";
    if (::setsockopt(fd, SOL_SOCKET, option, &size, sizeof(size)) < 0) {
        std::cerr << log_prefix << "[warning] failed to set TCP " << label << " buffer to " << size << ": "
                  << std::strerror(errno) << std::endl;
        return false;
    }
    // the kernel may round or double the value; check with OS tools
    std::cout << log_prefix << "requested TCP " << label << " buffer of " << size << " bytes" << std::endl;
    return true;
}

} // namespace fastxfer
