#include "simple_server.hpp"

#include "fastxfer/errors.hpp"
#include "fastxfer/helpers.hpp"
#include "fastxfer/net.hpp"

#include <cerrno>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <sys/socket.h>

namespace fastxfer {

ReceiveStats::ReceiveStats() : started(std::chrono::steady_clock::now()) {}

bool ReceiveStats::record(const ReceiveOutcome &outcome) {
    if (!outcome.ok || outcome.bytes == 0) {
        return false;
    }
    this->file_count++;
    this->byte_count += outcome.bytes;
    return true;
}

std::uint64_t ReceiveStats::files() const {
    return this->file_count;
}

std::uint64_t ReceiveStats::bytes() const {
    return this->byte_count;
}

double ReceiveStats::averageMegabytesPerSecond() const {
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - this->started).count();
    if (elapsed <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(this->byte_count) / elapsed / kMebibyte;
}

ReceiverServer::ReceiverServer(std::string address, ReceiveOptions options, KernelIo &kernel)
    : address(std::move(address)), options(std::move(options)), kernel(kernel) {}

void ReceiverServer::bind() {
    this->listener = create_listen_socket(this->address);
    std::cout << "server listening on " << this->address << " (port " << this->port() << ")" << std::endl;
}

std::uint16_t ReceiverServer::port() const {
    return local_port(this->listener.get());
}

void ReceiverServer::close() {
    this->closing = true;
    if (this->listener.valid()) {
        // wakes a blocked accept(); the descriptor itself is released by serve()'s owner
        ::shutdown(this->listener.get(), SHUT_RDWR);
    }
}

void ReceiverServer::setOutcomeHandler(OutcomeHandler handler) {
    this->on_outcome = std::move(handler);
}

ReceiveStats ReceiverServer::stats() const {
    std::lock_guard<std::mutex> lock(this->stats_mutex);
    return this->totals;
}

void ReceiverServer::serve() {
    if (!this->listener.valid()) {
        this->bind();
    }

    while (true) {
        int client_fd = ::accept(this->listener.get(), nullptr, nullptr);
        if (client_fd < 0) {
            int err = errno;
            if (this->closing) {
                std::cout << "listener closed, server exiting" << std::endl;
                return;
            }
            if (err == EBADF || err == ENOTSOCK) {
                std::cout << "listener closed, server exiting" << std::endl;
                return;
            }
            std::cerr << "[warning] accept failed: " << std::strerror(err) << std::endl;
            continue;
        }
        this->handleConnection(FileDescriptor(client_fd));
        std::cout << "waiting for next connection..." << std::endl;
    }
}

void ReceiverServer::handleConnection(FileDescriptor conn) {
    std::string peer = peer_address(conn.get());
    std::cout << "[" << peer << "] connection accepted" << std::endl;

    ReceiveOutcome outcome = receive_connection(std::move(conn), peer, this->options, this->kernel);

    ReceiveStats snapshot;
    bool counted;
    {
        std::lock_guard<std::mutex> lock(this->stats_mutex);
        counted = this->totals.record(outcome);
        snapshot = this->totals;
    }

    std::cout << std::fixed << std::setprecision(2);
    if (counted) {
        double mbps = outcome.seconds > 0 ? static_cast<double>(outcome.bytes) / outcome.seconds / kMebibyte : 0.0;
        std::cout << "[" << peer << "] transfer complete, '" << outcome.name << "' received "
                  << format_with_commas(outcome.bytes) << " bytes, " << mbps << " MB/s" << std::endl;
    }
    if (snapshot.bytes() > 0) {
        std::cout << "total received: " << snapshot.files() << " files, " << format_with_commas(snapshot.bytes())
                  << " bytes, average " << snapshot.averageMegabytesPerSecond() << " MB/s" << std::endl;
    }
    std::cout << std::defaultfloat;

    if (this->on_outcome) {
        this->on_outcome(outcome);
    }
}

int start_simple_server(const Config &config) {
    ReceiverServer server(config.addr, make_receive_options(config));
    try {
        server.bind();
    } catch (const TransferError &e) {
        std::cerr << "[error] " << e.what() << std::endl;
        return 1;
    }
    server.serve();
    return 0;
}

} // namespace fastxfer
