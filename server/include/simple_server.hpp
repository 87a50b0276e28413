#pragma once

#include "receiver.hpp"

#include "fastxfer/config.hpp"
#include "fastxfer/file_descriptor.hpp"
#include "fastxfer/kernel_io.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace fastxfer {

// process-lifetime totals over successful receipts that moved body bytes
class ReceiveStats {
public:
    ReceiveStats();

    bool record(const ReceiveOutcome &outcome);

    std::uint64_t files() const;
    std::uint64_t bytes() const;
    double averageMegabytesPerSecond() const;

private:
    std::uint64_t file_count = 0;
    std::uint64_t byte_count = 0;
    std::chrono::steady_clock::time_point started;
};

// Owns the listening socket and handles connections strictly one after
// another: the next accept() only happens once the current transfer is done.
class ReceiverServer {
public:
    using OutcomeHandler = std::function<void(const ReceiveOutcome &)>;

    ReceiverServer(std::string address, ReceiveOptions options, KernelIo &kernel = platform_kernel_io());

    // throws TransferError(Connect)
    void bind();
    std::uint16_t port() const;

    // returns once close() was called
    void serve();

    // safe to call from another thread
    void close();

    void setOutcomeHandler(OutcomeHandler handler);
    ReceiveStats stats() const;

private:
    void handleConnection(FileDescriptor conn);

    std::string address;
    ReceiveOptions options;
    KernelIo &kernel;
    FileDescriptor listener;
    std::atomic<bool> closing{false};
    OutcomeHandler on_outcome;

    mutable std::mutex stats_mutex;
    ReceiveStats totals;
};

// receive mode entry point, returns the process exit status
int start_simple_server(const Config &config);

} // namespace fastxfer
