#pragma once

#include "fastxfer/config.hpp"
#include "fastxfer/kernel_io.hpp"
#include "fastxfer/net.hpp"
#include "fastxfer/progress.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace fastxfer {

// name announced for the synthetic source
inline constexpr const char *kSyntheticName = "zero.dat";

struct SendOptions {
    std::string file;
    std::string addr;
    // required for the synthetic source, ignored for regular files
    std::optional<std::uint64_t> declared_size;
    int sndbuf = 0;
    std::chrono::milliseconds connect_timeout = kConnectTimeout;
    ProgressCallback on_progress = render_progress;
};

struct SendResult {
    std::string name;
    std::uint64_t bytes_sent = 0;
    bool zero_copy = false;
    double seconds = 0.0;
};

SendOptions make_send_options(const Config &config);

bool is_synthetic_source(const std::string &path);

// connect, send the header, send the body; throws TransferError
SendResult send_file(const SendOptions &opts, KernelIo &kernel);
SendResult send_file(const SendOptions &opts);

// advisory read-ahead over the whole file, never fails the caller
void prewarm_file(const std::string &path, KernelIo &kernel);

} // namespace fastxfer
