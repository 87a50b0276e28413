#pragma once

#include "fastxfer/config.hpp"
#include "fastxfer/errors.hpp"
#include "fastxfer/file_descriptor.hpp"
#include "fastxfer/kernel_io.hpp"
#include "fastxfer/progress.hpp"
#include "fastxfer/protocol.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace fastxfer {

// splice pipe capacity, best effort
constexpr int kPipeSize = 4 * static_cast<int>(kChunkSize);

struct ReceiveOptions {
    std::string dir = ".";
    bool use_splice = true;
    int rcvbuf = 0;
    bool direct_io = false;
    ProgressCallback on_progress = render_progress;
};

// result of one connection; failures are classified, never thrown
struct ReceiveOutcome {
    bool ok = false;
    std::string peer;
    std::string name;
    std::string path;
    std::uint64_t declared_size = 0;
    std::uint64_t bytes = 0;
    double seconds = 0.0;
    std::optional<ErrorKind> error_kind;
    std::string error;
};

ReceiveOptions make_receive_options(const Config &config);

bool is_discard_target(const std::string &dir);

// Handles one accepted connection end to end. The received name is joined
// onto opts.dir as is: a peer can address any path the process may write.
ReceiveOutcome receive_connection(FileDescriptor conn, const std::string &peer, const ReceiveOptions &opts,
                                  KernelIo &kernel);

} // namespace fastxfer
