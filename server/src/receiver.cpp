#include "receiver.hpp"
#include "buffered_pipeline.hpp"

#include "fastxfer/byte_stream.hpp"
#include "fastxfer/helpers.hpp"
#include "fastxfer/net.hpp"
#include "fastxfer/transfer_session.hpp"

#include <algorithm>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <iostream>
#include <sys/socket.h>

namespace fastxfer {

namespace {

struct Destination {
    std::string path;
    FileDescriptor fd;
    bool discard = false;
};

Destination open_destination(const TransferHeader &header, const ReceiveOptions &opts, const std::string &prefix) {
    namespace fs = std::filesystem;
    Destination dest;

    if (is_discard_target(opts.dir)) {
        dest.discard = true;
        dest.path = kDiscardTargetPath;
        dest.fd = FileDescriptor::open(kDiscardTargetPath, O_WRONLY);
        std::cout << prefix << "received name '" << header.name << "', discarding data" << std::endl;
        return dest;
    }

    std::error_code ec;
    fs::create_directories(opts.dir, ec);
    if (ec) {
        throw TransferError(ErrorKind::File, "failed to create directory '" + opts.dir + "': " + ec.message(),
                            opts.dir);
    }
    dest.path = (fs::path(opts.dir) / header.name).string();

    int flags = O_CREAT | O_WRONLY | O_TRUNC;
    if (opts.direct_io) {
#ifdef O_DIRECT
        flags |= O_DIRECT;
        std::cerr << prefix << "[warning] opening '" << dest.path
                  << "' with O_DIRECT: page cache bypassed, strict alignment rules apply" << std::endl;
#else
        std::cerr << prefix << "[warning] O_DIRECT not supported on this platform, ignoring" << std::endl;
#endif
    }
    dest.fd = FileDescriptor::open(dest.path, flags, 0644);
    std::cout << prefix << "saving '" << header.name << "' to " << dest.path << std::endl;
    return dest;
}

void splice_body(int sock_fd, const Destination &dest, TransferSession &session, KernelIo &kernel) {
    Pipe pipe = make_pipe();
    kernel.setPipeSize(pipe.write_end.get(), kPipeSize); // optimisation only

    std::uint64_t total = 0;
    while (total < session.declared_size) {
        auto want = static_cast<std::size_t>(std::min<std::uint64_t>(kChunkSize, session.declared_size - total));
        ssize_t moved = kernel.splice(sock_fd, pipe.write_end.get(), want);
        if (moved < 0) {
            int err = static_cast<int>(-moved);
            throw TransferError(classify_errno(err), errno_message("splice from socket to pipe failed", err));
        }
        if (moved == 0) {
            // peer closed; the size check after the loop reports the shortfall
            break;
        }

        ssize_t written = kernel.splice(pipe.read_end.get(), dest.fd.get(), static_cast<std::size_t>(moved));
        if (written < 0) {
            int err = static_cast<int>(-written);
            throw TransferError(classify_errno(err),
                                errno_message("splice from pipe to '" + dest.path + "' failed", err), dest.path,
                                total);
        }
        if (written != moved) {
            throw TransferError(ErrorKind::Integrity, "partial splice into '" + dest.path + "': expected " +
                                                          std::to_string(moved) + ", wrote " + std::to_string(written),
                                dest.path, total);
        }
        total += static_cast<std::uint64_t>(written);
        session.transferred.fetch_add(static_cast<std::uint64_t>(written), std::memory_order_relaxed);
    }
}

void buffered_body(int sock_fd, const Destination &dest, TransferSession &session) {
    FdReader socket_reader(sock_fd, true);
    FdWriter file_writer(dest.fd.get());
    DiscardSink sink;
    ByteWriter &out = dest.discard ? static_cast<ByteWriter &>(sink) : file_writer;

    BufferedPipeline pipeline(socket_reader, out, session.declared_size, session.transferred);
    pipeline.run();
}

} // namespace

ReceiveOptions make_receive_options(const Config &config) {
    ReceiveOptions opts;
    opts.dir = config.dir;
    opts.use_splice = !config.no_splice;
    opts.rcvbuf = config.rcvbuf;
    opts.direct_io = config.odirect;
    return opts;
}

bool is_discard_target(const std::string &dir) {
    return dir == kDiscardTargetPath;
}

ReceiveOutcome receive_connection(FileDescriptor conn, const std::string &peer, const ReceiveOptions &opts,
                                  KernelIo &kernel) {
    const std::string prefix = "[" + peer + "] ";
    ReceiveOutcome outcome;
    outcome.peer = peer;
    TransferSession session;

    try {
        if (opts.rcvbuf > 0) {
            tune_socket_buffer(conn.get(), SO_RCVBUF, opts.rcvbuf, prefix);
        }

        FdReader header_reader(conn.get(), true);
        TransferHeader header = decode_header(header_reader);
        session.name = header.name;
        session.declared_size = header.size;
        outcome.name = header.name;
        outcome.declared_size = header.size;
        std::cout << prefix << "header: name '" << header.name << "', size " << format_with_commas(header.size)
                  << " bytes" << std::endl;

        Destination dest = open_destination(header, opts, prefix);
        outcome.path = dest.path;

        if (!dest.discard && header.size > 0) {
            int err = kernel.preallocate(dest.fd.get(), header.size);
            if (err != 0) {
                std::cerr << prefix << "[warning] failed to preallocate '" << dest.path << "': " << std::strerror(err)
                          << std::endl;
            }
        }

        ProgressTracker tracker(header.size, session.transferred, opts.on_progress);
        tracker.start();

        if (header.size > 0) {
            if (opts.use_splice && kernel.supportsSplice()) {
                std::cout << prefix << "receiving with splice" << std::endl;
                splice_body(conn.get(), dest, session, kernel);
            } else {
                if (opts.use_splice) {
                    std::cerr << prefix << "[warning] splice unavailable (" << kernel.name()
                              << "), using buffered pipeline" << std::endl;
                } else {
                    std::cout << prefix << "receiving with buffered pipeline" << std::endl;
                }
                buffered_body(conn.get(), dest, session);
            }
        }
        tracker.stop();

        std::uint64_t received = session.transferred.load();
        if (received != header.size) {
            throw TransferError(ErrorKind::Integrity, "'" + header.name + "' received " + std::to_string(received) +
                                                          " bytes but declared " + std::to_string(header.size),
                                dest.path);
        }
        outcome.ok = true;
    } catch (const TransferError &e) {
        outcome.error_kind = e.kind();
        outcome.error = e.what();
        std::cerr << prefix << "[error] " << e.what() << std::endl;
    } catch (const std::exception &e) {
        outcome.error_kind = ErrorKind::Transfer;
        outcome.error = e.what();
        std::cerr << prefix << "[error] " << e.what() << std::endl;
    }

    conn.close();
    outcome.bytes = session.transferred.load();
    outcome.seconds = session.elapsedSeconds();
    std::cout << prefix << "connection closed" << std::endl;
    return outcome;
}

} // namespace fastxfer
