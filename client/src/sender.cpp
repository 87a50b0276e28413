#include "sender.hpp"

#include "fastxfer/byte_stream.hpp"
#include "fastxfer/errors.hpp"
#include "fastxfer/file_descriptor.hpp"
#include "fastxfer/helpers.hpp"
#include "fastxfer/protocol.hpp"
#include "fastxfer/transfer_session.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <iostream>
#include <sys/socket.h>
#include <sys/stat.h>
#include <vector>

namespace fastxfer {

namespace {

struct Source {
    std::string name;
    std::uint64_t size = 0;
    bool synthetic = false;
};

Source describe_source(const SendOptions &opts) {
    Source source;
    if (is_synthetic_source(opts.file)) {
        source.synthetic = true;
        source.name = kSyntheticName;
        source.size = *opts.declared_size;
        std::cout << "sending " << opts.file << " as '" << source.name << "', " << format_with_commas(source.size)
                  << " bytes" << std::endl;
        return source;
    }

    struct stat st{};
    if (::stat(opts.file.c_str(), &st) != 0) {
        throw TransferError(ErrorKind::File, errno_message("cannot stat '" + opts.file + "'", errno), opts.file);
    }
    if (!S_ISREG(st.st_mode)) {
        throw TransferError(ErrorKind::File, "'" + opts.file + "' is not a regular file", opts.file);
    }
    source.name = std::filesystem::path(opts.file).filename().string();
    source.size = static_cast<std::uint64_t>(st.st_size);
    return source;
}

std::uint64_t send_zero_copy(int sock_fd, int file_fd, const std::string &path, std::uint64_t size,
                             TransferSession &session, KernelIo &kernel) {
    off_t offset = 0;
    std::uint64_t sent = 0;
    while (sent < size) {
        std::size_t count = static_cast<std::size_t>(std::min<std::uint64_t>(kChunkSize, size - sent));
        auto current_offset = static_cast<std::uint64_t>(offset);

        ssize_t n = kernel.sendFile(sock_fd, file_fd, &offset, count);
        if (n < 0) {
            int err = static_cast<int>(-n);
            switch (classify_errno(err)) {
            case ErrorKind::DeviceIo:
                throw TransferError(ErrorKind::DeviceIo,
                                    errno_message("sendfile I/O error on '" + path + "' at offset " +
                                                      std::to_string(current_offset), err),
                                    path, current_offset);
            case ErrorKind::ConnectionLost:
                std::cerr << "[warning] connection lost during sendfile: " << std::strerror(err) << std::endl;
                throw TransferError(ErrorKind::ConnectionLost, errno_message("connection lost", err));
            default:
                throw TransferError(ErrorKind::Transfer,
                                    errno_message("sendfile failed at offset " + std::to_string(current_offset), err),
                                    path, current_offset);
            }
        }
        if (n == 0) {
            throw TransferError(ErrorKind::Transfer, "sendfile returned 0 with " + std::to_string(sent) + " of " +
                                                         std::to_string(size) + " bytes sent",
                                path, current_offset);
        }
        sent += static_cast<std::uint64_t>(n);
        session.transferred.fetch_add(static_cast<std::uint64_t>(n), std::memory_order_relaxed);
    }
    return sent;
}

std::uint64_t send_buffered(ByteReader &in, ByteWriter &sock_writer, TransferSession &session) {
    CountingWriter out(sock_writer, session.transferred);
    std::vector<char> buffer(kChunkSize);
    try {
        while (true) {
            std::size_t n = in.read(buffer.data(), buffer.size());
            if (n == 0) {
                break;
            }
            out.write(buffer.data(), n);
        }
    } catch (const TransferError &e) {
        if (e.kind() == ErrorKind::ConnectionLost) {
            std::cerr << "[warning] connection lost during buffered send: " << e.what() << std::endl;
        }
        throw TransferError(e.kind(), std::string(e.what()) + " (" + std::to_string(out.total()) + " bytes sent)",
                            e.path(), e.offset());
    }
    return out.total();
}

} // namespace

SendOptions make_send_options(const Config &config) {
    SendOptions opts;
    opts.file = config.file;
    opts.addr = config.addr;
    opts.sndbuf = config.sndbuf;
    if (is_synthetic_source(config.file)) {
        opts.declared_size = declared_size(config);
    }
    return opts;
}

bool is_synthetic_source(const std::string &path) {
    return path == kSyntheticSourcePath;
}

SendResult send_file(const SendOptions &opts) {
    return send_file(opts, platform_kernel_io());
}

SendResult send_file(const SendOptions &opts, KernelIo &kernel) {
    const bool synthetic = is_synthetic_source(opts.file);
    if (synthetic && !opts.declared_size) {
        throw TransferError(ErrorKind::Setup, std::string("a declared size is required to send ") + kSyntheticSourcePath);
    }

    FileDescriptor sock = connect_with_timeout(opts.addr, opts.connect_timeout);
    std::cout << "connected to receiver " << opts.addr << std::endl;

    if (opts.sndbuf > 0) {
        tune_socket_buffer(sock.get(), SO_SNDBUF, opts.sndbuf);
    }

    Source source = describe_source(opts);

    // header always goes through ordinary writes
    FdWriter sock_writer(sock.get(), true);
    std::string header = encode_header(source.name, source.size);
    sock_writer.write(header.data(), header.size());
    std::cout << "sent header: name '" << source.name << "', size " << format_with_commas(source.size) << " bytes"
              << std::endl;

    FileDescriptor file;
    if (!synthetic) {
        file = FileDescriptor::open(opts.file, O_RDONLY);
    }

    TransferSession session;
    session.name = source.name;
    session.declared_size = source.size;

    SendResult result;
    result.name = source.name;

    ProgressTracker tracker(source.size, session.transferred, opts.on_progress);
    tracker.start();

    if (source.size == 0) {
        tracker.stop();
        result.seconds = session.elapsedSeconds();
        return result;
    }

    std::uint64_t sent = 0;
    if (!synthetic && kernel.supportsSendFile() && sock.valid()) {
        std::cout << "sending '" << opts.file << "' with sendfile" << std::endl;
        result.zero_copy = true;
        sent = send_zero_copy(sock.get(), file.get(), opts.file, source.size, session, kernel);
    } else {
        if (synthetic) {
            std::cout << "sending synthetic data with buffered writes" << std::endl;
            ZeroSource zero(source.size);
            sent = send_buffered(zero, sock_writer, session);
        } else {
            std::cerr << "[warning] sendfile unavailable (" << kernel.name() << "), falling back to buffered writes"
                      << std::endl;
            // a file that grew after the stat must not spill past the declared body
            FdReader file_reader(file.get());
            LimitedReader reader(file_reader, source.size);
            sent = send_buffered(reader, sock_writer, session);
        }
    }
    tracker.stop();

    if (sent != source.size) {
        throw TransferError(ErrorKind::Integrity, "sent " + std::to_string(sent) + " bytes but declared " +
                                                      std::to_string(source.size),
                            opts.file);
    }

    result.bytes_sent = sent;
    result.seconds = session.elapsedSeconds();
    std::cout << "send complete, " << format_with_commas(sent) << " bytes" << std::endl;
    return result;
}

} // namespace fastxfer
