#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace fastxfer {

// closed set of failure classes; callers branch on the tag, never on the message
enum class ErrorKind {
    Setup,
    Connect,
    Protocol,
    File,
    ConnectionLost,
    DeviceIo,
    Integrity,
    Transfer,
    Advisory
};

const char *to_string(ErrorKind kind);

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string &msg);
    TransferError(ErrorKind kind, const std::string &msg, const std::string &path, std::uint64_t offset = 0);

    ErrorKind kind() const noexcept;
    const std::string &path() const noexcept;
    std::uint64_t offset() const noexcept;

private:
    ErrorKind error_kind;
    std::string file_path;
    std::uint64_t byte_offset = 0;
};

// EPIPE / ECONNRESET
bool is_connection_lost(int err);

// classification of a failed kernel copy (sendfile / splice)
ErrorKind classify_errno(int err);

// "<what>: <strerror(err)>"
std::string errno_message(const std::string &what, int err);

// stream read/write failure: connection loss or generic transfer error
TransferError stream_error(const std::string &what, int err);

} // namespace fastxfer
