#include "fastxfer/errors.hpp"

#include <cerrno>
#include <cstring>

namespace fastxfer {

const char *to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Setup:
        return "setup";
    case ErrorKind::Connect:
        return "connect";
    case ErrorKind::Protocol:
        return "protocol";
    case ErrorKind::File:
        return "file";
    case ErrorKind::ConnectionLost:
        return "connection_lost";
    case ErrorKind::DeviceIo:
        return "device_io";
    case ErrorKind::Integrity:
        return "integrity";
    case ErrorKind::Transfer:
        return "transfer";
    case ErrorKind::Advisory:
        return "advisory";
    }
    return "unknown";
}

TransferError::TransferError(ErrorKind kind, const std::string &msg)
    : std::runtime_error(msg), error_kind(kind) {}

TransferError::TransferError(ErrorKind kind, const std::string &msg, const std::string &path, std::uint64_t offset)
    : std::runtime_error(msg), error_kind(kind), file_path(path), byte_offset(offset) {}

ErrorKind TransferError::kind() const noexcept {
    return this->error_kind;
}

const std::string &TransferError::path() const noexcept {
    return this->file_path;
}

std::uint64_t TransferError::offset() const noexcept {
    return this->byte_offset;
}

bool is_connection_lost(int err) {
    return err == EPIPE || err == ECONNRESET;
}

ErrorKind classify_errno(int err) {
    if (is_connection_lost(err)) {
        return ErrorKind::ConnectionLost;
    }
    if (err == EIO) {
        return ErrorKind::DeviceIo;
    }
    return ErrorKind::Transfer;
}

std::string errno_message(const std::string &what, int err) {
    return what + ": " + std::strerror(err);
}

TransferError stream_error(const std::string &what, int err) {
    ErrorKind kind = is_connection_lost(err) ? ErrorKind::ConnectionLost : ErrorKind::Transfer;
    return TransferError(kind, errno_message(what, err));
}

} // namespace fastxfer
