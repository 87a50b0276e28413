#include "fastxfer/byte_stream.hpp"
#include "fastxfer/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <sys/socket.h>
#include <unistd.h>

namespace fastxfer {

FdReader::FdReader(int fd, bool is_socket) : fd(fd), is_socket(is_socket) {}

std::size_t FdReader::read(char *buffer, std::size_t length) {
    while (true) {
        ssize_t n = ::read(this->fd, buffer, length);
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno == EINTR) {
            continue;
        }
        throw stream_error(this->is_socket ? "socket read failed" : "file read failed", errno);
    }
}

void FdReader::interrupt() {
    if (this->is_socket) {
        // pending and future reads return end of stream
        ::shutdown(this->fd, SHUT_RD);
    }
}

FdWriter::FdWriter(int fd, bool is_socket) : fd(fd), is_socket(is_socket) {}

void FdWriter::write(const char *data, std::size_t length) {
    std::size_t sent = 0;
    while (sent < length) {
        ssize_t n = this->is_socket ? ::send(this->fd, data + sent, length - sent, MSG_NOSIGNAL)
                                    : ::write(this->fd, data + sent, length - sent);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw stream_error(this->is_socket ? "socket write failed" : "file write failed", errno);
        }
        sent += static_cast<std::size_t>(n);
    }
}

ZeroSource::ZeroSource(std::uint64_t size) : size(size) {}

std::size_t ZeroSource::read(char *, std::size_t length) {
    std::uint64_t left = this->remaining();
    std::size_t n = static_cast<std::size_t>(std::min<std::uint64_t>(left, length));
    this->produced += n;
    return n;
}

std::uint64_t ZeroSource::remaining() const {
    return this->size - this->produced;
}

void DiscardSink::write(const char *, std::size_t length) {
    this->discarded += length;
}

std::uint64_t DiscardSink::bytesDiscarded() const {
    return this->discarded;
}

LimitedReader::LimitedReader(ByteReader &inner, std::uint64_t limit) : inner(inner), limit(limit) {}

std::size_t LimitedReader::read(char *buffer, std::size_t length) {
    std::uint64_t left = this->remaining();
    if (left == 0) {
        return 0;
    }
    std::size_t n = this->inner.read(buffer, static_cast<std::size_t>(std::min<std::uint64_t>(left, length)));
    this->consumed += n;
    return n;
}

void LimitedReader::interrupt() {
    this->inner.interrupt();
}

std::uint64_t LimitedReader::remaining() const {
    return this->limit - this->consumed;
}

CountingWriter::CountingWriter(ByteWriter &inner, std::atomic<std::uint64_t> &counter)
    : inner(inner), counter(counter) {}

void CountingWriter::write(const char *data, std::size_t length) {
    this->inner.write(data, length);
    this->written += length;
    this->counter.fetch_add(length, std::memory_order_relaxed);
}

std::uint64_t CountingWriter::total() const {
    return this->written;
}

std::size_t read_full(ByteReader &reader, char *buffer, std::size_t length) {
    std::size_t got = 0;
    while (got < length) {
        std::size_t n = reader.read(buffer + got, length - got);
        if (n == 0) {
            break;
        }
        got += n;
    }
    return got;
}

} // namespace fastxfer
