#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace fastxfer {

class ByteReader {
public:
    virtual ~ByteReader() = default;

    // returns 0 at end of stream, throws TransferError on failure
    virtual std::size_t read(char *buffer, std::size_t length) = 0;

    // unblock a pending read from another thread; no-op by default
    virtual void interrupt() {}
};

class ByteWriter {
public:
    virtual ~ByteWriter() = default;

    // writes everything or throws TransferError
    virtual void write(const char *data, std::size_t length) = 0;
};

class FdReader : public ByteReader {
public:
    explicit FdReader(int fd, bool is_socket = false);

    std::size_t read(char *buffer, std::size_t length) override;
    void interrupt() override;

private:
    int fd;
    bool is_socket;
};

class FdWriter : public ByteWriter {
public:
    explicit FdWriter(int fd, bool is_socket = false);

    void write(const char *data, std::size_t length) override;

private:
    int fd;
    bool is_socket;
};

// yields exactly `size` bytes then end of stream; buffer content is left as is
class ZeroSource : public ByteReader {
public:
    explicit ZeroSource(std::uint64_t size);

    std::size_t read(char *buffer, std::size_t length) override;
    std::uint64_t remaining() const;

private:
    std::uint64_t size;
    std::uint64_t produced = 0;
};

class DiscardSink : public ByteWriter {
public:
    void write(const char *data, std::size_t length) override;
    std::uint64_t bytesDiscarded() const;

private:
    std::uint64_t discarded = 0;
};

// reads at most `limit` bytes from another reader, then reports end of stream
class LimitedReader : public ByteReader {
public:
    LimitedReader(ByteReader &inner, std::uint64_t limit);

    std::size_t read(char *buffer, std::size_t length) override;
    void interrupt() override;
    std::uint64_t remaining() const;

private:
    ByteReader &inner;
    std::uint64_t limit;
    std::uint64_t consumed = 0;
};

// forwards to another writer and publishes every accepted byte to a shared counter
class CountingWriter : public ByteWriter {
public:
    CountingWriter(ByteWriter &inner, std::atomic<std::uint64_t> &counter);

    void write(const char *data, std::size_t length) override;
    std::uint64_t total() const;

private:
    ByteWriter &inner;
    std::atomic<std::uint64_t> &counter;
    std::uint64_t written = 0;
};

// reads until `length` bytes or end of stream, returns the count obtained
std::size_t read_full(ByteReader &reader, char *buffer, std::size_t length);

} // namespace fastxfer
