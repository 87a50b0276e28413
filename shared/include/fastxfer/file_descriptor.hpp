#pragma once

#include <string>
#include <sys/types.h>

namespace fastxfer {

// owning descriptor, closed on destruction
class FileDescriptor {
public:
    FileDescriptor() noexcept = default;
    explicit FileDescriptor(int fd) noexcept;
    ~FileDescriptor();

    FileDescriptor(const FileDescriptor &) = delete;
    FileDescriptor &operator=(const FileDescriptor &) = delete;
    FileDescriptor(FileDescriptor &&other) noexcept;
    FileDescriptor &operator=(FileDescriptor &&other) noexcept;

    int get() const noexcept;
    bool valid() const noexcept;
    int release() noexcept;
    void reset(int fd = -1) noexcept;
    void close() noexcept;

    // throws TransferError(File) carrying the path
    static FileDescriptor open(const std::string &path, int flags, mode_t mode = 0);

private:
    int fd = -1;
};

struct Pipe {
    FileDescriptor read_end;
    FileDescriptor write_end;
};

Pipe make_pipe();

} // namespace fastxfer
