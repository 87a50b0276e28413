#include "fastxfer/file_descriptor.hpp"
#include "fastxfer/errors.hpp"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <utility>

namespace fastxfer {

FileDescriptor::FileDescriptor(int fd) noexcept : fd(fd) {}

FileDescriptor::~FileDescriptor() {
    this->close();
}

FileDescriptor::FileDescriptor(FileDescriptor &&other) noexcept : fd(other.release()) {}

FileDescriptor &FileDescriptor::operator=(FileDescriptor &&other) noexcept {
    if (this != &other) {
        this->reset(other.release());
    }
    return *this;
}

int FileDescriptor::get() const noexcept {
    return this->fd;
}

bool FileDescriptor::valid() const noexcept {
    return this->fd >= 0;
}

int FileDescriptor::release() noexcept {
    return std::exchange(this->fd, -1);
}

void FileDescriptor::reset(int new_fd) noexcept {
    if (this->fd >= 0 && this->fd != new_fd) {
        ::close(this->fd);
    }
    this->fd = new_fd;
}

void FileDescriptor::close() noexcept {
    this->reset(-1);
}

FileDescriptor FileDescriptor::open(const std::string &path, int flags, mode_t mode) {
    while (true) {
        int fd = ::open(path.c_str(), flags, mode);
        if (fd >= 0) {
            return FileDescriptor(fd);
        }
        if (errno == EINTR) {
            continue;
        }
        int err = errno;
        throw TransferError(ErrorKind::File, errno_message("failed to open '" + path + "'", err), path);
    }
}

Pipe make_pipe() {
    int fds[2];
    if (::pipe(fds) != 0) {
        throw TransferError(ErrorKind::Transfer, errno_message("failed to create pipe", errno));
    }
    return Pipe{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
}

} // namespace fastxfer
