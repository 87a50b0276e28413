#include "fastxfer/kernel_io.hpp"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

#if defined(__linux__)
#include <sys/sendfile.h>
#endif

namespace fastxfer {

#if defined(__linux__)

const char *LinuxKernelIo::name() const {
    return "linux";
}

bool LinuxKernelIo::supportsSendFile() const {
    return true;
}

bool LinuxKernelIo::supportsSplice() const {
    return true;
}

ssize_t LinuxKernelIo::sendFile(int out_fd, int in_fd, off_t *offset, std::size_t count) {
    while (true) {
        ssize_t n = ::sendfile(out_fd, in_fd, offset, count);
        if (n >= 0) {
            return n;
        }
        if (errno != EINTR) {
            return -errno;
        }
    }
}

ssize_t LinuxKernelIo::splice(int in_fd, int out_fd, std::size_t count) {
    constexpr unsigned int flags = SPLICE_F_MOVE | SPLICE_F_MORE;
    while (true) {
        ssize_t n = ::splice(in_fd, nullptr, out_fd, nullptr, count, flags);
        if (n >= 0) {
            return n;
        }
        if (errno != EINTR) {
            return -errno;
        }
    }
}

int LinuxKernelIo::preallocate(int fd, std::uint64_t size) {
    if (::fallocate(fd, 0, 0, static_cast<off_t>(size)) != 0) {
        return errno;
    }
    return 0;
}

int LinuxKernelIo::readAhead(int fd, std::uint64_t size) {
    if (::readahead(fd, 0, static_cast<std::size_t>(size)) != 0) {
        return errno;
    }
    return 0;
}

int LinuxKernelIo::setPipeSize(int pipe_fd, int size) {
    if (::fcntl(pipe_fd, F_SETPIPE_SZ, size) < 0) {
        return errno;
    }
    return 0;
}

#endif

const char *PortableKernelIo::name() const {
    return "portable";
}

bool PortableKernelIo::supportsSendFile() const {
    return false;
}

bool PortableKernelIo::supportsSplice() const {
    return false;
}

ssize_t PortableKernelIo::sendFile(int, int, off_t *, std::size_t) {
    return -ENOSYS;
}

ssize_t PortableKernelIo::splice(int, int, std::size_t) {
    return -ENOSYS;
}

int PortableKernelIo::preallocate(int fd, std::uint64_t size) {
    // posix_fallocate reports through its return value, not errno
    return ::posix_fallocate(fd, 0, static_cast<off_t>(size));
}

int PortableKernelIo::readAhead(int fd, std::uint64_t size) {
#ifdef POSIX_FADV_WILLNEED
    return ::posix_fadvise(fd, 0, static_cast<off_t>(size), POSIX_FADV_WILLNEED);
#else
    (void)fd;
    (void)size;
    return ENOSYS;
#endif
}

int PortableKernelIo::setPipeSize(int, int) {
    return ENOSYS;
}

KernelIo &platform_kernel_io() {
#if defined(__linux__)
    static LinuxKernelIo io;
#else
    static PortableKernelIo io;
#endif
    return io;
}

} // namespace fastxfer
