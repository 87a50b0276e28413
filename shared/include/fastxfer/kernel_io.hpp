#pragma once

#include <cstddef>
#include <cstdint>
#include <sys/types.h>

namespace fastxfer {

// Kernel-assisted copy primitives. Copy operations return the number of
// bytes moved or -errno; advisory operations return 0 or an errno value.
// The engines pick a strategy once per transfer from supportsSendFile() /
// supportsSplice() and fall back to plain read/write otherwise.
class KernelIo {
public:
    virtual ~KernelIo() = default;

    virtual const char *name() const = 0;
    virtual bool supportsSendFile() const = 0;
    virtual bool supportsSplice() const = 0;

    // file region -> socket, advancing *offset
    virtual ssize_t sendFile(int out_fd, int in_fd, off_t *offset, std::size_t count) = 0;
    // descriptor -> descriptor where at least one side is a pipe
    virtual ssize_t splice(int in_fd, int out_fd, std::size_t count) = 0;

    virtual int preallocate(int fd, std::uint64_t size) = 0;
    virtual int readAhead(int fd, std::uint64_t size) = 0;
    virtual int setPipeSize(int pipe_fd, int size) = 0;
};

#if defined(__linux__)
class LinuxKernelIo final : public KernelIo {
public:
    const char *name() const override;
    bool supportsSendFile() const override;
    bool supportsSplice() const override;
    ssize_t sendFile(int out_fd, int in_fd, off_t *offset, std::size_t count) override;
    ssize_t splice(int in_fd, int out_fd, std::size_t count) override;
    int preallocate(int fd, std::uint64_t size) override;
    int readAhead(int fd, std::uint64_t size) override;
    int setPipeSize(int pipe_fd, int size) override;
};
#endif

// no zero-copy primitives; always available
class PortableKernelIo final : public KernelIo {
public:
    const char *name() const override;
    bool supportsSendFile() const override;
    bool supportsSplice() const override;
    ssize_t sendFile(int out_fd, int in_fd, off_t *offset, std::size_t count) override;
    ssize_t splice(int in_fd, int out_fd, std::size_t count) override;
    int preallocate(int fd, std::uint64_t size) override;
    int readAhead(int fd, std::uint64_t size) override;
    int setPipeSize(int pipe_fd, int size) override;
};

KernelIo &platform_kernel_io();

} // namespace fastxfer
