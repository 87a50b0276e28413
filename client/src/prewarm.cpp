#include "sender.hpp"

#include "fastxfer/errors.hpp"
#include "fastxfer/file_descriptor.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <sys/stat.h>

namespace fastxfer {

void prewarm_file(const std::string &path, KernelIo &kernel) {
    std::cout << "issuing read-ahead for '" << path << "' (whole file)" << std::endl;
    auto started = std::chrono::steady_clock::now();

    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        std::cerr << "[warning] prewarm: cannot stat '" << path << "': " << std::strerror(errno) << std::endl;
        return;
    }
    if (st.st_size == 0) {
        std::cout << "'" << path << "' is empty, skipping prewarm" << std::endl;
        return;
    }

    FileDescriptor file;
    try {
        file = FileDescriptor::open(path, O_RDONLY);
    } catch (const TransferError &e) {
        std::cerr << "[warning] prewarm: " << e.what() << std::endl;
        return;
    }

    int err = kernel.readAhead(file.get(), static_cast<std::uint64_t>(st.st_size));
    auto took = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started);
    if (err != 0) {
        std::cerr << "[warning] read-ahead request failed: " << std::strerror(err) << std::endl;
        return;
    }
    // the kernel loads pages asynchronously; this only measures issuing the hint
    std::cout << "read-ahead issued in " << took.count() << " us" << std::endl;
}

} // namespace fastxfer
