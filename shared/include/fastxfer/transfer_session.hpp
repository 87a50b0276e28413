#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace fastxfer {

// per-connection transfer state, owned by the engine handling that connection
struct TransferSession {
    std::string name;
    std::uint64_t declared_size = 0;
    std::atomic<std::uint64_t> transferred{0};
    std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();

    double elapsedSeconds() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    }
};

} // namespace fastxfer
