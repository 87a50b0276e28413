#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace fastxfer {

constexpr std::chrono::milliseconds kProgressInterval{500};
constexpr double kMinElapsedSeconds = 0.1;

struct ProgressSnapshot {
    std::uint64_t transferred = 0;
    std::uint64_t total = 0;
    double elapsed_seconds = 0.0;
    double megabytes_per_second = 0.0;
    double percent = 0.0;
    bool final = false;
};

using ProgressCallback = std::function<void(const ProgressSnapshot &)>;

ProgressSnapshot compute_progress(std::uint64_t total, std::uint64_t transferred, double elapsed_seconds, bool final);

// single refreshed status line on stdout
void render_progress(const ProgressSnapshot &snapshot);

// samples a shared counter on its own thread until stop(); stop() emits one
// last snapshot and is safe to call more than once
class ProgressTracker {
public:
    ProgressTracker(std::uint64_t total, const std::atomic<std::uint64_t> &counter, ProgressCallback callback,
                    std::chrono::milliseconds interval = kProgressInterval);
    ~ProgressTracker();

    ProgressTracker(const ProgressTracker &) = delete;
    ProgressTracker &operator=(const ProgressTracker &) = delete;

    void start();
    void stop();

private:
    void run();
    void emit(bool final);

    using clock = std::chrono::steady_clock;

    std::uint64_t total;
    const std::atomic<std::uint64_t> &counter;
    ProgressCallback callback;
    std::chrono::milliseconds interval;
    clock::time_point started;

    std::mutex mutex;
    std::condition_variable cv;
    bool stopping = false;
    bool finished = false;
    std::thread worker;
};

} // namespace fastxfer
