#include "fastxfer/progress.hpp"
#include "fastxfer/helpers.hpp"

#include <algorithm>
#include <cstdio>

namespace fastxfer {

ProgressSnapshot compute_progress(std::uint64_t total, std::uint64_t transferred, double elapsed_seconds, bool final) {
    ProgressSnapshot snapshot;
    snapshot.transferred = transferred;
    snapshot.total = total;
    snapshot.final = final;
    snapshot.elapsed_seconds = std::max(elapsed_seconds, kMinElapsedSeconds);
    snapshot.megabytes_per_second = static_cast<double>(transferred) / snapshot.elapsed_seconds / 1024.0 / 1024.0;
    if (total == 0) {
        snapshot.percent = 100.0;
    } else {
        snapshot.percent = std::min(100.0, static_cast<double>(transferred) * 100.0 / static_cast<double>(total));
    }
    return snapshot;
}

void render_progress(const ProgressSnapshot &snapshot) {
    std::printf("\r\033[Kprogress: %.2f%% (%s/%s bytes), speed: %.2f MB/s%s", snapshot.percent,
                format_with_commas(snapshot.transferred).c_str(), format_with_commas(snapshot.total).c_str(),
                snapshot.megabytes_per_second, snapshot.final ? "\n" : "");
    std::fflush(stdout);
}

ProgressTracker::ProgressTracker(std::uint64_t total, const std::atomic<std::uint64_t> &counter,
                                 ProgressCallback callback, std::chrono::milliseconds interval)
    : total(total), counter(counter), callback(std::move(callback)), interval(interval), started(clock::now()) {}

ProgressTracker::~ProgressTracker() {
    this->stop();
}

void ProgressTracker::start() {
    if (this->worker.joinable()) {
        return;
    }
    this->started = clock::now();
    this->worker = std::thread(&ProgressTracker::run, this);
}

void ProgressTracker::stop() {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->finished) {
            return;
        }
        this->stopping = true;
        this->finished = true;
    }
    this->cv.notify_all();
    if (this->worker.joinable()) {
        this->worker.join();
    }
    this->emit(true);
}

void ProgressTracker::run() {
    std::unique_lock<std::mutex> lock(this->mutex);
    while (!this->stopping) {
        if (this->cv.wait_for(lock, this->interval, [&] { return this->stopping; })) {
            break;
        }
        lock.unlock();
        this->emit(false);
        lock.lock();
    }
}

void ProgressTracker::emit(bool final) {
    if (!this->callback) {
        return;
    }
    double elapsed = std::chrono::duration<double>(clock::now() - this->started).count();
    this->callback(compute_progress(this->total, this->counter.load(std::memory_order_relaxed), elapsed, final));
}

} // namespace fastxfer
