#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace fastxfer {

// Bounded handoff queue between one producer and one consumer thread.
// close() wakes both sides: push() then fails, pop() drains what is left
// and then returns std::nullopt.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity) : capacity(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("queue capacity must be > 0");
        }
    }

    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex);
        not_full.wait(lock, [&] { return closed || items.size() < capacity; });
        if (closed) {
            return false;
        }
        items.push_back(std::move(item));
        lock.unlock();
        not_empty.notify_one();
        return true;
    }

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex);
        not_empty.wait(lock, [&] { return closed || !items.empty(); });
        if (items.empty()) {
            return std::nullopt;
        }
        T item = std::move(items.front());
        items.pop_front();
        lock.unlock();
        not_full.notify_one();
        return item;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            closed = true;
        }
        not_empty.notify_all();
        not_full.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex);
        return closed;
    }

private:
    const std::size_t capacity;
    mutable std::mutex mutex;
    std::condition_variable not_empty;
    std::condition_variable not_full;
    std::deque<T> items;
    bool closed = false;
};

// single slot; the first error offered is kept, later ones are dropped
class FirstError {
public:
    bool offer(std::exception_ptr error) {
        std::lock_guard<std::mutex> lock(mutex);
        if (this->error || !error) {
            return false;
        }
        this->error = std::move(error);
        return true;
    }

    std::exception_ptr get() const {
        std::lock_guard<std::mutex> lock(mutex);
        return error;
    }

private:
    mutable std::mutex mutex;
    std::exception_ptr error;
};

} // namespace fastxfer
