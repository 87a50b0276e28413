#include "buffered_pipeline.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace fastxfer {

BufferedPipeline::BufferedPipeline(ByteReader &source, ByteWriter &sink, std::uint64_t declared_size,
                                   std::atomic<std::uint64_t> &progress, std::size_t chunk_size,
                                   std::size_t queue_depth)
    : source(source), sink(sink), declared_size(declared_size), progress(progress), chunk_size(chunk_size),
      queue_depth(queue_depth) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be > 0");
    }
}

void BufferedPipeline::run() {
    BoundedQueue<Chunk> queue(this->queue_depth);
    FirstError first_error;

    std::thread reader([&] { this->readLoop(queue, first_error); });
    this->writeLoop(queue, first_error);
    reader.join();

    if (auto error = first_error.get()) {
        std::rethrow_exception(error);
    }
}

std::uint64_t BufferedPipeline::bytesWritten() const {
    return this->written;
}

void BufferedPipeline::readLoop(BoundedQueue<Chunk> &queue, FirstError &first_error) {
    // reused across iterations, so every chunk handed over is a copy
    Chunk buffer(this->chunk_size);
    std::uint64_t received = 0;
    try {
        while (received < this->declared_size) {
            auto want = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), this->declared_size - received));
            std::size_t n = this->source.read(buffer.data(), want);
            if (n == 0) {
                break;
            }
            received += n;
            if (!queue.push(Chunk(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(n)))) {
                break; // writer gave up
            }
        }
    } catch (...) {
        first_error.offer(std::current_exception());
    }
    queue.close();
}

void BufferedPipeline::writeLoop(BoundedQueue<Chunk> &queue, FirstError &first_error) {
    while (auto chunk = queue.pop()) {
        try {
            this->sink.write(chunk->data(), chunk->size());
        } catch (...) {
            first_error.offer(std::current_exception());
            queue.close();
            this->source.interrupt();
            return;
        }
        this->written += chunk->size();
        this->progress.fetch_add(chunk->size(), std::memory_order_relaxed);
    }
}

} // namespace fastxfer
