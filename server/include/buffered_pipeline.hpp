#pragma once

#include "fastxfer/byte_stream.hpp"
#include "fastxfer/channel.hpp"
#include "fastxfer/protocol.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace fastxfer {

constexpr std::size_t kQueueDepth = 8;

// Reader thread -> bounded queue of owned chunks -> writer (calling thread).
// The first error from either side wins and is rethrown by run() once both
// sides have stopped; chunks read before a reader failure are still written.
class BufferedPipeline {
public:
    BufferedPipeline(ByteReader &source, ByteWriter &sink, std::uint64_t declared_size,
                     std::atomic<std::uint64_t> &progress, std::size_t chunk_size = kChunkSize,
                     std::size_t queue_depth = kQueueDepth);

    void run();

    std::uint64_t bytesWritten() const;

private:
    using Chunk = std::vector<char>;

    void readLoop(BoundedQueue<Chunk> &queue, FirstError &first_error);
    void writeLoop(BoundedQueue<Chunk> &queue, FirstError &first_error);

    ByteReader &source;
    ByteWriter &sink;
    std::uint64_t declared_size;
    std::atomic<std::uint64_t> &progress;
    std::size_t chunk_size;
    std::size_t queue_depth;
    std::uint64_t written = 0;
};

} // namespace fastxfer
