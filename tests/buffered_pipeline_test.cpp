#include "buffered_pipeline.hpp"

#include "fastxfer/errors.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <vector>

using namespace fastxfer;

namespace {

// serves `data` in reads of at most `step` bytes, then fails once `fail_after` bytes went out
class ScriptedReader : public ByteReader {
public:
    ScriptedReader(std::vector<char> data, std::size_t step, std::size_t fail_after = SIZE_MAX)
        : data(std::move(data)), step(step), fail_after(fail_after) {}

    std::size_t read(char *buffer, std::size_t length) override {
        if (this->offset >= this->fail_after) {
            throw TransferError(ErrorKind::Transfer, "scripted read failure");
        }
        std::size_t n = std::min({length, this->step, this->data.size() - this->offset});
        std::memcpy(buffer, this->data.data() + this->offset, n);
        this->offset += n;
        return n;
    }

    void interrupt() override { this->interrupted = true; }

    std::atomic<bool> interrupted{false};

private:
    std::vector<char> data;
    std::size_t step;
    std::size_t fail_after;
    std::size_t offset = 0;
};

class CollectingWriter : public ByteWriter {
public:
    explicit CollectingWriter(std::size_t fail_at_write = SIZE_MAX) : fail_at_write(fail_at_write) {}

    void write(const char *data, std::size_t length) override {
        if (this->writes++ == this->fail_at_write) {
            throw TransferError(ErrorKind::Transfer, "scripted write failure");
        }
        this->bytes.insert(this->bytes.end(), data, data + length);
    }

    std::vector<char> bytes;

private:
    std::size_t fail_at_write;
    std::size_t writes = 0;
};

} // namespace

TEST(BufferedPipelineTest, CopiesEverythingInOrder) {
    auto data = test_support::pattern_bytes(300000);
    ScriptedReader reader(data, 7000);
    CollectingWriter writer;
    std::atomic<std::uint64_t> progress{0};

    BufferedPipeline pipeline(reader, writer, data.size(), progress);
    pipeline.run();

    EXPECT_EQ(writer.bytes, data);
    EXPECT_EQ(pipeline.bytesWritten(), data.size());
    EXPECT_EQ(progress.load(), data.size());
}

TEST(BufferedPipelineTest, StopsAtDeclaredSize) {
    auto data = test_support::pattern_bytes(5000);
    ScriptedReader reader(data, 4096);
    CollectingWriter writer;
    std::atomic<std::uint64_t> progress{0};

    BufferedPipeline pipeline(reader, writer, 3000, progress, 1024, 2);
    pipeline.run();

    EXPECT_EQ(pipeline.bytesWritten(), 3000u);
    EXPECT_TRUE(std::equal(writer.bytes.begin(), writer.bytes.end(), data.begin()));
}

TEST(BufferedPipelineTest, EarlyEndOfStreamIsNotAnError) {
    auto data = test_support::pattern_bytes(40);
    ScriptedReader reader(data, 16);
    CollectingWriter writer;
    std::atomic<std::uint64_t> progress{0};

    BufferedPipeline pipeline(reader, writer, 100, progress);
    EXPECT_NO_THROW(pipeline.run());
    EXPECT_EQ(pipeline.bytesWritten(), 40u);
}

TEST(BufferedPipelineTest, ReadFailureKeepsChunksAlreadyRead) {
    auto data = test_support::pattern_bytes(10 * 1024);
    ScriptedReader reader(data, 1024, 3 * 1024);
    CollectingWriter writer;
    std::atomic<std::uint64_t> progress{0};

    BufferedPipeline pipeline(reader, writer, data.size(), progress, 1024, 8);
    try {
        pipeline.run();
        FAIL() << "expected TransferError";
    } catch (const TransferError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::Transfer);
        EXPECT_STREQ(e.what(), "scripted read failure");
    }
    EXPECT_EQ(pipeline.bytesWritten(), 3u * 1024);
    EXPECT_TRUE(std::equal(writer.bytes.begin(), writer.bytes.end(), data.begin()));
}

TEST(BufferedPipelineTest, WriteFailureStopsReader) {
    auto data = test_support::pattern_bytes(1024 * 1024);
    ScriptedReader reader(data, 1024);
    CollectingWriter writer(2);
    std::atomic<std::uint64_t> progress{0};

    BufferedPipeline pipeline(reader, writer, data.size(), progress, 1024, 2);
    try {
        pipeline.run();
        FAIL() << "expected TransferError";
    } catch (const TransferError &e) {
        EXPECT_STREQ(e.what(), "scripted write failure");
    }
    EXPECT_EQ(pipeline.bytesWritten(), 2u * 1024);
    EXPECT_TRUE(reader.interrupted.load());
}

TEST(BufferedPipelineTest, ZeroSourceIntoDiscardSink) {
    ZeroSource source(1000000);
    DiscardSink sink;
    std::atomic<std::uint64_t> progress{0};

    BufferedPipeline pipeline(source, sink, 1000000, progress);
    pipeline.run();

    EXPECT_EQ(sink.bytesDiscarded(), 1000000u);
    EXPECT_EQ(progress.load(), 1000000u);
}
