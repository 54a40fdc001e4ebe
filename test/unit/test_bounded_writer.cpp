#include <gtest/gtest.h>
#include "xlstext/core/BoundedWriter.hpp"
#include "xlstext/core/OutputSinks.hpp"

using namespace xlstext::core;

namespace {

class RecordingSink : public IOutputSink {
public:
    Error write(const char* data, size_t size, size_t& written) override {
        chunks.emplace_back(data, size);
        written = size;
        return success();
    }
    std::string getTypeName() const override { return "RecordingSink"; }

    std::vector<std::string> chunks;
};

class BrokenSink : public IOutputSink {
public:
    Error write(const char*, size_t size, size_t& written) override {
        written = size / 2;
        return makeError(ErrorCode::FileWriteError, "broken pipe");
    }
    std::string getTypeName() const override { return "BrokenSink"; }
};

} // namespace

TEST(BoundedWriterTest, WritesWithinBudget) {
    StringSink sink;
    BoundedWriter writer(sink, 10);

    EXPECT_FALSE(writer.write("abc"));
    EXPECT_FALSE(writer.exhausted());
    EXPECT_EQ(writer.written(), 3);
    EXPECT_EQ(writer.remaining(), 7);
    EXPECT_EQ(sink.str(), "abc");
}

TEST(BoundedWriterTest, TruncatesChunkToRemainder) {
    StringSink sink;
    BoundedWriter writer(sink, 5);

    EXPECT_FALSE(writer.write("abc"));
    EXPECT_FALSE(writer.write("defgh"));
    EXPECT_TRUE(writer.exhausted());
    EXPECT_EQ(writer.remaining(), 0);
    EXPECT_EQ(writer.written(), 5);
    EXPECT_EQ(sink.str(), "abcde");
}

TEST(BoundedWriterTest, ExactFitExhaustsBudget) {
    StringSink sink;
    BoundedWriter writer(sink, 4);

    EXPECT_FALSE(writer.write("abcd"));
    EXPECT_TRUE(writer.exhausted());
    EXPECT_EQ(sink.str(), "abcd");
}

TEST(BoundedWriterTest, NonPositiveBudgetStillReachesSink) {
    RecordingSink sink;
    BoundedWriter writer(sink, -3);

    EXPECT_FALSE(writer.write("abc"));
    EXPECT_TRUE(writer.exhausted());
    EXPECT_EQ(writer.written(), 0);
    ASSERT_EQ(sink.chunks.size(), 1u);
    EXPECT_TRUE(sink.chunks[0].empty());
}

TEST(BoundedWriterTest, SinkErrorIsReturned) {
    BrokenSink sink;
    BoundedWriter writer(sink, 100);

    Error err = writer.write("abcdef");
    ASSERT_TRUE(err);
    EXPECT_EQ(err.code, ErrorCode::FileWriteError);
    EXPECT_EQ(writer.written(), 3);
    EXPECT_TRUE(writer.exhausted());
}
