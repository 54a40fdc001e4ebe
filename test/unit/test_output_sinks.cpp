#include <gtest/gtest.h>
#include "xlstext/core/OutputSinks.hpp"

#include <cstdio>
#include <fstream>
#include <iterator>
#include <sstream>

using namespace xlstext::core;

TEST(OutputSinksTest, StringSinkAppends) {
    StringSink sink;
    size_t written = 0;

    EXPECT_FALSE(sink.write("hello ", 6, written));
    EXPECT_EQ(written, 6u);
    EXPECT_FALSE(sink.write("world", 5, written));
    EXPECT_EQ(sink.str(), "hello world");
    EXPECT_EQ(sink.release(), "hello world");
}

TEST(OutputSinksTest, StreamSinkWritesToStream) {
    std::ostringstream out;
    StreamSink sink(out);
    size_t written = 0;

    EXPECT_FALSE(sink.write("abc", 3, written));
    EXPECT_EQ(written, 3u);
    EXPECT_EQ(out.str(), "abc");
}

TEST(OutputSinksTest, StreamSinkReportsFailedStream) {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    StreamSink sink(out);
    size_t written = 42;

    Error err = sink.write("abc", 3, written);
    ASSERT_TRUE(err);
    EXPECT_EQ(err.code, ErrorCode::FileWriteError);
    EXPECT_EQ(written, 0u);
}

TEST(OutputSinksTest, FileSinkWritesFile) {
    const std::string path = ::testing::TempDir() + "xlstext_file_sink.txt";
    {
        auto sink = FileSink::create(path);
        ASSERT_TRUE(sink.hasValue()) << sink.error().fullMessage();
        size_t written = 0;
        EXPECT_FALSE(sink.value().write("line 1\n", 7, written));
        EXPECT_EQ(written, 7u);
        EXPECT_TRUE(sink.value().flush());
    }

    std::ifstream in(path, std::ios::binary);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "line 1\n");
    std::remove(path.c_str());
}

TEST(OutputSinksTest, FileSinkCreateFailsForBadDirectory) {
    auto sink = FileSink::create(::testing::TempDir() + "xlstext_missing_dir/out.txt");
    ASSERT_TRUE(sink.hasError());
    EXPECT_EQ(sink.error().code, ErrorCode::FileWriteError);
}
