#include <gtest/gtest.h>
#include "xlstext/reader/XlsDocument.hpp"
#include "xlstext/core/SheetConverter.hpp"
#include "xlstext/core/OutputSinks.hpp"
#include "xlstext/core/FileSignature.hpp"
#include "XlsFixture.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <sstream>
#include <vector>

using namespace xlstext;
using namespace xlstext::core;

using xlstext::test::XlsFixtureBuilder;
using xlstext::test::numberCell;
using xlstext::test::textCell;

TEST(XlsDocumentTest, EmptySourceIsRejected) {
    reader::XlsDocumentOpener opener;
    std::istringstream source("");

    auto document = opener.open(source, "UTF-8");
    ASSERT_TRUE(document.hasError());
    EXPECT_EQ(document.error().code, ErrorCode::InvalidWorkbook);
}

TEST(XlsDocumentTest, NonOleSourceIsRejected) {
    reader::XlsDocumentOpener opener;
    std::istringstream source("this is definitely not a spreadsheet");

    auto document = opener.open(source, "UTF-8");
    ASSERT_TRUE(document.hasError());
    EXPECT_EQ(document.error().code, ErrorCode::InvalidWorkbook);
}

TEST(XlsDocumentTest, TruncatedOleHeaderIsRejected) {
    reader::XlsDocumentOpener opener;
    std::istringstream source(std::string("\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1", 8) + "truncated");

    auto document = opener.open(source, "UTF-8");
    ASSERT_TRUE(document.hasError());
    EXPECT_EQ(document.error().code, ErrorCode::InvalidWorkbook);
}

TEST(XlsDocumentTest, ConverterTreatsGarbageAsEmpty) {
    SheetConverter converter;

    std::istringstream text_source("garbage");
    StringSink sink;
    auto text = converter.extractText(text_source, sink, 1000);
    EXPECT_FALSE(text.error);
    EXPECT_EQ(text.written, 0);
    EXPECT_TRUE(sink.str().empty());

    std::istringstream csv_source("garbage");
    auto csv = converter.extractCSV(csv_source, 0);
    ASSERT_TRUE(csv.hasValue());
    EXPECT_TRUE(csv.value().empty());

    std::istringstream cells_source("garbage");
    auto cells = converter.extractCells(cells_source);
    ASSERT_TRUE(cells.hasValue());
    EXPECT_TRUE(cells.value().empty());
}

// 两个工作表：Sheet1每行都有ROW记录；Column没有ROW记录，只有一列
class XlsFixtureTest : public ::testing::Test {
protected:
    void SetUp() override {
        bytes_ = XlsFixtureBuilder()
                     .addSheet({"Sheet1", true,
                                {textCell(0, 0, "A"), textCell(0, 1, "B"),
                                 textCell(1, 0, "C"), numberCell(1, 1, 42.5)}})
                     .addSheet({"Column", false,
                                {textCell(0, 0, "x"), numberCell(1, 0, 3.25),
                                 textCell(2, 0, "last")}})
                     .build();
    }

    // 数值单元格的文字由libxls格式化，只校验它表示的值
    static void expectNumber(const std::string& text, double expected) {
        ASSERT_FALSE(text.empty());
        EXPECT_DOUBLE_EQ(std::stod(text), expected);
    }

    static std::vector<std::string> nonEmpty(const std::vector<std::string>& cells) {
        std::vector<std::string> out;
        std::copy_if(cells.begin(), cells.end(), std::back_inserter(out),
                     [](const std::string& c) { return !c.empty(); });
        return out;
    }

    std::string bytes_;
};

TEST_F(XlsFixtureTest, OpenerExposesSheetsAndRows) {
    reader::XlsDocumentOpener opener;
    std::istringstream source(bytes_);

    auto opened = opener.open(source, "UTF-8");
    ASSERT_TRUE(opened.hasValue()) << opened.error().fullMessage();
    const auto& document = opened.value();
    ASSERT_EQ(document->sheetCount(), 2u);

    auto first = document->sheet(0);
    ASSERT_TRUE(first);
    EXPECT_EQ(first->name(), "Sheet1");
    EXPECT_EQ(first->maxRow(), 1u);

    auto header = first->row(0);
    ASSERT_TRUE(header);
    EXPECT_EQ(header->firstColumn(), 0u);
    EXPECT_GE(header->lastColumn(), 2u);
    EXPECT_EQ(header->cellText(0), "A");
    EXPECT_EQ(header->cellText(1), "B");

    auto second = document->sheet(1);
    ASSERT_TRUE(second);
    EXPECT_EQ(second->name(), "Column");
    EXPECT_EQ(second->maxRow(), 2u);

    // 没有ROW记录的单列行也必须存在并包含第0列
    for (uint32_t r = 0; r <= 2; ++r) {
        auto row = second->row(r);
        ASSERT_TRUE(row) << "row " << r;
        EXPECT_EQ(row->firstColumn(), 0u);
        EXPECT_EQ(row->lastColumn(), 1u);
    }
    EXPECT_EQ(second->row(0)->cellText(0), "x");
    expectNumber(second->row(1)->cellText(0), 3.25);
    EXPECT_EQ(second->row(2)->cellText(0), "last");

    EXPECT_FALSE(second->row(3));
    EXPECT_FALSE(document->sheet(2));
}

TEST_F(XlsFixtureTest, ExtractCellsVisitsBothSheets) {
    SheetConverter converter;
    std::istringstream source(bytes_);

    auto cells = converter.extractCells(source);
    ASSERT_TRUE(cells.hasValue());
    const auto values = nonEmpty(cells.value());
    ASSERT_EQ(values.size(), 7u);
    EXPECT_EQ(values[0], "A");
    EXPECT_EQ(values[1], "B");
    EXPECT_EQ(values[2], "C");
    expectNumber(values[3], 42.5);
    EXPECT_EQ(values[4], "x");
    expectNumber(values[5], 3.25);
    EXPECT_EQ(values[6], "last");
}

TEST_F(XlsFixtureTest, ExtractTextWritesEverySheet) {
    SheetConverter converter;

    std::istringstream cells_source(bytes_);
    auto cells = converter.extractCells(cells_source);
    ASSERT_TRUE(cells.hasValue());
    const auto values = nonEmpty(cells.value());
    ASSERT_EQ(values.size(), 7u);

    std::istringstream source(bytes_);
    StringSink sink;
    auto result = converter.extractText(source, sink, 1 << 20);
    EXPECT_FALSE(result.error);
    EXPECT_EQ(sink.str(),
              "Sheet \"Sheet1\" (1 rows):\nA, B\nC, " + values[3] + "\n"
              "\nSheet \"Column\" (2 rows):\nx\n" + values[5] + "\nlast\n");
    EXPECT_EQ(result.written, static_cast<int64_t>(sink.str().size()));
}

TEST_F(XlsFixtureTest, ExtractCSVOfSheetWithoutRowRecords) {
    SheetConverter converter;

    std::istringstream number_source(bytes_);
    auto cells = converter.extractCells(number_source);
    ASSERT_TRUE(cells.hasValue());
    const auto values = nonEmpty(cells.value());
    ASSERT_EQ(values.size(), 7u);

    // CSV不含最后一行
    std::istringstream source(bytes_);
    auto csv = converter.extractCSV(source, 1);
    ASSERT_TRUE(csv.hasValue());
    EXPECT_EQ(csv.value(), "\"x\"\n\"" + values[5] + "\"");

    std::istringstream first_source(bytes_);
    auto first = converter.extractCSV(first_source, 0);
    ASSERT_TRUE(first.hasValue());
    EXPECT_EQ(first.value().rfind("\"A\",\"B\"", 0), 0u);
    EXPECT_EQ(first.value().find('\n'), std::string::npos);
}

TEST_F(XlsFixtureTest, FileHelpersReadWorkbookFromDisk) {
    const std::string path = ::testing::TempDir() + "xlstext_fixture.xls";
    {
        std::ofstream out(path, std::ios::binary);
        out.write(bytes_.data(), static_cast<std::streamsize>(bytes_.size()));
    }

    auto sniff = isFileXLSPath(path);
    ASSERT_TRUE(sniff.hasValue());
    EXPECT_TRUE(sniff.value());

    SheetConverter converter;
    auto cells = converter.extractCellsFromFile(path);
    ASSERT_TRUE(cells.hasValue());
    EXPECT_EQ(nonEmpty(cells.value()).size(), 7u);

    auto csv = converter.extractCSVFromFile(path, 1);
    ASSERT_TRUE(csv.hasValue());
    EXPECT_EQ(csv.value().rfind("\"x\"\n\"", 0), 0u);

    std::remove(path.c_str());
}
