/// @file csv_loader_test.cpp
/// @brief Tests for the CSV adapter

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

#include "common/error.h"
#include "data/csv_loader.h"

namespace driftwatch::data {
namespace {

absl::StatusOr<Window> Parse(const std::string& text) {
    std::istringstream input(text);
    return ParseCsv(input);
}

TEST(CsvFieldTest, ClassifiesFields) {
    CsvOptions options;

    EXPECT_TRUE(IsNull(ParseCsvField("", false, options)));
    EXPECT_TRUE(IsNull(ParseCsvField("NA", false, options)));
    EXPECT_TRUE(IsNull(ParseCsvField("NaN", false, options)));
    EXPECT_TRUE(IsNull(ParseCsvField("null", false, options)));
    EXPECT_TRUE(IsNull(ParseCsvField("None", false, options)));

    auto number = ParseCsvField("149.5", false, options);
    ASSERT_TRUE(std::holds_alternative<double>(number));
    EXPECT_DOUBLE_EQ(std::get<double>(number), 149.5);

    auto exponent = ParseCsvField("1e3", false, options);
    ASSERT_TRUE(std::holds_alternative<double>(exponent));
    EXPECT_DOUBLE_EQ(std::get<double>(exponent), 1000.0);

    auto text = ParseCsvField("Manhattan", false, options);
    ASSERT_TRUE(std::holds_alternative<std::string>(text));
    EXPECT_EQ(std::get<std::string>(text), "Manhattan");
}

TEST(CsvFieldTest, QuotedNullTokenIsText) {
    auto value = ParseCsvField("NA", true, CsvOptions{});
    ASSERT_TRUE(std::holds_alternative<std::string>(value));
    EXPECT_EQ(std::get<std::string>(value), "NA");
}

TEST(CsvFieldTest, InfinityIsText) {
    auto value = ParseCsvField("inf", false, CsvOptions{});
    EXPECT_TRUE(std::holds_alternative<std::string>(value));
}

TEST(CsvRecordTest, QuotedFields) {
    std::istringstream input("\"Doe, Jane\",\"say \"\"hi\"\"\",  plain  \n");
    std::vector<bool> quoted;

    auto fields = ReadCsvRecord(input, CsvOptions{}, &quoted);
    ASSERT_TRUE(fields.ok());
    ASSERT_EQ(fields->size(), 3u);
    EXPECT_EQ((*fields)[0], "Doe, Jane");
    EXPECT_EQ((*fields)[1], "say \"hi\"");
    EXPECT_EQ((*fields)[2], "plain");
    EXPECT_EQ(quoted, (std::vector<bool>{true, true, false}));
}

TEST(CsvRecordTest, EmbeddedNewline) {
    std::istringstream input("\"line one\nline two\",x\r\nnext,y\n");

    auto first = ReadCsvRecord(input, CsvOptions{});
    ASSERT_TRUE(first.ok());
    ASSERT_EQ(first->size(), 2u);
    EXPECT_EQ((*first)[0], "line one\nline two");

    auto second = ReadCsvRecord(input, CsvOptions{});
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(*second, (std::vector<std::string>{"next", "y"}));

    auto end = ReadCsvRecord(input, CsvOptions{});
    ASSERT_TRUE(end.ok());
    EXPECT_TRUE(end->empty());
}

TEST(CsvRecordTest, UnterminatedQuote) {
    std::istringstream input("\"never closed,1\n");
    auto fields = ReadCsvRecord(input, CsvOptions{});
    EXPECT_FALSE(fields.ok());
}

TEST(CsvParseTest, BuildsWindow) {
    auto window = Parse(
        "price,room_type,bedrooms\n"
        "100,Entire home,2\n"
        "85.5,Private room,NA\n"
        ",Shared room,1\n");
    ASSERT_TRUE(window.ok()) << window.status();

    EXPECT_EQ(window->Columns(), (std::vector<std::string>{"price", "room_type", "bedrooms"}));
    EXPECT_EQ(window->NumRecords(), 3u);

    auto price = window->NumericValues("price");
    ASSERT_TRUE(price.ok());
    EXPECT_EQ(price->values, (std::vector<double>{100.0, 85.5}));
    EXPECT_EQ(price->null_count, 1u);

    auto bedrooms = window->Categories("bedrooms");
    ASSERT_TRUE(bedrooms.ok());
    EXPECT_EQ((*bedrooms)[0], "2");
    EXPECT_EQ((*bedrooms)[1], std::nullopt);
}

TEST(CsvParseTest, SkipsBomAndBlankLines) {
    auto window = Parse("\xEF\xBB\xBFx,y\n1,2\n\n3,4\n");
    ASSERT_TRUE(window.ok()) << window.status();
    EXPECT_EQ(window->Columns()[0], "x");
    EXPECT_EQ(window->NumRecords(), 2u);
}

TEST(CsvParseTest, LastRecordWithoutNewline) {
    auto window = Parse("x,y\n1,2");
    ASSERT_TRUE(window.ok());
    EXPECT_EQ(window->NumRecords(), 1u);
}

TEST(CsvParseTest, EmptyInputHasNoHeader) {
    auto window = Parse("");
    ASSERT_FALSE(window.ok());
    EXPECT_TRUE(IsSchemaMismatch(window.status()));
}

TEST(CsvParseTest, RaggedRowIsSchemaMismatch) {
    auto window = Parse("x,y\n1,2\n3\n");
    ASSERT_FALSE(window.ok());
    EXPECT_TRUE(IsSchemaMismatch(window.status()));
}

TEST(CsvParseTest, DuplicateHeaderIsSchemaMismatch) {
    auto window = Parse("x,x\n1,2\n");
    ASSERT_FALSE(window.ok());
    EXPECT_TRUE(IsSchemaMismatch(window.status()));
}

TEST(CsvParseTest, CustomDelimiter) {
    CsvOptions options;
    options.delimiter = ';';
    std::istringstream input("a;b\n1,5;x\n");

    auto window = ParseCsv(input, options);
    ASSERT_TRUE(window.ok());
    auto a = window->Categories("a");
    ASSERT_TRUE(a.ok());
    EXPECT_EQ((*a)[0], "1,5");
}

TEST(CsvParseTest, TextColumnsKeepTheirSpelling) {
    CsvOptions options;
    options.text_columns = {"zip", "absent"};
    std::istringstream input("zip,price\n007,1.0\n7,2\n1.0,3\nNA,4\n");

    auto window = ParseCsv(input, options);
    ASSERT_TRUE(window.ok()) << window.status();

    auto zip = window->Categories("zip");
    ASSERT_TRUE(zip.ok());
    ASSERT_EQ(zip->size(), 4u);
    EXPECT_EQ((*zip)[0], "007");
    EXPECT_EQ((*zip)[1], "7");
    EXPECT_EQ((*zip)[2], "1.0");
    EXPECT_FALSE((*zip)[3].has_value());

    auto price = window->NumericValues("price");
    ASSERT_TRUE(price.ok());
    EXPECT_EQ(price->values, (std::vector<double>{1.0, 2.0, 3.0, 4.0}));
}

TEST(CsvParseTest, NumericLookingCodesMergeWithoutTextColumns) {
    auto window = Parse("zip\n007\n7\n");
    ASSERT_TRUE(window.ok());

    auto zip = window->Categories("zip");
    ASSERT_TRUE(zip.ok());
    EXPECT_EQ((*zip)[0], (*zip)[1]);
}

TEST(CsvFileTest, MissingFileIsNotFound) {
    auto window = LoadCsvFile("/nonexistent/baseline.csv");
    ASSERT_FALSE(window.ok());
    EXPECT_EQ(window.status().code(), absl::StatusCode::kNotFound);
}

TEST(CsvFileTest, ErrorsKeepTheirCodeAndNameTheFile) {
    const auto path = std::filesystem::temp_directory_path() / "driftwatch_ragged.csv";
    {
        std::ofstream out(path);
        out << "x,y\n1\n";
    }

    auto window = LoadCsvFile(path);
    std::filesystem::remove(path);

    ASSERT_FALSE(window.ok());
    EXPECT_TRUE(IsSchemaMismatch(window.status()));
    EXPECT_NE(window.status().message().find("driftwatch_ragged.csv"), std::string_view::npos);
}

TEST(CsvFileTest, LoadsFile) {
    const auto path = std::filesystem::temp_directory_path() / "driftwatch_ok.csv";
    {
        std::ofstream out(path);
        out << "price\n1\n2\n3\n";
    }

    auto window = LoadCsvFile(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(window.ok()) << window.status();
    EXPECT_EQ(window->NumRecords(), 3u);
}

}  // namespace
}  // namespace driftwatch::data
