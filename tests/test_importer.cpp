#include <cmath>
#include <gtest/gtest.h>
#include "importer.hpp"
#include "test_support.hpp"

// Reads every row of `path`; stops at the first non-Ok status.
static RowStatus read_all(const std::string& path, ImportFormat format,
    std::vector<ParameterSet>& rows, std::string& err) {
    auto reader = open_row_reader(path, format, err);
    if (!reader) return RowStatus::Malformed;
    ImportRow row;
    RowStatus st;
    while ((st = reader->next(row)) == RowStatus::Ok)
        rows.push_back(coerce_row(row, 50));
    if (st == RowStatus::Malformed) err = reader->error();
    return st;
}

// ==========================
// Format detection
// ==========================

TEST(DetectImportFormat, UsesTheSuffix) {
    ImportFormat f = ImportFormat::Json;
    EXPECT_TRUE(detect_import_format("history.csv", f));
    EXPECT_EQ(f, ImportFormat::Csv);
    EXPECT_TRUE(detect_import_format("/tmp/a.b/history.json", f));
    EXPECT_EQ(f, ImportFormat::Json);
    EXPECT_FALSE(detect_import_format("history.txt", f));
    EXPECT_FALSE(detect_import_format("history.JSON", f));
    EXPECT_FALSE(detect_import_format("history.csv.bak", f));
}

// ==========================
// CSV primitives
// ==========================

TEST(SplitCsvLine, HandlesQuotesAndEmptyFields) {
    std::vector<std::string> f;
    ASSERT_TRUE(split_csv_line("a,\"b,c\",,\"say \"\"hi\"\"\"", f));
    ASSERT_EQ(f.size(), 4u);
    EXPECT_EQ(f[0], "a");
    EXPECT_EQ(f[1], "b,c");
    EXPECT_EQ(f[2], "");
    EXPECT_EQ(f[3], "say \"hi\"");

    ASSERT_TRUE(split_csv_line("", f));
    EXPECT_EQ(f.size(), 1u);

    EXPECT_FALSE(split_csv_line("a,\"open", f));
}

TEST(ParseNumber, AcceptsNumbersAndInfinities) {
    EXPECT_EQ(parse_number("42"), 42.0);
    EXPECT_EQ(parse_number(" 7.5 "), 7.5);
    EXPECT_EQ(parse_number("-3"), -3.0);
    EXPECT_EQ(parse_number("1e2"), 100.0);
    EXPECT_FALSE(parse_number("").has_value());
    EXPECT_FALSE(parse_number("   ").has_value());
    EXPECT_FALSE(parse_number("abc").has_value());
    EXPECT_FALSE(parse_number("12abc").has_value());
    EXPECT_FALSE(parse_number("nan").has_value());

    auto huge = parse_number("1e400");
    ASSERT_TRUE(huge.has_value());
    EXPECT_TRUE(std::isinf(*huge));
    EXPECT_GT(*huge, 0.0);
    auto neg = parse_number("-inf");
    ASSERT_TRUE(neg.has_value());
    EXPECT_TRUE(std::isinf(*neg));
    EXPECT_LT(*neg, 0.0);
}

// ==========================
// CSV reader
// ==========================

TEST(CsvRowReaderTest, ReadsRowsInFileOrder) {
    TempDir dir;
    std::string path = dir.write("rows.csv",
        "preparedness,teaching,materials,participation,difficulty\n"
        "10,20,30,40,50\n"
        "60,70,80,90,100\n");

    std::vector<ParameterSet> rows;
    std::string err;
    ASSERT_EQ(read_all(path, ImportFormat::Csv, rows, err), RowStatus::End) << err;
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].values, (std::array<int, PARAM_COUNT>{ 10, 20, 30, 40, 50 }));
    EXPECT_EQ(rows[1].values, (std::array<int, PARAM_COUNT>{ 60, 70, 80, 90, 100 }));
}

TEST(CsvRowReaderTest, MatchesColumnsByNameAndDefaultsMissingOnes) {
    TempDir dir;
    std::string path = dir.write("rows.csv",
        "student,difficulty,teaching,notes\r\n"
        "S001,20,90,good\r\n"
        "\r\n"
        "S002,,abc,\"late, twice\"\r\n");

    std::vector<ParameterSet> rows;
    std::string err;
    ASSERT_EQ(read_all(path, ImportFormat::Csv, rows, err), RowStatus::End) << err;
    ASSERT_EQ(rows.size(), 2u);

    EXPECT_EQ(rows[0].get(Param::Difficulty), 20);
    EXPECT_EQ(rows[0].get(Param::Teaching), 90);
    EXPECT_EQ(rows[0].get(Param::Preparedness), 50);   // column missing
    EXPECT_EQ(rows[0].get(Param::Materials), 50);

    EXPECT_EQ(rows[1].get(Param::Difficulty), 50);     // empty cell
    EXPECT_EQ(rows[1].get(Param::Teaching), 50);       // non-numeric
}

TEST(CsvRowReaderTest, ClampsAndRoundsValues) {
    TempDir dir;
    std::string path = dir.write("rows.csv",
        "preparedness,teaching\n"
        "150,-20\n"
        "72.5,33.2\n");

    std::vector<ParameterSet> rows;
    std::string err;
    ASSERT_EQ(read_all(path, ImportFormat::Csv, rows, err), RowStatus::End) << err;
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].get(Param::Preparedness), 100);
    EXPECT_EQ(rows[0].get(Param::Teaching), 0);
    EXPECT_EQ(rows[1].get(Param::Preparedness), 73);
    EXPECT_EQ(rows[1].get(Param::Teaching), 33);
}

TEST(CsvRowReaderTest, OverflowingCellsClampInsteadOfDefaulting) {
    TempDir dir;
    std::string path = dir.write("rows.csv",
        "preparedness,teaching,materials\n"
        "1e400,-1e400,nan\n");

    std::vector<ParameterSet> rows;
    std::string err;
    ASSERT_EQ(read_all(path, ImportFormat::Csv, rows, err), RowStatus::End) << err;
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].get(Param::Preparedness), 100);
    EXPECT_EQ(rows[0].get(Param::Teaching), 0);
    EXPECT_EQ(rows[0].get(Param::Materials), 50);
}

TEST(CsvRowReaderTest, ShortRowsAreFilledWithDefaults) {
    TempDir dir;
    std::string path = dir.write("rows.csv",
        "preparedness,teaching,materials\n"
        "80\n");

    std::vector<ParameterSet> rows;
    std::string err;
    ASSERT_EQ(read_all(path, ImportFormat::Csv, rows, err), RowStatus::End) << err;
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].get(Param::Preparedness), 80);
    EXPECT_EQ(rows[0].get(Param::Teaching), 50);
}

TEST(CsvRowReaderTest, HeaderOnlyFileHasNoRows) {
    TempDir dir;
    std::string path = dir.write("rows.csv", "preparedness,teaching\n");

    std::vector<ParameterSet> rows;
    std::string err;
    EXPECT_EQ(read_all(path, ImportFormat::Csv, rows, err), RowStatus::End);
    EXPECT_TRUE(rows.empty());
}

TEST(CsvRowReaderTest, EmptyFileIsRejected) {
    TempDir dir;
    std::string path = dir.write("rows.csv", "\n\n");

    std::string err;
    EXPECT_EQ(open_row_reader(path, ImportFormat::Csv, err), nullptr);
    EXPECT_NE(err.find("no columns"), std::string::npos);
}

TEST(CsvRowReaderTest, TooManyFieldsFailsBeforeAnyRow) {
    TempDir dir;
    std::string path = dir.write("rows.csv",
        "preparedness,teaching\n"
        "10,20\n"
        "30,40,50\n"
        "60,70\n");

    std::string err;
    EXPECT_EQ(open_row_reader(path, ImportFormat::Csv, err), nullptr);
    EXPECT_EQ(err, "line 3: expected 2 fields, saw 3");
}

TEST(CsvRowReaderTest, UnterminatedQuoteOnLastLineFailsAtOpen) {
    TempDir dir;
    std::string path = dir.write("rows.csv",
        "preparedness,teaching\n"
        "10,20\n"
        "30,\"40\n");

    std::string err;
    EXPECT_EQ(open_row_reader(path, ImportFormat::Csv, err), nullptr);
    EXPECT_EQ(err, "line 3: unterminated quoted field");
}

TEST(CsvRowReaderTest, UnopenedReaderReportsMalformed) {
    CsvRowReader reader;
    ImportRow row;
    EXPECT_EQ(reader.next(row), RowStatus::Malformed);
    EXPECT_FALSE(reader.error().empty());
}

TEST(CsvRowReaderTest, MissingFileIsReported) {
    TempDir dir;
    std::string path = dir.file("absent.csv");
    std::string err;
    EXPECT_EQ(open_row_reader(path, ImportFormat::Csv, err), nullptr);
    EXPECT_NE(err.find(path), std::string::npos);
}

// ==========================
// JSON reader
// ==========================

TEST(JsonRowReaderTest, DefaultsArePerEntry) {
    TempDir dir;
    std::string path = dir.write("rows.json", R"([
        {"preparedness": 90, "teaching": 80},
        {"materials": 10},
        {}
    ])");

    std::vector<ParameterSet> rows;
    std::string err;
    ASSERT_EQ(read_all(path, ImportFormat::Json, rows, err), RowStatus::End) << err;
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].values, (std::array<int, PARAM_COUNT>{ 90, 80, 50, 50, 50 }));
    EXPECT_EQ(rows[1].values, (std::array<int, PARAM_COUNT>{ 50, 50, 10, 50, 50 }));
    EXPECT_EQ(rows[2], ParameterSet::filled(50));
}

TEST(JsonRowReaderTest, NonNumericValuesDefault) {
    TempDir dir;
    std::string path = dir.write("rows.json",
        R"([{"preparedness": "80", "teaching": true, "materials": null, "participation": 12.6, "difficulty": 400}])");

    std::vector<ParameterSet> rows;
    std::string err;
    ASSERT_EQ(read_all(path, ImportFormat::Json, rows, err), RowStatus::End) << err;
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].values, (std::array<int, PARAM_COUNT>{ 50, 50, 50, 13, 100 }));
}

TEST(JsonRowReaderTest, RejectsNonArrayDocuments) {
    TempDir dir;
    std::string path = dir.write("rows.json", R"({"preparedness": 10})");
    std::string err;
    EXPECT_EQ(open_row_reader(path, ImportFormat::Json, err), nullptr);
    EXPECT_NE(err.find("array"), std::string::npos);
}

TEST(JsonRowReaderTest, ReportsParseErrors) {
    TempDir dir;
    std::string path = dir.write("rows.json", "[{\"preparedness\": 10,");
    std::string err;
    EXPECT_EQ(open_row_reader(path, ImportFormat::Json, err), nullptr);
    EXPECT_NE(err.find("malformed JSON"), std::string::npos);
}

TEST(JsonRowReaderTest, NonObjectEntryFailsAtOpen) {
    TempDir dir;
    std::string path = dir.write("rows.json", R"([{"teaching": 70}, 42, {"teaching": 10}])");

    std::string err;
    EXPECT_EQ(open_row_reader(path, ImportFormat::Json, err), nullptr);
    EXPECT_EQ(err, "entry 2 is not an object");
}

TEST(JsonRowReaderTest, NumberOverflowIsMalformed) {
    TempDir dir;
    std::string path = dir.write("rows.json", R"([{"preparedness": 1e400}])");

    std::string err;
    EXPECT_EQ(open_row_reader(path, ImportFormat::Json, err), nullptr);
    EXPECT_NE(err.find("malformed JSON"), std::string::npos);
}
