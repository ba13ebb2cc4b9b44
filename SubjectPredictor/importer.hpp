#pragma once
#include <array>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 importer.hpp — Bulk import readers (CSV / JSON)
-------------------------------------------------------------------------------
The model replays the scoring function over every row of an import file. To
keep that replay independent of the file format, each format is read through
the same RowReader interface:

    auto reader = open_row_reader(path, format, err);
    ImportRow row;
    while (reader->next(row) == RowStatus::Ok) { ... }

An ImportRow holds the raw numeric value of each parameter, or nullopt when
the field is absent / not a number. Turning that into a ParameterSet
(defaults, clamping) is coerce_row's job, not the reader's.

Formats
  - CSV : header line + one row per data point. Columns are matched to
          parameter names exactly. Double-quoted fields are supported.
  - JSON: an array of objects, any subset of parameter names per object.

Errors
  - Both readers check the whole file in open(), so structural errors (no
    CSV header, a row wider than the header, an unterminated quote, JSON
    parse error, a top level that is not an array, an entry that is not an
    object) are reported before the first row is handed out.
  - open_row_reader returns nullptr and fills `err` in those cases.
  - next() only returns RowStatus::Malformed for a reader used without a
    successful open(); error() then describes it.
-------------------------------------------------------------------------------
*/

// Raw per-parameter values of one imported row.
struct ImportRow {
    std::array<std::optional<double>, PARAM_COUNT> fields;
};

enum class RowStatus { Ok, End, Malformed };

// Uniform row iteration over an import source.
class RowReader {
public:
    virtual ~RowReader() = default;

    // Read the next row into `row`.
    virtual RowStatus next(ImportRow& row) = 0;

    // Description of the last Malformed result.
    const std::string& error() const { return error_; }

protected:
    std::string error_;
};

class CsvRowReader : public RowReader {
public:
    // Reads the header and every data line, checking field counts and quotes.
    bool open(const std::string& path, std::string& err);
    RowStatus next(ImportRow& row) override;

private:
    bool opened_ = false;
    std::array<int, PARAM_COUNT> column_{ -1, -1, -1, -1, -1 };  // -1 = column absent
    std::vector<std::vector<std::string>> rows_;
    std::size_t index_ = 0;
};

class JsonRowReader : public RowReader {
public:
    // Parses the whole document and checks that every entry is an object.
    bool open(const std::string& path, std::string& err);
    RowStatus next(ImportRow& row) override;

private:
    bool opened_ = false;
    nlohmann::json doc_;
    std::size_t index_ = 0;
};

/// Resolve the format from the file suffix (".csv" / ".json", case-sensitive).
bool detect_import_format(const std::string& path, ImportFormat& out);

/// Open a reader for `path`. Returns nullptr and sets `err` on failure.
std::unique_ptr<RowReader> open_row_reader(const std::string& path, ImportFormat format,
    std::string& err);

/// Build a full ParameterSet from a row: missing or non-numeric fields become
/// `fallback`, everything is clamped to [0,100].
ParameterSet coerce_row(const ImportRow& row, int fallback);

/// Split one CSV line into fields. Handles "quoted, fields" and "" escapes.
/// Returns false on an unterminated quote.
bool split_csv_line(const std::string& line, std::vector<std::string>& out);

/// Parse a CSV cell as a number. Empty, non-numeric and NaN cells give
/// nullopt; out-of-range and "inf" cells give an infinity.
std::optional<double> parse_number(const std::string& cell);
