#pragma once

/// @file csv_loader.h
/// @brief CSV adapter that materializes a Window from delimited text

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "data/window.h"

namespace driftwatch::data {

/// @brief Options for CSV parsing
struct CsvOptions {
    char delimiter = ',';

    /// Unquoted tokens read as null (compared case-insensitively).
    /// An empty field is always null.
    std::vector<std::string> null_tokens = {"na", "nan", "null", "none"};

    /// Columns whose non-null fields stay text even when they parse as
    /// numbers, so codes such as "007" and "7" remain distinct
    std::vector<std::string> text_columns;

    /// Upper bound on the size of one field, guards against runaway quotes
    size_t max_field_bytes = 8 * 1024 * 1024;
};

/// @brief Split one CSV record from the stream
///
/// Handles quoted fields with embedded delimiters, doubled quotes and
/// newlines. Unquoted fields are trimmed of spaces and tabs.
/// @param quoted Set per field: true when the field was quoted
/// @return Fields of the record; empty when the stream is exhausted;
///         InvalidArgument for an unterminated quote or oversized field
absl::StatusOr<std::vector<std::string>> ReadCsvRecord(
    std::istream& input, const CsvOptions& options, std::vector<bool>* quoted = nullptr);

/// @brief Interpret one field: null token, finite double, or text
Value ParseCsvField(const std::string& field, bool quoted, const CsvOptions& options);

/// @brief Parse a whole CSV document; the first record is the header
/// @return The window; SchemaMismatch for a bad header or a row whose
///         width differs from the header
absl::StatusOr<Window> ParseCsv(std::istream& input, const CsvOptions& options = {});

/// @brief Load a CSV file into a Window
absl::StatusOr<Window> LoadCsvFile(const std::filesystem::path& path,
                                   const CsvOptions& options = {});

}  // namespace driftwatch::data
