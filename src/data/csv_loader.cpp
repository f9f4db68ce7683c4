/// @file csv_loader.cpp
/// @brief CSV adapter implementation

#include "data/csv_loader.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <utility>
#include <variant>

#include <absl/strings/ascii.h>
#include <absl/strings/cord.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace driftwatch::data {

namespace {

std::string TrimUnquoted(const std::string& value) {
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

// Skip a UTF-8 byte order mark at the start of the stream
void SkipBom(std::istream& input) {
    static constexpr unsigned char kBom[] = {0xEF, 0xBB, 0xBF};
    for (unsigned char expected : kBom) {
        int next = input.peek();
        if (next == EOF || static_cast<unsigned char>(next) != expected) {
            if (expected != kBom[0]) {
                DRIFTWATCH_LOG_WARN("CSV input starts with an incomplete byte order mark");
            }
            return;
        }
        input.get();
    }
}

bool IsBlankRecord(const std::vector<std::string>& fields, const std::vector<bool>& quoted) {
    return fields.size() == 1 && fields[0].empty() && !quoted[0];
}

}  // namespace

absl::StatusOr<std::vector<std::string>> ReadCsvRecord(
    std::istream& input, const CsvOptions& options, std::vector<bool>* quoted) {
    std::vector<std::string> fields;
    if (quoted != nullptr) {
        quoted->clear();
    }
    if (input.peek() == EOF) {
        return fields;
    }

    std::string field;
    bool in_quotes = false;
    bool field_quoted = false;

    auto push_field = [&]() {
        fields.push_back(field_quoted ? field : TrimUnquoted(field));
        if (quoted != nullptr) {
            quoted->push_back(field_quoted);
        }
        field.clear();
        field_quoted = false;
    };

    char c;
    while (input.get(c)) {
        if (in_quotes) {
            if (c == '"') {
                if (input.peek() == '"') {
                    input.get();
                    field += '"';
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"' && !field_quoted && TrimUnquoted(field).empty()) {
            in_quotes = true;
            field_quoted = true;
            field.clear();
        } else if (c == options.delimiter) {
            push_field();
        } else if (c == '\n') {
            push_field();
            return fields;
        } else if (c == '\r') {
            if (input.peek() == '\n') {
                input.get();
            }
            push_field();
            return fields;
        } else if (field_quoted && (c == ' ' || c == '\t')) {
            // Padding between a closing quote and the delimiter
        } else {
            field += c;
        }

        if (field.size() > options.max_field_bytes) {
            return absl::InvalidArgumentError(absl::StrCat(
                "CSV field exceeds ", options.max_field_bytes, " bytes"));
        }
    }

    if (in_quotes) {
        return absl::InvalidArgumentError("CSV input ends inside a quoted field");
    }

    push_field();
    return fields;
}

Value ParseCsvField(const std::string& field, bool quoted, const CsvOptions& options) {
    if (field.empty()) {
        return std::monostate{};
    }

    if (!quoted) {
        std::string lowered = absl::AsciiStrToLower(field);
        auto it = std::find(options.null_tokens.begin(), options.null_tokens.end(), lowered);
        if (it != options.null_tokens.end()) {
            return std::monostate{};
        }
    }

    double number = 0.0;
    if (absl::SimpleAtod(field, &number) && std::isfinite(number)) {
        return number;
    }
    return field;
}

absl::StatusOr<Window> ParseCsv(std::istream& input, const CsvOptions& options) {
    SkipBom(input);

    std::vector<bool> quoted;
    DRIFTWATCH_ASSIGN_OR_RETURN(auto header, ReadCsvRecord(input, options, &quoted));
    if (header.empty() || IsBlankRecord(header, quoted)) {
        return SchemaMismatchError("CSV input has no header row");
    }

    Window window(header);
    DRIFTWATCH_RETURN_IF_ERROR(window.ValidateSchema());

    std::vector<bool> keep_text(header.size(), false);
    for (const auto& column : options.text_columns) {
        if (auto index = window.ColumnIndex(column)) {
            keep_text[*index] = true;
        }
    }

    size_t line = 1;
    while (true) {
        DRIFTWATCH_ASSIGN_OR_RETURN(auto fields, ReadCsvRecord(input, options, &quoted));
        if (fields.empty()) {
            break;
        }
        ++line;
        if (IsBlankRecord(fields, quoted)) {
            continue;
        }
        if (fields.size() != header.size()) {
            return SchemaMismatchError(absl::StrCat(
                "CSV record ", line, " has ", fields.size(), " fields, header has ",
                header.size()));
        }

        std::vector<Value> row;
        row.reserve(fields.size());
        for (size_t i = 0; i < fields.size(); ++i) {
            Value value = ParseCsvField(fields[i], quoted[i], options);
            if (keep_text[i] && std::holds_alternative<double>(value)) {
                value = fields[i];
            }
            row.push_back(std::move(value));
        }
        DRIFTWATCH_RETURN_IF_ERROR(window.AddRow(std::move(row)));
    }

    DRIFTWATCH_LOG_DEBUG("Parsed CSV with {} columns and {} records",
                         window.Columns().size(), window.NumRecords());
    return window;
}

absl::StatusOr<Window> LoadCsvFile(const std::filesystem::path& path,
                                   const CsvOptions& options) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return absl::NotFoundError(absl::StrCat("Cannot open CSV file: ", path.string()));
    }

    auto window = ParseCsv(file, options);
    if (!window.ok()) {
        absl::Status status(window.status().code(),
                            absl::StrCat(path.string(), ": ", window.status().message()));
        window.status().ForEachPayload(
            [&status](absl::string_view url, const absl::Cord& payload) {
                status.SetPayload(url, payload);
            });
        return status;
    }

    DRIFTWATCH_LOG_INFO("Loaded {} records from {}", window->NumRecords(), path.string());
    return window;
}

}  // namespace driftwatch::data
