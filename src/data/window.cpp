#include "data/window.h"

#include <cmath>
#include <unordered_set>
#include <utility>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <spdlog/fmt/fmt.h>

#include "common/error.h"

namespace driftwatch::data {

bool IsNull(const Value& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        return true;
    }
    if (const double* number = std::get_if<double>(&value)) {
        return std::isnan(*number);
    }
    return false;
}

Category ToCategory(const Value& value) {
    if (IsNull(value)) {
        return std::nullopt;
    }
    if (const double* number = std::get_if<double>(&value)) {
        return fmt::format("{}", *number);
    }
    return std::get<std::string>(value);
}

std::string_view FeatureKindToString(FeatureKind kind) {
    switch (kind) {
        case FeatureKind::kNumeric:
            return "numeric";
        case FeatureKind::kCategorical:
            return "categorical";
        default:
            return "unknown";
    }
}

// =============================================================================
// FeaturePartition
// =============================================================================

FeaturePartition::FeaturePartition(std::vector<std::string> numeric,
                                   std::vector<std::string> categorical)
    : numeric_(std::move(numeric)), categorical_(std::move(categorical)) {}

FeaturePartition FeaturePartition::FromDescriptors(
    const std::vector<FeatureDescriptor>& descriptors) {
    std::vector<std::string> numeric;
    std::vector<std::string> categorical;
    for (const auto& descriptor : descriptors) {
        if (descriptor.kind == FeatureKind::kNumeric) {
            numeric.push_back(descriptor.name);
        } else {
            categorical.push_back(descriptor.name);
        }
    }
    return FeaturePartition(std::move(numeric), std::move(categorical));
}

std::vector<FeatureDescriptor> FeaturePartition::Descriptors() const {
    std::vector<FeatureDescriptor> descriptors;
    descriptors.reserve(Size());
    for (const auto& name : numeric_) {
        descriptors.push_back({name, FeatureKind::kNumeric});
    }
    for (const auto& name : categorical_) {
        descriptors.push_back({name, FeatureKind::kCategorical});
    }
    return descriptors;
}

absl::Status FeaturePartition::Validate() const {
    std::unordered_set<std::string> seen;
    for (const auto& descriptor : Descriptors()) {
        if (descriptor.name.empty()) {
            return InvalidConfigurationError("Feature partition contains an empty name");
        }
        if (!seen.insert(descriptor.name).second) {
            return InvalidConfigurationError(absl::StrCat(
                "Feature '", descriptor.name, "' is listed more than once in the partition"));
        }
    }
    return absl::OkStatus();
}

// =============================================================================
// Window
// =============================================================================

Window::Window(std::vector<std::string> columns)
    : columns_(std::move(columns)) {
    column_index_.reserve(columns_.size());
    for (size_t i = 0; i < columns_.size(); ++i) {
        column_index_.emplace(columns_[i], i);
    }
}

absl::Status Window::AddRecord(const Record& record) {
    std::vector<Value> row(columns_.size());
    for (const auto& [name, value] : record) {
        auto it = column_index_.find(name);
        if (it == column_index_.end()) {
            return SchemaMismatchError(
                absl::StrCat("Record names unknown feature '", name, "'"));
        }
        row[it->second] = value;
    }
    rows_.push_back(std::move(row));
    return absl::OkStatus();
}

absl::Status Window::AddRow(std::vector<Value> row) {
    if (row.size() != columns_.size()) {
        return SchemaMismatchError(absl::StrCat(
            "Row has ", row.size(), " values but the schema has ", columns_.size(),
            " columns"));
    }
    rows_.push_back(std::move(row));
    return absl::OkStatus();
}

bool Window::HasColumn(std::string_view name) const {
    return column_index_.find(std::string(name)) != column_index_.end();
}

std::optional<size_t> Window::ColumnIndex(std::string_view name) const {
    auto it = column_index_.find(std::string(name));
    if (it == column_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

absl::StatusOr<size_t> Window::RequireColumn(std::string_view name) const {
    auto index = ColumnIndex(name);
    if (!index.has_value()) {
        return SchemaMismatchError(absl::StrCat("Feature '", absl::string_view(name.data(), name.size()), "' is not in the window"));
    }
    return *index;
}

absl::StatusOr<NumericColumn> Window::NumericValues(std::string_view name) const {
    DRIFTWATCH_ASSIGN_OR_RETURN(size_t column, RequireColumn(name));

    NumericColumn result;
    result.values.reserve(rows_.size());
    for (size_t row = 0; row < rows_.size(); ++row) {
        const Value& value = rows_[row][column];
        if (IsNull(value)) {
            ++result.null_count;
            continue;
        }
        const double* number = std::get_if<double>(&value);
        if (number == nullptr) {
            return SchemaMismatchError(absl::StrCat(
                "Numeric feature '", absl::string_view(name.data(), name.size()), "' holds non-numeric value '",
                std::get<std::string>(value), "' at record ", row));
        }
        result.values.push_back(*number);
    }
    return result;
}

absl::StatusOr<std::vector<Category>> Window::Categories(std::string_view name) const {
    DRIFTWATCH_ASSIGN_OR_RETURN(size_t column, RequireColumn(name));

    std::vector<Category> categories;
    categories.reserve(rows_.size());
    for (const auto& row : rows_) {
        categories.push_back(ToCategory(row[column]));
    }
    return categories;
}

absl::StatusOr<size_t> Window::NullCount(std::string_view name) const {
    DRIFTWATCH_ASSIGN_OR_RETURN(size_t column, RequireColumn(name));

    size_t nulls = 0;
    for (const auto& row : rows_) {
        if (IsNull(row[column])) {
            ++nulls;
        }
    }
    return nulls;
}

absl::Status Window::ValidateSchema() const {
    std::unordered_set<std::string_view> seen;
    for (const auto& column : columns_) {
        if (column.empty()) {
            return SchemaMismatchError("Window schema contains an empty column name");
        }
        if (!seen.insert(column).second) {
            return SchemaMismatchError(
                absl::StrCat("Window schema repeats column '", column, "'"));
        }
    }
    return absl::OkStatus();
}

absl::Status CheckSameSchema(const Window& baseline, const Window& comparison) {
    DRIFTWATCH_RETURN_IF_ERROR(baseline.ValidateSchema());
    DRIFTWATCH_RETURN_IF_ERROR(comparison.ValidateSchema());

    const auto& base_columns = baseline.Columns();
    const auto& comp_columns = comparison.Columns();

    for (const auto& column : base_columns) {
        if (!comparison.HasColumn(column)) {
            return SchemaMismatchError(absl::StrCat(
                "Comparison window is missing column '", column, "'"));
        }
    }
    for (const auto& column : comp_columns) {
        if (!baseline.HasColumn(column)) {
            return SchemaMismatchError(absl::StrCat(
                "Baseline window is missing column '", column, "'"));
        }
    }
    if (base_columns != comp_columns) {
        return SchemaMismatchError(absl::StrCat(
            "Column order differs: baseline [", absl::StrJoin(base_columns, ", "),
            "] vs comparison [", absl::StrJoin(comp_columns, ", "), "]"));
    }
    return absl::OkStatus();
}

absl::Status CheckPartitionCovered(const FeaturePartition& partition,
                                   const Window& baseline,
                                   const Window& comparison) {
    for (const auto& descriptor : partition.Descriptors()) {
        if (!baseline.HasColumn(descriptor.name)) {
            return SchemaMismatchError(absl::StrCat(
                std::string(FeatureKindToString(descriptor.kind)), " feature '", descriptor.name,
                "' is missing from the baseline window"));
        }
        if (!comparison.HasColumn(descriptor.name)) {
            return SchemaMismatchError(absl::StrCat(
                std::string(FeatureKindToString(descriptor.kind)), " feature '", descriptor.name,
                "' is missing from the comparison window"));
        }
    }
    return absl::OkStatus();
}

}  // namespace driftwatch::data
