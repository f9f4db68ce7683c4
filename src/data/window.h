#pragma once

/// @file window.h
/// @brief Tabular windows and the numeric/categorical feature partition

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

namespace driftwatch::data {

/// @brief A single cell: null, numeric or categorical text
using Value = std::variant<std::monostate, double, std::string>;

/// @brief A category label; std::nullopt is the null category
using Category = std::optional<std::string>;

/// @brief A record keyed by feature name
using Record = std::unordered_map<std::string, Value>;

/// @brief True for std::monostate and for NaN doubles
bool IsNull(const Value& value);

/// @brief Category label of a cell (null cells map to std::nullopt)
///
/// Numeric cells use their shortest round-trip text, so 3.0 becomes "3".
Category ToCategory(const Value& value);

/// @brief Kind of a monitored feature
enum class FeatureKind {
    kNumeric,
    kCategorical
};

/// @brief Convert feature kind to string
std::string_view FeatureKindToString(FeatureKind kind);

/// @brief A feature name plus its kind
struct FeatureDescriptor {
    std::string name;
    FeatureKind kind = FeatureKind::kNumeric;
};

/// @brief Externally supplied split of the schema into numeric and
///        categorical features
///
/// Covers a subset of the schema. Order within each list is the
/// evaluation and reporting order.
class FeaturePartition {
public:
    FeaturePartition() = default;
    FeaturePartition(std::vector<std::string> numeric,
                     std::vector<std::string> categorical);

    /// @brief Build a partition from descriptors, keeping their order
    static FeaturePartition FromDescriptors(const std::vector<FeatureDescriptor>& descriptors);

    const std::vector<std::string>& Numeric() const { return numeric_; }
    const std::vector<std::string>& Categorical() const { return categorical_; }

    /// @brief All descriptors, numeric family first
    std::vector<FeatureDescriptor> Descriptors() const;

    /// @brief Total number of features in both families
    size_t Size() const { return numeric_.size() + categorical_.size(); }

    /// @brief Reject empty or repeated names (InvalidConfiguration)
    absl::Status Validate() const;

private:
    std::vector<std::string> numeric_;
    std::vector<std::string> categorical_;
};

/// @brief Non-null values of a numeric feature plus the excluded null count
struct NumericColumn {
    std::vector<double> values;
    size_t null_count = 0;
};

/// @brief An ordered collection of records over an ordered schema
///
/// Windows are filled once by a data source and read-only afterwards.
class Window {
public:
    Window() = default;
    explicit Window(std::vector<std::string> columns);

    /// @brief Append a record; features the record omits are null
    /// @return SchemaMismatch if the record names an unknown feature
    absl::Status AddRecord(const Record& record);

    /// @brief Append a positional row in column order
    /// @return SchemaMismatch if the row width differs from the schema
    absl::Status AddRow(std::vector<Value> row);

    const std::vector<std::string>& Columns() const { return columns_; }
    size_t NumRecords() const { return rows_.size(); }
    bool Empty() const { return rows_.empty(); }

    bool HasColumn(std::string_view name) const;
    std::optional<size_t> ColumnIndex(std::string_view name) const;

    /// @brief Cell access by position (no bounds checking)
    const Value& At(size_t row, size_t column) const { return rows_[row][column]; }

    /// @brief Non-null numeric values of a feature
    /// @return SchemaMismatch if the feature is missing or holds text
    absl::StatusOr<NumericColumn> NumericValues(std::string_view name) const;

    /// @brief Category labels of a feature, nulls included as std::nullopt
    /// @return SchemaMismatch if the feature is missing
    absl::StatusOr<std::vector<Category>> Categories(std::string_view name) const;

    /// @brief Number of null cells of a feature
    absl::StatusOr<size_t> NullCount(std::string_view name) const;

    /// @brief Reject empty or duplicated column names (SchemaMismatch)
    absl::Status ValidateSchema() const;

private:
    absl::StatusOr<size_t> RequireColumn(std::string_view name) const;

    std::vector<std::string> columns_;
    std::unordered_map<std::string, size_t> column_index_;
    std::vector<std::vector<Value>> rows_;
};

/// @brief Require identical, identically ordered schemas
/// @return SchemaMismatch naming the first difference
absl::Status CheckSameSchema(const Window& baseline, const Window& comparison);

/// @brief Require every partition feature in both windows
/// @return SchemaMismatch naming the first missing feature and window
absl::Status CheckPartitionCovered(const FeaturePartition& partition,
                                   const Window& baseline,
                                   const Window& comparison);

}  // namespace driftwatch::data
