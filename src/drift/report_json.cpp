/// @file report_json.cpp
/// @brief JSON rendering of run and summary reports

#include "drift/report_json.h"

#include <cmath>
#include <optional>
#include <string>
#include <utility>

namespace driftwatch::drift {

using json = nlohmann::json;

namespace {

json Number(double value) {
    if (!std::isfinite(value)) {
        return nullptr;
    }
    return value;
}

json OptionalNumber(const std::optional<double>& value) {
    return value.has_value() ? Number(*value) : json(nullptr);
}

json DescribeToJson(const stats::DescriptiveStats& s) {
    return json{
        {"count", Number(s.count)},
        {"mean", Number(s.mean)},
        {"std", Number(s.std)},
        {"min", Number(s.min)},
        {"25%", Number(s.q25)},
        {"50%", Number(s.q50)},
        {"75%", Number(s.q75)},
        {"max", Number(s.max)},
    };
}

json CategoricalToJson(const CategoricalSummary& summary) {
    json j;
    j["feature"] = summary.feature;
    j["mode"] = summary.mode.has_value() ? json(*summary.mode) : json(nullptr);
    j["distinct_count"] = summary.distinct_count;
    j["missing_count"] = summary.missing_count;
    return j;
}

}  // namespace

json ToJson(const TestResult& result) {
    json j;
    j["statistic"] = Number(result.statistic);
    j["p_value"] = Number(result.p_value);
    j["corrected_alpha"] = Number(result.corrected_alpha);
    j["is_drift"] = result.is_drift;
    return j;
}

json ToJson(const DriftEvent& event) {
    json j;
    j["feature"] = event.feature_name;
    j["test"] = std::string(TestKindToString(event.test_kind));
    j["result"] = ToJson(event.result);
    return j;
}

json ToJson(const FeatureOutcome& outcome) {
    json j;
    j["feature"] = outcome.feature_name;
    j["kind"] = std::string(data::FeatureKindToString(outcome.feature_kind));
    j["test"] = std::string(TestKindToString(outcome.test_kind));
    j["status"] = std::string(OutcomeStatusToString(outcome.status));
    if (outcome.result.has_value()) {
        j["result"] = ToJson(*outcome.result);
    } else {
        j["result"] = nullptr;
        j["skip_reason"] = outcome.skip_reason;
    }
    return j;
}

json ToJson(const RunReport& report) {
    json j;
    j["numeric_alpha"] = OptionalNumber(report.numeric_alpha);
    j["categorical_alpha"] = OptionalNumber(report.categorical_alpha);
    j["drift_detected"] = report.HasDrift();

    json outcomes = json::array();
    for (const auto& outcome : report.outcomes) {
        outcomes.push_back(ToJson(outcome));
    }
    j["outcomes"] = std::move(outcomes);

    json events = json::array();
    for (const auto& event : report.events) {
        events.push_back(ToJson(event));
    }
    j["events"] = std::move(events);
    return j;
}

json ToJson(const SummaryReport& summary) {
    json percent_change = json::array();
    for (const auto& row : summary.percent_change) {
        json changes = json::object();
        for (const auto& [statistic, percent] : row.percent) {
            changes[statistic] = Number(percent);
        }
        percent_change.push_back(json{
            {"feature", row.feature},
            {"baseline", DescribeToJson(row.baseline)},
            {"comparison", DescribeToJson(row.comparison)},
            {"percent_change", std::move(changes)},
        });
    }

    json null_rates = json::array();
    for (const auto& row : summary.null_rates) {
        null_rates.push_back(json{
            {"feature", row.feature},
            {"baseline_null_pct", Number(row.baseline_null_pct)},
            {"comparison_null_pct", Number(row.comparison_null_pct)},
        });
    }

    json jensen_shannon = json::array();
    for (const auto& row : summary.jensen_shannon) {
        jensen_shannon.push_back(json{
            {"feature", row.feature},
            {"distance", Number(row.distance)},
            {"exceeds_threshold", row.exceeds_threshold},
        });
    }

    json baseline_categorical = json::array();
    for (const auto& row : summary.baseline_categorical) {
        baseline_categorical.push_back(CategoricalToJson(row));
    }
    json comparison_categorical = json::array();
    for (const auto& row : summary.comparison_categorical) {
        comparison_categorical.push_back(CategoricalToJson(row));
    }

    json j;
    j["percent_change"] = std::move(percent_change);
    j["null_rates"] = std::move(null_rates);
    j["jensen_shannon"] = std::move(jensen_shannon);
    j["baseline_categorical"] = std::move(baseline_categorical);
    j["comparison_categorical"] = std::move(comparison_categorical);
    return j;
}

std::string DumpJson(const json& document, int indent) {
    return document.dump(indent, ' ', false, json::error_handler_t::replace);
}

}  // namespace driftwatch::drift
