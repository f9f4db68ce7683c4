#pragma once

/// @file report_json.h
/// @brief JSON rendering of run and summary reports
///
/// Non-finite numbers (NaN statistics, an infinite chi-squared) are
/// written as null.

#include <string>

#include <nlohmann/json.hpp>

#include "drift/drift_monitor.h"
#include "drift/summary_reporter.h"
#include "drift/test_result.h"

namespace driftwatch::drift {

nlohmann::json ToJson(const TestResult& result);
nlohmann::json ToJson(const DriftEvent& event);
nlohmann::json ToJson(const FeatureOutcome& outcome);

/// @brief Thresholds, outcomes and events of a run
nlohmann::json ToJson(const RunReport& report);

/// @brief Every diagnostic table, keyed by table name
nlohmann::json ToJson(const SummaryReport& summary);

/// @brief Serialize a report document
///
/// Feature names and labels come from input files in any encoding;
/// invalid UTF-8 bytes are written as U+FFFD.
std::string DumpJson(const nlohmann::json& document, int indent = 2);

}  // namespace driftwatch::drift
