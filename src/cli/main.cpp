/// @file main.cpp
/// @brief driftwatch command-line entry point
///
/// Compares two CSV files and prints a JSON report to stdout. Logs go to
/// stderr.

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "common/config.h"
#include "common/error.h"
#include "common/logging.h"
#include "data/csv_loader.h"
#include "drift/drift_monitor.h"
#include "drift/report_json.h"

namespace {

constexpr int kExitNoDrift = 0;
constexpr int kExitError = 1;
constexpr int kExitDrift = 2;

constexpr const char* kVersion = "1.0.0";

int Fail(const absl::Status& status, std::string_view what) {
    DRIFTWATCH_LOG_ERROR("{}: {} [{}]", what, status.message(),
                         driftwatch::ErrorCodeToString(driftwatch::GetErrorCode(status)));
    driftwatch::ShutdownLogging();
    return kExitError;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"driftwatch - two-sample drift detection for tabular data"};

    std::string baseline_path;
    std::string comparison_path;
    std::string config_path;
    std::vector<std::string> numeric_features;
    std::vector<std::string> categorical_features;
    double alpha = driftwatch::drift::kDefaultFamilyAlpha;
    std::string categorical_test;
    int64_t workers = 1;
    std::string log_level;
    std::string log_file;
    bool no_summary = false;

    app.add_option("-b,--baseline", baseline_path, "Baseline window CSV file")->required();
    app.add_option("-n,--comparison", comparison_path, "Comparison window CSV file")->required();
    app.add_option("-c,--config", config_path, "Path to YAML configuration file");
    auto* numeric_opt = app.add_option("--numeric", numeric_features,
                                       "Numeric features (comma-separated)")
                            ->delimiter(',');
    auto* categorical_opt = app.add_option("--categorical", categorical_features,
                                           "Categorical features (comma-separated)")
                                ->delimiter(',');
    auto* alpha_opt = app.add_option("--alpha", alpha, "Family-wise significance level");
    auto* test_opt = app.add_option("--categorical-test", categorical_test,
                                    "Categorical test (contingency, goodness_of_fit)");
    auto* workers_opt = app.add_option("--workers", workers, "Worker threads for feature tests");
    auto* level_opt = app.add_option("--log-level", log_level,
                                     "Log level (trace, debug, info, warn, error)");
    auto* log_file_opt = app.add_option("--log-file", log_file, "Also write logs to this file");
    app.add_flag("--no-summary", no_summary, "Skip descriptive diagnostics");
    app.set_version_flag("-v,--version", std::string("driftwatch v") + kVersion);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // --help and --version arrive here with a zero exit code
        return app.exit(e) == 0 ? kExitNoDrift : kExitError;
    }

    // Configuration: file, then environment, then command line
    std::optional<std::filesystem::path> config_file;
    if (!config_path.empty()) {
        config_file = config_path;
    }
    auto config_or = driftwatch::LoadConfig(config_file);
    if (!config_or.ok()) {
        return Fail(config_or.status(), "Failed to load configuration");
    }
    driftwatch::Config config = *std::move(config_or);

    if (numeric_opt->count() > 0) {
        config.Set("features.numeric", numeric_features);
    }
    if (categorical_opt->count() > 0) {
        config.Set("features.categorical", categorical_features);
    }
    if (alpha_opt->count() > 0) {
        config.Set("monitor.alpha", alpha);
    }
    if (test_opt->count() > 0) {
        config.Set("monitor.categorical_test", categorical_test);
    }
    if (workers_opt->count() > 0) {
        config.Set("monitor.num_workers", workers);
    }
    if (level_opt->count() > 0) {
        config.Set("logging.level", log_level);
    }
    if (no_summary) {
        config.Set("report.summary", false);
    }
    if (log_file_opt->count() > 0) {
        config.Set("logging.file", log_file);
    }

    auto log_config = driftwatch::LogConfigFromConfig(config);
    if (!log_config.ok()) {
        return Fail(log_config.status(), "Invalid configuration");
    }
    if (auto status = driftwatch::InitLogging(*log_config); !status.ok()) {
        return Fail(status, "Failed to initialize logging");
    }
    DRIFTWATCH_LOG_DEBUG("Effective configuration: {}",
                         driftwatch::drift::DumpJson(config.ToJson(), -1));

    auto options_or = driftwatch::drift::MonitorOptions::FromConfig(config);
    if (!options_or.ok()) {
        return Fail(options_or.status(), "Invalid configuration");
    }
    auto partition = driftwatch::drift::PartitionFromConfig(config);
    if (partition.Size() == 0) {
        return Fail(driftwatch::InvalidConfigurationError(
                        "No features to monitor; pass --numeric/--categorical or set "
                        "features.numeric/features.categorical"),
                    "Invalid configuration");
    }

    DRIFTWATCH_LOG_INFO("driftwatch v{} starting", kVersion);
    DRIFTWATCH_LOG_INFO("Configuration:");
    DRIFTWATCH_LOG_INFO("  Baseline: {}", baseline_path);
    DRIFTWATCH_LOG_INFO("  Comparison: {}", comparison_path);
    DRIFTWATCH_LOG_INFO("  Features: {} numeric, {} categorical",
                        partition.Numeric().size(), partition.Categorical().size());
    DRIFTWATCH_LOG_INFO("  Family alpha: {:.4g}", options_or->alpha);
    DRIFTWATCH_LOG_INFO("  Categorical test: {}",
                        driftwatch::drift::CategoricalTestToString(options_or->categorical_test));
    DRIFTWATCH_LOG_INFO("  Workers: {}", options_or->num_workers);

    // Categorical codes keep their spelling ("007" is not "7")
    driftwatch::data::CsvOptions csv_options;
    csv_options.text_columns = partition.Categorical();

    auto baseline = driftwatch::data::LoadCsvFile(baseline_path, csv_options);
    if (!baseline.ok()) {
        return Fail(baseline.status(), "Failed to load baseline window");
    }
    auto comparison = driftwatch::data::LoadCsvFile(comparison_path, csv_options);
    if (!comparison.ok()) {
        return Fail(comparison.status(), "Failed to load comparison window");
    }
    DRIFTWATCH_LOG_INFO("Loaded {} baseline and {} comparison records",
                        baseline->NumRecords(), comparison->NumRecords());

    driftwatch::drift::DriftMonitor monitor(*std::move(baseline), *std::move(comparison),
                                            std::move(partition), *std::move(options_or));

    auto report = monitor.Evaluate();
    if (!report.ok()) {
        return Fail(report.status(), "Drift evaluation failed");
    }

    nlohmann::json output;
    output["run"] = driftwatch::drift::ToJson(*report);

    if (config.GetBool("report.summary", true)) {
        auto summary = monitor.Summary();
        if (!summary.ok()) {
            return Fail(summary.status(), "Summary diagnostics failed");
        }
        output["summary"] = driftwatch::drift::ToJson(*summary);
    }

    std::cout << driftwatch::drift::DumpJson(output) << std::endl;

    const int exit_code = report->HasDrift() ? kExitDrift : kExitNoDrift;
    DRIFTWATCH_LOG_INFO("Finished: {} drift events", report->events.size());
    driftwatch::ShutdownLogging();
    return exit_code;
}
