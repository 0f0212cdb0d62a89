#pragma once

#include <spdlog/spdlog.h>

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

#include "pipeline.hpp"

struct OutputConfig {
  // Logging settings
  bool verbose_logging = false;
  std::string log_level = "info";

  // Report file; empty disables it
  std::string json_output_path = "output/analysis_report.json";

  // CSV export of the aligned curves
  bool enable_csv_export = false;
  std::string csv_output_path = "output/comparison.csv";
};

class OutputManager {
public:
  explicit OutputManager(const OutputConfig& config);

  // Writes every enabled output for a result and logs its summary.
  void processResult(const AnalysisResult& result);

  // Serialized form consumed by the presentation layer.
  static nlohmann::json toJson(const AnalysisResult& result);
  static std::string toCSV(const ComparisonData& comparison);

  bool writeReport(const AnalysisResult& result, const std::filesystem::path& path);
  bool writeCSV(const AnalysisResult& result, const std::filesystem::path& path);

  void logSummary(const AnalysisResult& result) const;

private:
  OutputConfig config_;

  void ensureOutputDirectory(const std::filesystem::path& path);
};
