#include "output_manager.hpp"

#include <spdlog/fmt/fmt.h>

#include <fstream>
#include <sstream>

namespace {

nlohmann::json statToJson(const StatComparison& s) {
  return {{"pro", s.pro_text()}, {"trainee", s.trainee_text()}, {"difference", s.difference_text()}};
}

}  // namespace

OutputManager::OutputManager(const OutputConfig& config) : config_(config) {
  // Set logging level
  if (config_.log_level == "debug" || config_.verbose_logging) {
    spdlog::set_level(spdlog::level::debug);
  } else if (config_.log_level == "info") {
    spdlog::set_level(spdlog::level::info);
  } else if (config_.log_level == "warn") {
    spdlog::set_level(spdlog::level::warn);
  } else if (config_.log_level == "error") {
    spdlog::set_level(spdlog::level::err);
  }
}

void OutputManager::processResult(const AnalysisResult& result) {
  logSummary(result);

  if (!config_.json_output_path.empty()) {
    writeReport(result, config_.json_output_path);
  }
  if (config_.enable_csv_export) {
    writeCSV(result, config_.csv_output_path);
  }
}

nlohmann::json OutputManager::toJson(const AnalysisResult& result) {
  nlohmann::json j;
  j["trainee"] = result.trainee_name;
  j["demo"] = result.demo;

  nlohmann::json comparison = nlohmann::json::object();
  for (MetricKind k : kAllMetricKinds) {
    nlohmann::json pts = nlohmann::json::array();
    for (const auto& p : result.comparison.series(k)) {
      pts.push_back(
          {{"strokePercent", p.stroke_percent}, {"proValue", p.pro_value},
           {"traineeValue", p.trainee_value}});
    }
    comparison[metric_key(k)] = std::move(pts);
  }
  j["comparison"] = std::move(comparison);

  j["phases"] = nlohmann::json::array();
  for (const auto& ph : result.phases) {
    j["phases"].push_back(
        {{"phase", ph.phase}, {"start", ph.start}, {"end", ph.end}, {"color", ph.color}});
  }

  j["stats"] = {{"strokeDuration", statToJson(result.stats.stroke_duration)},
                {"peakRotation", statToJson(result.stats.peak_rotation)},
                {"peakExtension", statToJson(result.stats.peak_extension)},
                {"wristDrop", statToJson(result.stats.wrist_drop)}};

  const auto& rec = result.recommendations;
  nlohmann::json priorities = nlohmann::json::array();
  for (const auto& p : rec.priorities) {
    priorities.push_back({{"severity", severity_name(p.severity)},
                          {"metric", p.metric},
                          {"issue", p.issue},
                          {"detail", p.detail},
                          {"improvement", p.improvement}});
  }
  nlohmann::json strengths = nlohmann::json::array();
  for (const auto& s : rec.strengths) {
    strengths.push_back(
        {{"metric", s.metric}, {"achievement", s.achievement}, {"detail", s.detail}});
  }
  nlohmann::json drills = nlohmann::json::array();
  for (const auto& d : rec.drills) {
    drills.push_back({{"name", d.name}, {"description", d.description}, {"reps", d.reps}});
  }
  j["recommendations"] = {{"priorities", std::move(priorities)},
                          {"strengths", std::move(strengths)},
                          {"drills", std::move(drills)},
                          {"overallScore", rec.overall_score}};
  return j;
}

std::string OutputManager::toCSV(const ComparisonData& comparison) {
  std::ostringstream os;
  os << "stroke_percent";
  for (MetricKind k : kAllMetricKinds) {
    os << "," << metric_key(k) << "_pro," << metric_key(k) << "_trainee";
  }
  os << "\n";

  const size_t rows = comparison.wrist_hip.size();
  for (size_t i = 0; i < rows; ++i) {
    os << comparison.wrist_hip[i].stroke_percent;
    for (MetricKind k : kAllMetricKinds) {
      const auto& series = comparison.series(k);
      if (i < series.size()) {
        os << fmt::format(",{:.3f},{:.3f}", series[i].pro_value, series[i].trainee_value);
      } else {
        os << ",,";
      }
    }
    os << "\n";
  }
  return os.str();
}

bool OutputManager::writeReport(const AnalysisResult& result, const std::filesystem::path& path) {
  ensureOutputDirectory(path);
  std::ofstream file(path);
  if (!file.is_open()) {
    spdlog::error("Failed to open report file: {}", path.string());
    return false;
  }
  file << toJson(result).dump(2) << "\n";
  spdlog::info("Report written to {}", path.string());
  return true;
}

bool OutputManager::writeCSV(const AnalysisResult& result, const std::filesystem::path& path) {
  ensureOutputDirectory(path);
  std::ofstream file(path);
  if (!file.is_open()) {
    spdlog::error("Failed to open CSV file: {}", path.string());
    return false;
  }
  file << toCSV(result.comparison);
  spdlog::info("CSV export: {} ({} rows)", path.string(), result.comparison.wrist_hip.size());
  return true;
}

void OutputManager::logSummary(const AnalysisResult& result) const {
  const auto& s = result.stats;
  const auto& rec = result.recommendations;

  spdlog::info("=== STROKE ANALYSIS: {}{} ===", result.trainee_name, result.demo ? " (demo)" : "");
  spdlog::info("Overall score: {}", rec.overall_score);
  spdlog::info("Stroke duration: pro={}s trainee={}s diff={}ms", s.stroke_duration.pro_text(),
               s.stroke_duration.trainee_text(), s.stroke_duration.difference_text());
  spdlog::info("Peak rotation: pro={} trainee={} diff={}", s.peak_rotation.pro_text(),
               s.peak_rotation.trainee_text(), s.peak_rotation.difference_text());
  spdlog::info("Peak extension: pro={} trainee={} diff={}", s.peak_extension.pro_text(),
               s.peak_extension.trainee_text(), s.peak_extension.difference_text());
  spdlog::info("Wrist drop: pro={} trainee={} diff={}", s.wrist_drop.pro_text(),
               s.wrist_drop.trainee_text(), s.wrist_drop.difference_text());

  for (const auto& p : rec.priorities) {
    spdlog::info("[{}] {}: {}", severity_name(p.severity), p.metric, p.issue);
  }
  for (const auto& st : rec.strengths) {
    spdlog::info("[strength] {}: {}", st.metric, st.achievement);
  }
  for (const auto& d : rec.drills) {
    spdlog::info("Drill: {} ({})", d.name, d.reps);
  }
}

void OutputManager::ensureOutputDirectory(const std::filesystem::path& path) {
  const auto dir = path.parent_path();
  if (dir.empty()) return;
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    spdlog::warn("Could not create output directory {}: {}", dir.string(), ec.message());
  }
}
