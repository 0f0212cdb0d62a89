#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "anchor_detector.hpp"
#include "comparator.hpp"
#include "metrics.hpp"
#include "recommendation_engine.hpp"
#include "types.hpp"

struct AnalysisConfig {
  double capture_fps{kDefaultCaptureFps};
  AnchorThresholds anchors;
  RecommendationThresholds rules;
};

struct AnalysisResult {
  ComparisonData comparison;
  std::vector<PhaseMarker> phases;
  StatsBundle stats;
  RecommendationReport recommendations;
  bool demo{false};
  std::string trainee_name;
};

constexpr const char* kDemoTraineeName = "Demo Trainee Data";

// Runs extraction, anchor detection, normalization, comparison and recommendations
// against a fixed reference recording. Each call returns an independent value.
class AnalysisPipeline {
public:
  AnalysisPipeline(std::vector<PoseFrame> reference, AnalysisConfig cfg, MetricsRegistry& m);

  AnalysisResult run(const std::vector<PoseFrame>& trainee, const std::string& trainee_name) const;
  AnalysisResult run_demo() const;

  size_t reference_frames() const { return reference_.size(); }

private:
  const std::vector<PoseFrame> reference_;
  const MetricSet reference_metrics_;
  AnalysisConfig cfg_;
  RecommendationEngine engine_;
  MetricsRegistry& metrics_;

  AnalysisResult demo_result(const std::string& trainee_name) const;
};

struct UploadOutcome {
  bool ok{false};
  std::string error;  // user-facing notice when !ok
};

constexpr const char* kUploadErrorNotice =
    "Error loading file. Please ensure it's a valid JSON file with pose data.";

// Holds the latest result for the presentation side. A failed upload leaves the
// previous result in place.
class AnalysisSession {
public:
  AnalysisSession(const AnalysisPipeline& pipeline, MetricsRegistry& m)
      : pipeline_(pipeline), metrics_(m) {}

  void load_demo();
  UploadOutcome upload(const std::string& name, const std::string& document);
  std::shared_ptr<const AnalysisResult> latest() const;

private:
  const AnalysisPipeline& pipeline_;
  MetricsRegistry& metrics_;

  mutable std::mutex mu_;
  std::shared_ptr<const AnalysisResult> latest_;
};
