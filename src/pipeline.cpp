#include "pipeline.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

#include "demo_generator.hpp"
#include "metric_extractor.hpp"
#include "pose_loader.hpp"
#include "temporal_normalizer.hpp"

using namespace std::chrono;

AnalysisPipeline::AnalysisPipeline(std::vector<PoseFrame> reference, AnalysisConfig cfg,
                                   MetricsRegistry& m)
    : reference_(std::move(reference)),
      reference_metrics_(extract_metrics(reference_, Side::Pro)),
      cfg_(cfg),
      engine_(cfg.rules),
      metrics_(m) {
  spdlog::info("Reference recording: {} frames, {} wrist-hip samples", reference_.size(),
               reference_metrics_.wrist_hip.size());
  if (reference_metrics_.wrist_hip.empty()) {
    spdlog::warn("Reference recording has no usable wrist-hip samples; every analysis will "
                 "fall back to demo data");
  }
}

AnalysisResult AnalysisPipeline::demo_result(const std::string& trainee_name) const {
  DemoData demo = generate_demo_data();
  AnalysisResult r;
  r.recommendations = engine_.evaluate(demo.stats, demo.comparison);
  r.comparison = std::move(demo.comparison);
  r.stats = demo.stats;
  r.phases = phase_markers();
  r.demo = true;
  r.trainee_name = trainee_name;
  return r;
}

AnalysisResult AnalysisPipeline::run_demo() const { return demo_result(kDemoTraineeName); }

AnalysisResult AnalysisPipeline::run(const std::vector<PoseFrame>& trainee,
                                     const std::string& trainee_name) const {
  auto t0 = steady_clock::now();
  metrics_.inc_analysis();

  auto fallback = [&](const char* reason) {
    spdlog::warn("Falling back to demo data for '{}': {}", trainee_name, reason);
    metrics_.inc_fallback();
    metrics_.add_analysis_ms(duration<double, std::milli>(steady_clock::now() - t0).count());
    return demo_result(trainee_name);
  };

  const MetricSet trainee_metrics = extract_metrics(trainee, Side::Trainee);
  if (reference_metrics_.wrist_hip.empty() || trainee_metrics.wrist_hip.empty()) {
    return fallback("no wrist-hip samples");
  }

  const auto pro_anchors = detect_anchors(reference_metrics_.wrist_hip, cfg_.anchors);
  const auto trainee_anchors = detect_anchors(trainee_metrics.wrist_hip, cfg_.anchors);
  if (!pro_anchors || !trainee_anchors) {
    return fallback("anchor detection failed");
  }
  if (pro_anchors->degenerate() || trainee_anchors->degenerate()) {
    return fallback("stroke span is empty");
  }

  AnalysisResult r;
  r.trainee_name = trainee_name;
  r.comparison =
      normalize_and_align(reference_metrics_, trainee_metrics, *pro_anchors, *trainee_anchors);
  r.phases = phase_markers();
  r.stats = compare_recordings(reference_metrics_, trainee_metrics, *pro_anchors,
                               *trainee_anchors, cfg_.capture_fps);
  r.recommendations = engine_.evaluate(r.stats, r.comparison);

  const double ms = duration<double, std::milli>(steady_clock::now() - t0).count();
  metrics_.add_analysis_ms(ms);
  spdlog::info("Analysed '{}' ({} frames) in {:.2f}ms: score {}", trainee_name, trainee.size(),
               ms, r.recommendations.overall_score);
  return r;
}

void AnalysisSession::load_demo() {
  auto result = std::make_shared<const AnalysisResult>(pipeline_.run_demo());
  std::lock_guard<std::mutex> g(mu_);
  latest_ = std::move(result);
}

UploadOutcome AnalysisSession::upload(const std::string& name, const std::string& document) {
  std::vector<PoseFrame> frames;
  try {
    frames = parse_frames_text(document);
  } catch (const PoseParseError& e) {
    spdlog::error("Error parsing trainee data '{}': {}", name, e.what());
    metrics_.inc_parse_error();
    return {false, kUploadErrorNotice};
  }

  auto result = std::make_shared<const AnalysisResult>(pipeline_.run(frames, name));
  std::lock_guard<std::mutex> g(mu_);
  latest_ = std::move(result);
  return {true, ""};
}

std::shared_ptr<const AnalysisResult> AnalysisSession::latest() const {
  std::lock_guard<std::mutex> g(mu_);
  return latest_;
}
