#include "recommendation_engine.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <set>

namespace {

template <typename Get>
double curve_range(const std::vector<ComparisonPoint>& pts, Get get) {
  if (pts.empty()) return 0.0;
  double lo = get(pts.front());
  double hi = lo;
  for (const auto& p : pts) {
    lo = std::min(lo, get(p));
    hi = std::max(hi, get(p));
  }
  return hi - lo;
}

int severity_rank(Severity s) {
  switch (s) {
    case Severity::High:
      return 0;
    case Severity::Medium:
      return 1;
    case Severity::Low:
    default:
      return 2;
  }
}

}  // namespace

const Drill* drill_for_metric(const std::string& metric) {
  static const std::map<std::string, Drill> drills{
      {"Shoulder Rotation",
       {"Wall Rotation Drill",
        "Stand with back against wall, practice rotating shoulders while maintaining contact",
        "3 sets of 15 reps"}},
      {"Wrist Position",
       {"Paddle Drop Drill",
        "Practice letting paddle drop naturally during backswing, pause at lowest point",
        "3 sets of 10 slow-motion swings"}},
      {"Weight Transfer",
       {"Step and Drive Drill",
        "Practice stepping back, loading, then driving forward without hitting",
        "3 sets of 12 reps"}},
      {"Arm Extension",
       {"Target Reach Drill",
        "Place target cone 2 feet past contact point, practice reaching paddle to cone",
        "3 sets of 15 swings"}},
      {"Stroke Tempo",
       {"Rhythm Training",
        "Count \"1-2-3\" for backswing-forward-follow through, maintain consistent tempo",
        "5 sets of 10 swings"}},
  };
  auto it = drills.find(metric);
  return it == drills.end() ? nullptr : &it->second;
}

RecommendationReport RecommendationEngine::evaluate(const StatsBundle& stats,
                                                    const ComparisonData& comparison) const {
  RecommendationReport r;

  int total = 0;
  int count = 0;
  total += assess_rotation(stats, r);
  count++;
  total += assess_wrist_position(stats, r);
  count++;
  total += assess_weight_transfer(comparison, r);
  count++;
  total += assess_extension(stats, r);
  count++;
  total += assess_tempo(stats, r);
  count++;

  r.overall_score = static_cast<int>(std::lround(static_cast<double>(total) / count));

  std::stable_sort(r.priorities.begin(), r.priorities.end(),
                   [](const Priority& a, const Priority& b) {
                     return severity_rank(a.severity) < severity_rank(b.severity);
                   });

  std::set<std::string> drilled;
  const size_t top = std::min(kMaxDrills, r.priorities.size());
  for (size_t i = 0; i < top; ++i) {
    const std::string& metric = r.priorities[i].metric;
    if (drilled.count(metric)) continue;
    if (const Drill* d = drill_for_metric(metric)) {
      r.drills.push_back(*d);
      drilled.insert(metric);
    }
  }
  return r;
}

int RecommendationEngine::assess_rotation(const StatsBundle& s, RecommendationReport& r) const {
  const double diff = s.peak_rotation.rounded_difference();
  if (diff < t_.rotation_high) {
    r.priorities.push_back(
        {Severity::High, "Shoulder Rotation",
         fmt::format("Insufficient rotation ({:.0f}° less than optimal)", std::abs(diff)),
         "Limited shoulder turn reduces power generation and can lead to arm-dominant swings",
         "Focus on turning your back to the target during backswing"});
    return 60;
  }
  if (diff < t_.rotation_medium) {
    r.priorities.push_back({Severity::Medium, "Shoulder Rotation",
                            fmt::format("Below optimal rotation ({:.0f}° less)", std::abs(diff)),
                            "More rotation would increase power",
                            "Practice shadow swings with exaggerated shoulder turn"});
    return 75;
  }
  if (diff > t_.rotation_strength) {
    r.strengths.push_back({"Shoulder Rotation", "Excellent shoulder turn",
                           fmt::format("Achieving {}° rotation (pro level: {}°)",
                                       s.peak_rotation.trainee_text(),
                                       s.peak_rotation.pro_text())});
    return 95;
  }
  return 85;
}

int RecommendationEngine::assess_wrist_position(const StatsBundle& s,
                                                RecommendationReport& r) const {
  const double diff = s.wrist_drop.rounded_difference();
  if (diff > t_.wrist_drop_high) {
    r.priorities.push_back(
        {Severity::High, "Wrist Position",
         fmt::format("Shallow wrist drop ({:.0f}px higher than optimal)", diff),
         "Limited wrist drop reduces power and spin potential",
         "Allow the paddle to drop naturally during backswing, creating lag"});
    return 65;
  }
  if (diff > t_.wrist_drop_medium) {
    r.priorities.push_back({Severity::Medium, "Wrist Position", "Wrist position could be lower",
                            "Deeper drop would improve power generation",
                            "Practice feeling the paddle weight during backswing"});
    return 80;
  }
  r.strengths.push_back(
      {"Wrist Mechanics", "Good wrist lag", "Proper wrist position for power generation"});
  return 90;
}

int RecommendationEngine::assess_weight_transfer(const ComparisonData& c,
                                                 RecommendationReport& r) const {
  const double trainee_range =
      curve_range(c.weight_transfer, [](const ComparisonPoint& p) { return p.trainee_value; });
  const double pro_range =
      curve_range(c.weight_transfer, [](const ComparisonPoint& p) { return p.pro_value; });

  if (trainee_range < pro_range * t_.weight_transfer_high_ratio) {
    r.priorities.push_back({Severity::High, "Weight Transfer", "Limited weight shift",
                            "Insufficient weight transfer reduces power and balance",
                            "Practice loading back foot, then driving forward through contact"});
    return 60;
  }
  if (trainee_range < pro_range * t_.weight_transfer_medium_ratio) {
    r.priorities.push_back({Severity::Medium, "Weight Transfer", "Moderate weight transfer",
                            "More dynamic weight shift would improve power",
                            "Exaggerate the back-to-front movement in practice"});
    return 75;
  }
  r.strengths.push_back(
      {"Weight Transfer", "Dynamic weight shift", "Good transfer from back to front foot"});
  return 90;
}

int RecommendationEngine::assess_extension(const StatsBundle& s, RecommendationReport& r) const {
  const double diff = s.peak_extension.rounded_difference();
  if (diff < t_.extension_high) {
    r.priorities.push_back(
        {Severity::High, "Arm Extension",
         fmt::format("Limited extension ({:.0f} units less)", std::abs(diff)),
         "Incomplete extension reduces reach and power",
         "Focus on extending through the ball toward your target"});
    return 65;
  }
  if (diff < t_.extension_medium) {
    r.priorities.push_back({Severity::Medium, "Arm Extension", "Could extend more fully",
                            "Fuller extension improves control and power",
                            "Practice reaching toward target on follow-through"});
    return 80;
  }
  r.strengths.push_back(
      {"Arm Extension", "Full extension through contact", "Good reach and follow-through"});
  return 95;
}

int RecommendationEngine::assess_tempo(const StatsBundle& s, RecommendationReport& r) const {
  const double diff_ms = s.stroke_duration.rounded_difference();
  if (diff_ms > t_.tempo_slow_ms) {
    r.priorities.push_back({Severity::Medium, "Stroke Tempo",
                            fmt::format("Slow stroke execution ({:.0f}ms slower)", diff_ms),
                            "Slower tempo may affect reaction time",
                            "Work on smoother, more efficient transitions"});
    return 70;
  }
  if (diff_ms < t_.tempo_efficient_ms) {
    r.strengths.push_back({"Stroke Timing", "Efficient tempo", "Quick, smooth execution"});
    return 95;
  }
  return 85;
}
