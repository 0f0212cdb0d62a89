#pragma once
#include <string>
#include <vector>

#include "types.hpp"

enum class Severity { High, Medium, Low };

inline const char* severity_name(Severity s) {
  switch (s) {
    case Severity::High:
      return "high";
    case Severity::Medium:
      return "medium";
    case Severity::Low:
    default:
      return "low";
  }
}

struct Priority {
  Severity severity{Severity::Medium};
  std::string metric;
  std::string issue;
  std::string detail;
  std::string improvement;
};

struct Strength {
  std::string metric;
  std::string achievement;
  std::string detail;
};

struct Drill {
  std::string name;
  std::string description;
  std::string reps;
};

struct RecommendationReport {
  std::vector<Priority> priorities;  // severity-sorted
  std::vector<Strength> strengths;
  std::vector<Drill> drills;
  int overall_score{0};
};

// Rule cutoffs. Rotation, wrist drop and extension act on the published statistic
// differences; weight transfer on the ratio of trainee to pro curve range; tempo on
// the duration difference in ms.
struct RecommendationThresholds {
  double rotation_high{-15.0};
  double rotation_medium{-8.0};
  double rotation_strength{-5.0};
  double wrist_drop_high{20.0};
  double wrist_drop_medium{10.0};
  double weight_transfer_high_ratio{0.6};
  double weight_transfer_medium_ratio{0.8};
  double extension_high{-25.0};
  double extension_medium{-15.0};
  double tempo_slow_ms{300.0};
  double tempo_efficient_ms{100.0};
};

constexpr size_t kMaxDrills = 3;

// Drill for a priority metric, or nullptr when the table has none.
const Drill* drill_for_metric(const std::string& metric);

class RecommendationEngine {
public:
  explicit RecommendationEngine(RecommendationThresholds t = RecommendationThresholds{})
      : t_(t) {}

  // Deterministic; no state survives between calls.
  RecommendationReport evaluate(const StatsBundle& stats, const ComparisonData& comparison) const;

private:
  RecommendationThresholds t_;

  // Each rule appends at most one finding and returns its component score.
  int assess_rotation(const StatsBundle& s, RecommendationReport& r) const;
  int assess_wrist_position(const StatsBundle& s, RecommendationReport& r) const;
  int assess_weight_transfer(const ComparisonData& c, RecommendationReport& r) const;
  int assess_extension(const StatsBundle& s, RecommendationReport& r) const;
  int assess_tempo(const StatsBundle& s, RecommendationReport& r) const;
};
