#pragma once
#include <array>
#include <cstdint>
#include <map>
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

// Joint names as they appear in pose documents.
constexpr const char* kRightWrist = "rightWrist";
constexpr const char* kRightHip = "rightHip";
constexpr const char* kLeftShoulder = "leftShoulder";
constexpr const char* kRightShoulder = "rightShoulder";
constexpr const char* kLeftAnkle = "leftAnkle";
constexpr const char* kRightAnkle = "rightAnkle";

// 0 or negative coordinates mean "not detected", never a measurement of zero.
inline bool detected(double coord) { return coord > 0.0; }

struct Pose {
  std::map<std::string, cv::Point2d> joints;

  std::optional<cv::Point2d> joint(const std::string& name) const {
    auto it = joints.find(name);
    if (it == joints.end()) return std::nullopt;
    return it->second;
  }
};

struct PoseFrame {
  int64_t frame_id{0};
  double timestamp{0.0};
  std::vector<Pose> people;

  // Only the first detected person is analysed.
  const Pose* first_person() const { return people.empty() ? nullptr : &people.front(); }
};

enum class Side { Pro, Trainee };

inline const char* side_name(Side s) { return s == Side::Pro ? "Pro" : "Trainee"; }

enum class MetricKind { WristHip, ShoulderRotation, WeightTransfer, ArmExtension };

constexpr std::array<MetricKind, 4> kAllMetricKinds{MetricKind::WristHip,
                                                    MetricKind::ShoulderRotation,
                                                    MetricKind::WeightTransfer,
                                                    MetricKind::ArmExtension};

// Key used for the metric in serialized output.
inline const char* metric_key(MetricKind k) {
  switch (k) {
    case MetricKind::WristHip:
      return "wristHip";
    case MetricKind::ShoulderRotation:
      return "shoulderRotation";
    case MetricKind::WeightTransfer:
      return "weightTransfer";
    case MetricKind::ArmExtension:
      return "armExtension";
  }
  return "unknown";
}

struct MetricSample {
  int64_t frame_id{0};
  double timestamp{0.0};
  double value{0.0};
  Side side{Side::Pro};
};

using MetricSeries = std::vector<MetricSample>;

struct MetricSet {
  MetricSeries wrist_hip;
  MetricSeries shoulder_rotation;
  MetricSeries weight_transfer;
  MetricSeries arm_extension;
  std::vector<int64_t> frame_ids;

  const MetricSeries& series(MetricKind k) const;
  MetricSeries& series(MetricKind k);
};

// Indices into a recording's wrist-hip series.
struct AnchorSet {
  int backswing_start{0};
  int backswing_peak{0};
  int forward_swing_start{0};
  int follow_through_end{0};
  double min_value{0.0};

  int span() const { return follow_through_end - backswing_start; }
  bool degenerate() const { return span() <= 0; }
};

struct ComparisonPoint {
  int stroke_percent{0};
  double pro_value{0.0};
  double trainee_value{0.0};
};

struct ComparisonData {
  std::vector<ComparisonPoint> wrist_hip;
  std::vector<ComparisonPoint> shoulder_rotation;
  std::vector<ComparisonPoint> weight_transfer;
  std::vector<ComparisonPoint> arm_extension;

  const std::vector<ComparisonPoint>& series(MetricKind k) const;
  std::vector<ComparisonPoint>& series(MetricKind k);
};

struct PhaseMarker {
  std::string phase;
  int start{0};
  int end{0};
  std::string color;
};

// Phase annotations for the percent axis; identical for every analysis.
const std::vector<PhaseMarker>& phase_markers();

struct StatComparison {
  double pro{0.0};
  double trainee{0.0};
  double difference{0.0};  // trainee - pro
  int value_decimals{1};
  int difference_decimals{1};

  std::string pro_text() const;
  std::string trainee_text() const;
  std::string difference_text() const;
  // Difference at its published precision.
  double rounded_difference() const;
};

struct StatsBundle {
  StatComparison stroke_duration;  // seconds, difference in ms
  StatComparison peak_rotation;
  StatComparison peak_extension;
  StatComparison wrist_drop;
};
