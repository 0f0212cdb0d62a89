#include "comparator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace {

StatComparison make_stat(double pro, double trainee, double scale, int value_decimals,
                         int difference_decimals) {
  StatComparison s;
  s.pro = pro;
  s.trainee = trainee;
  s.difference = (trainee - pro) * scale;
  s.value_decimals = value_decimals;
  s.difference_decimals = difference_decimals;
  return s;
}

}  // namespace

double series_peak(const MetricSeries& series) {
  if (series.empty()) return 0.0;
  auto it = std::max_element(series.begin(), series.end(),
                             [](const MetricSample& a, const MetricSample& b) {
                               return a.value < b.value;
                             });
  return it->value;
}

StatsBundle compare_recordings(const MetricSet& pro, const MetricSet& trainee,
                               const AnchorSet& pro_anchors, const AnchorSet& trainee_anchors,
                               double capture_fps) {
  if (pro.shoulder_rotation.empty() || trainee.shoulder_rotation.empty()) {
    spdlog::warn("Shoulder rotation missing on one side; peak rotation reads as 0");
  }
  if (pro.arm_extension.empty() || trainee.arm_extension.empty()) {
    spdlog::warn("Arm extension missing on one side; peak extension reads as 0");
  }

  StatsBundle s;
  s.stroke_duration = make_stat(pro_anchors.span() / capture_fps,
                                trainee_anchors.span() / capture_fps, 1000.0, 2, 0);
  s.peak_rotation = make_stat(series_peak(pro.shoulder_rotation),
                              series_peak(trainee.shoulder_rotation), 1.0, 1, 1);
  s.peak_extension =
      make_stat(series_peak(pro.arm_extension), series_peak(trainee.arm_extension), 1.0, 1, 1);
  s.wrist_drop = make_stat(pro_anchors.min_value, trainee_anchors.min_value, 1.0, 1, 1);
  return s;
}
