#include "demo_generator.hpp"

#include "temporal_normalizer.hpp"

namespace {

StatComparison fixed_stat(double pro, double trainee, double difference, int value_decimals,
                          int difference_decimals) {
  return StatComparison{pro, trainee, difference, value_decimals, difference_decimals};
}

// Piecewise-linear curves per phase (backswing <30, forward swing <60/70, rest).
ComparisonPoint wrist_hip_at(int percent) {
  const double p = percent;
  if (p < 30) return {percent, -30 - p * 1.0, -25 - p * 0.8};
  if (p < 60) {
    const double progress = (p - 30) / 30;
    return {percent, -60 + progress * 40, -45 + progress * 35};
  }
  if (p < 70) return {percent, -20, -10};
  const double progress = (p - 70) / 30;
  return {percent, -20 + progress * 5, -10 + progress * 2};
}

ComparisonPoint rotation_at(int percent) {
  const double p = percent;
  if (p < 30) return {percent, 10 + p * 1.17, 10 + p * 0.83};
  if (p < 60) {
    const double progress = (p - 30) / 30;
    return {percent, 45 - progress * 15, 35 - progress * 10};
  }
  return {percent, 30 - (p - 60) * 0.5, 25 - (p - 60) * 0.3};
}

ComparisonPoint weight_at(int percent) {
  const double p = percent;
  if (p < 30) return {percent, 50 - p * 0.83, 50 - p * 0.5};
  if (p < 70) {
    const double progress = (p - 30) / 40;
    return {percent, 25 + progress * 50, 35 + progress * 30};
  }
  return {percent, 75 + (p - 70) * 0.17, 65 + (p - 70) * 0.1};
}

ComparisonPoint extension_at(int percent) {
  const double p = percent;
  if (p < 30) return {percent, 50 - p * 0.33, 50 - p * 0.2};
  if (p < 70) {
    const double progress = (p - 30) / 40;
    return {percent, 40 + progress * 40, 45 + progress * 25};
  }
  const double progress = (p - 70) / 30;
  return {percent, 80 + progress * 20, 70 + progress * 10};
}

}  // namespace

DemoData generate_demo_data() {
  DemoData d;
  for (int percent = 0; percent <= 100; percent += kPercentStep) {
    d.comparison.wrist_hip.push_back(wrist_hip_at(percent));
    d.comparison.shoulder_rotation.push_back(rotation_at(percent));
    d.comparison.weight_transfer.push_back(weight_at(percent));
    d.comparison.arm_extension.push_back(extension_at(percent));
  }

  d.stats.stroke_duration = fixed_stat(1.50, 1.75, 250, 2, 0);
  d.stats.peak_rotation = fixed_stat(45.0, 35.0, -10.0, 1, 1);
  d.stats.peak_extension = fixed_stat(100.0, 80.0, -20.0, 1, 1);
  d.stats.wrist_drop = fixed_stat(-60.0, -45.0, 15.0, 1, 1);
  return d;
}
