#include "types.hpp"

#include <spdlog/fmt/fmt.h>

#include <locale>
#include <sstream>

const MetricSeries& MetricSet::series(MetricKind k) const {
  switch (k) {
    case MetricKind::WristHip:
      return wrist_hip;
    case MetricKind::ShoulderRotation:
      return shoulder_rotation;
    case MetricKind::WeightTransfer:
      return weight_transfer;
    case MetricKind::ArmExtension:
    default:
      return arm_extension;
  }
}

MetricSeries& MetricSet::series(MetricKind k) {
  return const_cast<MetricSeries&>(static_cast<const MetricSet&>(*this).series(k));
}

const std::vector<ComparisonPoint>& ComparisonData::series(MetricKind k) const {
  switch (k) {
    case MetricKind::WristHip:
      return wrist_hip;
    case MetricKind::ShoulderRotation:
      return shoulder_rotation;
    case MetricKind::WeightTransfer:
      return weight_transfer;
    case MetricKind::ArmExtension:
    default:
      return arm_extension;
  }
}

std::vector<ComparisonPoint>& ComparisonData::series(MetricKind k) {
  return const_cast<std::vector<ComparisonPoint>&>(
      static_cast<const ComparisonData&>(*this).series(k));
}

const std::vector<PhaseMarker>& phase_markers() {
  static const std::vector<PhaseMarker> markers{
      {"Backswing", 0, 30, "#82ca9d"},
      {"Forward Swing", 30, 60, "#ff7300"},
      {"Contact", 60, 70, "#ff0000"},
      {"Follow-through", 70, 100, "#0088fe"},
  };
  return markers;
}

std::string StatComparison::pro_text() const {
  return fmt::format("{:.{}f}", pro, value_decimals);
}

std::string StatComparison::trainee_text() const {
  return fmt::format("{:.{}f}", trainee, value_decimals);
}

std::string StatComparison::difference_text() const {
  return fmt::format("{:.{}f}", difference, difference_decimals);
}

double StatComparison::rounded_difference() const {
  // Parsed back from the text so rules act on exactly what the report shows. fmt always
  // writes '.', so the read must not follow the global locale.
  std::istringstream in(difference_text());
  in.imbue(std::locale::classic());
  double value = 0.0;
  in >> value;
  return value;
}
