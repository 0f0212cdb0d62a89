#include "temporal_normalizer.hpp"

#include <cmath>

double map_percent_to_index(double percent, const AnchorSet& anchors) {
  const double start = static_cast<double>(anchors.backswing_start);
  const double length = static_cast<double>(anchors.span());
  return start + length * percent / 100.0;
}

double interpolate_value(const MetricSeries& series, double index) {
  if (series.empty()) return 0.0;

  const double floor_idx = std::floor(index);
  const double ceil_idx = std::ceil(index);
  const double last = static_cast<double>(series.size() - 1);

  if (floor_idx >= last) return series.back().value;
  if (floor_idx < 0.0) return series.front().value;

  const double lo = series[static_cast<size_t>(floor_idx)].value;
  if (floor_idx == ceil_idx) return lo;

  const double hi = series[static_cast<size_t>(ceil_idx)].value;
  return lo + (hi - lo) * (index - floor_idx);
}

ComparisonData normalize_and_align(const MetricSet& pro, const MetricSet& trainee,
                                   const AnchorSet& pro_anchors,
                                   const AnchorSet& trainee_anchors) {
  ComparisonData out;
  for (MetricKind k : kAllMetricKinds) out.series(k).reserve(kPercentPoints);

  for (int percent = 0; percent <= 100; percent += kPercentStep) {
    const double pro_idx = map_percent_to_index(percent, pro_anchors);
    const double trainee_idx = map_percent_to_index(percent, trainee_anchors);

    for (MetricKind k : kAllMetricKinds) {
      out.series(k).push_back({percent, interpolate_value(pro.series(k), pro_idx),
                               interpolate_value(trainee.series(k), trainee_idx)});
    }
  }
  return out;
}
