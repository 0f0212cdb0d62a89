#pragma once

#include "types.hpp"

constexpr int kPercentStep = 2;
constexpr int kPercentPoints = 100 / kPercentStep + 1;  // 0,2,...,100

// Maps stroke progress (0-100) to a fractional index in
// [backswing_start, follow_through_end].
double map_percent_to_index(double percent, const AnchorSet& anchors);

// Linear interpolation between neighbouring samples. Indices at or beyond the last
// sample clamp to its value; an empty series yields 0.
double interpolate_value(const MetricSeries& series, double index);

// Resamples both recordings onto the shared percent axis. Every metric kind uses the
// percent->index mapping of its own recording's wrist-hip anchors.
ComparisonData normalize_and_align(const MetricSet& pro, const MetricSet& trainee,
                                   const AnchorSet& pro_anchors,
                                   const AnchorSet& trainee_anchors);
