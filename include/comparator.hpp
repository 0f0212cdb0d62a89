#pragma once

#include "types.hpp"

constexpr double kDefaultCaptureFps = 30.0;

// Highest value in a series; 0 for an empty series.
double series_peak(const MetricSeries& series);

// Pro-vs-trainee statistics. Every difference is trainee - pro; stroke duration is in
// seconds with its difference reported in milliseconds.
StatsBundle compare_recordings(const MetricSet& pro, const MetricSet& trainee,
                               const AnchorSet& pro_anchors, const AnchorSet& trainee_anchors,
                               double capture_fps = kDefaultCaptureFps);
