#pragma once

#include <vector>

#include "types.hpp"

// Shoulder width of this many pixels reads as kRotationScaleDeg degrees of rotation.
constexpr double kRotationWidthPx = 50.0;
constexpr double kRotationScaleDeg = 45.0;

// Derives the four kinematic series from a recording. Each rule runs independently,
// so a frame missing one joint pair still contributes to the other series.
MetricSet extract_metrics(const std::vector<PoseFrame>& frames, Side side);
