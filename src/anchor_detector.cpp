#include "anchor_detector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

std::optional<AnchorSet> detect_anchors(const MetricSeries& wrist_hip, const AnchorThresholds& t) {
  if (wrist_hip.empty()) return std::nullopt;

  const int n = static_cast<int>(wrist_hip.size());
  auto v = [&](int i) { return wrist_hip[static_cast<size_t>(i)].value; };

  AnchorSet a;

  // Deepest wrist drop; first occurrence wins.
  a.backswing_peak = 0;
  a.min_value = v(0);
  for (int i = 1; i < n; ++i) {
    if (v(i) < a.min_value) {
      a.min_value = v(i);
      a.backswing_peak = i;
    }
  }

  a.backswing_start = 0;
  for (int i = 1; i < a.backswing_peak; ++i) {
    if (v(i) - v(i - 1) < t.onset_drop) {
      a.backswing_start = std::max(0, i - t.onset_lookback);
      break;
    }
  }

  a.forward_swing_start = a.backswing_peak;
  for (int i = a.backswing_peak + 1; i < n - 1; ++i) {
    if (v(i + 1) - v(i) > t.forward_rise) {
      a.forward_swing_start = i;
      break;
    }
  }

  a.follow_through_end = n - 1;
  // The settle test reads v(i + 1), so the bound never reaches the last sample.
  const int settle_limit = n - std::max(1, t.settle_hold);
  for (int i = a.forward_swing_start + t.settle_skip; i < settle_limit; ++i) {
    if (std::abs(v(i + 1) - v(i)) < t.settle_delta) {
      a.follow_through_end = i + t.settle_hold;
      break;
    }
  }

  spdlog::debug("Anchors: start={} peak={} forward={} end={} min={:.1f}", a.backswing_start,
                a.backswing_peak, a.forward_swing_start, a.follow_through_end, a.min_value);
  return a;
}
