#pragma once

#include <optional>

#include "types.hpp"

// Swing-onset and settling thresholds in px/frame. Tuned for 30 fps capture and not
// scaled to frame rate or noise level.
struct AnchorThresholds {
  double onset_drop{-2.0};   // first difference below this starts the backswing
  int onset_lookback{5};     // backswing start is placed this many samples earlier
  double forward_rise{2.0};  // forward difference above this starts the forward swing
  double settle_delta{1.0};  // |difference| below this counts as settled
  int settle_skip{10};       // samples after forward-swing start before settling is tested
  int settle_hold{5};        // follow-through end is placed this many samples later
};

// Locates the stroke phase anchors in a wrist-hip series. Returns nullopt for an
// empty series. forward_swing_start < follow_through_end is not guaranteed.
std::optional<AnchorSet> detect_anchors(const MetricSeries& wrist_hip,
                                        const AnchorThresholds& t = AnchorThresholds{});
