#include "metric_extractor.hpp"

#include <spdlog/spdlog.h>

#include <cmath>

MetricSet extract_metrics(const std::vector<PoseFrame>& frames, Side side) {
  MetricSet m;

  for (const auto& frame : frames) {
    const Pose* person = frame.first_person();
    if (!person) continue;

    auto sample = [&](double value) {
      return MetricSample{frame.frame_id, frame.timestamp, value, side};
    };

    const auto r_wrist = person->joint(kRightWrist);
    const auto r_hip = person->joint(kRightHip);
    const auto l_shoulder = person->joint(kLeftShoulder);
    const auto r_shoulder = person->joint(kRightShoulder);
    const auto l_ankle = person->joint(kLeftAnkle);
    const auto r_ankle = person->joint(kRightAnkle);

    // Wrist-hip vertical differential; more negative = wrist higher above hip
    if (r_wrist && r_hip && detected(r_wrist->y) && detected(r_hip->y)) {
      m.wrist_hip.push_back(sample(r_wrist->y - r_hip->y));
    }

    // Shoulder width as a linear rotation proxy
    if (l_shoulder && r_shoulder && detected(l_shoulder->x) && detected(r_shoulder->x)) {
      const double width = std::abs(l_shoulder->x - r_shoulder->x);
      m.shoulder_rotation.push_back(sample(width / kRotationWidthPx * kRotationScaleDeg));
    }

    // Percent of weight on the right foot
    if (l_ankle && r_ankle && detected(l_ankle->x) && detected(r_ankle->x)) {
      m.weight_transfer.push_back(sample(r_ankle->x / (l_ankle->x + r_ankle->x) * 100.0));
    }

    if (r_shoulder && r_wrist && detected(r_shoulder->x) && detected(r_wrist->x) &&
        detected(r_shoulder->y) && detected(r_wrist->y)) {
      m.arm_extension.push_back(sample(cv::norm(*r_wrist - *r_shoulder)));
    }

    m.frame_ids.push_back(frame.frame_id);
  }

  spdlog::debug("{} metrics: wristHip={} shoulderRotation={} weightTransfer={} armExtension={}",
                side_name(side), m.wrist_hip.size(), m.shoulder_rotation.size(),
                m.weight_transfer.size(), m.arm_extension.size());
  return m;
}
