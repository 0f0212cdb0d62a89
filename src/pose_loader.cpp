#include "pose_loader.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>

namespace {

double number_or_zero(const nlohmann::json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_number()) return 0.0;
  return it->get<double>();
}

// Whole-number ids that fit int64; anything else keeps the array position.
std::optional<int64_t> integral_id(double v) {
  constexpr double kLimit = 9223372036854775808.0;  // 2^63
  if (!std::isfinite(v) || v != std::floor(v)) return std::nullopt;
  if (v < -kLimit || v >= kLimit) return std::nullopt;
  return static_cast<int64_t>(v);
}

bool parse_pose(const nlohmann::json& frame, Pose& pose) {
  auto prim = frame.find("primitives");
  if (prim == frame.end() || !prim->is_object()) return false;
  auto people = prim->find("people");
  if (people == prim->end() || !people->is_array() || people->empty()) return false;

  const auto& person = (*people)[0];
  if (!person.is_object()) return false;
  auto p = person.find("pose");
  if (p == person.end() || !p->is_object()) return false;

  for (auto it = p->begin(); it != p->end(); ++it) {
    if (!it.value().is_object()) continue;
    // Missing coordinates parse as 0, which reads as "not detected".
    pose.joints[it.key()] =
        cv::Point2d(number_or_zero(it.value(), "x"), number_or_zero(it.value(), "y"));
  }
  return true;
}

}  // namespace

std::vector<PoseFrame> parse_frames(const nlohmann::json& doc) {
  if (!doc.is_array()) {
    throw PoseParseError("pose document must be an array of frames");
  }

  std::vector<PoseFrame> frames;
  frames.reserve(doc.size());
  int64_t position = 0;
  for (const auto& item : doc) {
    PoseFrame frame;
    frame.frame_id = position;
    if (item.is_object()) {
      auto id = item.find("frameId");
      if (id != item.end() && id->is_number()) {
        if (id->is_number_unsigned()) {
          const auto u = id->get<uint64_t>();
          if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            frame.frame_id = static_cast<int64_t>(u);
          }
        } else if (id->is_number_integer()) {
          frame.frame_id = id->get<int64_t>();
        } else if (auto whole = integral_id(id->get<double>())) {
          frame.frame_id = *whole;
        }
      }
      frame.timestamp = number_or_zero(item, "timestamp");

      Pose pose;
      if (parse_pose(item, pose)) frame.people.push_back(std::move(pose));
    }
    frames.push_back(std::move(frame));
    position++;
  }

  spdlog::debug("Parsed {} frames", frames.size());
  return frames;
}

std::vector<PoseFrame> parse_frames_text(const std::string& text) {
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(text);
  } catch (const nlohmann::json::exception& e) {
    // parse_error for bad syntax, out_of_range for numbers that overflow a double
    throw PoseParseError(e.what());
  }
  return parse_frames(doc);
}

std::vector<PoseFrame> load_frames_file(const std::filesystem::path& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw PoseParseError("cannot open pose file: " + path.string());
  }
  std::ostringstream buf;
  buf << file.rdbuf();
  return parse_frames_text(buf.str());
}
