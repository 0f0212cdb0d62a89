#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "types.hpp"

// Raised when a pose document cannot be read or is not a frame array.
class PoseParseError : public std::runtime_error {
public:
  explicit PoseParseError(const std::string& what) : std::runtime_error(what) {}
};

// Converts a parsed document into frames. Expects a top-level array of frame objects,
// each optionally carrying primitives.people[0].pose, frameId and timestamp.
// Elements without a usable pose become frames with no people.
std::vector<PoseFrame> parse_frames(const nlohmann::json& doc);

std::vector<PoseFrame> parse_frames_text(const std::string& text);

std::vector<PoseFrame> load_frames_file(const std::filesystem::path& path);
