#include "util.hpp"

#include <yaml-cpp/yaml.h>

AppConfig load_config(const std::string& path) {
  YAML::Node y = YAML::LoadFile(path);
  AppConfig c{};

  if (y["input"] && y["input"]["reference_path"])
    c.input.reference_path = y["input"]["reference_path"].as<std::string>();

  if (y["analysis"]) {
    auto a = y["analysis"];
    if (a["capture_fps"]) c.analysis.capture_fps = a["capture_fps"].as<double>();

    if (a["anchors"]) {
      auto n = a["anchors"];
      auto& t = c.analysis.anchors;
      if (n["onset_drop"]) t.onset_drop = n["onset_drop"].as<double>();
      if (n["onset_lookback"]) t.onset_lookback = n["onset_lookback"].as<int>();
      if (n["forward_rise"]) t.forward_rise = n["forward_rise"].as<double>();
      if (n["settle_delta"]) t.settle_delta = n["settle_delta"].as<double>();
      if (n["settle_skip"]) t.settle_skip = n["settle_skip"].as<int>();
      if (n["settle_hold"]) t.settle_hold = n["settle_hold"].as<int>();
    }

    if (a["rules"]) {
      auto n = a["rules"];
      auto& r = c.analysis.rules;
      if (n["rotation_high"]) r.rotation_high = n["rotation_high"].as<double>();
      if (n["rotation_medium"]) r.rotation_medium = n["rotation_medium"].as<double>();
      if (n["rotation_strength"]) r.rotation_strength = n["rotation_strength"].as<double>();
      if (n["wrist_drop_high"]) r.wrist_drop_high = n["wrist_drop_high"].as<double>();
      if (n["wrist_drop_medium"]) r.wrist_drop_medium = n["wrist_drop_medium"].as<double>();
      if (n["weight_transfer_high_ratio"])
        r.weight_transfer_high_ratio = n["weight_transfer_high_ratio"].as<double>();
      if (n["weight_transfer_medium_ratio"])
        r.weight_transfer_medium_ratio = n["weight_transfer_medium_ratio"].as<double>();
      if (n["extension_high"]) r.extension_high = n["extension_high"].as<double>();
      if (n["extension_medium"]) r.extension_medium = n["extension_medium"].as<double>();
      if (n["tempo_slow_ms"]) r.tempo_slow_ms = n["tempo_slow_ms"].as<double>();
      if (n["tempo_efficient_ms"]) r.tempo_efficient_ms = n["tempo_efficient_ms"].as<double>();
    }
  }

  // Load Output configuration
  if (y["output"]) {
    auto output = y["output"];

    // Logging settings
    if (output["logging"] && output["logging"]["verbose_logging"])
      c.output_config.verbose_logging = output["logging"]["verbose_logging"].as<bool>();
    if (output["logging"] && output["logging"]["log_level"])
      c.output_config.log_level = output["logging"]["log_level"].as<std::string>();

    if (output["json_output_path"])
      c.output_config.json_output_path = output["json_output_path"].as<std::string>();

    // CSV export settings
    if (output["csv"]) {
      auto csv = output["csv"];
      if (csv["enable_csv_export"])
        c.output_config.enable_csv_export = csv["enable_csv_export"].as<bool>();
      if (csv["csv_output_path"])
        c.output_config.csv_output_path = csv["csv_output_path"].as<std::string>();
    }
  }

  if (y["server"]) {
    if (y["server"]["host"]) c.server.host = y["server"]["host"].as<std::string>();
    if (y["server"]["port"]) c.server.port = y["server"]["port"].as<int>();
  }

  return c;
}
