#pragma once
#include <string>

#include "output_manager.hpp"
#include "pipeline.hpp"

struct InputConfig {
  std::string reference_path{"data/pro_reference.json"};
};

struct ServerConfig {
  std::string host{"0.0.0.0"};
  int port{8080};
};

struct AppConfig {
  InputConfig input;
  AnalysisConfig analysis;
  OutputConfig output_config;
  ServerConfig server;
};

AppConfig load_config(const std::string& path);
