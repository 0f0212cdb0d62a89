#include <httplib.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

#include "metrics.hpp"
#include "output_manager.hpp"
#include "pipeline.hpp"
#include "pose_loader.hpp"
#include "util.hpp"

int main(int argc, char** argv) {
  CLI::App cli_app{"StrokeCoach: pro-vs-trainee stroke comparison and coaching report"};

  std::string cfg_path = "configs/config.yaml";
  cli_app.add_option("-c,--config", cfg_path, "Configuration file path")->check(CLI::ExistingFile);

  std::string trainee_path;
  cli_app.add_option("-t,--trainee", trainee_path, "Trainee pose recording (JSON)")
      ->check(CLI::ExistingFile);

  std::string reference_path;
  cli_app.add_option("-r,--reference", reference_path, "Override the reference recording path");

  std::string output_path;
  cli_app.add_option("-o,--output", output_path, "Report JSON output path");

  bool serve = false;
  cli_app.add_flag("--serve", serve, "Serve the upload/report HTTP endpoints");

  bool show_version = false;
  cli_app.add_flag("-v,--version", show_version, "Show version information");

  try {
    cli_app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return cli_app.exit(e);
  }

  if (show_version) {
    std::cout << "StrokeCoach v1.0.0" << std::endl;
    std::cout << "Pose-based stroke alignment, comparison and coaching" << std::endl;
    return 0;
  }

  spdlog::set_pattern("[%H:%M:%S.%e] %^[%l]%$ %v");
  spdlog::info("StrokeCoach starting (config: {})", cfg_path);

  AppConfig app;
  try {
    app = load_config(cfg_path);
  } catch (const std::exception& e) {
    spdlog::error("Failed to load config {}: {}", cfg_path, e.what());
    return 1;
  }
  if (!reference_path.empty()) app.input.reference_path = reference_path;
  if (!output_path.empty()) app.output_config.json_output_path = output_path;

  OutputManager output(app.output_config);

  std::vector<PoseFrame> reference;
  try {
    reference = load_frames_file(app.input.reference_path);
  } catch (const PoseParseError& e) {
    spdlog::error("Failed to load reference recording {}: {}", app.input.reference_path,
                  e.what());
    return 1;
  }

  MetricsRegistry metrics;
  AnalysisPipeline pipeline(std::move(reference), app.analysis, metrics);
  AnalysisSession session(pipeline, metrics);

  if (trainee_path.empty()) {
    session.load_demo();
  } else {
    std::ifstream file(trainee_path);
    std::ostringstream buf;
    buf << file.rdbuf();
    UploadOutcome outcome = session.upload(trainee_path, buf.str());
    if (!outcome.ok) {
      spdlog::error("{}", outcome.error);
      return 1;
    }
  }
  output.processResult(*session.latest());

  if (!serve) return 0;

  httplib::Server svr;

  svr.Get("/healthz", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content("{\"status\":\"ok\"}", "application/json");
  });

  svr.Get("/analysis", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content(OutputManager::toJson(*session.latest()).dump(2), "application/json");
  });

  svr.Post("/analysis", [&](const httplib::Request& req, httplib::Response& res) {
    const std::string name =
        req.has_param("name") ? req.get_param_value("name") : std::string("upload");
    UploadOutcome outcome = session.upload(name, req.body);
    if (!outcome.ok) {
      res.status = 400;
      res.set_content(nlohmann::json{{"error", outcome.error}}.dump(), "application/json");
      return;
    }
    auto latest = session.latest();
    output.logSummary(*latest);
    res.set_content(OutputManager::toJson(*latest).dump(2), "application/json");
  });

  svr.Get("/metrics", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content(metrics.prometheus_text(metrics.snapshot()), "text/plain; version=0.0.4");
  });

  spdlog::info("HTTP server listening on {}:{}", app.server.host, app.server.port);
  if (!svr.listen(app.server.host, app.server.port)) {
    spdlog::error("Failed to bind {}:{}", app.server.host, app.server.port);
    return 1;
  }

  spdlog::info("Shutdown complete.");
  return 0;
}
