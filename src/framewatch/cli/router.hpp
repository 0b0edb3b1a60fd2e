#pragma once

#include "core/logging/logger.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace framewatch::cli {

// Options for `framewatch monitor`. Unset optionals fall back to the config
// file (when given) and then to MonitoringConfig defaults.
struct MonitorOptions {
  std::filesystem::path captures_dir;
  std::optional<std::filesystem::path> config_path;
  std::optional<std::string> host;
  std::optional<std::string> device_id;
  std::optional<std::size_t> max_frames;
  std::optional<std::chrono::milliseconds> ingest_interval;
  std::optional<std::chrono::milliseconds> playback_interval;

  // Zero runs until interrupted or control is lost.
  std::chrono::milliseconds duration{0};
  std::filesystem::path output_dir = "out";

  // Device control is considered held while this file exists. Without it,
  // control is held for the whole run.
  std::optional<std::filesystem::path> control_file;

  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Runs one monitoring session against a capture directory and writes
// `events.jsonl` and `monitoring_state.json` into the output directory.
int ExecuteMonitor(const MonitorOptions& options);

// Routes `framewatch` subcommands. Exit codes:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => config file invalid
//   20 => device control not active at start
//   21 => device control lost during the run
int Dispatch(int argc, char** argv);

} // namespace framewatch::cli
