#pragma once

#include "backends/monitoring_backend.hpp"
#include "monitoring/frame_model.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace framewatch::monitoring {

constexpr std::size_t kDefaultMaxFramesPerFetch = 10U;

struct MonitoringConfig {
  backends::DeviceTarget target{.host = "localhost", .device_id = "device1"};
  std::size_t max_frames = kDefaultMaxFrames;
  std::chrono::milliseconds ingest_interval{1000};
  std::chrono::milliseconds playback_interval{1000};

  // Upper bound the frame source applies per fetch (newest frames win).
  std::size_t max_frames_per_fetch = kDefaultMaxFramesPerFetch;
};

struct ConfigIssue {
  std::string path;
  std::string message;
};

// Range checks shared by the file loader and CLI overrides. Returns true
// when `issues` stays empty.
bool ValidateMonitoringConfig(const MonitoringConfig& config, std::vector<ConfigIssue>& issues);

// Applies a JSON config object onto `config`. Accepted keys:
//   host, device_id, max_frames, ingest_interval_ms, playback_interval_ms,
//   max_frames_per_fetch
// Unknown keys and wrongly typed values are reported with their path; `$`
// is used for document-level problems. Returns true when no issue was found.
bool ApplyMonitoringConfigText(std::string_view json_text, MonitoringConfig& config,
                               std::vector<ConfigIssue>& issues);

// Reads and applies a config file. Returns false with `error` set only when
// the file cannot be read; content problems land in `issues`.
bool LoadMonitoringConfigFile(const std::filesystem::path& path, MonitoringConfig& config,
                              std::vector<ConfigIssue>& issues, std::string& error);

// "path: message; path: message" for logs and CLI output.
std::string FormatConfigIssues(const std::vector<ConfigIssue>& issues);

} // namespace framewatch::monitoring
