#include "monitoring/config.hpp"

#include "core/json_dom.hpp"

#include <array>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <limits>
#include <utility>

namespace fs = std::filesystem;

namespace framewatch::monitoring {

namespace {

using JsonValue = core::json::Value;

// Keeps interval values well inside std::chrono::milliseconds range.
constexpr std::uint64_t kMaxIntervalMs = 24ULL * 60ULL * 60ULL * 1000ULL;

constexpr std::array<std::string_view, 6> kKnownKeys = {
    "host",
    "device_id",
    "max_frames",
    "ingest_interval_ms",
    "playback_interval_ms",
    "max_frames_per_fetch",
};

void AddIssue(std::vector<ConfigIssue>& issues, std::string path, std::string message) {
  issues.push_back({.path = std::move(path), .message = std::move(message)});
}

void ReadString(const JsonValue& root, std::string_view key, std::string& out,
                std::vector<ConfigIssue>& issues) {
  const JsonValue* field = core::json::FindField(root, key);
  if (field == nullptr) {
    return;
  }
  if (!core::json::IsString(field)) {
    AddIssue(issues, std::string(key), "must be a string");
    return;
  }
  out = field->string_value;
}

void ReadCount(const JsonValue& root, std::string_view key, std::size_t& out,
               std::vector<ConfigIssue>& issues) {
  const JsonValue* field = core::json::FindField(root, key);
  if (field == nullptr) {
    return;
  }
  std::uint64_t parsed = 0U;
  if (!core::json::TryGetNonNegativeInteger(*field, parsed) ||
      parsed > std::numeric_limits<std::size_t>::max()) {
    AddIssue(issues, std::string(key), "must be a non-negative integer");
    return;
  }
  out = static_cast<std::size_t>(parsed);
}

void ReadIntervalMs(const JsonValue& root, std::string_view key, std::chrono::milliseconds& out,
                    std::vector<ConfigIssue>& issues) {
  const JsonValue* field = core::json::FindField(root, key);
  if (field == nullptr) {
    return;
  }
  std::uint64_t parsed = 0U;
  if (!core::json::TryGetNonNegativeInteger(*field, parsed)) {
    AddIssue(issues, std::string(key), "must be a non-negative integer (milliseconds)");
    return;
  }
  if (parsed > kMaxIntervalMs) {
    AddIssue(issues, std::string(key), "must not exceed " + std::to_string(kMaxIntervalMs));
    return;
  }
  out = std::chrono::milliseconds(static_cast<std::int64_t>(parsed));
}

} // namespace

bool ValidateMonitoringConfig(const MonitoringConfig& config, std::vector<ConfigIssue>& issues) {
  const std::size_t issues_before = issues.size();
  if (config.target.device_id.empty()) {
    AddIssue(issues, "device_id", "must not be empty");
  }
  if (config.max_frames == 0U) {
    AddIssue(issues, "max_frames", "must be greater than 0");
  }
  if (config.ingest_interval <= std::chrono::milliseconds::zero()) {
    AddIssue(issues, "ingest_interval_ms", "must be greater than 0");
  }
  if (config.playback_interval <= std::chrono::milliseconds::zero()) {
    AddIssue(issues, "playback_interval_ms", "must be greater than 0");
  }
  if (config.max_frames_per_fetch == 0U) {
    AddIssue(issues, "max_frames_per_fetch", "must be greater than 0");
  }
  return issues.size() == issues_before;
}

bool ApplyMonitoringConfigText(const std::string_view json_text, MonitoringConfig& config,
                               std::vector<ConfigIssue>& issues) {
  issues.clear();

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    AddIssue(issues, "$", parse_error);
    return false;
  }
  if (!core::json::IsObject(&root)) {
    AddIssue(issues, "$", "config must be a JSON object");
    return false;
  }

  for (const auto& [key, value] : root.object_value) {
    (void)value;
    bool known = false;
    for (const std::string_view candidate : kKnownKeys) {
      if (key == candidate) {
        known = true;
        break;
      }
    }
    if (!known) {
      AddIssue(issues, key, "is not a recognized config key");
    }
  }

  MonitoringConfig updated = config;
  ReadString(root, "host", updated.target.host, issues);
  ReadString(root, "device_id", updated.target.device_id, issues);
  ReadCount(root, "max_frames", updated.max_frames, issues);
  ReadIntervalMs(root, "ingest_interval_ms", updated.ingest_interval, issues);
  ReadIntervalMs(root, "playback_interval_ms", updated.playback_interval, issues);
  ReadCount(root, "max_frames_per_fetch", updated.max_frames_per_fetch, issues);
  if (!issues.empty()) {
    return false;
  }

  if (!ValidateMonitoringConfig(updated, issues)) {
    return false;
  }
  config = std::move(updated);
  return true;
}

bool LoadMonitoringConfigFile(const fs::path& path, MonitoringConfig& config,
                              std::vector<ConfigIssue>& issues, std::string& error) {
  issues.clear();
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "unable to read config file: " + path.string();
    return false;
  }

  const std::string contents((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
  if (contents.empty()) {
    AddIssue(issues, "$", "config file is empty; provide a JSON object");
    return true;
  }

  (void)ApplyMonitoringConfigText(contents, config, issues);
  return true;
}

std::string FormatConfigIssues(const std::vector<ConfigIssue>& issues) {
  std::string formatted;
  for (const ConfigIssue& issue : issues) {
    if (!formatted.empty()) {
      formatted += "; ";
    }
    formatted += issue.path + ": " + issue.message;
  }
  return formatted;
}

} // namespace framewatch::monitoring
