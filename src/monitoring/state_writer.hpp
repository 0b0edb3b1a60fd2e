#pragma once

#include "monitoring/monitoring_session.hpp"
#include "monitoring/trend_analysis.hpp"

#include <filesystem>
#include <string>

namespace framewatch::monitoring {

std::string ToJson(const MonitoringState& state);

// Writes `<output_dir>/monitoring_state.json`: the state snapshot plus the
// trend summary, newline-terminated. The file is replaced, never appended,
// so a watcher always reads one complete document.
bool WriteMonitoringStateJson(const MonitoringState& state, const TrendSummary& trends,
                              const std::string& session_id,
                              const std::filesystem::path& output_dir,
                              std::filesystem::path& written_path, std::string& error);

} // namespace framewatch::monitoring
