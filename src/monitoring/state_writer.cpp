#include "monitoring/state_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace fs = std::filesystem;

namespace framewatch::monitoring {

std::string ToJson(const MonitoringState& state) {
  using core::WriteJsonBoolField;
  using core::WriteJsonRawField;
  using core::WriteJsonStringField;

  std::ostringstream frames;
  frames << "[";
  for (std::size_t i = 0; i < state.frames.size(); ++i) {
    if (i > 0U) {
      frames << ",";
    }
    frames << ToJson(state.frames[i]);
  }
  frames << "]";

  std::ostringstream out;
  bool first = true;
  out << "{";
  WriteJsonBoolField(out, "isActive", state.is_active, first);
  WriteJsonBoolField(out, "isProcessing", state.is_processing, first);
  WriteJsonBoolField(out, "isPlaying", state.is_playing, first);
  WriteJsonRawField(out, "currentFrameIndex", std::to_string(state.current_frame_index), first);
  WriteJsonRawField(out, "totalFrames", std::to_string(state.total_frames), first);
  WriteJsonRawField(out, "maxFrames", std::to_string(state.max_frames), first);
  WriteJsonRawField(out, "lastProcessedFrame", std::to_string(state.last_processed_frame), first);
  if (state.error.empty()) {
    WriteJsonRawField(out, "error", "null", first);
  } else {
    WriteJsonStringField(out, "error", state.error, first);
  }
  if (state.overlay_error.empty()) {
    WriteJsonRawField(out, "overlayError", "null", first);
  } else {
    WriteJsonStringField(out, "overlayError", state.overlay_error, first);
  }
  WriteJsonRawField(out, "frames", frames.str(), first);
  out << "}";
  return out.str();
}

bool WriteMonitoringStateJson(const MonitoringState& state, const TrendSummary& trends,
                              const std::string& session_id, const fs::path& output_dir,
                              fs::path& written_path, std::string& error) {
  if (output_dir.empty()) {
    error = "output directory cannot be empty";
    return false;
  }

  std::ostringstream document;
  bool first = true;
  document << "{";
  core::WriteJsonStringField(document, "sessionId", session_id, first);
  core::WriteJsonStringField(document, "writtenAtUtc",
                             core::FormatUtcTimestamp(std::chrono::system_clock::now()), first);
  core::WriteJsonRawField(document, "state", ToJson(state), first);
  core::WriteJsonRawField(document, "trends", ToJson(trends), first);
  document << "}\n";

  written_path = output_dir / "monitoring_state.json";
  return core::WriteTextFileAtomic(written_path, document.str(), error);
}

} // namespace framewatch::monitoring
