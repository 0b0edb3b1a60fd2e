#include "events/event_model.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace framewatch::events {

std::string ToJson(EventType event_type) {
  switch (event_type) {
  case EventType::kSessionStarted:
    return "session_started";
  case EventType::kSessionStopped:
    return "session_stopped";
  case EventType::kControlLost:
    return "control_lost";
  case EventType::kFramesIngested:
    return "frames_ingested";
  case EventType::kFrameFetchFailed:
    return "frame_fetch_failed";
  case EventType::kFrameAnalysisFailed:
    return "frame_analysis_failed";
  case EventType::kSubtitleOverlayApplied:
    return "subtitle_overlay_applied";
  case EventType::kSubtitleOverlayFailed:
    return "subtitle_overlay_failed";
  case EventType::kPlaybackAutoPaused:
    return "playback_auto_paused";
  }

  return "unknown";
}

std::string ToJson(const Event& event) {
  std::ostringstream out;
  out << "{"
      << "\"ts_utc\":\"" << core::FormatUtcTimestamp(event.ts) << "\","
      << "\"type\":\"" << ToJson(event.type) << "\","
      << "\"payload\":{";

  // std::map keeps key order stable so lines diff cleanly.
  bool first = true;
  for (const auto& [key, value] : event.payload) {
    core::WriteJsonStringField(out, key, value, first);
  }

  out << "}}";
  return out.str();
}

} // namespace framewatch::events
