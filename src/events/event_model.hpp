#pragma once

#include <chrono>
#include <map>
#include <string>

namespace framewatch::events {

// Timeline event categories written to events.jsonl. The string forms are a
// stable contract for anything that tails the log.
enum class EventType {
  kSessionStarted,
  kSessionStopped,
  kControlLost,
  kFramesIngested,
  kFrameFetchFailed,
  kFrameAnalysisFailed,
  kSubtitleOverlayApplied,
  kSubtitleOverlayFailed,
  kPlaybackAutoPaused,
};

// One timeline record.
//
// - `ts`: UTC timestamp when the event occurred.
// - `type`: normalized category.
// - `payload`: string key/value attributes.
struct Event {
  std::chrono::system_clock::time_point ts{};
  EventType type = EventType::kSessionStarted;
  std::map<std::string, std::string> payload;
};

std::string ToJson(EventType event_type);
std::string ToJson(const Event& event);

} // namespace framewatch::events
