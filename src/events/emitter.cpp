#include "events/emitter.hpp"

#include "events/jsonl_writer.hpp"

#include <utility>

namespace framewatch::events {

Emitter::Emitter(std::filesystem::path output_dir) : output_dir_(std::move(output_dir)) {}

void Emitter::SetSessionId(std::string session_id) {
  session_id_ = std::move(session_id);
}

bool Emitter::EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
                      std::map<std::string, std::string> payload, std::string& error) {
  Event event;
  event.ts = ts;
  event.type = type;
  event.payload = std::move(payload);
  event.payload["session_id"] = session_id_;
  return AppendEventJsonl(event, output_dir_, events_path_, error);
}

bool Emitter::EmitSessionStarted(const SessionStartedEvent& event, std::string& error) {
  return EmitRaw(EventType::kSessionStarted, event.ts,
                 {
                     {"host", event.host},
                     {"device_id", event.device_id},
                     {"max_frames", std::to_string(event.max_frames)},
                     {"ingest_interval_ms", std::to_string(event.ingest_interval_ms)},
                     {"playback_interval_ms", std::to_string(event.playback_interval_ms)},
                 },
                 error);
}

bool Emitter::EmitSessionStopped(const SessionStoppedEvent& event, std::string& error) {
  return EmitRaw(EventType::kSessionStopped, event.ts,
                 {
                     {"reason", event.reason},
                     {"frames_buffered", std::to_string(event.frames_buffered)},
                     {"last_processed_frame", std::to_string(event.last_processed_frame)},
                     {"skipped_ticks", std::to_string(event.skipped_ticks)},
                 },
                 error);
}

bool Emitter::EmitControlLost(const ControlLostEvent& event, std::string& error) {
  return EmitRaw(EventType::kControlLost, event.ts,
                 {
                     {"last_processed_frame", std::to_string(event.last_processed_frame)},
                 },
                 error);
}

bool Emitter::EmitFramesIngested(const FramesIngestedEvent& event, std::string& error) {
  return EmitRaw(EventType::kFramesIngested, event.ts,
                 {
                     {"appended", std::to_string(event.appended)},
                     {"failed", std::to_string(event.failed)},
                     {"first_frame", std::to_string(event.first_frame)},
                     {"last_frame", std::to_string(event.last_frame)},
                     {"total_frames", std::to_string(event.total_frames)},
                 },
                 error);
}

bool Emitter::EmitFrameFetchFailed(const FrameFetchFailedEvent& event, std::string& error) {
  return EmitRaw(EventType::kFrameFetchFailed, event.ts,
                 {
                     {"since_frame", std::to_string(event.since_frame)},
                     {"error", event.error},
                 },
                 error);
}

bool Emitter::EmitFrameAnalysisFailed(const FrameAnalysisFailedEvent& event, std::string& error) {
  return EmitRaw(EventType::kFrameAnalysisFailed, event.ts,
                 {
                     {"frame_number", std::to_string(event.frame_number)},
                     {"error", event.error},
                 },
                 error);
}

bool Emitter::EmitSubtitleOverlay(const SubtitleOverlayEvent& event, std::string& error) {
  switch (event.outcome) {
  case SubtitleOverlayEvent::Outcome::kApplied:
    return EmitRaw(EventType::kSubtitleOverlayApplied, event.ts,
                   {
                       {"detector", event.detector},
                       {"frame_number", std::to_string(event.frame_number)},
                       {"detected", event.detected ? "true" : "false"},
                       {"text", event.text},
                   },
                   error);
  case SubtitleOverlayEvent::Outcome::kFailed:
    return EmitRaw(EventType::kSubtitleOverlayFailed, event.ts,
                   {
                       {"detector", event.detector},
                       {"frame_number", std::to_string(event.frame_number)},
                       {"error", event.error},
                   },
                   error);
  }

  error = "unsupported subtitle overlay outcome";
  return false;
}

bool Emitter::EmitPlaybackAutoPaused(const PlaybackAutoPausedEvent& event, std::string& error) {
  return EmitRaw(EventType::kPlaybackAutoPaused, event.ts,
                 {
                     {"frame_index", std::to_string(event.frame_index)},
                     {"frame_number", std::to_string(event.frame_number)},
                 },
                 error);
}

} // namespace framewatch::events
