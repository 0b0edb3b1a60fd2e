#pragma once

#include "events/event_model.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace framewatch::events {

// Typed facade over the JSONL timeline so every producer writes the same
// payload keys for a given event type. Every record carries `session_id`.
class Emitter {
public:
  struct SessionStartedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string host;
    std::string device_id;
    std::uint64_t max_frames = 0;
    std::uint64_t ingest_interval_ms = 0;
    std::uint64_t playback_interval_ms = 0;
  };

  struct SessionStoppedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string reason;
    std::uint64_t frames_buffered = 0;
    std::uint64_t last_processed_frame = 0;
    std::uint64_t skipped_ticks = 0;
  };

  struct ControlLostEvent {
    std::chrono::system_clock::time_point ts{};
    std::uint64_t last_processed_frame = 0;
  };

  struct FramesIngestedEvent {
    std::chrono::system_clock::time_point ts{};
    std::uint64_t appended = 0;
    std::uint64_t failed = 0;
    std::uint64_t first_frame = 0;
    std::uint64_t last_frame = 0;
    std::uint64_t total_frames = 0;
  };

  struct FrameFetchFailedEvent {
    std::chrono::system_clock::time_point ts{};
    std::uint64_t since_frame = 0;
    std::string error;
  };

  struct FrameAnalysisFailedEvent {
    std::chrono::system_clock::time_point ts{};
    std::uint64_t frame_number = 0;
    std::string error;
  };

  // One input for both overlay outcomes:
  // - kApplied: `detected`, `text`
  // - kFailed: `error`
  struct SubtitleOverlayEvent {
    enum class Outcome {
      kApplied,
      kFailed,
    };

    Outcome outcome = Outcome::kApplied;
    std::chrono::system_clock::time_point ts{};
    std::string detector;
    std::uint64_t frame_number = 0;

    bool detected = false;
    std::string text;

    std::string error;
  };

  struct PlaybackAutoPausedEvent {
    std::chrono::system_clock::time_point ts{};
    std::uint64_t frame_index = 0;
    std::uint64_t frame_number = 0;
  };

  explicit Emitter(std::filesystem::path output_dir);

  void SetSessionId(std::string session_id);
  const std::string& session_id() const {
    return session_id_;
  }

  // Empty until the first successful write.
  const std::filesystem::path& events_path() const {
    return events_path_;
  }

  bool EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
               std::map<std::string, std::string> payload, std::string& error);

  bool EmitSessionStarted(const SessionStartedEvent& event, std::string& error);
  bool EmitSessionStopped(const SessionStoppedEvent& event, std::string& error);
  bool EmitControlLost(const ControlLostEvent& event, std::string& error);
  bool EmitFramesIngested(const FramesIngestedEvent& event, std::string& error);
  bool EmitFrameFetchFailed(const FrameFetchFailedEvent& event, std::string& error);
  bool EmitFrameAnalysisFailed(const FrameAnalysisFailedEvent& event, std::string& error);
  bool EmitSubtitleOverlay(const SubtitleOverlayEvent& event, std::string& error);
  bool EmitPlaybackAutoPaused(const PlaybackAutoPausedEvent& event, std::string& error);

private:
  std::filesystem::path output_dir_;
  std::filesystem::path events_path_;
  std::string session_id_;
};

} // namespace framewatch::events
