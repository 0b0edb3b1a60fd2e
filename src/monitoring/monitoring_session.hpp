#pragma once

#include "backends/monitoring_backend.hpp"
#include "monitoring/config.hpp"
#include "monitoring/diagnostics.hpp"
#include "monitoring/frame_buffer.hpp"
#include "monitoring/ingestion_scheduler.hpp"
#include "monitoring/playback_controller.hpp"
#include "monitoring/subtitle_overlay_service.hpp"
#include "monitoring/trend_analysis.hpp"
#include "runtime/control_signal.hpp"
#include "runtime/scheduler.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace framewatch::monitoring {

// Point-in-time copy of everything a dashboard renders.
struct MonitoringState {
  bool is_active = false;
  // True while an ingestion round is waiting on the source or backend.
  bool is_processing = false;
  bool is_playing = false;
  std::vector<Frame> frames;
  std::size_t current_frame_index = 0U;
  std::size_t total_frames = 0U;
  std::size_t max_frames = kDefaultMaxFrames;
  std::string error;
  std::uint64_t last_processed_frame = 0U;

  // Last subtitle overlay failure; kept apart from `error` so an overlay
  // problem never masks ingestion state.
  std::string overlay_error;
};

// Binds ingestion, playback and subtitle overlays to the external control
// signal. `inactive -> active -> inactive`; a deasserted control signal runs
// the stop sequence without any caller involvement.
//
// Everything acquired by Start() (cancellation source, ingestion timer) lives
// in one per-session object, so releasing it is the stop sequence. The
// scheduler, control signal and both collaborators must outlive the session.
class MonitoringSession {
public:
  MonitoringSession(runtime::IScheduler& scheduler, runtime::ControlSignal& control,
                    backends::IFrameSource& frame_source,
                    backends::IAnalysisBackend& analysis_backend, MonitoringConfig config = {},
                    Diagnostics diagnostics = {});
  ~MonitoringSession();

  MonitoringSession(const MonitoringSession&) = delete;
  MonitoringSession& operator=(const MonitoringSession&) = delete;

  // Returns true when the session is active afterwards. Requires the control
  // signal to be active; otherwise records a descriptive error and creates
  // nothing. Calling Start() on an active session changes nothing.
  bool Start(std::string& error);

  // Cancels every timer and outstanding request, stops playback and
  // discards the buffer. Idempotent.
  void Stop();

  bool active() const {
    return active_ != nullptr;
  }
  const std::string& session_id() const {
    return session_id_;
  }
  const MonitoringConfig& config() const {
    return config_;
  }

  // Session error when one is set, otherwise the last ingestion error.
  const std::string& error() const;

  MonitoringState Snapshot() const;
  TrendSummary Trends() const;

  PlaybackController& playback() {
    return playback_;
  }
  SubtitleOverlayService& subtitles() {
    return subtitles_;
  }
  const FrameBuffer& buffer() const {
    return buffer_;
  }
  const FrameIngestionScheduler& ingestion() const {
    return ingestion_;
  }

private:
  struct ActiveResources {
    runtime::CancellationSource cancellation;
    runtime::ScopedTimer ingestion_timer;
  };

  void OnControlChanged(bool control_active);
  void TearDown(const std::string& reason);
  std::string NextSessionId();

  runtime::IScheduler& scheduler_;
  runtime::ControlSignal& control_;
  MonitoringConfig config_;
  Diagnostics diagnostics_;

  FrameBuffer buffer_;
  PlaybackController playback_;
  FrameIngestionScheduler ingestion_;
  SubtitleOverlayService subtitles_;

  std::string error_;
  std::string session_id_;
  std::uint64_t sessions_started_ = 0U;

  std::unique_ptr<ActiveResources> active_;
  runtime::ControlSignal::Subscription control_subscription_;
};

} // namespace framewatch::monitoring
