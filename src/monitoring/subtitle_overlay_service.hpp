#pragma once

#include "backends/monitoring_backend.hpp"
#include "monitoring/diagnostics.hpp"
#include "monitoring/frame_buffer.hpp"
#include "monitoring/playback_controller.hpp"
#include "runtime/scheduler.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace framewatch::monitoring {

// On-demand subtitle detection for the frame under the cursor.
//
// A request pauses playback and pins the cursor, then merges the detector's
// answer into that frame's analysis. Only the subtitle and language fields
// change. Failures never touch the rest of the state: they are recorded on
// the frame (`overlay_error`) and in `last_error()`.
class SubtitleOverlayService {
public:
  SubtitleOverlayService(runtime::IScheduler& scheduler,
                         backends::IAnalysisBackend& analysis_backend, FrameBuffer& buffer,
                         PlaybackController& playback, Diagnostics diagnostics = {});

  SubtitleOverlayService(const SubtitleOverlayService&) = delete;
  SubtitleOverlayService& operator=(const SubtitleOverlayService&) = delete;

  void Begin(backends::DeviceTarget target, runtime::CancellationToken token);
  void End();

  // Returns true when a request was sent. Nothing is sent without an active
  // session, with an empty buffer, or while the same detector is in flight.
  bool RequestOverlay(backends::SubtitleDetectorKind detector);

  bool in_flight(backends::SubtitleDetectorKind detector) const;
  const std::string& last_error() const {
    return last_error_;
  }

private:
  void OnDetected(backends::SubtitleDetectorKind detector, std::uint64_t frame_number,
                  backends::DetectSubtitlesResult result);
  void RecordFailure(backends::SubtitleDetectorKind detector, std::uint64_t frame_number,
                     std::string message);

  runtime::IScheduler& scheduler_;
  backends::IAnalysisBackend& analysis_backend_;
  FrameBuffer& buffer_;
  PlaybackController& playback_;
  Diagnostics diagnostics_;

  backends::DeviceTarget target_;
  runtime::CancellationToken token_;

  // Indexed by SubtitleDetectorKind.
  std::array<bool, 2> in_flight_{};
  std::string last_error_;
};

} // namespace framewatch::monitoring
