#include "monitoring/subtitle_overlay_service.hpp"

#include "monitoring/analysis_payload.hpp"

#include <chrono>
#include <cstddef>
#include <utility>

namespace framewatch::monitoring {

namespace {

using core::logging::LogLevel;

std::size_t SlotFor(const backends::SubtitleDetectorKind detector) {
  return detector == backends::SubtitleDetectorKind::kAi ? 1U : 0U;
}

} // namespace

SubtitleOverlayService::SubtitleOverlayService(runtime::IScheduler& scheduler,
                                               backends::IAnalysisBackend& analysis_backend,
                                               FrameBuffer& buffer, PlaybackController& playback,
                                               Diagnostics diagnostics)
    : scheduler_(scheduler), analysis_backend_(analysis_backend), buffer_(buffer),
      playback_(playback), diagnostics_(diagnostics) {}

void SubtitleOverlayService::Begin(backends::DeviceTarget target,
                                   runtime::CancellationToken token) {
  End();
  target_ = std::move(target);
  token_ = std::move(token);
  last_error_.clear();
}

void SubtitleOverlayService::End() {
  in_flight_.fill(false);
}

bool SubtitleOverlayService::in_flight(const backends::SubtitleDetectorKind detector) const {
  return in_flight_[SlotFor(detector)];
}

bool SubtitleOverlayService::RequestOverlay(const backends::SubtitleDetectorKind detector) {
  if (token_.IsCancelled()) {
    return false;
  }
  if (in_flight_[SlotFor(detector)]) {
    diagnostics_.Log(LogLevel::kDebug, "subtitle overlay already in flight",
                     {{"detector", backends::ToString(detector)}});
    return false;
  }
  const Frame* frame = buffer_.Current();
  if (frame == nullptr) {
    return false;
  }

  playback_.Pause();
  buffer_.Pin();

  const std::uint64_t frame_number = frame->frame_number;
  in_flight_[SlotFor(detector)] = true;
  diagnostics_.Log(LogLevel::kInfo, "subtitle overlay requested",
                   {{"detector", backends::ToString(detector)},
                    {"frame_number", std::to_string(frame_number)}});

  runtime::IScheduler* scheduler = &scheduler_;
  const runtime::CancellationToken token = token_;
  analysis_backend_.DetectSubtitles(
      {.target = target_,
       .image_source_url = frame->image_path,
       .extract_text = true,
       .detector = detector},
      [this, scheduler, token, detector, frame_number](backends::DetectSubtitlesResult result) {
        scheduler->Post(
            [this, token, detector, frame_number, result = std::move(result)]() mutable {
              if (token.IsCancelled()) {
                return;
              }
              OnDetected(detector, frame_number, std::move(result));
            });
      });
  return true;
}

void SubtitleOverlayService::OnDetected(const backends::SubtitleDetectorKind detector,
                                        const std::uint64_t frame_number,
                                        backends::DetectSubtitlesResult result) {
  in_flight_[SlotFor(detector)] = false;

  if (!result.success) {
    RecordFailure(detector, frame_number,
                  "Subtitle detection failed: " +
                      (result.error.empty() ? std::string("unknown error") : result.error));
    return;
  }

  SubtitleDetection detection;
  std::string decode_error;
  if (!DecodeSubtitleDetection(result.payload, detection, decode_error)) {
    RecordFailure(detector, frame_number, "Malformed subtitle detection payload: " + decode_error);
    return;
  }

  const Frame* frame = buffer_.Find(frame_number);
  if (frame == nullptr) {
    RecordFailure(detector, frame_number,
                  "Frame " + std::to_string(frame_number) +
                      " left the buffer before subtitle detection completed");
    return;
  }

  const Analysis merged = MergeSubtitleDetection(frame->analysis, detection);
  std::string overwrite_error;
  if (!buffer_.OverwriteAnalysis(frame_number, merged, overwrite_error)) {
    RecordFailure(detector, frame_number, overwrite_error);
    return;
  }

  last_error_.clear();
  diagnostics_.Log(LogLevel::kInfo, "subtitle overlay applied",
                   {{"detector", backends::ToString(detector)},
                    {"frame_number", std::to_string(frame_number)},
                    {"detected", detection.detected ? "true" : "false"},
                    {"text", merged.subtitles.truncated_text}});
  diagnostics_.Emit([&](events::Emitter& emitter, std::string& error) {
    return emitter.EmitSubtitleOverlay(
        {.outcome = events::Emitter::SubtitleOverlayEvent::Outcome::kApplied,
         .ts = std::chrono::system_clock::now(),
         .detector = backends::ToString(detector),
         .frame_number = frame_number,
         .detected = detection.detected,
         .text = detection.text},
        error);
  });
}

void SubtitleOverlayService::RecordFailure(const backends::SubtitleDetectorKind detector,
                                           const std::uint64_t frame_number,
                                           std::string message) {
  std::string attach_error;
  if (!buffer_.SetOverlayError(frame_number, message, attach_error)) {
    diagnostics_.Log(LogLevel::kDebug, "overlay error not attached to frame",
                     {{"frame_number", std::to_string(frame_number)}, {"error", attach_error}});
  }

  diagnostics_.Log(LogLevel::kWarn, "subtitle overlay failed",
                   {{"detector", backends::ToString(detector)},
                    {"frame_number", std::to_string(frame_number)},
                    {"error", message}});
  diagnostics_.Emit([&](events::Emitter& emitter, std::string& error) {
    return emitter.EmitSubtitleOverlay(
        {.outcome = events::Emitter::SubtitleOverlayEvent::Outcome::kFailed,
         .ts = std::chrono::system_clock::now(),
         .detector = backends::ToString(detector),
         .frame_number = frame_number,
         .error = message},
        error);
  });
  last_error_ = std::move(message);
}

} // namespace framewatch::monitoring
