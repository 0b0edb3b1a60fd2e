#include "backends/testing/scripted_backends.hpp"
#include "common/assertions.hpp"
#include "common/json_fixtures.hpp"
#include "monitoring/frame_buffer.hpp"
#include "monitoring/playback_controller.hpp"
#include "monitoring/subtitle_overlay_service.hpp"
#include "runtime/manual_scheduler.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

using framewatch::backends::SubtitleDetectorKind;
using framewatch::backends::testing::ScriptedAnalysisBackend;
using framewatch::monitoring::AnalysisStatus;
using framewatch::monitoring::Frame;
using framewatch::monitoring::FrameBuffer;
using framewatch::monitoring::PlaybackController;
using framewatch::monitoring::SubtitleOverlayService;
using framewatch::runtime::CancellationSource;
using framewatch::runtime::ManualScheduler;
using framewatch::tests::common::AssertContains;
using framewatch::tests::common::AssertEq;
using framewatch::tests::common::AssertTrue;
using framewatch::tests::common::Fail;
using framewatch::tests::common::ParseJsonOrFail;
using namespace std::chrono_literals;

namespace {

constexpr const char* kDetectedPayload = R"({
  "subtitles_detected": true,
  "combined_extracted_text": "Hello world from the stream",
  "detected_language": "en",
  "results": [{"confidence": 0.82, "extracted_text": "Hello", "detected_language": "en"}]
})";

struct Fixture {
  ManualScheduler scheduler;
  ScriptedAnalysisBackend backend;
  FrameBuffer buffer{180U};
  PlaybackController playback{scheduler, buffer, 1000ms};
  SubtitleOverlayService subtitles{scheduler, backend, buffer, playback};
  CancellationSource cancellation;

  explicit Fixture(const std::uint64_t first = 1U, const std::uint64_t last = 50U) {
    std::vector<Frame> frames;
    for (std::uint64_t n = first; n <= last; ++n) {
      Frame frame;
      frame.frame_number = n;
      frame.image_path = "/captures/frame_" + std::to_string(n) + ".jpg";
      frame.processed = true;
      frame.analysis.status = AnalysisStatus::kIssue;
      frame.analysis.blackscreen.detected = true;
      frame.analysis.blackscreen.consecutive_frames = 3U;
      frame.analysis.freeze.detected = true;
      frame.analysis.errors.detected = true;
      frame.analysis.errors.error_type = "network";
      frames.push_back(frame);
    }
    std::string error;
    if (!buffer.Append(std::move(frames), error)) {
      Fail("append failed: " + error);
    }
    subtitles.Begin({.host = "localhost", .device_id = "device1"}, cancellation.token());
  }
};

void OverlayPausesAndMergesOnlySubtitleFields() {
  Fixture f;
  f.playback.GoToFrame(41U);
  f.playback.Play();
  AssertTrue(f.playback.playing(), "playing before the request");
  const std::vector<Frame> before(f.buffer.frames().begin(), f.buffer.frames().end());

  f.backend.QueueSubtitleResult(ParseJsonOrFail(kDetectedPayload));
  AssertTrue(f.subtitles.RequestOverlay(SubtitleDetectorKind::kStandard), "request sent");
  AssertTrue(!f.playback.playing(), "request pauses playback");
  AssertTrue(f.buffer.pinned(), "request pins the cursor");
  AssertTrue(f.subtitles.in_flight(SubtitleDetectorKind::kStandard), "in flight until drained");

  AssertEq(f.backend.subtitle_requests().size(), 1U, "one detector call");
  AssertEq(f.backend.subtitle_requests()[0].image_source_url,
           std::string("/captures/frame_42.jpg"), "image source is the frame path");
  AssertTrue(f.backend.subtitle_requests()[0].extract_text, "text extraction requested");

  (void)f.scheduler.RunPending();
  AssertTrue(!f.subtitles.in_flight(SubtitleDetectorKind::kStandard), "request completed");
  AssertTrue(f.subtitles.last_error().empty(), "no overlay error");

  for (std::size_t i = 0U; i < before.size(); ++i) {
    const Frame& now = f.buffer.frames()[i];
    if (now.frame_number != 42U) {
      AssertTrue(now == before[i], "frames other than 42 unchanged");
      continue;
    }
    AssertTrue(now.subtitle_overlay_performed, "overlay flag set");
    AssertTrue(now.analysis.subtitles.detected, "subtitles detected");
    AssertEq(now.analysis.subtitles.text, std::string("Hello world from the stream"),
             "combined text preferred");
    AssertEq(now.analysis.subtitles.truncated_text, std::string("Hello worl..."),
             "display text shortened");
    AssertEq(now.analysis.language.language, std::string("en"), "language merged");
    AssertTrue(now.analysis.subtitles.confidence == 0.82, "confidence from first result");
    AssertTrue(now.analysis.blackscreen == before[i].analysis.blackscreen, "blackscreen kept");
    AssertTrue(now.analysis.freeze == before[i].analysis.freeze, "freeze kept");
    AssertTrue(now.analysis.errors == before[i].analysis.errors, "errors kept");
    AssertTrue(now.analysis.status == AnalysisStatus::kIssue, "status kept");
  }
  AssertEq(f.buffer.Current()->frame_number, std::uint64_t{42}, "cursor stays on 42");
}

void FailureIsScopedToFrame() {
  Fixture f;
  f.playback.GoToFrame(9U);
  f.backend.QueueSubtitleFailure("detector offline");

  AssertTrue(f.subtitles.RequestOverlay(SubtitleDetectorKind::kAi), "ai request sent");
  AssertTrue(f.backend.subtitle_requests()[0].detector == SubtitleDetectorKind::kAi, "ai detector");
  (void)f.scheduler.RunPending();

  AssertEq(f.subtitles.last_error(), std::string("Subtitle detection failed: detector offline"),
           "service error");
  const Frame* frame = f.buffer.Find(10U);
  AssertTrue(frame->overlay_error.has_value(), "frame carries overlay error");
  AssertTrue(!frame->subtitle_overlay_performed, "analysis untouched on failure");

  // Retry succeeds and clears both.
  f.backend.QueueSubtitleResult(ParseJsonOrFail(R"({"subtitles_detected": false})"));
  AssertTrue(f.subtitles.RequestOverlay(SubtitleDetectorKind::kAi), "retry sent");
  (void)f.scheduler.RunPending();
  AssertTrue(f.subtitles.last_error().empty(), "error cleared on success");
  frame = f.buffer.Find(10U);
  AssertTrue(!frame->overlay_error.has_value(), "frame error cleared");
  AssertEq(frame->analysis.subtitles.truncated_text, std::string("None"), "no text");
  AssertTrue(frame->analysis.subtitles.confidence == 0.1, "undetected default confidence");
  AssertEq(frame->analysis.language.language, std::string("unknown"), "language reset");
}

void MalformedPayloadRejected() {
  Fixture f;
  f.backend.QueueSubtitleResult(ParseJsonOrFail(R"({"subtitles_detected": "yes"})"));
  AssertTrue(f.subtitles.RequestOverlay(SubtitleDetectorKind::kStandard), "request sent");
  (void)f.scheduler.RunPending();
  AssertContains(f.subtitles.last_error(), "subtitles.subtitles_detected must be a boolean");
}

void EvictedFrameReportsError() {
  Fixture f(1U, 3U);
  f.buffer.Last();
  f.backend.set_hold_subtitles(true);
  f.backend.QueueSubtitleResult(ParseJsonOrFail(kDetectedPayload));
  AssertTrue(f.subtitles.RequestOverlay(SubtitleDetectorKind::kStandard), "request for 3");

  // Ingestion keeps running: frame 3 falls out of a 180-frame window.
  std::vector<Frame> more;
  for (std::uint64_t n = 4U; n <= 190U; ++n) {
    Frame frame;
    frame.frame_number = n;
    more.push_back(frame);
  }
  std::string error;
  AssertTrue(f.buffer.Append(std::move(more), error), "append newer frames");

  AssertTrue(f.backend.CompleteNextSubtitles(), "release detection");
  (void)f.scheduler.RunPending();
  AssertEq(f.subtitles.last_error(),
           std::string("Frame 3 left the buffer before subtitle detection completed"),
           "eviction reported");
  for (const Frame& frame : f.buffer.frames()) {
    AssertTrue(!frame.subtitle_overlay_performed, "no other frame overwritten");
  }
}

void RequestsAreGuarded() {
  Fixture f;
  f.backend.set_hold_subtitles(true);
  AssertTrue(f.subtitles.RequestOverlay(SubtitleDetectorKind::kStandard), "first request");
  AssertTrue(!f.subtitles.RequestOverlay(SubtitleDetectorKind::kStandard),
             "same detector not re-requested while in flight");
  AssertTrue(f.subtitles.RequestOverlay(SubtitleDetectorKind::kAi), "other detector allowed");

  f.cancellation.Cancel();
  f.backend.QueueSubtitleResult(ParseJsonOrFail(kDetectedPayload));
  AssertTrue(f.backend.CompleteNextSubtitles(), "late result delivered");
  (void)f.scheduler.RunPending();
  AssertTrue(!f.buffer.Current()->subtitle_overlay_performed, "late result dropped");
  AssertTrue(!f.subtitles.RequestOverlay(SubtitleDetectorKind::kAi),
             "no requests after cancellation");

  ManualScheduler scheduler;
  ScriptedAnalysisBackend backend;
  FrameBuffer empty(10U);
  PlaybackController playback(scheduler, empty);
  SubtitleOverlayService subtitles(scheduler, backend, empty, playback);
  CancellationSource cancellation;
  subtitles.Begin({.host = "localhost", .device_id = "device1"}, cancellation.token());
  AssertTrue(!subtitles.RequestOverlay(SubtitleDetectorKind::kStandard), "empty buffer");
  AssertTrue(backend.subtitle_requests().empty(), "nothing sent for empty buffer");
}

} // namespace

int main() {
  OverlayPausesAndMergesOnlySubtitleFields();
  FailureIsScopedToFrame();
  MalformedPayloadRejected();
  EvictedFrameReportsError();
  RequestsAreGuarded();
  return 0;
}
