#include "common/assertions.hpp"
#include "monitoring/frame_buffer.hpp"

#include <cstdint>
#include <string>
#include <vector>

using framewatch::monitoring::Analysis;
using framewatch::monitoring::AnalysisStatus;
using framewatch::monitoring::Frame;
using framewatch::monitoring::FrameBuffer;
using framewatch::tests::common::AssertContains;
using framewatch::tests::common::AssertEq;
using framewatch::tests::common::AssertTrue;
using framewatch::tests::common::Fail;

namespace {

std::vector<Frame> MakeFrames(const std::uint64_t first, const std::uint64_t last) {
  std::vector<Frame> frames;
  for (std::uint64_t n = first; n <= last; ++n) {
    Frame frame;
    frame.frame_number = n;
    frame.image_path = "/captures/frame_" + std::to_string(n) + ".jpg";
    frame.analysis.status = AnalysisStatus::kOk;
    frame.processed = true;
    frames.push_back(frame);
  }
  return frames;
}

void AppendOrFail(FrameBuffer& buffer, std::vector<Frame> frames) {
  std::string error;
  if (!buffer.Append(std::move(frames), error)) {
    Fail("append failed: " + error);
  }
}

void EvictsOldestAndFollowsTail() {
  FrameBuffer buffer(5U);
  AssertTrue(buffer.Current() == nullptr, "empty buffer has no current frame");

  AppendOrFail(buffer, MakeFrames(1U, 3U));
  AssertEq(buffer.current_index(), 2U, "cursor follows tail on first append");

  AppendOrFail(buffer, MakeFrames(4U, 8U));
  AssertEq(buffer.size(), 5U, "buffer capped at max_frames");
  AssertEq(buffer.frames().front().frame_number, std::uint64_t{4}, "oldest frames evicted");
  AssertEq(buffer.Current()->frame_number, std::uint64_t{8}, "cursor still on tail");
  AssertTrue(buffer.Find(3U) == nullptr, "evicted frame not findable");
  AssertTrue(buffer.Find(6U) != nullptr, "buffered frame findable");
}

void RejectsOutOfOrderBatches() {
  FrameBuffer buffer(10U);
  AppendOrFail(buffer, MakeFrames(5U, 6U));

  std::string error;
  AssertTrue(!buffer.Append(MakeFrames(6U, 7U), error), "overlapping batch rejected");
  AssertContains(error, "not newer than buffered tail 6");

  std::vector<Frame> descending = MakeFrames(7U, 8U);
  std::swap(descending[0], descending[1]);
  AssertTrue(!buffer.Append(descending, error), "descending batch rejected");
  AssertContains(error, "not strictly ascending");
  AssertEq(buffer.size(), 2U, "rejected batches leave the buffer unchanged");

  AssertTrue(buffer.Append({}, error), "empty batch accepted");
  AssertEq(buffer.size(), 2U, "empty batch appends nothing");
}

void PinnedCursorStaysAndClamps() {
  FrameBuffer buffer(4U);
  AppendOrFail(buffer, MakeFrames(1U, 4U));

  buffer.GoTo(1U);
  AssertTrue(buffer.pinned(), "manual move pins the cursor");
  AppendOrFail(buffer, MakeFrames(5U, 5U));
  AssertEq(buffer.current_index(), 1U, "pinned cursor keeps its index");
  AssertEq(buffer.Current()->frame_number, std::uint64_t{3}, "index now shows a newer frame");

  buffer.GoTo(99U);
  AssertEq(buffer.current_index(), 3U, "GoTo clamps to last index");

  buffer.Previous();
  buffer.Previous();
  buffer.Previous();
  buffer.Previous();
  AssertEq(buffer.current_index(), 0U, "Previous clamps at head");

  buffer.Last();
  AssertTrue(!buffer.pinned(), "Last releases the pin");
  AppendOrFail(buffer, MakeFrames(6U, 6U));
  AssertEq(buffer.Current()->frame_number, std::uint64_t{6}, "live-follow resumes");
}

void AdvanceDoesNotPin() {
  FrameBuffer buffer(10U);
  AppendOrFail(buffer, MakeFrames(1U, 3U));
  buffer.First();
  buffer.Unpin();

  AssertTrue(buffer.Advance(), "advance from head");
  AssertTrue(!buffer.pinned(), "advance leaves pin state alone");
  AssertTrue(buffer.Advance(), "advance to tail");
  AssertTrue(!buffer.Advance(), "advance stops at tail");
  AssertEq(buffer.current_index(), 2U, "cursor on tail");
}

void OverwritesAnalysisInPlace() {
  FrameBuffer buffer(10U);
  AppendOrFail(buffer, MakeFrames(40U, 44U));

  std::string error;
  AssertTrue(buffer.SetOverlayError(42U, "detector timed out", error), "overlay error recorded");
  AssertTrue(buffer.Find(42U)->overlay_error.has_value(), "overlay error visible");

  Analysis analysis;
  analysis.status = AnalysisStatus::kIssue;
  analysis.subtitles.detected = true;
  analysis.subtitles.text = "hello";
  AssertTrue(buffer.OverwriteAnalysis(42U, analysis, error), "overwrite buffered frame");

  const Frame* frame = buffer.Find(42U);
  AssertTrue(frame->subtitle_overlay_performed, "overlay marked performed");
  AssertTrue(!frame->overlay_error.has_value(), "overlay error cleared");
  AssertTrue(frame->analysis == analysis, "analysis replaced");
  AssertTrue(!buffer.Find(41U)->subtitle_overlay_performed, "neighbours untouched");

  AssertTrue(!buffer.OverwriteAnalysis(7U, analysis, error), "missing frame rejected");
  AssertContains(error, "frame 7 not found in buffer");

  AssertTrue(buffer.SetOverlayError(40U, "head", error), "head frame writable");
  AssertTrue(buffer.SetOverlayError(44U, "tail", error), "tail frame writable");
  AssertEq(*buffer.Find(40U)->overlay_error, std::string("head"), "head error stored");
  AssertEq(*buffer.Find(44U)->overlay_error, std::string("tail"), "tail error stored");
  AssertTrue(!buffer.SetOverlayError(45U, "past tail", error), "past tail rejected");
  AssertContains(error, "frame 45 not found in buffer");
}

void ClearResetsCursor() {
  FrameBuffer buffer(0U);
  AssertEq(buffer.max_frames(), 1U, "capacity clamped to one");
  AppendOrFail(buffer, MakeFrames(1U, 3U));
  AssertEq(buffer.size(), 1U, "single slot keeps newest");
  buffer.Pin();
  buffer.Clear();
  AssertTrue(buffer.empty() && !buffer.pinned(), "clear empties and unpins");
  AssertEq(buffer.current_index(), 0U, "cursor reset");
  buffer.Next();
  buffer.First();
  AssertTrue(!buffer.pinned(), "moves on empty buffer are no-ops");
}

} // namespace

int main() {
  EvictsOldestAndFollowsTail();
  RejectsOutOfOrderBatches();
  PinnedCursorStaysAndClamps();
  AdvanceDoesNotPin();
  OverwritesAnalysisInPlace();
  ClearResetsCursor();
  return 0;
}
