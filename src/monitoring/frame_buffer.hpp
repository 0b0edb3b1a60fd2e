#pragma once

#include "monitoring/frame_model.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace framewatch::monitoring {

// Bounded, ordered window of analyzed frames plus the playback cursor.
//
// Invariants held after every public call:
// - frame numbers strictly ascending, no duplicates
// - size() <= max_frames(), oldest frames evicted first
// - current_index() < size() when non-empty, 0 when empty
class FrameBuffer {
public:
  explicit FrameBuffer(std::size_t max_frames = kDefaultMaxFrames);

  // Appends an ascending batch whose first frame is newer than the current
  // tail, then evicts from the head down to max_frames(). Returns false and
  // leaves the buffer untouched when the batch breaks ordering.
  //
  // Cursor policy: when the cursor sat on the previous tail (or the buffer
  // was empty) and is not pinned, it follows to the new tail. Otherwise it
  // keeps its index, clamped into range.
  bool Append(std::vector<Frame> batch, std::string& error);

  // Replaces the analysis of one buffered frame in place. Marks the overlay
  // as performed and clears any previous overlay error. Returns false with
  // `error` set when the frame is no longer buffered.
  bool OverwriteAnalysis(std::uint64_t frame_number, const Analysis& analysis,
                         std::string& error);

  // Records an overlay failure on one buffered frame.
  bool SetOverlayError(std::uint64_t frame_number, std::string message, std::string& error);

  const Frame* Current() const;
  const Frame* Find(std::uint64_t frame_number) const;

  // Cursor movement. All operations clamp into range and are no-ops on an
  // empty buffer. Manual moves pin the cursor; Last() releases the pin.
  void GoTo(std::size_t index);
  void Next();
  void Previous();
  void First();
  void Last();

  // Advances the cursor by one without pinning. Returns false when the
  // cursor is already on the tail.
  bool Advance();

  void Pin();
  void Unpin();

  void Clear();

  bool empty() const {
    return frames_.empty();
  }
  std::size_t size() const {
    return frames_.size();
  }
  std::size_t max_frames() const {
    return max_frames_;
  }
  std::size_t current_index() const {
    return current_index_;
  }
  bool pinned() const {
    return pinned_;
  }
  bool AtTail() const;

  const std::deque<Frame>& frames() const {
    return frames_;
  }

private:
  Frame* FindMutable(std::uint64_t frame_number);
  void ClampCursor();

  std::size_t max_frames_ = kDefaultMaxFrames;
  std::deque<Frame> frames_;
  std::size_t current_index_ = 0U;
  bool pinned_ = false;
};

} // namespace framewatch::monitoring
