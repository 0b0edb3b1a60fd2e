#include "monitoring/frame_buffer.hpp"

#include <algorithm>
#include <utility>

namespace framewatch::monitoring {

FrameBuffer::FrameBuffer(const std::size_t max_frames)
    : max_frames_(std::max<std::size_t>(max_frames, 1U)) {}

bool FrameBuffer::Append(std::vector<Frame> batch, std::string& error) {
  error.clear();
  if (batch.empty()) {
    return true;
  }

  for (std::size_t i = 1U; i < batch.size(); ++i) {
    if (batch[i].frame_number <= batch[i - 1U].frame_number) {
      error = "frame batch is not strictly ascending at frame " +
              std::to_string(batch[i].frame_number);
      return false;
    }
  }
  if (!frames_.empty() && batch.front().frame_number <= frames_.back().frame_number) {
    error = "frame " + std::to_string(batch.front().frame_number) +
            " is not newer than buffered tail " + std::to_string(frames_.back().frame_number);
    return false;
  }

  const bool follow_tail = !pinned_ && AtTail();

  for (Frame& frame : batch) {
    frames_.push_back(std::move(frame));
  }

  while (frames_.size() > max_frames_) {
    frames_.pop_front();
  }

  if (follow_tail) {
    current_index_ = frames_.size() - 1U;
    return true;
  }

  // Eviction shifts every surviving frame left; the cursor keeps its index
  // rather than its frame.
  ClampCursor();
  return true;
}

bool FrameBuffer::OverwriteAnalysis(const std::uint64_t frame_number, const Analysis& analysis,
                                    std::string& error) {
  error.clear();
  Frame* frame = FindMutable(frame_number);
  if (frame == nullptr) {
    error = "frame " + std::to_string(frame_number) + " not found in buffer";
    return false;
  }
  frame->analysis = analysis;
  frame->subtitle_overlay_performed = true;
  frame->overlay_error.reset();
  return true;
}

bool FrameBuffer::SetOverlayError(const std::uint64_t frame_number, std::string message,
                                  std::string& error) {
  error.clear();
  Frame* frame = FindMutable(frame_number);
  if (frame == nullptr) {
    error = "frame " + std::to_string(frame_number) + " not found in buffer";
    return false;
  }
  frame->overlay_error = std::move(message);
  return true;
}

const Frame* FrameBuffer::Current() const {
  if (frames_.empty()) {
    return nullptr;
  }
  return &frames_[current_index_];
}

const Frame* FrameBuffer::Find(const std::uint64_t frame_number) const {
  const auto it = std::lower_bound(
      frames_.begin(), frames_.end(), frame_number,
      [](const Frame& frame, const std::uint64_t number) { return frame.frame_number < number; });
  if (it == frames_.end() || it->frame_number != frame_number) {
    return nullptr;
  }
  return &(*it);
}

Frame* FrameBuffer::FindMutable(const std::uint64_t frame_number) {
  const auto it = std::lower_bound(
      frames_.begin(), frames_.end(), frame_number,
      [](const Frame& frame, const std::uint64_t number) { return frame.frame_number < number; });
  if (it == frames_.end() || it->frame_number != frame_number) {
    return nullptr;
  }
  return &(*it);
}

void FrameBuffer::GoTo(const std::size_t index) {
  if (frames_.empty()) {
    return;
  }
  current_index_ = std::min(index, frames_.size() - 1U);
  pinned_ = true;
}

void FrameBuffer::Next() {
  if (frames_.empty()) {
    return;
  }
  GoTo(current_index_ + 1U);
}

void FrameBuffer::Previous() {
  if (frames_.empty()) {
    return;
  }
  GoTo(current_index_ == 0U ? 0U : current_index_ - 1U);
}

void FrameBuffer::First() {
  GoTo(0U);
}

void FrameBuffer::Last() {
  if (frames_.empty()) {
    return;
  }
  current_index_ = frames_.size() - 1U;
  pinned_ = false;
}

bool FrameBuffer::Advance() {
  if (frames_.empty() || AtTail()) {
    return false;
  }
  ++current_index_;
  return true;
}

void FrameBuffer::Pin() {
  pinned_ = true;
}

void FrameBuffer::Unpin() {
  pinned_ = false;
}

void FrameBuffer::Clear() {
  frames_.clear();
  current_index_ = 0U;
  pinned_ = false;
}

bool FrameBuffer::AtTail() const {
  return frames_.empty() || current_index_ + 1U >= frames_.size();
}

void FrameBuffer::ClampCursor() {
  if (frames_.empty()) {
    current_index_ = 0U;
    return;
  }
  current_index_ = std::min(current_index_, frames_.size() - 1U);
}

} // namespace framewatch::monitoring
