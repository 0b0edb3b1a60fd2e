#include "monitoring/playback_controller.hpp"

#include <string>

namespace framewatch::monitoring {

namespace {

using core::logging::LogLevel;

} // namespace

PlaybackController::PlaybackController(runtime::IScheduler& scheduler, FrameBuffer& buffer,
                                       const std::chrono::milliseconds interval,
                                       Diagnostics diagnostics)
    : scheduler_(scheduler), buffer_(buffer),
      interval_(interval > std::chrono::milliseconds::zero() ? interval : kDefaultInterval),
      diagnostics_(diagnostics) {}

void PlaybackController::Play() {
  if (playing_ || buffer_.empty()) {
    return;
  }
  playing_ = true;
  timer_ = runtime::ScopedTimer(scheduler_, interval_, [this]() { Tick(); });
  diagnostics_.Log(LogLevel::kDebug, "playback started",
                   {{"frame_index", std::to_string(buffer_.current_index())}});
}

void PlaybackController::Pause() {
  timer_.Reset();
  if (!playing_) {
    return;
  }
  playing_ = false;
  diagnostics_.Log(LogLevel::kDebug, "playback paused",
                   {{"frame_index", std::to_string(buffer_.current_index())}});
}

void PlaybackController::TogglePlayback() {
  if (playing_) {
    Pause();
  } else {
    Play();
  }
}

void PlaybackController::Tick() {
  if (!playing_) {
    return;
  }
  if (buffer_.empty()) {
    Pause();
    return;
  }
  if (buffer_.Advance()) {
    return;
  }

  // Caught up with the newest frame: hand the cursor back to live-follow.
  const Frame* current = buffer_.Current();
  const std::size_t index = buffer_.current_index();
  const std::uint64_t frame_number = current != nullptr ? current->frame_number : 0U;
  Pause();
  buffer_.Unpin();
  diagnostics_.Log(LogLevel::kInfo, "playback reached newest frame",
                   {{"frame_index", std::to_string(index)},
                    {"frame_number", std::to_string(frame_number)}});
  diagnostics_.Emit([&](events::Emitter& emitter, std::string& error) {
    return emitter.EmitPlaybackAutoPaused({.ts = std::chrono::system_clock::now(),
                                           .frame_index = index,
                                           .frame_number = frame_number},
                                          error);
  });
}

void PlaybackController::GoToFrame(const std::size_t index) {
  buffer_.GoTo(index);
}

void PlaybackController::NextFrame() {
  buffer_.Next();
}

void PlaybackController::PreviousFrame() {
  buffer_.Previous();
}

void PlaybackController::GoToFirst() {
  buffer_.First();
}

void PlaybackController::GoToLast() {
  buffer_.Last();
}

} // namespace framewatch::monitoring
