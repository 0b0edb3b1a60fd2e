#pragma once

#include "monitoring/diagnostics.hpp"
#include "monitoring/frame_buffer.hpp"
#include "runtime/scheduler.hpp"

#include <chrono>
#include <cstddef>

namespace framewatch::monitoring {

// Periodic cursor advance over the buffered frames, independent of
// ingestion. Reaching the newest frame stops playback; there is no
// wraparound. Manual navigation works in either state and clamps.
class PlaybackController {
public:
  static constexpr std::chrono::milliseconds kDefaultInterval{1000};

  PlaybackController(runtime::IScheduler& scheduler, FrameBuffer& buffer,
                     std::chrono::milliseconds interval = kDefaultInterval,
                     Diagnostics diagnostics = {});

  PlaybackController(const PlaybackController&) = delete;
  PlaybackController& operator=(const PlaybackController&) = delete;

  // No-op when the buffer is empty or playback is already running.
  void Play();
  void Pause();
  void TogglePlayback();

  // One playback step. Advances the cursor or, when it already sits on the
  // newest frame, stops playback instead.
  void Tick();

  void GoToFrame(std::size_t index);
  void NextFrame();
  void PreviousFrame();
  void GoToFirst();
  void GoToLast();

  bool playing() const {
    return playing_;
  }
  std::chrono::milliseconds interval() const {
    return interval_;
  }

private:
  runtime::IScheduler& scheduler_;
  FrameBuffer& buffer_;
  std::chrono::milliseconds interval_;
  Diagnostics diagnostics_;

  bool playing_ = false;
  runtime::ScopedTimer timer_;
};

} // namespace framewatch::monitoring
