#pragma once

#include "backends/monitoring_backend.hpp"
#include "monitoring/diagnostics.hpp"
#include "monitoring/frame_buffer.hpp"
#include "runtime/scheduler.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace framewatch::monitoring {

// Polls the frame source and drives new frames through analysis into the
// buffer. One call to `Tick` is one polling round; the owning session wires
// it to a periodic timer.
//
// Rounds are serialized. A tick that arrives while the previous round is
// still waiting on the source or the backend is skipped and counted.
// Completions are re-posted onto the scheduler and dropped once the round's
// cancellation token fires.
class FrameIngestionScheduler {
public:
  struct Stats {
    std::uint64_t ticks = 0;
    std::uint64_t skipped_ticks = 0;
    std::uint64_t frames_appended = 0;
    std::uint64_t frames_failed = 0;
  };

  FrameIngestionScheduler(runtime::IScheduler& scheduler, backends::IFrameSource& frame_source,
                          backends::IAnalysisBackend& analysis_backend, FrameBuffer& buffer,
                          Diagnostics diagnostics = {});

  FrameIngestionScheduler(const FrameIngestionScheduler&) = delete;
  FrameIngestionScheduler& operator=(const FrameIngestionScheduler&) = delete;

  // Starts a fresh session context: low-water mark back to 0, no error, no
  // outstanding round.
  void Begin(backends::DeviceTarget target, runtime::CancellationToken token);

  // Drops any outstanding round without touching the low-water mark.
  void End();

  void Tick();

  bool in_flight() const {
    return in_flight_;
  }
  std::uint64_t last_processed_frame() const {
    return last_processed_frame_;
  }
  const std::string& last_error() const {
    return last_error_;
  }
  const Stats& stats() const {
    return stats_;
  }

private:
  void OnFetched(backends::FetchFramesResult result);
  void AnalyzeNext();
  void OnAnalyzed(backends::AnalyzeFrameResult result);
  void FinishRound();
  void RecordFrameFailure(std::uint64_t frame_number, const std::string& error);

  runtime::IScheduler& scheduler_;
  backends::IFrameSource& frame_source_;
  backends::IAnalysisBackend& analysis_backend_;
  FrameBuffer& buffer_;
  Diagnostics diagnostics_;

  backends::DeviceTarget target_;
  runtime::CancellationToken token_;

  std::uint64_t last_processed_frame_ = 0U;
  std::string last_error_;
  Stats stats_;

  // State of the outstanding round.
  bool in_flight_ = false;
  std::vector<backends::CapturedFrameRef> pending_;
  std::size_t next_pending_ = 0U;
  std::vector<Frame> analyzed_;
  std::size_t round_failures_ = 0U;
  std::string round_first_error_;
};

} // namespace framewatch::monitoring
