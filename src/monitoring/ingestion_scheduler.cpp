#include "monitoring/ingestion_scheduler.hpp"

#include "monitoring/analysis_payload.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

namespace framewatch::monitoring {

namespace {

using core::logging::LogLevel;

std::chrono::system_clock::time_point FromEpochSeconds(const std::int64_t seconds) {
  return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

} // namespace

FrameIngestionScheduler::FrameIngestionScheduler(runtime::IScheduler& scheduler,
                                                 backends::IFrameSource& frame_source,
                                                 backends::IAnalysisBackend& analysis_backend,
                                                 FrameBuffer& buffer, Diagnostics diagnostics)
    : scheduler_(scheduler), frame_source_(frame_source), analysis_backend_(analysis_backend),
      buffer_(buffer), diagnostics_(diagnostics) {}

void FrameIngestionScheduler::Begin(backends::DeviceTarget target,
                                    runtime::CancellationToken token) {
  End();
  target_ = std::move(target);
  token_ = std::move(token);
  last_processed_frame_ = 0U;
  last_error_.clear();
  stats_ = Stats{};
}

void FrameIngestionScheduler::End() {
  in_flight_ = false;
  pending_.clear();
  next_pending_ = 0U;
  analyzed_.clear();
  round_failures_ = 0U;
  round_first_error_.clear();
}

void FrameIngestionScheduler::Tick() {
  if (token_.IsCancelled()) {
    return;
  }
  if (in_flight_) {
    ++stats_.skipped_ticks;
    diagnostics_.Log(LogLevel::kDebug, "ingestion tick skipped, previous round outstanding",
                     {{"skipped_ticks", std::to_string(stats_.skipped_ticks)}});
    return;
  }

  in_flight_ = true;
  ++stats_.ticks;

  runtime::IScheduler* scheduler = &scheduler_;
  const runtime::CancellationToken token = token_;
  frame_source_.FetchNewFrames(
      {.target = target_, .since_frame_number = last_processed_frame_},
      [this, scheduler, token](backends::FetchFramesResult result) {
        scheduler->Post([this, token, result = std::move(result)]() mutable {
          if (token.IsCancelled()) {
            return;
          }
          OnFetched(std::move(result));
        });
      });
}

void FrameIngestionScheduler::OnFetched(backends::FetchFramesResult result) {
  if (!result.success) {
    last_error_ = "Failed to fetch frames: " +
                  (result.error.empty() ? std::string("unknown error") : result.error);
    diagnostics_.Log(LogLevel::kWarn, "frame fetch failed",
                     {{"since_frame", std::to_string(last_processed_frame_)},
                      {"error", result.error}});
    diagnostics_.Emit([&](events::Emitter& emitter, std::string& error) {
      return emitter.EmitFrameFetchFailed({.ts = std::chrono::system_clock::now(),
                                           .since_frame = last_processed_frame_,
                                           .error = result.error},
                                          error);
    });
    End();
    return;
  }

  std::vector<backends::CapturedFrameRef> frames = std::move(result.frames);
  std::sort(frames.begin(), frames.end(),
            [](const backends::CapturedFrameRef& lhs, const backends::CapturedFrameRef& rhs) {
              return lhs.frame_number < rhs.frame_number;
            });

  // Anything at or below the low-water mark was already handled (or already
  // failed) in an earlier round; repeated numbers keep their first entry.
  const std::uint64_t low_water_mark = last_processed_frame_;
  frames.erase(std::remove_if(frames.begin(), frames.end(),
                              [low_water_mark](const backends::CapturedFrameRef& frame) {
                                return frame.frame_number <= low_water_mark;
                              }),
               frames.end());
  frames.erase(std::unique(frames.begin(), frames.end(),
                           [](const backends::CapturedFrameRef& lhs,
                              const backends::CapturedFrameRef& rhs) {
                             return lhs.frame_number == rhs.frame_number;
                           }),
               frames.end());

  // Nothing new: the previous round's outcome, error included, stands.
  if (frames.empty()) {
    End();
    return;
  }

  pending_ = std::move(frames);
  next_pending_ = 0U;
  analyzed_.clear();
  analyzed_.reserve(pending_.size());
  round_failures_ = 0U;
  round_first_error_.clear();
  AnalyzeNext();
}

void FrameIngestionScheduler::AnalyzeNext() {
  if (next_pending_ >= pending_.size()) {
    FinishRound();
    return;
  }

  const backends::CapturedFrameRef& frame = pending_[next_pending_];
  runtime::IScheduler* scheduler = &scheduler_;
  const runtime::CancellationToken token = token_;
  analysis_backend_.AnalyzeFrame(
      {.target = target_, .frame_path = frame.path, .frame_number = frame.frame_number},
      [this, scheduler, token](backends::AnalyzeFrameResult result) {
        scheduler->Post([this, token, result = std::move(result)]() mutable {
          if (token.IsCancelled()) {
            return;
          }
          OnAnalyzed(std::move(result));
        });
      });
}

void FrameIngestionScheduler::OnAnalyzed(backends::AnalyzeFrameResult result) {
  if (!in_flight_ || next_pending_ >= pending_.size()) {
    return;
  }
  const backends::CapturedFrameRef& ref = pending_[next_pending_];

  if (!result.success) {
    RecordFrameFailure(ref.frame_number,
                       result.error.empty() ? std::string("analysis failed") : result.error);
  } else {
    Analysis analysis;
    std::string decode_error;
    if (!DecodeAnalysis(result.analysis, analysis, decode_error)) {
      RecordFrameFailure(ref.frame_number, "malformed analysis payload: " + decode_error);
    } else {
      Frame frame;
      frame.frame_number = ref.frame_number;
      frame.timestamp = FromEpochSeconds(ref.timestamp);
      frame.image_path = ref.path;
      frame.analysis = std::move(analysis);
      frame.processed = true;
      analyzed_.push_back(std::move(frame));
    }
  }

  ++next_pending_;
  AnalyzeNext();
}

void FrameIngestionScheduler::RecordFrameFailure(const std::uint64_t frame_number,
                                                 const std::string& error) {
  ++round_failures_;
  ++stats_.frames_failed;
  if (round_first_error_.empty()) {
    round_first_error_ = error;
  }
  diagnostics_.Log(LogLevel::kWarn, "frame analysis failed",
                   {{"frame_number", std::to_string(frame_number)}, {"error", error}});
  diagnostics_.Emit([&](events::Emitter& emitter, std::string& emit_error) {
    return emitter.EmitFrameAnalysisFailed(
        {.ts = std::chrono::system_clock::now(), .frame_number = frame_number, .error = error},
        emit_error);
  });
}

void FrameIngestionScheduler::FinishRound() {
  const std::uint64_t batch_max = pending_.back().frame_number;
  const std::size_t appended = analyzed_.size();
  const std::uint64_t first_appended = appended > 0U ? analyzed_.front().frame_number : 0U;
  const std::uint64_t last_appended = appended > 0U ? analyzed_.back().frame_number : 0U;

  std::string append_error;
  const bool append_ok = buffer_.Append(std::move(analyzed_), append_error);

  // Failed frames are not retried: the mark moves past the whole batch.
  last_processed_frame_ = std::max(last_processed_frame_, batch_max);

  if (!append_ok) {
    last_error_ = "Failed to store analyzed frames: " + append_error;
    diagnostics_.Log(LogLevel::kError, "frame batch rejected by buffer",
                     {{"error", append_error}});
  } else if (round_failures_ > 0U) {
    last_error_ = "Failed to analyze " + std::to_string(round_failures_) +
                  " frame(s): " + round_first_error_;
  } else {
    last_error_.clear();
  }

  if (append_ok) {
    stats_.frames_appended += appended;
  }
  diagnostics_.Log(LogLevel::kDebug, "ingestion round complete",
                   {{"appended", std::to_string(append_ok ? appended : 0U)},
                    {"failed", std::to_string(round_failures_)},
                    {"last_processed_frame", std::to_string(last_processed_frame_)},
                    {"total_frames", std::to_string(buffer_.size())}});
  diagnostics_.Emit([&](events::Emitter& emitter, std::string& error) {
    return emitter.EmitFramesIngested({.ts = std::chrono::system_clock::now(),
                                       .appended = append_ok ? appended : 0U,
                                       .failed = round_failures_,
                                       .first_frame = first_appended,
                                       .last_frame = last_appended,
                                       .total_frames = buffer_.size()},
                                      error);
  });

  End();
}

} // namespace framewatch::monitoring
