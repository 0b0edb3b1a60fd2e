#include "monitoring/monitoring_session.hpp"

#include <chrono>
#include <utility>

namespace framewatch::monitoring {

namespace {

using core::logging::LogLevel;

constexpr char kControlInactiveError[] =
    "Cannot start monitoring: device control is not active. Take control of the device first.";
constexpr char kControlLostError[] = "Device control lost; monitoring stopped";

std::uint64_t ToMillis(const std::chrono::milliseconds value) {
  return value.count() > 0 ? static_cast<std::uint64_t>(value.count()) : 0U;
}

} // namespace

MonitoringSession::MonitoringSession(runtime::IScheduler& scheduler,
                                     runtime::ControlSignal& control,
                                     backends::IFrameSource& frame_source,
                                     backends::IAnalysisBackend& analysis_backend,
                                     MonitoringConfig config, Diagnostics diagnostics)
    : scheduler_(scheduler), control_(control), config_(std::move(config)),
      diagnostics_(diagnostics), buffer_(config_.max_frames),
      playback_(scheduler, buffer_, config_.playback_interval, diagnostics),
      ingestion_(scheduler, frame_source, analysis_backend, buffer_, diagnostics),
      subtitles_(scheduler, analysis_backend, buffer_, playback_, diagnostics) {
  control_subscription_ =
      control_.Subscribe([this](const bool control_active) { OnControlChanged(control_active); });
}

MonitoringSession::~MonitoringSession() {
  control_subscription_.Reset();
  if (active_ != nullptr) {
    TearDown("session destroyed");
  }
}

bool MonitoringSession::Start(std::string& error) {
  error.clear();
  if (active_ != nullptr) {
    return true;
  }

  if (!control_.active()) {
    error_ = kControlInactiveError;
    error = error_;
    diagnostics_.Log(LogLevel::kWarn, "monitoring start rejected",
                     {{"reason", "control_not_active"}});
    return false;
  }

  std::vector<ConfigIssue> issues;
  if (!ValidateMonitoringConfig(config_, issues)) {
    error_ = "Cannot start monitoring: invalid config (" + FormatConfigIssues(issues) + ")";
    error = error_;
    diagnostics_.Log(LogLevel::kError, "monitoring start rejected",
                     {{"reason", "invalid_config"}, {"error", error_}});
    return false;
  }

  error_.clear();
  buffer_.Clear();
  session_id_ = NextSessionId();
  if (diagnostics_.logger() != nullptr) {
    diagnostics_.logger()->SetSessionId(session_id_);
  }
  if (diagnostics_.emitter() != nullptr) {
    diagnostics_.emitter()->SetSessionId(session_id_);
  }

  active_ = std::make_unique<ActiveResources>();
  ingestion_.Begin(config_.target, active_->cancellation.token());
  subtitles_.Begin(config_.target, active_->cancellation.token());
  active_->ingestion_timer =
      runtime::ScopedTimer(scheduler_, config_.ingest_interval, [this]() { ingestion_.Tick(); });
  // First poll runs as soon as the scheduler is free, not one interval later.
  scheduler_.Post([this, token = active_->cancellation.token()]() {
    if (!token.IsCancelled()) {
      ingestion_.Tick();
    }
  });

  diagnostics_.Log(LogLevel::kInfo, "monitoring session started",
                   {{"host", config_.target.host},
                    {"device_id", config_.target.device_id},
                    {"max_frames", std::to_string(config_.max_frames)},
                    {"ingest_interval_ms", std::to_string(ToMillis(config_.ingest_interval))}});
  diagnostics_.Emit([&](events::Emitter& emitter, std::string& emit_error) {
    return emitter.EmitSessionStarted(
        {.ts = std::chrono::system_clock::now(),
         .host = config_.target.host,
         .device_id = config_.target.device_id,
         .max_frames = config_.max_frames,
         .ingest_interval_ms = ToMillis(config_.ingest_interval),
         .playback_interval_ms = ToMillis(config_.playback_interval)},
        emit_error);
  });
  return true;
}

void MonitoringSession::Stop() {
  if (active_ == nullptr) {
    return;
  }
  TearDown("stopped");
}

void MonitoringSession::OnControlChanged(const bool control_active) {
  if (control_active || active_ == nullptr) {
    return;
  }

  error_ = kControlLostError;
  diagnostics_.Log(LogLevel::kWarn, "device control lost, stopping monitoring",
                   {{"last_processed_frame", std::to_string(ingestion_.last_processed_frame())}});
  diagnostics_.Emit([&](events::Emitter& emitter, std::string& emit_error) {
    return emitter.EmitControlLost({.ts = std::chrono::system_clock::now(),
                                    .last_processed_frame = ingestion_.last_processed_frame()},
                                   emit_error);
  });
  TearDown("control_lost");
}

void MonitoringSession::TearDown(const std::string& reason) {
  const std::size_t frames_buffered = buffer_.size();
  const std::uint64_t skipped_ticks = ingestion_.stats().skipped_ticks;

  // Cancelling first makes every completion still queued on the scheduler a
  // no-op; releasing the resources cancels the ingestion timer.
  active_->cancellation.Cancel();
  active_.reset();

  playback_.Pause();
  ingestion_.End();
  subtitles_.End();
  buffer_.Clear();

  diagnostics_.Log(LogLevel::kInfo, "monitoring session stopped",
                   {{"reason", reason},
                    {"frames_buffered", std::to_string(frames_buffered)},
                    {"last_processed_frame", std::to_string(ingestion_.last_processed_frame())}});
  diagnostics_.Emit([&](events::Emitter& emitter, std::string& emit_error) {
    return emitter.EmitSessionStopped({.ts = std::chrono::system_clock::now(),
                                       .reason = reason,
                                       .frames_buffered = frames_buffered,
                                       .last_processed_frame = ingestion_.last_processed_frame(),
                                       .skipped_ticks = skipped_ticks},
                                      emit_error);
  });
}

std::string MonitoringSession::NextSessionId() {
  ++sessions_started_;
  const auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
  return "monitor-" + std::to_string(epoch_ms) + "-" + std::to_string(sessions_started_);
}

const std::string& MonitoringSession::error() const {
  if (!error_.empty()) {
    return error_;
  }
  return ingestion_.last_error();
}

MonitoringState MonitoringSession::Snapshot() const {
  MonitoringState state;
  state.is_active = active();
  state.is_processing = active() && ingestion_.in_flight();
  state.is_playing = playback_.playing();
  state.frames.assign(buffer_.frames().begin(), buffer_.frames().end());
  state.current_frame_index = buffer_.current_index();
  state.total_frames = buffer_.size();
  state.max_frames = buffer_.max_frames();
  state.error = error();
  state.last_processed_frame = ingestion_.last_processed_frame();
  state.overlay_error = subtitles_.last_error();
  return state;
}

TrendSummary MonitoringSession::Trends() const {
  return ComputeTrends(buffer_.frames());
}

} // namespace framewatch::monitoring
