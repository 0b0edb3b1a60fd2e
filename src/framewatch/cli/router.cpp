#include "framewatch/cli/router.hpp"

#include "backends/capture_dir/capture_dir_frame_source.hpp"
#include "backends/capture_dir/sidecar_analysis_backend.hpp"
#include "core/errors/exit_codes.hpp"
#include "events/emitter.hpp"
#include "monitoring/config.hpp"
#include "monitoring/diagnostics.hpp"
#include "monitoring/monitoring_session.hpp"
#include "monitoring/state_writer.hpp"
#include "runtime/control_signal.hpp"
#include "runtime/event_loop.hpp"
#include "runtime/scheduler.hpp"

#include <charconv>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace framewatch::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitControlNotActive =
    core::errors::ToInt(core::errors::ExitCode::kControlNotActive);
constexpr int kExitControlLost = core::errors::ToInt(core::errors::ExitCode::kControlLost);

constexpr std::chrono::milliseconds kWatchInterval{100};
constexpr std::chrono::hours kRunSlice{1};

volatile std::sig_atomic_t g_interrupt_requested = 0;

extern "C" void HandleInterruptSignal(int /*signal*/) {
  g_interrupt_requested = 1;
}

// Installs the SIGINT handler for the lifetime of one monitor run and puts
// the previous handler back afterwards.
class ScopedInterruptHandler {
public:
  ScopedInterruptHandler() {
    g_interrupt_requested = 0;
    previous_ = std::signal(SIGINT, HandleInterruptSignal);
  }
  ~ScopedInterruptHandler() {
    if (previous_ != SIG_ERR) {
      std::signal(SIGINT, previous_);
    }
  }

  ScopedInterruptHandler(const ScopedInterruptHandler&) = delete;
  ScopedInterruptHandler& operator=(const ScopedInterruptHandler&) = delete;

private:
  using Handler = void (*)(int);
  Handler previous_ = SIG_ERR;
};

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  framewatch monitor --captures <dir> [--config <config.json>] [--host <host>] "
         "[--device <id>] [--max-frames <n>] [--ingest-interval-ms <ms>] "
         "[--playback-interval-ms <ms>] [--duration-ms <ms>] [--out <dir>] "
         "[--control-file <path>] [--log-level <debug|info|warn|error>]\n"
      << "  framewatch validate-config <config.json>\n"
      << "  framewatch version\n";
}

bool ParseUnsigned(std::string_view flag, std::string_view raw, std::uint64_t& value,
                   std::string& error) {
  const char* begin = raw.data();
  const char* end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (raw.empty() || ec != std::errc() || ptr != end) {
    error = "invalid value for " + std::string(flag) + ": '" + std::string(raw) +
            "' (expected a non-negative integer)";
    return false;
  }
  return true;
}

bool ParseMilliseconds(std::string_view flag, std::string_view raw,
                       std::chrono::milliseconds& value, std::string& error) {
  std::uint64_t parsed = 0U;
  if (!ParseUnsigned(flag, raw, parsed, error)) {
    return false;
  }
  if (parsed > static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max())) {
    error = "value for " + std::string(flag) + " is too large";
    return false;
  }
  value = std::chrono::milliseconds(static_cast<std::int64_t>(parsed));
  return true;
}

bool ParseMonitorOptions(const std::vector<std::string_view>& args, MonitorOptions& options,
                         std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token.empty() || token.front() != '-') {
      error = "unexpected argument: " + std::string(token);
      return false;
    }
    if (i + 1 >= args.size()) {
      error = "missing value for " + std::string(token);
      return false;
    }
    const std::string_view value = args[i + 1];
    ++i;

    if (token == "--captures") {
      options.captures_dir = fs::path(value);
    } else if (token == "--config") {
      options.config_path = fs::path(value);
    } else if (token == "--host") {
      options.host = std::string(value);
    } else if (token == "--device") {
      options.device_id = std::string(value);
    } else if (token == "--max-frames") {
      std::uint64_t parsed = 0U;
      if (!ParseUnsigned(token, value, parsed, error)) {
        return false;
      }
      options.max_frames = static_cast<std::size_t>(parsed);
    } else if (token == "--ingest-interval-ms") {
      std::chrono::milliseconds parsed{0};
      if (!ParseMilliseconds(token, value, parsed, error)) {
        return false;
      }
      options.ingest_interval = parsed;
    } else if (token == "--playback-interval-ms") {
      std::chrono::milliseconds parsed{0};
      if (!ParseMilliseconds(token, value, parsed, error)) {
        return false;
      }
      options.playback_interval = parsed;
    } else if (token == "--duration-ms") {
      if (!ParseMilliseconds(token, value, options.duration, error)) {
        return false;
      }
    } else if (token == "--out") {
      options.output_dir = fs::path(value);
    } else if (token == "--control-file") {
      options.control_file = fs::path(value);
    } else if (token == "--log-level") {
      if (!core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
    } else {
      error = "unknown option: " + std::string(token);
      return false;
    }
  }

  if (options.captures_dir.empty()) {
    error = "monitor requires --captures <dir>";
    return false;
  }
  if (options.output_dir.empty()) {
    error = "--out cannot be empty";
    return false;
  }
  return true;
}

void PrintConfigIssues(const std::string& source, const std::vector<monitoring::ConfigIssue>& issues) {
  std::cerr << "invalid config: " << source << '\n';
  for (const monitoring::ConfigIssue& issue : issues) {
    std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
  }
}

// Config file first, then CLI flags on top, then one validation pass over
// the merged result.
int ResolveConfig(const MonitorOptions& options, monitoring::MonitoringConfig& config) {
  std::vector<monitoring::ConfigIssue> issues;
  if (options.config_path.has_value()) {
    std::string error;
    if (!monitoring::LoadMonitoringConfigFile(options.config_path.value(), config, issues,
                                              error)) {
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
    if (!issues.empty()) {
      PrintConfigIssues(options.config_path->string(), issues);
      return kExitConfigInvalid;
    }
  }

  if (options.host.has_value()) {
    config.target.host = options.host.value();
  }
  if (options.device_id.has_value()) {
    config.target.device_id = options.device_id.value();
  }
  if (options.max_frames.has_value()) {
    config.max_frames = options.max_frames.value();
  }
  if (options.ingest_interval.has_value()) {
    config.ingest_interval = options.ingest_interval.value();
  }
  if (options.playback_interval.has_value()) {
    config.playback_interval = options.playback_interval.value();
  }

  if (!monitoring::ValidateMonitoringConfig(config, issues)) {
    PrintConfigIssues("command line", issues);
    return kExitConfigInvalid;
  }
  return kExitSuccess;
}

bool ControlFileHeld(const std::optional<fs::path>& control_file) {
  if (!control_file.has_value()) {
    return true;
  }
  std::error_code ec;
  return fs::exists(control_file.value(), ec) && !ec;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  std::cout << "framewatch 0.1.0\n";
  return kExitSuccess;
}

int CommandValidateConfig(const std::vector<std::string_view>& args) {
  if (args.size() != 1U) {
    std::cerr << "error: validate-config requires exactly 1 argument: <config.json>\n";
    return kExitUsage;
  }

  const fs::path config_path(args.front());
  monitoring::MonitoringConfig config;
  std::vector<monitoring::ConfigIssue> issues;
  std::string error;
  if (!monitoring::LoadMonitoringConfigFile(config_path, config, issues, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  if (!issues.empty()) {
    PrintConfigIssues(config_path.string(), issues);
    return kExitConfigInvalid;
  }

  std::cout << "valid: " << config_path.string() << '\n';
  return kExitSuccess;
}

int CommandMonitor(const std::vector<std::string_view>& args) {
  MonitorOptions options;
  std::string error;
  if (!ParseMonitorOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  return ExecuteMonitor(options);
}

} // namespace

int ExecuteMonitor(const MonitorOptions& options) {
  monitoring::MonitoringConfig config;
  const int config_status = ResolveConfig(options, config);
  if (config_status != kExitSuccess) {
    return config_status;
  }

  core::logging::Logger logger(options.log_level);
  events::Emitter emitter(options.output_dir);
  const monitoring::Diagnostics diagnostics(&logger, &emitter);

  runtime::EventLoop loop;
  runtime::ControlSignal control(ControlFileHeld(options.control_file));
  backends::capture_dir::CaptureDirFrameSource frame_source(options.captures_dir,
                                                            config.max_frames_per_fetch);
  backends::capture_dir::SidecarAnalysisBackend analysis_backend;

  monitoring::MonitoringSession session(loop, control, frame_source, analysis_backend, config,
                                        diagnostics);

  std::string error;
  if (!session.Start(error)) {
    std::cerr << "error: " << error << '\n';
    return control.active() ? kExitFailure : kExitControlNotActive;
  }

  logger.Info("monitoring capture directory",
              {{"captures", options.captures_dir.string()},
               {"out", options.output_dir.string()},
               {"duration_ms", std::to_string(options.duration.count())}});

  ScopedInterruptHandler interrupt_handler;
  std::optional<std::string> stop_reason;
  runtime::ScopedTimer watcher(loop, kWatchInterval, [&]() {
    if (stop_reason.has_value()) {
      return;
    }
    if (g_interrupt_requested != 0) {
      stop_reason = "interrupted";
    } else if (!ControlFileHeld(options.control_file)) {
      control.Set(false);
      stop_reason = "control_lost";
    } else if (!session.active()) {
      stop_reason = "session_inactive";
    }
    if (stop_reason.has_value()) {
      loop.RequestStop();
    }
  });

  const bool bounded = options.duration > std::chrono::milliseconds::zero();
  const auto deadline = std::chrono::steady_clock::now() + options.duration;
  while (!stop_reason.has_value()) {
    auto slice_end = std::chrono::steady_clock::now() + kRunSlice;
    if (bounded && deadline < slice_end) {
      slice_end = deadline;
    }
    loop.RunUntil(slice_end);
    if (bounded && std::chrono::steady_clock::now() >= deadline && !stop_reason.has_value()) {
      stop_reason = "duration_elapsed";
    }
  }
  watcher.Reset();

  const bool control_lost = !control.active();
  const monitoring::MonitoringState state = session.Snapshot();
  fs::path state_path;
  const bool state_written = monitoring::WriteMonitoringStateJson(
      state, session.Trends(), session.session_id(), options.output_dir, state_path, error);
  if (!state_written) {
    logger.Error("failed to write monitoring state", {{"error", error}});
  }

  session.Stop();

  std::cout << "session: " << session.session_id() << '\n'
            << "stop_reason: " << stop_reason.value() << '\n'
            << "frames_buffered: " << state.total_frames << '\n'
            << "last_processed_frame: " << state.last_processed_frame << '\n';
  if (state_written) {
    std::cout << "state: " << state_path.string() << '\n';
  }
  if (!emitter.events_path().empty()) {
    std::cout << "events: " << emitter.events_path().string() << '\n';
  }
  if (!state.error.empty()) {
    std::cout << "last_error: " << state.error << '\n';
  }

  if (control_lost) {
    std::cerr << "error: device control lost during monitoring\n";
    return kExitControlLost;
  }
  return state_written ? kExitSuccess : kExitFailure;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "monitor") {
    return CommandMonitor(args);
  }
  if (command == "validate-config") {
    return CommandValidateConfig(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace framewatch::cli
