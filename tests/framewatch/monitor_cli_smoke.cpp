#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/json_fixtures.hpp"
#include "common/temp_dir.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

using framewatch::tests::common::AssertContains;
using framewatch::tests::common::AssertNotContains;
using framewatch::tests::common::AssertEq;
using framewatch::tests::common::AssertTrue;
using framewatch::tests::common::DispatchCaptured;
using framewatch::tests::common::Fail;

namespace {

void WriteFile(const fs::path& path, std::string_view text) {
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    Fail("failed to write fixture: " + path.string());
  }
  out << text;
}

void VersionAndUsage() {
  std::string out;
  std::string err;
  AssertEq(DispatchCaptured({"framewatch", "version"}, out, err), 0, "version exit code");
  AssertEq(out, std::string("framewatch 0.1.0\n"), "version text");

  AssertEq(DispatchCaptured({"framewatch"}, out, err), 2, "missing subcommand");
  AssertContains(err, "usage:");
  AssertEq(DispatchCaptured({"framewatch", "replay"}, out, err), 2, "unknown subcommand");
  AssertContains(err, "unknown subcommand: replay");
  AssertEq(DispatchCaptured({"framewatch", "monitor", "--out", "x"}, out, err), 2,
           "monitor without captures");
  AssertContains(err, "monitor requires --captures <dir>");
  AssertEq(DispatchCaptured({"framewatch", "monitor", "--captures", "c", "--max-frames", "ten"},
                            out, err),
           2, "non-numeric flag value");
  AssertContains(err, "invalid value for --max-frames");
  AssertEq(DispatchCaptured({"framewatch", "help"}, out, err), 0, "help");
  AssertContains(out, "framewatch validate-config");
}

void ValidateConfig(const fs::path& root) {
  const fs::path good = root / "good.json";
  const fs::path bad = root / "bad.json";
  WriteFile(good, R"({"host":"10.1.1.1","device_id":"stb-1","max_frames":30})");
  WriteFile(bad, R"({"max_frames":"many","colour":"red"})");

  std::string out;
  std::string err;
  AssertEq(DispatchCaptured({"framewatch", "validate-config", good.string()}, out, err), 0,
           "valid config");
  AssertContains(out, "valid: ");

  AssertEq(DispatchCaptured({"framewatch", "validate-config", bad.string()}, out, err), 10,
           "invalid config exit code");
  AssertContains(err, "colour: is not a recognized config key");
  AssertContains(err, "max_frames: must be a non-negative integer");

  AssertEq(DispatchCaptured({"framewatch", "validate-config", (root / "nope.json").string()}, out,
                            err),
           1, "unreadable config");

  AssertEq(DispatchCaptured({"framewatch", "monitor", "--captures", root.string(), "--config",
                             bad.string()},
                            out, err),
           10, "monitor refuses an invalid config");
  AssertEq(DispatchCaptured(
               {"framewatch", "monitor", "--captures", root.string(), "--ingest-interval-ms", "0"},
               out, err),
           10, "zero interval from the command line");
}

void MonitorWithoutControl(const fs::path& root) {
  std::string out;
  std::string err;
  const fs::path out_dir = root / "no-control-out";
  AssertEq(DispatchCaptured({"framewatch", "monitor", "--captures", (root / "captures").string(),
                             "--control-file", (root / "control.lock").string(), "--out",
                             out_dir.string()},
                            out, err),
           20, "control not held at start");
  AssertContains(err, "device control is not active");
  AssertTrue(!fs::exists(out_dir / "monitoring_state.json"), "nothing written without control");
}

void MonitorShortRun(const fs::path& root) {
  const fs::path captures = root / "captures";
  fs::create_directories(captures);
  WriteFile(captures / "frame_1.jpg", "img");
  WriteFile(captures / "frame_1.json", R"({"status":"ok"})");
  WriteFile(captures / "frame_2.jpg", "img");
  WriteFile(captures / "frame_2.json",
            R"({"analysis":{"status":"issue","blackscreen":{"detected":true}}})");
  WriteFile(captures / "frame_3.jpg", "img");
  WriteFile(captures / "frame_4.jpg", "img");
  WriteFile(captures / "frame_4.json", R"({"status":"ok"})");

  const fs::path out_dir = root / "run-out";
  std::string out;
  std::string err;
  const int exit_code = DispatchCaptured(
      {"framewatch", "monitor", "--captures", captures.string(), "--ingest-interval-ms", "50",
       "--duration-ms", "600", "--out", out_dir.string(), "--log-level", "debug"},
      out, err);
  AssertEq(exit_code, 0, "short monitor run exit code");
  AssertContains(out, "stop_reason: duration_elapsed");
  AssertContains(out, "frames_buffered: 2");
  AssertContains(out, "last_processed_frame: 2");
  AssertContains(err, "msg=\"monitoring session started\"");

  const auto state = framewatch::tests::common::ParseJsonOrFail(
      framewatch::tests::common::ReadFileToString(out_dir / "monitoring_state.json"));
  const auto* state_section = framewatch::core::json::FindField(state, "state");
  AssertTrue(state_section != nullptr, "state section present");
  AssertEq(framewatch::core::json::FindField(*state_section, "frames")->array_value.size(), 2U,
           "frames behind the pending analysis held back");

  const std::string events = framewatch::tests::common::ReadFileToString(out_dir / "events.jsonl");
  AssertContains(events, "\"type\":\"session_started\"");
  AssertContains(events, "\"type\":\"frames_ingested\"");
  AssertNotContains(events, "\"type\":\"frame_analysis_failed\"");
  AssertContains(events, "\"reason\":\"stopped\"");
}

void MonitorControlLost(const fs::path& root) {
  const fs::path control_file = root / "control.held";
  WriteFile(control_file, "held");

  std::thread releaser([control_file]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    std::error_code ec;
    fs::remove(control_file, ec);
  });

  std::string out;
  std::string err;
  const fs::path out_dir = root / "lost-out";
  const int exit_code = DispatchCaptured(
      {"framewatch", "monitor", "--captures", (root / "captures").string(), "--control-file",
       control_file.string(), "--duration-ms", "10000", "--out", out_dir.string()},
      out, err);
  releaser.join();

  AssertEq(exit_code, 21, "control lost exit code");
  AssertContains(out, "stop_reason: control_lost");
  const std::string events = framewatch::tests::common::ReadFileToString(out_dir / "events.jsonl");
  AssertContains(events, "\"type\":\"control_lost\"");
}

} // namespace

int main() {
  const fs::path root = framewatch::tests::common::CreateUniqueTempDir("framewatch-monitor-cli");

  VersionAndUsage();
  ValidateConfig(root);
  MonitorWithoutControl(root);
  MonitorShortRun(root);
  MonitorControlLost(root);

  framewatch::tests::common::RemovePathBestEffort(root);
  return 0;
}
