#include "common/assertions.hpp"
#include "common/temp_dir.hpp"
#include "events/emitter.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using framewatch::events::Emitter;
using framewatch::tests::common::AssertContains;
using framewatch::tests::common::AssertEq;
using framewatch::tests::common::AssertNotContains;
using framewatch::tests::common::Fail;

namespace {

std::vector<std::string> ReadNonEmptyLines(const fs::path& path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    Fail("failed to open events output");
  }

  std::vector<std::string> lines;
  std::string line;
  while (std::getline(input, line)) {
    if (!line.empty()) {
      lines.push_back(line);
    }
  }
  return lines;
}

std::chrono::system_clock::time_point AtMillis(const long long ms) {
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

} // namespace

int main() {
  const fs::path out_dir = framewatch::tests::common::CreateUniqueTempDir("framewatch-emitter");

  std::string error;
  Emitter emitter(out_dir);
  emitter.SetSessionId("monitor-1000-1");
  if (!emitter.events_path().empty()) {
    Fail("events path should stay empty until the first write");
  }

  if (!emitter.EmitSessionStarted({.ts = AtMillis(1'000),
                                   .host = "localhost",
                                   .device_id = "device1",
                                   .max_frames = 180,
                                   .ingest_interval_ms = 1000,
                                   .playback_interval_ms = 1000},
                                  error)) {
    Fail("EmitSessionStarted failed: " + error);
  }

  if (!emitter.EmitFramesIngested({.ts = AtMillis(2'000),
                                   .appended = 2,
                                   .failed = 1,
                                   .first_frame = 41,
                                   .last_frame = 43,
                                   .total_frames = 43},
                                  error)) {
    Fail("EmitFramesIngested failed: " + error);
  }

  if (!emitter.EmitSubtitleOverlay({.outcome = Emitter::SubtitleOverlayEvent::Outcome::kApplied,
                                    .ts = AtMillis(2'500),
                                    .detector = "standard",
                                    .frame_number = 42,
                                    .detected = true,
                                    .text = "Hello \"world\""},
                                   error)) {
    Fail("EmitSubtitleOverlay applied failed: " + error);
  }

  if (!emitter.EmitSubtitleOverlay({.outcome = Emitter::SubtitleOverlayEvent::Outcome::kFailed,
                                    .ts = AtMillis(3'000),
                                    .detector = "ai",
                                    .frame_number = 42,
                                    .error = "detector offline"},
                                   error)) {
    Fail("EmitSubtitleOverlay failed outcome failed: " + error);
  }

  if (!emitter.EmitSessionStopped({.ts = AtMillis(4'000),
                                   .reason = "control_lost",
                                   .frames_buffered = 43,
                                   .last_processed_frame = 43,
                                   .skipped_ticks = 2},
                                  error)) {
    Fail("EmitSessionStopped failed: " + error);
  }

  AssertEq(emitter.events_path(), out_dir / "events.jsonl", "events path");
  const std::vector<std::string> lines = ReadNonEmptyLines(emitter.events_path());
  AssertEq(lines.size(), 5U, "one line per event");

  AssertContains(lines[0], "\"ts_utc\":\"1970-01-01T00:00:01.000Z\"");
  AssertContains(lines[0], "\"type\":\"session_started\"");
  AssertContains(lines[0], "\"device_id\":\"device1\"");
  AssertContains(lines[0], "\"max_frames\":\"180\"");
  AssertContains(lines[0], "\"session_id\":\"monitor-1000-1\"");

  AssertContains(lines[1], "\"type\":\"frames_ingested\"");
  AssertContains(lines[1], "\"appended\":\"2\"");
  AssertContains(lines[1], "\"failed\":\"1\"");

  AssertContains(lines[2], "\"type\":\"subtitle_overlay_applied\"");
  AssertContains(lines[2], "\"detected\":\"true\"");
  AssertContains(lines[2], "\"text\":\"Hello \\\"world\\\"\"");
  AssertNotContains(lines[2], "\"error\"");

  AssertContains(lines[3], "\"type\":\"subtitle_overlay_failed\"");
  AssertContains(lines[3], "\"detector\":\"ai\"");
  AssertContains(lines[3], "\"error\":\"detector offline\"");
  AssertNotContains(lines[3], "\"text\"");

  AssertContains(lines[4], "\"type\":\"session_stopped\"");
  AssertContains(lines[4], "\"reason\":\"control_lost\"");
  AssertContains(lines[4], "\"skipped_ticks\":\"2\"");

  framewatch::tests::common::RemovePathBestEffort(out_dir);
  return 0;
}
