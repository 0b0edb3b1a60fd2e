#include "common/assertions.hpp"
#include "common/temp_dir.hpp"
#include "events/event_model.hpp"
#include "events/jsonl_writer.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using framewatch::tests::common::AssertContains;
using framewatch::tests::common::AssertEq;
using framewatch::tests::common::Fail;

int main() {
  using framewatch::events::Event;
  using framewatch::events::EventType;

  const fs::path out_dir =
      framewatch::tests::common::CreateUniqueTempDir("framewatch-events-jsonl") / "run";

  Event first;
  first.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(1'000));
  first.type = EventType::kFrameFetchFailed;
  first.payload = {
      {"since_frame", "12"},
      {"error", "connection refused"},
  };

  Event second;
  second.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(2'250));
  second.type = EventType::kControlLost;
  second.payload = {
      {"last_processed_frame", "12"},
      {"note", "line1\nline2"},
  };

  fs::path written_path;
  std::string error;
  if (!framewatch::events::AppendEventJsonl(first, out_dir, written_path, error)) {
    Fail("first append failed: " + error);
  }
  if (!framewatch::events::AppendEventJsonl(second, out_dir, written_path, error)) {
    Fail("second append failed: " + error);
  }
  AssertEq(written_path, out_dir / "events.jsonl", "events file path");

  std::ifstream input(written_path, std::ios::binary);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(input, line)) {
    lines.push_back(line);
  }
  AssertEq(lines.size(), 2U, "appended lines");

  AssertEq(lines[0],
           std::string("{\"ts_utc\":\"1970-01-01T00:00:01.000Z\",\"type\":\"frame_fetch_failed\","
                       "\"payload\":{\"error\":\"connection refused\",\"since_frame\":\"12\"}}"),
           "payload keys sorted");
  AssertContains(lines[1], "\"ts_utc\":\"1970-01-01T00:00:02.250Z\"");
  AssertContains(lines[1], "\"type\":\"control_lost\"");
  AssertContains(lines[1], "\"note\":\"line1\\nline2\"");

  fs::path unused;
  if (framewatch::events::AppendEventJsonl(first, fs::path(), unused, error)) {
    Fail("empty output directory should be rejected");
  }
  AssertContains(error, "cannot be empty");

  framewatch::tests::common::RemovePathBestEffort(out_dir.parent_path());
  return 0;
}
