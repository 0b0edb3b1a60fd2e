#include "events/jsonl_writer.hpp"

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace framewatch::events {

bool AppendEventJsonl(const Event& event, const fs::path& output_dir, fs::path& written_path,
                      std::string& error) {
  if (output_dir.empty()) {
    error = "event output directory cannot be empty";
    return false;
  }

  std::error_code ec;
  fs::create_directories(output_dir, ec);
  if (ec) {
    error = "failed to create event output directory '" + output_dir.string() +
            "': " + ec.message();
    return false;
  }

  written_path = output_dir / "events.jsonl";
  std::ofstream out_file(written_path, std::ios::binary | std::ios::app);
  if (!out_file) {
    error = "failed to open event log '" + written_path.string() + "' for append";
    return false;
  }

  out_file << ToJson(event) << '\n';
  if (!out_file) {
    error = "failed while appending to event log '" + written_path.string() + "'";
    return false;
  }

  return true;
}

} // namespace framewatch::events
