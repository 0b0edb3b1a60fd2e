#pragma once

#include "events/event_model.hpp"

#include <filesystem>
#include <string>

namespace framewatch::events {

// Appends one JSON-serialized event per line to `<output_dir>/events.jsonl`.
//
// Creates `output_dir` when missing and opens the log in append mode, so a
// restarted session keeps extending the same timeline. Returns false with
// `error` populated on failure.
bool AppendEventJsonl(const Event& event, const std::filesystem::path& output_dir,
                      std::filesystem::path& written_path, std::string& error);

} // namespace framewatch::events
