#pragma once

#include "core/json_dom.hpp"
#include "monitoring/frame_model.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace framewatch::monitoring {

// Decodes one analysis payload into the closed `Analysis` model.
//
// Rules:
// - payload must be an object with a `status` of ok|issue|processing|error
// - `blackscreen`, `freeze`, `subtitles`, `errors`, `language` are optional;
//   when present they must be objects whose known fields carry the right type
// - `language` may also be a bare language string
// - missing `truncatedText` is derived from `text`
// On failure `error` names the offending field path and `analysis` is left
// untouched.
bool DecodeAnalysis(const core::json::Value& payload, Analysis& analysis, std::string& error);

// Parses JSON text then decodes it. Accepts either the analysis object itself
// or a wrapper object holding it under `analysis`.
bool ParseAnalysisJson(std::string_view text, Analysis& analysis, std::string& error);

// Normalized subtitle detector response.
struct SubtitleDetection {
  bool detected = false;
  std::string text;
  std::optional<std::string> language;
  double confidence = 0.0;
};

bool DecodeSubtitleDetection(const core::json::Value& payload, SubtitleDetection& detection,
                             std::string& error);

// Returns `base` with its subtitle and language fields replaced by the
// detector result. Blackscreen, freeze, errors and status are preserved.
Analysis MergeSubtitleDetection(const Analysis& base, const SubtitleDetection& detection);

} // namespace framewatch::monitoring
