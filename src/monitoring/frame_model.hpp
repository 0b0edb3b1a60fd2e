#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace framewatch::monitoring {

// 180 frames at the 1 Hz ingestion cadence keeps roughly three minutes of
// history in memory.
constexpr std::size_t kDefaultMaxFrames = 180U;

// Subtitle text longer than this is shortened for overlay display.
constexpr std::size_t kMaxSubtitleDisplayLength = 10U;

enum class AnalysisStatus {
  kOk = 0,
  kIssue,
  kProcessing,
  kError,
};

struct BlackscreenResult {
  bool detected = false;
  std::uint32_t consecutive_frames = 0U;
  double confidence = 0.0;

  bool operator==(const BlackscreenResult& other) const = default;
};

struct FreezeResult {
  bool detected = false;
  std::uint32_t consecutive_frames = 0U;

  bool operator==(const FreezeResult& other) const = default;
};

struct SubtitleResult {
  bool detected = false;
  std::string text;
  std::string truncated_text = "None";

  // Detector confidence in [0, 1]; only subtitle overlays report it.
  double confidence = 0.0;

  bool operator==(const SubtitleResult& other) const = default;
};

struct ErrorTextResult {
  bool detected = false;
  std::string error_type;
  std::string error_text;

  bool operator==(const ErrorTextResult& other) const = default;
};

struct LanguageResult {
  std::string language = "unknown";
  double confidence = 0.0;

  bool operator==(const LanguageResult& other) const = default;
};

// Closed analysis record. Backend payloads are decoded into this shape at the
// ingestion boundary (see analysis_payload.hpp).
struct Analysis {
  AnalysisStatus status = AnalysisStatus::kProcessing;
  BlackscreenResult blackscreen;
  FreezeResult freeze;
  SubtitleResult subtitles;
  ErrorTextResult errors;
  LanguageResult language;

  bool operator==(const Analysis& other) const = default;
};

struct Frame {
  std::uint64_t frame_number = 0U;
  std::chrono::system_clock::time_point timestamp{};
  std::string image_path;
  Analysis analysis;
  bool processed = false;

  // Set once a subtitle overlay result has been merged into `analysis`.
  bool subtitle_overlay_performed = false;

  // Last overlay failure for this frame; cleared by a successful overlay.
  std::optional<std::string> overlay_error;

  bool operator==(const Frame& other) const = default;
};

const char* ToString(AnalysisStatus status);
bool ParseAnalysisStatus(std::string_view raw, AnalysisStatus& status);

// Display form of subtitle text: "None" when empty, otherwise at most
// kMaxSubtitleDisplayLength UTF-8 code points followed by "..." when
// shortened.
std::string TruncateSubtitleText(std::string_view text);

std::string ToJson(const Analysis& analysis);
std::string ToJson(const Frame& frame);

} // namespace framewatch::monitoring
