#include "monitoring/frame_model.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace framewatch::monitoring {

const char* ToString(const AnalysisStatus status) {
  switch (status) {
  case AnalysisStatus::kOk:
    return "ok";
  case AnalysisStatus::kIssue:
    return "issue";
  case AnalysisStatus::kProcessing:
    return "processing";
  case AnalysisStatus::kError:
    return "error";
  }
  return "processing";
}

bool ParseAnalysisStatus(const std::string_view raw, AnalysisStatus& status) {
  if (raw == "ok") {
    status = AnalysisStatus::kOk;
    return true;
  }
  if (raw == "issue") {
    status = AnalysisStatus::kIssue;
    return true;
  }
  if (raw == "processing") {
    status = AnalysisStatus::kProcessing;
    return true;
  }
  if (raw == "error") {
    status = AnalysisStatus::kError;
    return true;
  }
  return false;
}

std::string TruncateSubtitleText(const std::string_view text) {
  if (text.empty()) {
    return "None";
  }
  // Counts UTF-8 code points so a cut never lands inside a multibyte
  // character. Continuation bytes are 0b10xxxxxx.
  std::size_t code_points = 0U;
  for (std::size_t pos = 0U; pos < text.size(); ++pos) {
    if ((static_cast<unsigned char>(text[pos]) & 0xC0U) == 0x80U) {
      continue;
    }
    if (code_points == kMaxSubtitleDisplayLength) {
      return std::string(text.substr(0, pos)) + "...";
    }
    ++code_points;
  }
  return std::string(text);
}

std::string ToJson(const Analysis& analysis) {
  using core::FormatJsonDouble;
  using core::WriteJsonBoolField;
  using core::WriteJsonRawField;
  using core::WriteJsonStringField;

  std::ostringstream out;
  bool first = true;
  out << "{";
  WriteJsonStringField(out, "status", ToString(analysis.status), first);

  std::ostringstream blackscreen;
  bool blackscreen_first = true;
  blackscreen << "{";
  WriteJsonBoolField(blackscreen, "detected", analysis.blackscreen.detected, blackscreen_first);
  WriteJsonRawField(blackscreen, "consecutiveFrames",
                    std::to_string(analysis.blackscreen.consecutive_frames), blackscreen_first);
  WriteJsonRawField(blackscreen, "confidence", FormatJsonDouble(analysis.blackscreen.confidence),
                    blackscreen_first);
  blackscreen << "}";
  WriteJsonRawField(out, "blackscreen", blackscreen.str(), first);

  std::ostringstream freeze;
  bool freeze_first = true;
  freeze << "{";
  WriteJsonBoolField(freeze, "detected", analysis.freeze.detected, freeze_first);
  WriteJsonRawField(freeze, "consecutiveFrames", std::to_string(analysis.freeze.consecutive_frames),
                    freeze_first);
  freeze << "}";
  WriteJsonRawField(out, "freeze", freeze.str(), first);

  std::ostringstream subtitles;
  bool subtitles_first = true;
  subtitles << "{";
  WriteJsonBoolField(subtitles, "detected", analysis.subtitles.detected, subtitles_first);
  WriteJsonStringField(subtitles, "text", analysis.subtitles.text, subtitles_first);
  WriteJsonStringField(subtitles, "truncatedText", analysis.subtitles.truncated_text,
                       subtitles_first);
  WriteJsonRawField(subtitles, "confidence", FormatJsonDouble(analysis.subtitles.confidence),
                    subtitles_first);
  subtitles << "}";
  WriteJsonRawField(out, "subtitles", subtitles.str(), first);

  std::ostringstream errors;
  bool errors_first = true;
  errors << "{";
  WriteJsonBoolField(errors, "detected", analysis.errors.detected, errors_first);
  WriteJsonStringField(errors, "errorType", analysis.errors.error_type, errors_first);
  WriteJsonStringField(errors, "errorText", analysis.errors.error_text, errors_first);
  errors << "}";
  WriteJsonRawField(out, "errors", errors.str(), first);

  std::ostringstream language;
  bool language_first = true;
  language << "{";
  WriteJsonStringField(language, "language", analysis.language.language, language_first);
  WriteJsonRawField(language, "confidence", FormatJsonDouble(analysis.language.confidence),
                    language_first);
  language << "}";
  WriteJsonRawField(out, "language", language.str(), first);

  out << "}";
  return out.str();
}

std::string ToJson(const Frame& frame) {
  std::ostringstream out;
  bool first = true;
  out << "{";
  core::WriteJsonRawField(out, "frameNumber", std::to_string(frame.frame_number), first);
  core::WriteJsonStringField(out, "timestamp", core::FormatUtcTimestamp(frame.timestamp), first);
  core::WriteJsonStringField(out, "imagePath", frame.image_path, first);
  core::WriteJsonBoolField(out, "processed", frame.processed, first);
  core::WriteJsonBoolField(out, "subtitleOverlayPerformed", frame.subtitle_overlay_performed,
                           first);
  if (frame.overlay_error.has_value()) {
    core::WriteJsonStringField(out, "overlayError", frame.overlay_error.value(), first);
  }
  core::WriteJsonRawField(out, "analysis", ToJson(frame.analysis), first);
  out << "}";
  return out.str();
}

} // namespace framewatch::monitoring
