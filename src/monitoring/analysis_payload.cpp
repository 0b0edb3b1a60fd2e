#include "monitoring/analysis_payload.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace framewatch::monitoring {

namespace {

using JsonValue = core::json::Value;

constexpr double kDefaultDetectedConfidence = 0.9;
constexpr double kDefaultUndetectedConfidence = 0.1;

bool ReadOptionalBool(const JsonValue& object_value, std::string_view key, std::string_view path,
                      bool& out, std::string& error) {
  const JsonValue* field = core::json::FindField(object_value, key);
  if (field == nullptr || core::json::IsNull(field)) {
    return true;
  }
  if (!core::json::IsBool(field)) {
    error = std::string(path) + "." + std::string(key) + " must be a boolean";
    return false;
  }
  out = field->bool_value;
  return true;
}

bool ReadOptionalString(const JsonValue& object_value, std::string_view key,
                        std::string_view path, std::string& out, std::string& error) {
  const JsonValue* field = core::json::FindField(object_value, key);
  if (field == nullptr || core::json::IsNull(field)) {
    return true;
  }
  if (!core::json::IsString(field)) {
    error = std::string(path) + "." + std::string(key) + " must be a string";
    return false;
  }
  out = field->string_value;
  return true;
}

bool ReadOptionalNumber(const JsonValue& object_value, std::string_view key,
                        std::string_view path, double& out, std::string& error) {
  const JsonValue* field = core::json::FindField(object_value, key);
  if (field == nullptr || core::json::IsNull(field)) {
    return true;
  }
  if (!core::json::IsNumber(field)) {
    error = std::string(path) + "." + std::string(key) + " must be a number";
    return false;
  }
  out = field->number_value;
  return true;
}

bool ReadOptionalCount(const JsonValue& object_value, std::string_view key, std::string_view path,
                       std::uint32_t& out, std::string& error) {
  const JsonValue* field = core::json::FindField(object_value, key);
  if (field == nullptr || core::json::IsNull(field)) {
    return true;
  }
  std::uint64_t parsed = 0U;
  if (!core::json::TryGetNonNegativeInteger(*field, parsed) ||
      parsed > std::numeric_limits<std::uint32_t>::max()) {
    error = std::string(path) + "." + std::string(key) + " must be a non-negative integer";
    return false;
  }
  out = static_cast<std::uint32_t>(parsed);
  return true;
}

// Returns the nested object for `key`, nullptr when absent. Sets `error` when
// the field exists with a non-object type.
const JsonValue* FindSection(const JsonValue& payload, std::string_view key, std::string& error) {
  const JsonValue* section = core::json::FindField(payload, key);
  if (section == nullptr || core::json::IsNull(section)) {
    return nullptr;
  }
  if (!core::json::IsObject(section)) {
    error = "analysis." + std::string(key) + " must be an object";
  }
  return section;
}

bool DecodeBlackscreen(const JsonValue& payload, BlackscreenResult& out, std::string& error) {
  const JsonValue* section = FindSection(payload, "blackscreen", error);
  if (!error.empty()) {
    return false;
  }
  if (section == nullptr) {
    return true;
  }
  constexpr std::string_view kPath = "analysis.blackscreen";
  return ReadOptionalBool(*section, "detected", kPath, out.detected, error) &&
         ReadOptionalCount(*section, "consecutiveFrames", kPath, out.consecutive_frames, error) &&
         ReadOptionalNumber(*section, "confidence", kPath, out.confidence, error);
}

bool DecodeFreeze(const JsonValue& payload, FreezeResult& out, std::string& error) {
  const JsonValue* section = FindSection(payload, "freeze", error);
  if (!error.empty()) {
    return false;
  }
  if (section == nullptr) {
    return true;
  }
  constexpr std::string_view kPath = "analysis.freeze";
  return ReadOptionalBool(*section, "detected", kPath, out.detected, error) &&
         ReadOptionalCount(*section, "consecutiveFrames", kPath, out.consecutive_frames, error);
}

bool DecodeSubtitles(const JsonValue& payload, SubtitleResult& out, std::string& error) {
  const JsonValue* section = FindSection(payload, "subtitles", error);
  if (!error.empty()) {
    return false;
  }
  if (section == nullptr) {
    return true;
  }
  constexpr std::string_view kPath = "analysis.subtitles";
  std::string truncated;
  if (!ReadOptionalBool(*section, "detected", kPath, out.detected, error) ||
      !ReadOptionalString(*section, "text", kPath, out.text, error) ||
      !ReadOptionalString(*section, "truncatedText", kPath, truncated, error) ||
      !ReadOptionalNumber(*section, "confidence", kPath, out.confidence, error)) {
    return false;
  }
  out.truncated_text = truncated.empty() ? TruncateSubtitleText(out.text) : truncated;
  return true;
}

bool DecodeErrors(const JsonValue& payload, ErrorTextResult& out, std::string& error) {
  const JsonValue* section = FindSection(payload, "errors", error);
  if (!error.empty()) {
    return false;
  }
  if (section == nullptr) {
    return true;
  }
  constexpr std::string_view kPath = "analysis.errors";
  return ReadOptionalBool(*section, "detected", kPath, out.detected, error) &&
         ReadOptionalString(*section, "errorType", kPath, out.error_type, error) &&
         ReadOptionalString(*section, "errorText", kPath, out.error_text, error);
}

bool DecodeLanguage(const JsonValue& payload, LanguageResult& out, std::string& error) {
  const JsonValue* field = core::json::FindField(payload, "language");
  if (field == nullptr || core::json::IsNull(field)) {
    return true;
  }
  if (core::json::IsString(field)) {
    out.language = field->string_value.empty() ? "unknown" : field->string_value;
    return true;
  }
  if (!core::json::IsObject(field)) {
    error = "analysis.language must be an object or a string";
    return false;
  }
  constexpr std::string_view kPath = "analysis.language";
  if (!ReadOptionalString(*field, "language", kPath, out.language, error) ||
      !ReadOptionalNumber(*field, "confidence", kPath, out.confidence, error)) {
    return false;
  }
  if (out.language.empty()) {
    out.language = "unknown";
  }
  return true;
}

} // namespace

bool DecodeAnalysis(const JsonValue& payload, Analysis& analysis, std::string& error) {
  error.clear();
  if (!core::json::IsObject(&payload)) {
    error = "analysis payload must be a JSON object";
    return false;
  }

  const JsonValue* status_field = core::json::FindField(payload, "status");
  if (status_field == nullptr) {
    error = "analysis.status is required";
    return false;
  }
  if (!core::json::IsString(status_field)) {
    error = "analysis.status must be a string";
    return false;
  }

  Analysis decoded;
  if (!ParseAnalysisStatus(status_field->string_value, decoded.status)) {
    error = "analysis.status has unsupported value '" + status_field->string_value +
            "' (expected ok|issue|processing|error)";
    return false;
  }

  if (!DecodeBlackscreen(payload, decoded.blackscreen, error) ||
      !DecodeFreeze(payload, decoded.freeze, error) ||
      !DecodeSubtitles(payload, decoded.subtitles, error) ||
      !DecodeErrors(payload, decoded.errors, error) ||
      !DecodeLanguage(payload, decoded.language, error)) {
    return false;
  }

  analysis = std::move(decoded);
  return true;
}

bool ParseAnalysisJson(const std::string_view text, Analysis& analysis, std::string& error) {
  JsonValue root;
  if (!core::json::Parse(text, root, error)) {
    return false;
  }

  const JsonValue* wrapped = core::json::FindField(root, "analysis");
  if (core::json::IsObject(wrapped) && core::json::FindField(root, "status") == nullptr) {
    return DecodeAnalysis(*wrapped, analysis, error);
  }
  return DecodeAnalysis(root, analysis, error);
}

bool DecodeSubtitleDetection(const JsonValue& payload, SubtitleDetection& detection,
                             std::string& error) {
  error.clear();
  if (!core::json::IsObject(&payload)) {
    error = "subtitle detection payload must be a JSON object";
    return false;
  }

  constexpr std::string_view kPath = "subtitles";
  SubtitleDetection decoded;
  std::string combined_text;
  std::string detected_language;
  if (!ReadOptionalBool(payload, "subtitles_detected", kPath, decoded.detected, error) ||
      !ReadOptionalString(payload, "combined_extracted_text", kPath, combined_text, error) ||
      !ReadOptionalString(payload, "detected_language", kPath, detected_language, error)) {
    return false;
  }

  std::string first_text;
  std::string first_language;
  double first_confidence = 0.0;
  const JsonValue* results = core::json::FindField(payload, "results");
  if (results != nullptr && !core::json::IsNull(results)) {
    if (!core::json::IsArray(results)) {
      error = "subtitles.results must be an array";
      return false;
    }
    if (!results->array_value.empty()) {
      const JsonValue& first = results->array_value.front();
      if (!core::json::IsObject(&first)) {
        error = "subtitles.results[0] must be an object";
        return false;
      }
      constexpr std::string_view kResultPath = "subtitles.results[0]";
      if (!ReadOptionalNumber(first, "confidence", kResultPath, first_confidence, error) ||
          !ReadOptionalString(first, "extracted_text", kResultPath, first_text, error) ||
          !ReadOptionalString(first, "detected_language", kResultPath, first_language, error)) {
        return false;
      }
    }
  }

  decoded.text = !combined_text.empty() ? combined_text : first_text;

  const std::string& language = !detected_language.empty() ? detected_language : first_language;
  if (!language.empty() && language != "unknown") {
    decoded.language = language;
  }

  // A zero confidence is treated as "not reported".
  if (first_confidence != 0.0) {
    decoded.confidence = first_confidence;
  } else {
    decoded.confidence =
        decoded.detected ? kDefaultDetectedConfidence : kDefaultUndetectedConfidence;
  }

  detection = std::move(decoded);
  return true;
}

Analysis MergeSubtitleDetection(const Analysis& base, const SubtitleDetection& detection) {
  Analysis merged = base;
  merged.subtitles.detected = detection.detected;
  merged.subtitles.text = detection.text;
  merged.subtitles.truncated_text = TruncateSubtitleText(detection.text);
  merged.subtitles.confidence = detection.confidence;
  if (detection.language.has_value()) {
    merged.language.language = detection.language.value();
    merged.language.confidence = detection.confidence;
  } else {
    merged.language = LanguageResult{};
  }
  return merged;
}

} // namespace framewatch::monitoring
