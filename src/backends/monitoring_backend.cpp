#include "backends/monitoring_backend.hpp"

namespace framewatch::backends {

const char* ToString(const SubtitleDetectorKind kind) {
  switch (kind) {
  case SubtitleDetectorKind::kStandard:
    return "standard";
  case SubtitleDetectorKind::kAi:
    return "ai";
  }
  return "standard";
}

bool ParseSubtitleDetectorKind(const std::string& raw, SubtitleDetectorKind& kind) {
  if (raw == "standard" || raw == "ocr") {
    kind = SubtitleDetectorKind::kStandard;
    return true;
  }
  if (raw == "ai") {
    kind = SubtitleDetectorKind::kAi;
    return true;
  }
  return false;
}

} // namespace framewatch::backends
