#pragma once

#include "core/json_dom.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace framewatch::backends {

// Host/device pair every collaborator request is addressed to.
struct DeviceTarget {
  std::string host;
  std::string device_id;
};

// One newly captured frame as reported by the frame producer.
struct CapturedFrameRef {
  std::string path;
  std::uint64_t frame_number = 0U;

  // Capture time in whole seconds since the Unix epoch.
  std::int64_t timestamp = 0;
};

struct FetchFramesRequest {
  DeviceTarget target;

  // Low-water mark: only frames numbered above this are wanted.
  std::uint64_t since_frame_number = 0U;
};

struct FetchFramesResult {
  bool success = false;
  std::vector<CapturedFrameRef> frames;
  std::string error;
};

struct AnalyzeFrameRequest {
  DeviceTarget target;
  std::string frame_path;
  std::uint64_t frame_number = 0U;
};

// `analysis` is the raw payload as received; it is decoded into the closed
// monitoring model by the caller, never trusted as-is.
struct AnalyzeFrameResult {
  bool success = false;
  core::json::Value analysis;
  std::string error;
};

// The two interchangeable subtitle detectors exposed by the analysis service.
enum class SubtitleDetectorKind {
  kStandard = 0,
  kAi,
};

const char* ToString(SubtitleDetectorKind kind);
bool ParseSubtitleDetectorKind(const std::string& raw, SubtitleDetectorKind& kind);

struct DetectSubtitlesRequest {
  DeviceTarget target;
  std::string image_source_url;
  bool extract_text = true;
  SubtitleDetectorKind detector = SubtitleDetectorKind::kStandard;
};

// `payload` carries the detector response body (subtitles_detected,
// combined_extracted_text, detected_language, results[]).
struct DetectSubtitlesResult {
  bool success = false;
  core::json::Value payload;
  std::string error;
};

using FetchFramesCallback = std::function<void(FetchFramesResult result)>;
using AnalyzeFrameCallback = std::function<void(AnalyzeFrameResult result)>;
using DetectSubtitlesCallback = std::function<void(DetectSubtitlesResult result)>;

// Producer of captured frames.
//
// Implementations complete every request exactly once, either inline or later
// from any thread; callers re-post completions onto their scheduler.
class IFrameSource {
public:
  virtual ~IFrameSource() = default;

  virtual void FetchNewFrames(const FetchFramesRequest& request, FetchFramesCallback done) = 0;
};

// Request/response analysis capability (blackscreen/freeze/subtitle/error
// detection). Same completion contract as IFrameSource.
class IAnalysisBackend {
public:
  virtual ~IAnalysisBackend() = default;

  virtual void AnalyzeFrame(const AnalyzeFrameRequest& request, AnalyzeFrameCallback done) = 0;

  virtual void DetectSubtitles(const DetectSubtitlesRequest& request,
                               DetectSubtitlesCallback done) = 0;
};

} // namespace framewatch::backends
