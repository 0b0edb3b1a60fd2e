#pragma once

#include "backends/monitoring_backend.hpp"

#include <filesystem>
#include <string>

namespace framewatch::backends::capture_dir {

// Sidecar file names the analysis service writes next to `image_path`:
//   frame_0042.jpg -> frame_0042.json               (frame analysis)
//                  -> frame_0042_subtitles.json     (standard detector)
//                  -> frame_0042_subtitles_ai.json  (AI detector)
std::filesystem::path AnalysisSidecarPath(const std::filesystem::path& image_path);
std::filesystem::path SubtitleSidecarPath(const std::filesystem::path& image_path,
                                          SubtitleDetectorKind detector);

// Analysis backend that reads results the external analysis service already
// wrote to disk. Requests complete inline; a missing or unparsable sidecar
// is a failed result, never an exception.
class SidecarAnalysisBackend final : public IAnalysisBackend {
public:
  SidecarAnalysisBackend() = default;

  void AnalyzeFrame(const AnalyzeFrameRequest& request, AnalyzeFrameCallback done) override;
  void DetectSubtitles(const DetectSubtitlesRequest& request,
                       DetectSubtitlesCallback done) override;
};

} // namespace framewatch::backends::capture_dir
