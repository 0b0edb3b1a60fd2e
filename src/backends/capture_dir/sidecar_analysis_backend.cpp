#include "backends/capture_dir/sidecar_analysis_backend.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <string_view>
#include <utility>

namespace fs = std::filesystem;

namespace framewatch::backends::capture_dir {

namespace {

constexpr std::string_view kFileUrlPrefix = "file://";

fs::path WithStemSuffix(const fs::path& image_path, const std::string& suffix) {
  fs::path sidecar = image_path;
  sidecar.replace_filename(image_path.stem().string() + suffix);
  return sidecar;
}

fs::path ImagePathFromSource(const std::string& image_source_url) {
  const std::string_view source(image_source_url);
  if (source.substr(0, kFileUrlPrefix.size()) == kFileUrlPrefix) {
    return fs::path(std::string(source.substr(kFileUrlPrefix.size())));
  }
  return fs::path(image_source_url);
}

bool LoadSidecarJson(const fs::path& path, core::json::Value& root, std::string& error) {
  std::string contents;
  if (!core::ReadTextFile(path, contents, error)) {
    return false;
  }
  std::string parse_error;
  if (!core::json::Parse(contents, root, parse_error)) {
    error = "invalid JSON in '" + path.string() + "': " + parse_error;
    return false;
  }
  if (!core::json::IsObject(&root)) {
    error = "'" + path.string() + "' must contain a JSON object";
    return false;
  }
  return true;
}

} // namespace

fs::path AnalysisSidecarPath(const fs::path& image_path) {
  return WithStemSuffix(image_path, ".json");
}

fs::path SubtitleSidecarPath(const fs::path& image_path, const SubtitleDetectorKind detector) {
  return WithStemSuffix(image_path, detector == SubtitleDetectorKind::kAi ? "_subtitles_ai.json"
                                                                          : "_subtitles.json");
}

void SidecarAnalysisBackend::AnalyzeFrame(const AnalyzeFrameRequest& request,
                                          AnalyzeFrameCallback done) {
  AnalyzeFrameResult result;
  if (request.frame_path.empty()) {
    result.error = "frame path is empty";
    done(std::move(result));
    return;
  }

  core::json::Value root;
  if (!LoadSidecarJson(AnalysisSidecarPath(request.frame_path), root, result.error)) {
    done(std::move(result));
    return;
  }

  // The service writes either the bare analysis object or a response
  // envelope carrying it under `analysis`.
  const core::json::Value* wrapped = core::json::FindField(root, "analysis");
  if (core::json::IsObject(wrapped) && core::json::FindField(root, "status") == nullptr) {
    result.analysis = *wrapped;
  } else {
    result.analysis = std::move(root);
  }
  result.success = true;
  done(std::move(result));
}

void SidecarAnalysisBackend::DetectSubtitles(const DetectSubtitlesRequest& request,
                                             DetectSubtitlesCallback done) {
  DetectSubtitlesResult result;
  if (request.image_source_url.empty()) {
    result.error = "image source is empty";
    done(std::move(result));
    return;
  }

  const fs::path image_path = ImagePathFromSource(request.image_source_url);
  core::json::Value root;
  if (!LoadSidecarJson(SubtitleSidecarPath(image_path, request.detector), root, result.error)) {
    done(std::move(result));
    return;
  }

  // A sidecar may record the detector's own failure.
  const core::json::Value* success = core::json::FindField(root, "success");
  if (core::json::IsBool(success) && !success->bool_value) {
    const core::json::Value* detector_error = core::json::FindField(root, "error");
    result.error = core::json::IsString(detector_error) ? detector_error->string_value
                                                        : std::string("detector reported failure");
    done(std::move(result));
    return;
  }

  result.payload = std::move(root);
  result.success = true;
  done(std::move(result));
}

} // namespace framewatch::backends::capture_dir
