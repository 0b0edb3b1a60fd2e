#include "backends/capture_dir/sidecar_analysis_backend.hpp"
#include "common/assertions.hpp"
#include "common/temp_dir.hpp"
#include "monitoring/analysis_payload.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

using framewatch::backends::AnalyzeFrameResult;
using framewatch::backends::DetectSubtitlesResult;
using framewatch::backends::SubtitleDetectorKind;
using framewatch::backends::capture_dir::AnalysisSidecarPath;
using framewatch::backends::capture_dir::SidecarAnalysisBackend;
using framewatch::backends::capture_dir::SubtitleSidecarPath;
using framewatch::tests::common::AssertContains;
using framewatch::tests::common::AssertEq;
using framewatch::tests::common::AssertTrue;
using framewatch::tests::common::Fail;

namespace {

void WriteFile(const std::filesystem::path& path, std::string_view text) {
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    Fail("failed to write fixture: " + path.string());
  }
  out << text;
}

AnalyzeFrameResult Analyze(SidecarAnalysisBackend& backend, const std::filesystem::path& image) {
  AnalyzeFrameResult captured;
  backend.AnalyzeFrame({.target = {}, .frame_path = image.string(), .frame_number = 1U},
                       [&](AnalyzeFrameResult result) { captured = std::move(result); });
  return captured;
}

DetectSubtitlesResult Detect(SidecarAnalysisBackend& backend, const std::string& source,
                             const SubtitleDetectorKind detector) {
  DetectSubtitlesResult captured;
  backend.DetectSubtitles(
      {.target = {}, .image_source_url = source, .extract_text = true, .detector = detector},
      [&](DetectSubtitlesResult result) { captured = std::move(result); });
  return captured;
}

} // namespace

int main() {
  AssertEq(AnalysisSidecarPath("/c/frame_0042.jpg"), std::filesystem::path("/c/frame_0042.json"),
           "analysis sidecar name");
  AssertEq(SubtitleSidecarPath("/c/frame_0042.jpg", SubtitleDetectorKind::kStandard),
           std::filesystem::path("/c/frame_0042_subtitles.json"), "standard detector sidecar");
  AssertEq(SubtitleSidecarPath("/c/frame_0042.jpg", SubtitleDetectorKind::kAi),
           std::filesystem::path("/c/frame_0042_subtitles_ai.json"), "ai detector sidecar");

  const auto dir = framewatch::tests::common::CreateUniqueTempDir("framewatch-sidecar");
  SidecarAnalysisBackend backend;

  // Envelope form is unwrapped; the decoded analysis carries the fields.
  WriteFile(dir / "frame_1.json",
            R"({"frame": 1, "analysis": {"status": "issue", "freeze": {"detected": true}}})");
  AnalyzeFrameResult analyzed = Analyze(backend, dir / "frame_1.jpg");
  AssertTrue(analyzed.success, "envelope sidecar loads");
  framewatch::monitoring::Analysis analysis;
  std::string error;
  AssertTrue(framewatch::monitoring::DecodeAnalysis(analyzed.analysis, analysis, error),
             "unwrapped payload decodes");
  AssertTrue(analysis.freeze.detected, "freeze flag carried");

  WriteFile(dir / "frame_2.json", R"({"status": "ok"})");
  AssertTrue(Analyze(backend, dir / "frame_2.jpg").success, "bare sidecar loads");

  AnalyzeFrameResult missing = Analyze(backend, dir / "frame_3.jpg");
  AssertTrue(!missing.success, "missing sidecar fails");
  AssertContains(missing.error, "unable to read file");

  WriteFile(dir / "frame_4.json", "{not json");
  AnalyzeFrameResult broken = Analyze(backend, dir / "frame_4.jpg");
  AssertTrue(!broken.success, "invalid JSON fails");
  AssertContains(broken.error, "invalid JSON");

  WriteFile(dir / "frame_5_subtitles_ai.json",
            R"({"success": true, "subtitles_detected": true, "combined_extracted_text": "hi"})");
  const std::string file_url = "file://" + (dir / "frame_5.jpg").string();
  DetectSubtitlesResult detected = Detect(backend, file_url, SubtitleDetectorKind::kAi);
  AssertTrue(detected.success, "file:// source resolved");
  AssertTrue(Detect(backend, file_url, SubtitleDetectorKind::kStandard).success == false,
             "each detector reads its own sidecar");

  WriteFile(dir / "frame_6_subtitles.json", R"({"success": false, "error": "ocr crashed"})");
  DetectSubtitlesResult failed =
      Detect(backend, (dir / "frame_6.jpg").string(), SubtitleDetectorKind::kStandard);
  AssertTrue(!failed.success, "recorded detector failure surfaces");
  AssertEq(failed.error, std::string("ocr crashed"), "detector error text");

  AssertTrue(!Detect(backend, "", SubtitleDetectorKind::kStandard).success, "empty source");

  framewatch::tests::common::RemovePathBestEffort(dir);
  return 0;
}
