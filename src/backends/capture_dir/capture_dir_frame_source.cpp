#include "backends/capture_dir/capture_dir_frame_source.hpp"

#include "backends/capture_dir/sidecar_analysis_backend.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <limits>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace framewatch::backends::capture_dir {

namespace {

constexpr std::string_view kFramePrefix = "frame_";

std::int64_t ToEpochSeconds(const fs::file_time_type mtime) {
  const auto as_system = fs::file_time_type::clock::to_sys(mtime);
  return std::chrono::duration_cast<std::chrono::seconds>(as_system.time_since_epoch()).count();
}

} // namespace

bool ParseCaptureFrameNumber(const std::string_view filename, std::uint64_t& frame_number) {
  std::size_t search_from = 0U;
  while (true) {
    const std::size_t prefix_at = filename.find(kFramePrefix, search_from);
    if (prefix_at == std::string_view::npos) {
      return false;
    }

    std::size_t pos = prefix_at + kFramePrefix.size();
    std::uint64_t value = 0U;
    bool any_digit = false;
    bool overflow = false;
    while (pos < filename.size() && std::isdigit(static_cast<unsigned char>(filename[pos])) != 0) {
      const std::uint64_t digit = static_cast<std::uint64_t>(filename[pos] - '0');
      if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10U) {
        overflow = true;
      }
      value = value * 10U + digit;
      any_digit = true;
      ++pos;
    }

    if (any_digit) {
      if (overflow) {
        return false;
      }
      frame_number = value;
      return true;
    }
    search_from = prefix_at + 1U;
  }
}

bool IsCaptureImage(const fs::path& path) {
  const std::string extension = path.extension().string();
  return extension == ".jpg" || extension == ".jpeg" || extension == ".png";
}

CaptureDirFrameSource::CaptureDirFrameSource(fs::path capture_dir,
                                             const std::size_t max_frames_per_fetch)
    : capture_dir_(std::move(capture_dir)),
      max_frames_per_fetch_(std::max<std::size_t>(max_frames_per_fetch, 1U)) {}

void CaptureDirFrameSource::FetchNewFrames(const FetchFramesRequest& request,
                                           FetchFramesCallback done) {
  FetchFramesResult result;
  result.success = ScanNewFrames(request.since_frame_number, result.frames, result.error);
  if (!result.success) {
    result.frames.clear();
  }
  done(std::move(result));
}

bool CaptureDirFrameSource::ScanNewFrames(const std::uint64_t since_frame_number,
                                          std::vector<CapturedFrameRef>& frames,
                                          std::string& error) const {
  frames.clear();
  error.clear();

  std::error_code ec;
  if (!fs::exists(capture_dir_, ec)) {
    if (ec) {
      error = "failed to stat capture directory '" + capture_dir_.string() + "': " + ec.message();
      return false;
    }
    return true;
  }

  fs::directory_iterator it(capture_dir_, ec);
  if (ec) {
    error = "failed to open capture directory '" + capture_dir_.string() + "': " + ec.message();
    return false;
  }

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      error = "failed to list capture directory '" + capture_dir_.string() + "': " + ec.message();
      return false;
    }
    const fs::directory_entry& entry = *it;
    std::error_code entry_ec;
    if (!entry.is_regular_file(entry_ec) || !IsCaptureImage(entry.path())) {
      continue;
    }

    std::uint64_t frame_number = 0U;
    if (!ParseCaptureFrameNumber(entry.path().filename().string(), frame_number) ||
        frame_number <= since_frame_number) {
      continue;
    }

    // A file removed between listing and stat is skipped, not fatal.
    const fs::file_time_type mtime = entry.last_write_time(entry_ec);
    if (entry_ec) {
      continue;
    }

    frames.push_back({
        .path = entry.path().string(),
        .frame_number = frame_number,
        .timestamp = ToEpochSeconds(mtime),
    });
  }

  std::sort(frames.begin(), frames.end(),
            [](const CapturedFrameRef& lhs, const CapturedFrameRef& rhs) {
              return lhs.frame_number < rhs.frame_number;
            });

  // The analysis sidecar lands after the image. Nothing at or after the
  // first frame still waiting for it is reported, so the low-water mark
  // never moves past an unanalyzed frame.
  const auto first_pending =
      std::find_if(frames.begin(), frames.end(), [](const CapturedFrameRef& frame) {
        std::error_code sidecar_ec;
        return !fs::is_regular_file(AnalysisSidecarPath(frame.path), sidecar_ec);
      });
  frames.erase(first_pending, frames.end());

  if (frames.size() > max_frames_per_fetch_) {
    frames.erase(frames.begin(),
                 frames.begin() + static_cast<std::ptrdiff_t>(frames.size() - max_frames_per_fetch_));
  }
  return true;
}

} // namespace framewatch::backends::capture_dir
