#pragma once

#include "backends/monitoring_backend.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace framewatch::backends::capture_dir {

constexpr std::size_t kDefaultMaxFramesPerFetch = 10U;

// Extracts N from the first `frame_<digits>` in a capture file name.
bool ParseCaptureFrameNumber(std::string_view filename, std::uint64_t& frame_number);

// True for the image extensions the capture service writes (.jpg, .jpeg,
// .png).
bool IsCaptureImage(const std::filesystem::path& path);

// Frame source over the directory the capture service writes screenshots
// into. Requests complete inline.
//
// A fetch returns frames numbered above the low-water mark, ascending, at
// most `max_frames_per_fetch` of them (the newest ones). The timestamp is the
// file's modification time in seconds. A frame is reported only once its
// analysis sidecar exists, and the scan stops at the first frame without
// one. A missing directory is not an error: the capture service may not have
// produced anything yet.
class CaptureDirFrameSource final : public IFrameSource {
public:
  explicit CaptureDirFrameSource(std::filesystem::path capture_dir,
                                 std::size_t max_frames_per_fetch = kDefaultMaxFramesPerFetch);

  void FetchNewFrames(const FetchFramesRequest& request, FetchFramesCallback done) override;

  bool ScanNewFrames(std::uint64_t since_frame_number, std::vector<CapturedFrameRef>& frames,
                     std::string& error) const;

  const std::filesystem::path& capture_dir() const {
    return capture_dir_;
  }

private:
  std::filesystem::path capture_dir_;
  std::size_t max_frames_per_fetch_ = kDefaultMaxFramesPerFetch;
};

} // namespace framewatch::backends::capture_dir
