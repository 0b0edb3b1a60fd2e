#pragma once

#include "monitoring/frame_model.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>

namespace framewatch::monitoring {

constexpr std::size_t kErrorTrendWindow = 10U;
constexpr std::size_t kSubtitleTrendWindow = 3U;

// Consecutive blackscreen/freeze detections counted back from the newest
// frame. One or two in a row is a warning; three or more is an error.
struct ErrorTrend {
  std::uint32_t blackscreen_consecutive = 0U;
  std::uint32_t freeze_consecutive = 0U;
  bool has_warning = false;
  bool has_error = false;
  std::size_t frames_analyzed = 0U;
};

struct SubtitleTrend {
  bool show_red_indicator = false;
  bool current_has_subtitles = false;
  std::size_t frames_analyzed = 0U;
  std::size_t no_subtitles_streak = 0U;
};

struct TrendSummary {
  std::optional<ErrorTrend> errors;
  std::optional<SubtitleTrend> subtitles;
};

// Both return nullopt when no processed frame is buffered.
std::optional<ErrorTrend> ComputeErrorTrend(const std::deque<Frame>& frames);
std::optional<SubtitleTrend> ComputeSubtitleTrend(const std::deque<Frame>& frames);
TrendSummary ComputeTrends(const std::deque<Frame>& frames);

std::string ToJson(const TrendSummary& trends);

} // namespace framewatch::monitoring
