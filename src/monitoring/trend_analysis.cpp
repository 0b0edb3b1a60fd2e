#include "monitoring/trend_analysis.hpp"

#include "core/json_utils.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

namespace framewatch::monitoring {

namespace {

// Newest-last view of the last `window` processed frames.
std::vector<const Frame*> RecentProcessed(const std::deque<Frame>& frames,
                                          const std::size_t window) {
  std::vector<const Frame*> recent;
  for (auto it = frames.rbegin(); it != frames.rend() && recent.size() < window; ++it) {
    if (it->processed) {
      recent.push_back(&(*it));
    }
  }
  std::reverse(recent.begin(), recent.end());
  return recent;
}

} // namespace

std::optional<ErrorTrend> ComputeErrorTrend(const std::deque<Frame>& frames) {
  const std::vector<const Frame*> recent = RecentProcessed(frames, kErrorTrendWindow);
  if (recent.empty()) {
    return std::nullopt;
  }

  ErrorTrend trend;
  trend.frames_analyzed = recent.size();

  // Walks back from the newest frame. Each streak ends at the first frame
  // that breaks it, and the walk ends as soon as either streak ends or a
  // frame shows neither condition.
  for (auto it = recent.rbegin(); it != recent.rend(); ++it) {
    const Analysis& analysis = (*it)->analysis;
    if (analysis.blackscreen.detected) {
      ++trend.blackscreen_consecutive;
    } else if (trend.blackscreen_consecutive > 0U) {
      break;
    }

    if (analysis.freeze.detected) {
      ++trend.freeze_consecutive;
    } else if (trend.freeze_consecutive > 0U) {
      break;
    }

    if (!analysis.blackscreen.detected && !analysis.freeze.detected) {
      break;
    }
  }

  const std::uint32_t max_consecutive =
      std::max(trend.blackscreen_consecutive, trend.freeze_consecutive);
  trend.has_warning = max_consecutive >= 1U && max_consecutive < 3U;
  trend.has_error = max_consecutive >= 3U;
  return trend;
}

std::optional<SubtitleTrend> ComputeSubtitleTrend(const std::deque<Frame>& frames) {
  const std::vector<const Frame*> recent = RecentProcessed(frames, kSubtitleTrendWindow);
  if (recent.empty()) {
    return std::nullopt;
  }

  SubtitleTrend trend;
  trend.frames_analyzed = recent.size();
  trend.current_has_subtitles = recent.back()->analysis.subtitles.detected;
  trend.no_subtitles_streak = static_cast<std::size_t>(
      std::count_if(recent.begin(), recent.end(),
                    [](const Frame* frame) { return !frame->analysis.subtitles.detected; }));
  trend.show_red_indicator = recent.size() >= kSubtitleTrendWindow &&
                             trend.no_subtitles_streak == recent.size();
  return trend;
}

TrendSummary ComputeTrends(const std::deque<Frame>& frames) {
  return TrendSummary{
      .errors = ComputeErrorTrend(frames),
      .subtitles = ComputeSubtitleTrend(frames),
  };
}

std::string ToJson(const TrendSummary& trends) {
  using core::WriteJsonBoolField;
  using core::WriteJsonRawField;

  std::ostringstream out;
  bool first = true;
  out << "{";

  if (trends.errors.has_value()) {
    const ErrorTrend& errors = trends.errors.value();
    std::ostringstream section;
    bool section_first = true;
    section << "{";
    WriteJsonRawField(section, "blackscreenConsecutive",
                      std::to_string(errors.blackscreen_consecutive), section_first);
    WriteJsonRawField(section, "freezeConsecutive", std::to_string(errors.freeze_consecutive),
                      section_first);
    WriteJsonBoolField(section, "hasWarning", errors.has_warning, section_first);
    WriteJsonBoolField(section, "hasError", errors.has_error, section_first);
    WriteJsonRawField(section, "framesAnalyzed", std::to_string(errors.frames_analyzed),
                      section_first);
    section << "}";
    WriteJsonRawField(out, "errorTrend", section.str(), first);
  } else {
    WriteJsonRawField(out, "errorTrend", "null", first);
  }

  if (trends.subtitles.has_value()) {
    const SubtitleTrend& subtitles = trends.subtitles.value();
    std::ostringstream section;
    bool section_first = true;
    section << "{";
    WriteJsonBoolField(section, "showRedIndicator", subtitles.show_red_indicator, section_first);
    WriteJsonBoolField(section, "currentHasSubtitles", subtitles.current_has_subtitles,
                       section_first);
    WriteJsonRawField(section, "framesAnalyzed", std::to_string(subtitles.frames_analyzed),
                      section_first);
    WriteJsonRawField(section, "noSubtitlesStreak", std::to_string(subtitles.no_subtitles_streak),
                      section_first);
    section << "}";
    WriteJsonRawField(out, "subtitleTrend", section.str(), first);
  } else {
    WriteJsonRawField(out, "subtitleTrend", "null", first);
  }

  out << "}";
  return out.str();
}

} // namespace framewatch::monitoring
