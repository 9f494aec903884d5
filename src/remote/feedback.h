#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <vector>

namespace tvlink::remote {

// Physical feedback given after a successful user action.
enum class FeedbackPattern : std::uint8_t {
  kKeyPress,
  kAppLaunch,
  kTextChunk,
  kTextSubmit,
};

const char* feedback_pattern_to_string(FeedbackPattern pattern);

// Alternating on/off durations, starting with "on".
std::vector<std::chrono::milliseconds> feedback_pattern_timings(FeedbackPattern pattern);

using FeedbackSink = std::function<void(FeedbackPattern)>;

}  // namespace tvlink::remote
