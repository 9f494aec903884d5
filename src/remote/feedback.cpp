#include "remote/feedback.h"

namespace tvlink::remote {

using std::chrono::milliseconds;

const char* feedback_pattern_to_string(FeedbackPattern pattern) {
  switch (pattern) {
    case FeedbackPattern::kKeyPress:
      return "key";
    case FeedbackPattern::kAppLaunch:
      return "app";
    case FeedbackPattern::kTextChunk:
      return "text";
    case FeedbackPattern::kTextSubmit:
      return "submit";
    default:
      return "unknown";
  }
}

std::vector<milliseconds> feedback_pattern_timings(FeedbackPattern pattern) {
  switch (pattern) {
    case FeedbackPattern::kKeyPress:
      return {milliseconds(50)};
    case FeedbackPattern::kAppLaunch:
      return {milliseconds(50), milliseconds(100), milliseconds(50)};
    case FeedbackPattern::kTextChunk:
      return {milliseconds(10)};
    case FeedbackPattern::kTextSubmit:
      return {milliseconds(50), milliseconds(30), milliseconds(50)};
    default:
      return {};
  }
}

}  // namespace tvlink::remote
