#include "remote/text_input.h"

#include <utility>

#include "common/logging/logger.h"
#include "remote/key_map.h"

namespace tvlink::remote {

namespace {
bool is_continuation(char c) { return (static_cast<unsigned char>(c) & 0xC0) == 0x80; }

// Start of the last character in text.
std::size_t last_char_start(std::string_view text) {
  std::size_t pos = 0;
  std::size_t start = 0;
  while (pos < text.size()) {
    start = pos;
    pos += char_length_at(text, pos);
  }
  return start;
}
}  // namespace

std::size_t char_length_at(std::string_view text, std::size_t pos) {
  const auto lead = static_cast<unsigned char>(text[pos]);
  std::size_t length = 1;
  if ((lead & 0xE0) == 0xC0) {
    length = 2;
  } else if ((lead & 0xF0) == 0xE0) {
    length = 3;
  } else if ((lead & 0xF8) == 0xF0) {
    length = 4;
  }
  if (pos + length > text.size()) {
    return 1;
  }
  for (std::size_t i = 1; i < length; ++i) {
    if (!is_continuation(text[pos + i])) {
      return 1;
    }
  }
  return length;
}

std::size_t count_code_points(std::string_view text) {
  std::size_t count = 0;
  for (std::size_t pos = 0; pos < text.size(); pos += char_length_at(text, pos)) {
    ++count;
  }
  return count;
}

std::vector<TextOp> diff_text(std::string_view previous, std::string_view current) {
  std::vector<TextOp> ops;
  if (previous == current) {
    return ops;
  }

  // Walk whole characters so the prefix ends on a boundary in both strings.
  std::size_t prefix = 0;
  while (prefix < previous.size() && prefix < current.size()) {
    const auto length = char_length_at(previous, prefix);
    if (char_length_at(current, prefix) != length ||
        previous.substr(prefix, length) != current.substr(prefix, length)) {
      break;
    }
    prefix += length;
  }

  const auto deletes = count_code_points(previous.substr(prefix));
  for (std::size_t i = 0; i < deletes; ++i) {
    ops.push_back(TextOp{TextOp::Kind::kDeleteChar, {}});
  }
  if (prefix < current.size()) {
    ops.push_back(TextOp{TextOp::Kind::kInsertText, std::string(current.substr(prefix))});
  }
  return ops;
}

TextInputSync::TextInputSync(gateway::GatewayClient& gateway, const SessionState& state,
                             KeyDispatcher& keys, NoticeBoard& notices, FeedbackSink feedback,
                             bool auto_enter)
    : gateway_(gateway),
      state_(state),
      keys_(keys),
      notices_(notices),
      feedback_(std::move(feedback)),
      auto_enter_(auto_enter) {}

void TextInputSync::on_edit(std::string current) {
  const std::string previous = std::move(last_sent_);
  // Recorded before anything is sent so a quick follow-up edit diffs
  // against this snapshot, not against what the device acknowledged.
  last_sent_ = current;
  current_ = std::move(current);

  const auto ops = diff_text(previous, current_);
  if (ops.empty()) {
    return;
  }
  if (!state_.connected()) {
    LOG_DEBUG("Not connected, dropping {} text operation(s)", ops.size());
    return;
  }

  for (const auto& op : ops) {
    if (op.kind == TextOp::Kind::kDeleteChar) {
      enqueue(Pending{Pending::Action::kKey, keycode::kDel, false, FeedbackPattern::kKeyPress});
    } else {
      enqueue(Pending{Pending::Action::kText, op.text, false, FeedbackPattern::kTextChunk});
    }
  }
}

bool TextInputSync::submit_all() {
  if (current_.empty() || !state_.connected()) {
    return false;
  }
  last_sent_ = current_;
  enqueue(Pending{Pending::Action::kText, current_, auto_enter_, FeedbackPattern::kTextSubmit});
  return true;
}

void TextInputSync::press_enter() {
  enqueue(Pending{Pending::Action::kKey, keycode::kEnter, false, FeedbackPattern::kKeyPress});
}

void TextInputSync::backspace() {
  if (current_.empty()) {
    enqueue(Pending{Pending::Action::kKey, keycode::kDel, false, FeedbackPattern::kKeyPress});
    return;
  }
  on_edit(current_.substr(0, last_char_start(current_)));
}

void TextInputSync::clear() {
  current_.clear();
  last_sent_.clear();
}

void TextInputSync::apply_remote_value(std::string value) {
  LOG_DEBUG("Device text field holds {} character(s)", count_code_points(value));
  current_ = value;
  last_sent_ = std::move(value);
}

void TextInputSync::cancel_pending() {
  if (!queue_.empty()) {
    LOG_DEBUG("Dropping {} queued text operation(s)", queue_.size());
  }
  queue_.clear();
}

void TextInputSync::enqueue(Pending op) {
  queue_.push_back(std::move(op));
  pump();
}

void TextInputSync::pump() {
  while (!in_flight_ && !queue_.empty()) {
    Pending op = std::move(queue_.front());
    queue_.pop_front();
    in_flight_ = true;

    auto done = [this, op](const gateway::CommandResult& result) { on_done(op, result); };

    if (op.action == Pending::Action::kKey) {
      // Rejections are reported by the dispatcher itself.
      if (auto ec = keys_.send(op.value, std::move(done))) {
        in_flight_ = false;
      }
      continue;
    }

    if (!state_.connected()) {
      LOG_DEBUG("Not connected, dropping queued text");
      in_flight_ = false;
      continue;
    }
    gateway_.send_text(op.value, op.enter, std::move(done));
  }
}

void TextInputSync::on_done(const Pending& op, const gateway::CommandResult& result) {
  in_flight_ = false;
  if (op.action == Pending::Action::kText) {
    if (!result.ok()) {
      LOG_WARN("Sending text failed: {}", result.message);
      notices_.error(result.message);
    } else if (feedback_) {
      feedback_(op.feedback);
    }
  }
  pump();
}

}  // namespace tvlink::remote
