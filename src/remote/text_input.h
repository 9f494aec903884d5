#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <vector>

#include "gateway/gateway_client.h"
#include "remote/feedback.h"
#include "remote/key_dispatcher.h"
#include "remote/notice_board.h"
#include "remote/session_state.h"

namespace tvlink::remote {

// One edit step reproducing a local text change on the device.
struct TextOp {
  enum class Kind : std::uint8_t {
    kInsertText,  // Append text at the cursor.
    kDeleteChar,  // Delete one character before the cursor.
  };

  Kind kind{Kind::kInsertText};
  std::string text;  // kInsertText only.

  bool operator==(const TextOp&) const = default;
};

// Operations turning previous into current, assuming the device's cursor
// sits at the end of previous: delete back to the longest common prefix,
// then insert the rest of current. The prefix never ends inside a UTF-8
// sequence and one kDeleteChar removes one code point.
std::vector<TextOp> diff_text(std::string_view previous, std::string_view current);

// Number of characters in text. A well-formed UTF-8 sequence is one
// character; any byte outside such a sequence counts as one on its own.
std::size_t count_code_points(std::string_view text);

// Byte length of the character starting at pos (pos < text.size()).
std::size_t char_length_at(std::string_view text, std::size_t pos);

// Mirrors a local text buffer onto the device's focused text field.
// Operations go out strictly in the order they were produced, one request
// at a time.
class TextInputSync {
 public:
  TextInputSync(gateway::GatewayClient& gateway, const SessionState& state, KeyDispatcher& keys,
                NoticeBoard& notices, FeedbackSink feedback = {}, bool auto_enter = true);

  TextInputSync(const TextInputSync&) = delete;
  TextInputSync& operator=(const TextInputSync&) = delete;

  // The local buffer now reads current.
  void on_edit(std::string current);

  // Send the whole buffer in one request, optionally followed by Enter.
  // Returns false if there is nothing to send or the session is down.
  bool submit_all();

  void press_enter();

  // Remove the last character locally, or press DEL on the device if the
  // buffer is already empty.
  void backspace();

  // Forget the buffer without telling the device.
  void clear();

  // The device reported its field's contents.
  void apply_remote_value(std::string value);

  // Drop queued operations that have not been sent yet.
  void cancel_pending();

  // The gateway dropped the request in flight without answering.
  void forget_in_flight() { in_flight_ = false; }

  const std::string& current() const { return current_; }
  const std::string& last_sent() const { return last_sent_; }
  bool auto_enter() const { return auto_enter_; }
  void set_auto_enter(bool enabled) { auto_enter_ = enabled; }

  std::size_t queued() const { return queue_.size(); }
  bool in_flight() const { return in_flight_; }

 private:
  struct Pending {
    enum class Action : std::uint8_t { kText, kKey };

    Action action{Action::kText};
    std::string value;
    bool enter{false};
    FeedbackPattern feedback{FeedbackPattern::kTextChunk};
  };

  void enqueue(Pending op);
  void pump();
  void on_done(const Pending& op, const gateway::CommandResult& result);

  gateway::GatewayClient& gateway_;
  const SessionState& state_;
  KeyDispatcher& keys_;
  NoticeBoard& notices_;
  FeedbackSink feedback_;
  bool auto_enter_;

  std::string current_;
  std::string last_sent_;
  std::deque<Pending> queue_;
  bool in_flight_{false};
};

}  // namespace tvlink::remote
