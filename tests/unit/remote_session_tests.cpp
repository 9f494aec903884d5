#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include "remote/remote_session.h"
#include "support/fake_gateway.h"
#include "support/manual_clock.h"

namespace tvlink::remote::tests {

using namespace std::chrono_literals;
using test_support::FakeGateway;
using test_support::make_status;

class RemoteSessionTest : public ::testing::Test {
 protected:
  RemoteSessionTest()
      : timers_(clock_.fn()),
        session_(gateway_, timers_, RemoteSessionConfig{}, [] { return true; },
                 [this](FeedbackPattern pattern) { feedback_.push_back(pattern); }) {}

  void run_for(std::chrono::milliseconds duration) { clock_.run_for(timers_, duration); }

  static gateway::DeviceEvent event(const std::string& type, nlohmann::json data) {
    gateway::DeviceEvent e;
    e.type_name = type;
    e.type = gateway::device_event_type_from_string(type);
    e.data = std::move(data);
    return e;
  }

  test_support::ManualClock clock_;
  utils::TimerHeap timers_;
  FakeGateway gateway_;
  std::vector<FeedbackPattern> feedback_;
  RemoteSession session_;
};

TEST_F(RemoteSessionTest, StartPollsImmediately) {
  session_.start();
  EXPECT_TRUE(session_.running());
  EXPECT_EQ(gateway_.count("status"), 1U);
  EXPECT_EQ(gateway_.count("events"), 0U);
  EXPECT_TRUE(session_.poller().timer_armed());
  EXPECT_TRUE(session_.events().timer_armed());
}

TEST_F(RemoteSessionTest, EventStreamFollowsConnection) {
  session_.start();
  gateway_.complete_status(make_status(true));
  EXPECT_TRUE(session_.state().connected());

  run_for(3000ms);
  EXPECT_EQ(gateway_.count("events"), 1U);
}

TEST_F(RemoteSessionTest, ImeShowUpdatesText) {
  session_.start();
  gateway_.complete_status(make_status(true));
  run_for(3000ms);
  ASSERT_EQ(gateway_.event_handlers.size(), 1U);

  gateway_.complete_event(event("ime_show", {{"value", "star wa"}}));
  EXPECT_EQ(session_.text().current(), "star wa");
  EXPECT_EQ(session_.text().last_sent(), "star wa");

  // Typing continues from the device's value.
  session_.text().on_edit("star wars");
  EXPECT_EQ(gateway_.args("send_text"), std::vector<std::string>{"rs"});
}

TEST_F(RemoteSessionTest, OtherEventsLeaveTextAlone) {
  session_.start();
  gateway_.complete_status(make_status(true));
  run_for(3000ms);

  gateway_.complete_event(event("volume_changed", {{"level", 4}}));
  EXPECT_TRUE(session_.text().current().empty());
  // The stream keeps polling.
  EXPECT_EQ(gateway_.count("events"), 2U);
}

TEST_F(RemoteSessionTest, PairingRequestOpensCodeEntry) {
  session_.start();
  gateway_.complete_status(make_status(false, true));
  EXPECT_EQ(session_.pairing().phase(), PairingPhase::kCodeEntry);

  EXPECT_FALSE(session_.pairing().submit("A1B2C3"));
  EXPECT_EQ(gateway_.args("pairing_code"), std::vector<std::string>{"A1B2C3"});
  EXPECT_TRUE(session_.state().snapshot().pairing_in_progress);
}

TEST_F(RemoteSessionTest, KeysUseSessionState) {
  session_.start();
  EXPECT_EQ(session_.keys().send("KEYCODE_HOME"), error::Errc::kNotConnected);
  EXPECT_EQ(session_.notices().latest_message(), "Not connected to TV");

  gateway_.complete_status(make_status(true));
  EXPECT_FALSE(session_.keys().send("KEYCODE_HOME"));
  gateway_.complete_command();
  ASSERT_EQ(feedback_.size(), 1U);
  EXPECT_EQ(feedback_[0], FeedbackPattern::kKeyPress);
}

TEST_F(RemoteSessionTest, StopCancelsEverything) {
  session_.start();
  gateway_.complete_status(make_status(true));
  run_for(3000ms);
  session_.keys().send("KEYCODE_MUTE");
  session_.notices().error("boom");

  session_.stop();
  EXPECT_FALSE(session_.running());
  EXPECT_EQ(gateway_.cancel_all_count, 1);
  EXPECT_TRUE(gateway_.commands.empty());
  EXPECT_TRUE(gateway_.event_handlers.empty());
  EXPECT_EQ(session_.notices().size(), 0U);
  EXPECT_TRUE(timers_.empty());
  EXPECT_FALSE(session_.poller().in_flight());
  EXPECT_FALSE(session_.events().in_flight());

  const auto calls = gateway_.calls.size();
  run_for(60000ms);
  EXPECT_EQ(gateway_.calls.size(), calls);
}

TEST_F(RemoteSessionTest, RestartAfterStop) {
  session_.start();
  session_.stop();
  session_.start();
  EXPECT_EQ(gateway_.count("status"), 2U);
}

}  // namespace tvlink::remote::tests
