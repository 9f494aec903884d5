#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "remote/event_stream.h"
#include "remote/session_state.h"
#include "support/fake_gateway.h"
#include "support/manual_clock.h"

namespace tvlink::remote::tests {

using namespace std::chrono_literals;
using test_support::FakeGateway;

class EventStreamTest : public ::testing::Test {
 protected:
  EventStreamTest()
      : timers_(clock_.fn()),
        stream_(gateway_, state_, timers_, [this]() { return visible_; }) {
    stream_.subscribe([this](const gateway::DeviceEvent& event) {
      received_.push_back(event.type_name);
    });
  }

  void set_connected(bool connected) {
    SessionSnapshot snapshot;
    snapshot.connected = connected;
    state_.replace(snapshot, ChangeSource::kStatusPoll);
  }

  static gateway::DeviceEvent ime_show(const std::string& value) {
    gateway::DeviceEvent event;
    event.type = gateway::DeviceEventType::kImeShow;
    event.type_name = "ime_show";
    event.data = {{"value", value}};
    return event;
  }

  void run_for(std::chrono::milliseconds duration) { clock_.run_for(timers_, duration); }

  test_support::ManualClock clock_;
  utils::TimerHeap timers_;
  FakeGateway gateway_;
  SessionState state_;
  bool visible_{true};
  EventStream stream_;
  std::vector<std::string> received_;
};

TEST_F(EventStreamTest, ParksWhileDisconnected) {
  stream_.start();
  EXPECT_EQ(gateway_.count("events"), 0U);
  EXPECT_TRUE(stream_.timer_armed());

  run_for(9000ms);
  EXPECT_EQ(gateway_.count("events"), 0U);

  set_connected(true);
  run_for(3000ms);
  EXPECT_EQ(gateway_.count("events"), 1U);
}

TEST_F(EventStreamTest, DispatchesEventAndContinuesImmediately) {
  set_connected(true);
  stream_.start();
  ASSERT_EQ(gateway_.count("events"), 1U);

  gateway_.complete_event(ime_show("hello"));
  ASSERT_EQ(received_.size(), 1U);
  EXPECT_EQ(received_[0], "ime_show");
  EXPECT_EQ(gateway_.count("events"), 2U);
  EXPECT_EQ(stream_.stats().events, 1U);
}

TEST_F(EventStreamTest, EmptyResponseLoopsWithoutDispatch) {
  set_connected(true);
  stream_.start();

  gateway_.complete_event(std::nullopt);
  EXPECT_TRUE(received_.empty());
  EXPECT_EQ(gateway_.count("events"), 2U);
}

TEST_F(EventStreamTest, ErrorBacksOffBeforeRetrying) {
  set_connected(true);
  stream_.start();

  gateway_.fail_event();
  EXPECT_EQ(gateway_.count("events"), 1U);
  run_for(1999ms);
  EXPECT_EQ(gateway_.count("events"), 1U);
  run_for(1ms);
  EXPECT_EQ(gateway_.count("events"), 2U);
  EXPECT_EQ(stream_.stats().errors, 1U);
}

TEST_F(EventStreamTest, ErrorsNeverEndTheLoop) {
  set_connected(true);
  stream_.start();

  for (int i = 0; i < 10; ++i) {
    gateway_.fail_event();
    run_for(2000ms);
  }
  EXPECT_TRUE(stream_.running());
  EXPECT_EQ(gateway_.count("events"), 11U);
}

TEST_F(EventStreamTest, BackgroundAddsDelay) {
  set_connected(true);
  visible_ = false;
  stream_.start();

  gateway_.complete_event(std::nullopt);
  EXPECT_EQ(gateway_.count("events"), 1U);
  run_for(1000ms);
  EXPECT_EQ(gateway_.count("events"), 2U);

  gateway_.fail_event();
  run_for(2999ms);
  EXPECT_EQ(gateway_.count("events"), 2U);
  run_for(1ms);
  EXPECT_EQ(gateway_.count("events"), 3U);
}

TEST_F(EventStreamTest, SingleRequestOutstanding) {
  set_connected(true);
  stream_.start();
  stream_.start();
  stream_.stop();
  stream_.start();

  EXPECT_EQ(gateway_.event_handlers.size(), 1U);
  EXPECT_EQ(gateway_.count("events"), 1U);

  // The pending request carries the restarted loop on.
  gateway_.complete_event(std::nullopt);
  EXPECT_EQ(gateway_.event_handlers.size(), 1U);
}

TEST_F(EventStreamTest, CompletionAfterStopDoesNotContinue) {
  set_connected(true);
  stream_.start();
  stream_.stop();

  gateway_.complete_event(ime_show("late"));
  EXPECT_TRUE(received_.empty());
  EXPECT_EQ(gateway_.count("events"), 1U);
  EXPECT_FALSE(stream_.timer_armed());
  EXPECT_TRUE(timers_.empty());
}

TEST_F(EventStreamTest, StopCancelsParkedTimer) {
  stream_.start();
  ASSERT_TRUE(stream_.timer_armed());
  stream_.stop();
  EXPECT_TRUE(timers_.empty());
}

}  // namespace tvlink::remote::tests
