#include <gtest/gtest.h>

#include <chrono>
#include <vector>

#include "remote/notice_board.h"
#include "remote/session_state.h"
#include "remote/status_poller.h"
#include "support/fake_gateway.h"
#include "support/manual_clock.h"

namespace tvlink::remote::tests {

using namespace std::chrono_literals;
using test_support::FakeGateway;
using test_support::make_status;

class StatusPollerTest : public ::testing::Test {
 protected:
  StatusPollerTest()
      : timers_(clock_.fn()), notices_(timers_), poller_(gateway_, state_, timers_, notices_) {}

  void run_for(std::chrono::milliseconds duration) { clock_.run_for(timers_, duration); }

  test_support::ManualClock clock_;
  utils::TimerHeap timers_;
  FakeGateway gateway_;
  NoticeBoard notices_;
  SessionState state_;
  StatusPoller poller_;
};

TEST_F(StatusPollerTest, StartPollsImmediatelyThenAtBaseInterval) {
  poller_.start();
  EXPECT_EQ(gateway_.count("status"), 1U);
  gateway_.complete_status(make_status(false));

  run_for(1999ms);
  EXPECT_EQ(gateway_.count("status"), 1U);
  run_for(1ms);
  EXPECT_EQ(gateway_.count("status"), 2U);
}

TEST_F(StatusPollerTest, SuccessfulPollReplacesSnapshot) {
  gateway::StatusReport status = make_status(true);
  status.tv_name = "Living Room";
  status.apps = {{"YouTube", "com.google.android.youtube.tv", "yt.png"}};

  std::vector<SessionChange> changes;
  state_.subscribe([&](const SessionChange& change, const SessionSnapshot&) {
    changes.push_back(change);
  });

  poller_.poll();
  gateway_.complete_status(status);

  const auto& snapshot = state_.snapshot();
  EXPECT_TRUE(snapshot.connected);
  EXPECT_EQ(snapshot.device_name, "Living Room");
  ASSERT_EQ(snapshot.apps.size(), 1U);
  EXPECT_EQ(snapshot.apps[0].id, "com.google.android.youtube.tv");

  ASSERT_EQ(changes.size(), 1U);
  EXPECT_EQ(changes[0].source, ChangeSource::kStatusPoll);
  EXPECT_TRUE(changes[0].has(SessionField::kConnected));
  EXPECT_TRUE(changes[0].has(SessionField::kDeviceName));
  EXPECT_TRUE(changes[0].has(SessionField::kApps));
  EXPECT_FALSE(changes[0].has(SessionField::kConnecting));
}

TEST_F(StatusPollerTest, FailedPollLeavesStateUntouched) {
  poller_.poll();
  gateway_.complete_status(make_status(true));
  const SessionSnapshot before = state_.snapshot();

  int published = 0;
  state_.subscribe([&](const SessionChange&, const SessionSnapshot&) { ++published; });

  poller_.poll();
  gateway_.fail_status();

  EXPECT_EQ(state_.snapshot(), before);
  EXPECT_EQ(published, 0);
  EXPECT_EQ(notices_.size(), 0U);
  EXPECT_EQ(poller_.stats().polls_failed, 1U);
}

TEST_F(StatusPollerTest, TickSkippedWhilePollInFlight) {
  poller_.start();
  ASSERT_TRUE(poller_.in_flight());

  run_for(2000ms);
  run_for(2000ms);
  EXPECT_EQ(gateway_.count("status"), 1U);
  EXPECT_EQ(poller_.stats().ticks_skipped, 2U);

  gateway_.complete_status(make_status(false));
  run_for(2000ms);
  EXPECT_EQ(gateway_.count("status"), 2U);
}

TEST_F(StatusPollerTest, ConnectSwitchesToFastCadenceUntilConnected) {
  poller_.start();
  gateway_.complete_status(make_status(false));

  poller_.connect();
  ASSERT_EQ(gateway_.count("connect"), 1U);
  gateway_.complete_command();
  EXPECT_EQ(poller_.cadence(), PollCadence::kFast);
  EXPECT_EQ(timers_.size(), 1U);

  run_for(500ms);
  EXPECT_EQ(gateway_.count("status"), 2U);
  gateway_.complete_status(make_status(false, false, true));
  EXPECT_EQ(poller_.cadence(), PollCadence::kFast);

  run_for(500ms);
  EXPECT_EQ(gateway_.count("status"), 3U);
  gateway_.complete_status(make_status(true));
  EXPECT_EQ(poller_.cadence(), PollCadence::kBase);
  EXPECT_EQ(timers_.size(), 1U);

  run_for(1999ms);
  EXPECT_EQ(gateway_.count("status"), 3U);
  run_for(1ms);
  EXPECT_EQ(gateway_.count("status"), 4U);
}

TEST_F(StatusPollerTest, AbortedConnectRestoresBaseCadence) {
  poller_.start();
  gateway_.complete_status(make_status(false));
  poller_.enter_fast_mode();

  run_for(500ms);
  gateway_.complete_status(make_status(false, false, false));
  EXPECT_EQ(poller_.cadence(), PollCadence::kBase);
}

TEST_F(StatusPollerTest, PollIssuedBeforeFastModeDoesNotEndIt) {
  poller_.start();
  ASSERT_TRUE(poller_.in_flight());
  poller_.enter_fast_mode();

  gateway_.complete_status(make_status(false));
  EXPECT_EQ(poller_.cadence(), PollCadence::kFast);
}

TEST_F(StatusPollerTest, ConnectFailureSurfacesNotice) {
  poller_.connect();
  gateway_.reject_command("Failed to connect to server");

  EXPECT_EQ(poller_.cadence(), PollCadence::kBase);
  EXPECT_EQ(notices_.latest_message(), "Failed to connect to server");
}

TEST_F(StatusPollerTest, AtMostOneTimerPending) {
  poller_.start();
  gateway_.complete_status(make_status(false));
  for (int i = 0; i < 5; ++i) {
    poller_.enter_fast_mode();
  }
  EXPECT_EQ(timers_.size(), 1U);

  poller_.start();
  EXPECT_EQ(timers_.size(), 1U);
  EXPECT_EQ(gateway_.count("status"), 1U);
}

TEST_F(StatusPollerTest, StopCancelsTimer) {
  poller_.start();
  gateway_.complete_status(make_status(false));
  poller_.stop();
  poller_.stop();

  EXPECT_FALSE(poller_.timer_armed());
  run_for(10000ms);
  EXPECT_EQ(gateway_.count("status"), 1U);
}

}  // namespace tvlink::remote::tests
