#include <gtest/gtest.h>

#include <chrono>
#include <vector>

#include "common/error/remote_error.h"
#include "remote/notice_board.h"
#include "remote/pairing_coordinator.h"
#include "remote/session_state.h"
#include "remote/status_poller.h"
#include "support/fake_gateway.h"
#include "support/manual_clock.h"

namespace tvlink::remote::tests {

using namespace std::chrono_literals;
using test_support::FakeGateway;
using test_support::make_status;

class PairingCoordinatorTest : public ::testing::Test {
 protected:
  PairingCoordinatorTest()
      : timers_(clock_.fn()),
        notices_(timers_),
        poller_(gateway_, state_, timers_, notices_),
        pairing_(gateway_, state_, poller_, notices_) {
    pairing_.subscribe([this](PairingPhase phase) { phases_.push_back(phase); });
  }

  // Deliver one status poll result.
  void report(bool connected, bool pairing) {
    poller_.poll();
    gateway_.complete_status(make_status(connected, pairing));
  }

  test_support::ManualClock clock_;
  utils::TimerHeap timers_;
  FakeGateway gateway_;
  NoticeBoard notices_;
  SessionState state_;
  StatusPoller poller_;
  PairingCoordinator pairing_;
  std::vector<PairingPhase> phases_;
};

TEST_F(PairingCoordinatorTest, PhaseToString) {
  EXPECT_STREQ(pairing_phase_to_string(PairingPhase::kIdle), "idle");
  EXPECT_STREQ(pairing_phase_to_string(PairingPhase::kCodeEntry), "code-entry");
  EXPECT_STREQ(pairing_phase_to_string(PairingPhase::kSubmitting), "submitting");
}

TEST_F(PairingCoordinatorTest, GatewayPairingOpensCodeEntry) {
  report(false, true);
  EXPECT_EQ(pairing_.phase(), PairingPhase::kCodeEntry);
  EXPECT_TRUE(pairing_.code().empty());
  EXPECT_FALSE(pairing_.submitting());
  ASSERT_EQ(phases_.size(), 1U);
  EXPECT_EQ(phases_[0], PairingPhase::kCodeEntry);

  // Repeated reports keep the flow open without re-announcing it.
  report(false, true);
  EXPECT_EQ(phases_.size(), 1U);
}

TEST_F(PairingCoordinatorTest, ShortCodeIsRejectedLocally) {
  report(false, true);
  const auto calls = gateway_.calls.size();

  auto ec = pairing_.submit("123");
  EXPECT_EQ(ec, error::make_error_code(error::Errc::kValidation));
  EXPECT_EQ(gateway_.calls.size(), calls);
  EXPECT_EQ(pairing_.phase(), PairingPhase::kCodeEntry);
  EXPECT_EQ(notices_.latest_message(), "Please enter a valid pairing code");
}

TEST_F(PairingCoordinatorTest, SubmitSetsPairingInProgressOptimistically) {
  report(false, true);
  // The gateway has not reported the flag yet in this state.
  state_.replace(SessionSnapshot{}, ChangeSource::kStatusPoll);
  ASSERT_FALSE(state_.snapshot().pairing_in_progress);

  EXPECT_FALSE(pairing_.submit("A1B2C3"));
  EXPECT_EQ(pairing_.phase(), PairingPhase::kSubmitting);
  EXPECT_TRUE(state_.snapshot().pairing_in_progress);
  ASSERT_EQ(gateway_.count("pairing_code"), 1U);
  EXPECT_EQ(gateway_.args("pairing_code")[0], "A1B2C3");
}

TEST_F(PairingCoordinatorTest, RejectionReturnsToCodeEntryKeepingCode) {
  report(false, true);
  ASSERT_FALSE(pairing_.submit("ABCD"));

  gateway_.reject_command("Not waiting for pairing code");
  EXPECT_EQ(pairing_.phase(), PairingPhase::kCodeEntry);
  EXPECT_EQ(pairing_.code(), "ABCD");
  EXPECT_EQ(notices_.latest_message(), "Not waiting for pairing code");
}

TEST_F(PairingCoordinatorTest, AcceptanceClosesFlowAndPollsFast) {
  report(false, true);
  ASSERT_FALSE(pairing_.submit("ABCD"));

  gateway_.complete_command();
  EXPECT_EQ(pairing_.phase(), PairingPhase::kIdle);
  EXPECT_TRUE(pairing_.code().empty());
  EXPECT_EQ(poller_.cadence(), PollCadence::kFast);
}

TEST_F(PairingCoordinatorTest, AnsweredRequestDoesNotReopen) {
  report(false, true);
  ASSERT_FALSE(pairing_.submit("ABCD"));
  gateway_.complete_command();

  // The gateway still reports the request it is finishing.
  report(false, true);
  EXPECT_EQ(pairing_.phase(), PairingPhase::kIdle);

  // Once it clears, a new request opens the flow again.
  report(false, false);
  report(false, true);
  EXPECT_EQ(pairing_.phase(), PairingPhase::kCodeEntry);
}

TEST_F(PairingCoordinatorTest, ConnectedClosesOpenFlow) {
  report(false, true);
  ASSERT_TRUE(pairing_.set_code("12"));

  report(true, false);
  EXPECT_EQ(pairing_.phase(), PairingPhase::kIdle);
  EXPECT_TRUE(pairing_.code().empty());
}

TEST_F(PairingCoordinatorTest, LateResultAfterConnectIsIgnored) {
  report(false, true);
  ASSERT_FALSE(pairing_.submit("ABCD"));
  report(true, false);
  ASSERT_EQ(pairing_.phase(), PairingPhase::kIdle);

  gateway_.reject_command("Pairing timeout");
  EXPECT_EQ(pairing_.phase(), PairingPhase::kIdle);
}

TEST_F(PairingCoordinatorTest, CancelReturnsToIdle) {
  report(false, true);
  ASSERT_TRUE(pairing_.set_code("9876"));

  EXPECT_TRUE(pairing_.cancel());
  EXPECT_EQ(pairing_.phase(), PairingPhase::kIdle);
  EXPECT_TRUE(pairing_.code().empty());
  EXPECT_TRUE(pairing_.cancel());
}

TEST_F(PairingCoordinatorTest, CannotCancelWhileSubmitting) {
  report(false, true);
  ASSERT_FALSE(pairing_.submit("ABCD"));
  EXPECT_FALSE(pairing_.cancel());
  EXPECT_EQ(pairing_.phase(), PairingPhase::kSubmitting);
}

TEST_F(PairingCoordinatorTest, SubmitWithoutRequestIsRejected) {
  auto ec = pairing_.submit("ABCD");
  EXPECT_EQ(ec, error::make_error_code(error::Errc::kValidation));
  EXPECT_EQ(gateway_.count("pairing_code"), 0U);
}

}  // namespace tvlink::remote::tests
