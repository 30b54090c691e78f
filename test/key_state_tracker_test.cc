#include "KeyStateTracker.hpp"
#include <algorithm>
#include <gtest/gtest.h>
#include <string>
#include <vector>

class KeyStateTrackerTest : public ::testing::Test {
protected:
  void SetUp() override {
    for (const KeyCode &code : {KeyCode("x"), KeyCode("y")}) {
      hooks.on_press(code, [this, code] { log.push_back("press " + code); });
      hooks.on_release(code,
                       [this, code] { log.push_back("release " + code); });
    }
  }

  // Advances virtual time in steps of step_ms
  void advance(KeyStateTracker &tracker, long total_ms, long step_ms = 10) {
    for (long t = 0; t < total_ms; t += step_ms) {
      tracker.on_tick(step_ms);
    }
  }

  int count(const std::string &entry) const {
    return static_cast<int>(std::count(log.begin(), log.end(), entry));
  }

  static constexpr CalibrationResult delays{.initial_delay_ms = 300,
                                            .repeat_interval_ms = 40};

  HookRegistry hooks;
  std::vector<std::string> log;
};

TEST_F(KeyStateTrackerTest, EveryKeyStartsReleased) {
  KeyStateTracker tracker(hooks, delays);

  EXPECT_FALSE(tracker.is_pressed("x"));
  EXPECT_FALSE(tracker.state("x").has_value());
  EXPECT_TRUE(tracker.pressed_keys().empty());
}

TEST_F(KeyStateTrackerTest, FirstEventPresses) {
  KeyStateTracker tracker(hooks, delays);
  tracker.on_event_observed("x");

  EXPECT_EQ(log, (std::vector<std::string>{"press x"}));

  auto state = tracker.state("x");
  ASSERT_TRUE(state.has_value());
  EXPECT_TRUE(state->pressed);
  EXPECT_TRUE(state->is_first_repeat);
  EXPECT_EQ(state->elapsed_since_last_event_ms, 0);
}

TEST_F(KeyStateTrackerTest, TransientEventWithinInitialDelayIsNotReleased) {
  KeyStateTracker tracker(hooks, delays);
  tracker.on_event_observed("x");
  advance(tracker, 290);

  EXPECT_EQ(count("release x"), 0);
  EXPECT_TRUE(tracker.is_pressed("x"));
  EXPECT_EQ(tracker.state("x")->elapsed_since_last_event_ms, 290);
}

TEST_F(KeyStateTrackerTest, ReleasesOnlyAfterExceedingInitialDelay) {
  KeyStateTracker tracker(hooks, delays);
  tracker.on_event_observed("x");

  // exactly at the threshold is still pressed
  advance(tracker, 300);
  EXPECT_EQ(count("release x"), 0);

  tracker.on_tick(10);
  EXPECT_EQ(count("release x"), 1);
  EXPECT_FALSE(tracker.is_pressed("x"));

  // later ticks do not release it again
  advance(tracker, 1000);
  EXPECT_EQ(count("release x"), 1);
}

TEST_F(KeyStateTrackerTest, SustainedRepeatsKeepKeyPressed) {
  KeyStateTracker tracker(hooks, delays);

  for (int cycle = 0; cycle < 10; cycle++) {
    tracker.on_event_observed("x");
    advance(tracker, delays.repeat_interval_ms / 2);
  }

  EXPECT_EQ(count("press x"), 1);
  EXPECT_EQ(count("release x"), 0);
  EXPECT_TRUE(tracker.is_pressed("x"));
  EXPECT_FALSE(tracker.state("x")->is_first_repeat);
}

TEST_F(KeyStateTrackerTest, ReleasesAfterRepeatGap) {
  KeyStateTracker tracker(hooks, delays);

  for (int cycle = 0; cycle < 10; cycle++) {
    tracker.on_event_observed("x");
    advance(tracker, delays.repeat_interval_ms / 2);
  }

  // 20 ms already passed since the last repeat
  advance(tracker, 20);
  EXPECT_EQ(count("release x"), 0);

  tracker.on_tick(10);
  EXPECT_EQ(count("release x"), 1);

  advance(tracker, 500);
  EXPECT_EQ(count("release x"), 1);
  EXPECT_FALSE(tracker.is_pressed("x"));
}

TEST_F(KeyStateTrackerTest, RepeatIntervalAppliesAfterFirstRepeat) {
  KeyStateTracker tracker(hooks, delays);
  tracker.on_event_observed("x");
  advance(tracker, 280);
  tracker.on_event_observed("x");

  // the long initial delay no longer protects the key
  advance(tracker, 50);
  EXPECT_EQ(count("release x"), 1);
}

TEST_F(KeyStateTrackerTest, PressingAgainAfterReleaseStartsOver) {
  KeyStateTracker tracker(hooks, delays);
  tracker.on_event_observed("x");
  tracker.on_event_observed("x");
  advance(tracker, 50);
  ASSERT_EQ(count("release x"), 1);

  tracker.on_event_observed("x");

  EXPECT_EQ(count("press x"), 2);
  EXPECT_TRUE(tracker.state("x")->is_first_repeat);

  // back on the initial delay
  advance(tracker, 100);
  EXPECT_EQ(count("release x"), 1);
}

TEST_F(KeyStateTrackerTest, KeysAgeIndependently) {
  KeyStateTracker tracker(hooks, delays);
  tracker.on_event_observed("x");
  advance(tracker, 200);
  tracker.on_event_observed("y");
  advance(tracker, 150);

  EXPECT_EQ(log,
            (std::vector<std::string>{"press x", "press y", "release x"}));
  EXPECT_EQ(tracker.pressed_keys(), (std::vector<KeyCode>{"y"}));
}

TEST_F(KeyStateTrackerTest, UnregisteredKeysAreTrackedSilently) {
  KeyStateTracker tracker(hooks, delays);
  tracker.on_event_observed("\x1b[A");

  EXPECT_TRUE(tracker.is_pressed("\x1b[A"));
  advance(tracker, 400);
  EXPECT_FALSE(tracker.is_pressed("\x1b[A"));
  EXPECT_TRUE(log.empty());
}

TEST_F(KeyStateTrackerTest, ObserverSeesEveryTransition) {
  KeyStateTracker tracker(hooks, delays);
  std::vector<std::string> transitions;
  tracker.set_observer([&](const KeyCode &code, bool pressed) {
    transitions.push_back((pressed ? "+" : "-") + code);
  });

  tracker.on_event_observed("z");
  tracker.on_event_observed("z");
  advance(tracker, 50);

  EXPECT_EQ(transitions, (std::vector<std::string>{"+z", "-z"}));
}
