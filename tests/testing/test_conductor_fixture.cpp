/**
 * @file test_conductor_fixture.cpp
 * @brief The GoogleTest collaborators: ConductorTest and with_conductor
 */

#include "baton/testing/conductor_test.hpp"

#include <boost/thread/latch.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>

using baton::Beat;
using baton::Conductor;

/* ============================================================================
 * ConductorTest
 * ========================================================================= */

class FixtureTest : public baton::testing::ConductorTest {};

// Nothing calls conduct_test(): TearDown() does, and the threads check themselves
TEST_F(FixtureTest, ConductsAutomaticallyOnTearDown)
{
   thread("late", [this] {
      wait_for_beat(1);
      EXPECT_EQ(beat(), 1u);
   });
   thread("early", [this] { EXPECT_EQ(tick(), 0u); });

   EXPECT_FALSE(conductor->conducting_has_begun());
}

TEST_F(FixtureTest, ExplicitConductIsNotRepeated)
{
   std::atomic<int> runs{0};
   threads(2, "worker", [&runs] { ++runs; });

   conduct_test();
   EXPECT_EQ(runs.load(), 2);
   EXPECT_TRUE(conductor->conducting_has_finished());
}

TEST_F(FixtureTest, FixtureForwardsFreezeAndFinish)
{
   bool finished = false;
   when_finished([&finished] { finished = true; });

   thread([this] {
      Beat const before = beat();
      with_clock_frozen([&] { EXPECT_TRUE(conductor->is_clock_frozen()); });
      EXPECT_EQ(beat(), before);
   });

   conduct_test();
   EXPECT_TRUE(finished);
}

TEST_F(FixtureTest, SettingsApplyToTheAutomaticConduct)
{
   settings.clock_period  = std::chrono::milliseconds{1};
   settings.blocked_grace = std::chrono::milliseconds{20};

   auto latch = std::make_shared<boost::latch>(1);
   thread([latch] { latch->wait(); });
   thread([this, latch] {
      wait_for_beat(1);
      latch->count_down();
   });
}

/* ============================================================================
 * with_conductor
 * ========================================================================= */

TEST(WithConductorTest, ConductsWhenTheBodyDidNot)
{
   std::atomic<bool> ran{false};
   bool conducted = false;

   baton::testing::with_conductor([&](Conductor& conductor) {
      conductor.thread([&ran] { ran = true; });
      conductor.when_finished([&conducted] { conducted = true; });
   });

   EXPECT_TRUE(ran);
   EXPECT_TRUE(conducted);
}

TEST(WithConductorTest, DoesNotConductTwice)
{
   EXPECT_NO_THROW(baton::testing::with_conductor([](Conductor& conductor) {
      conductor.thread([] {});
      conductor.conduct_test();
   }));
}

TEST(WithConductorTest, FailuresPropagate)
{
   EXPECT_THROW(baton::testing::with_conductor([](Conductor& conductor) {
                   conductor.thread([] { throw std::runtime_error("worker failed"); });
                }),
                std::runtime_error);
}
