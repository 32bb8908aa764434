/**
 * @file test_conductor.cpp
 * @brief Conducted interleavings: ordering, blocking outside the clock, freezing
 *
 * These tests rely on the default timing constants (10 ms clock period,
 * 100 ms blocked grace). On a heavily loaded host a thread that is merely slow
 * can be mistaken for a blocked one; treat a rare failure here as a tuning
 * question before treating it as a logic bug.
 */

#include "baton.hpp"
#include "../support/bounded_queue.hpp"
#include "DEBUG_PRINT.hpp"

#include <boost/thread/latch.hpp>
#include <boost/thread/lock_guard.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/thread.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace baton;
using test_support::BoundedQueue;

/* ============================================================================
 * Test Fixtures
 * ========================================================================= */

class ConductingTest : public ::testing::Test
{
protected:
   void record(char c)
   {
      boost::lock_guard<boost::mutex> lk(trace_mutex);
      trace += c;
   }

   std::string recorded() const
   {
      boost::lock_guard<boost::mutex> lk(trace_mutex);
      return trace;
   }

   Conductor conductor;

private:
   mutable boost::mutex trace_mutex;
   std::string trace;
};

/* ============================================================================
 * Ordering Tests
 * ========================================================================= */

TEST_F(ConductingTest, EmptyConductorFinishesImmediately)
{
   conductor.conduct_test();
   EXPECT_TRUE(conductor.conducting_has_begun());
   EXPECT_TRUE(conductor.conducting_has_finished());
   EXPECT_EQ(conductor.beat(), 0u);
}

TEST_F(ConductingTest, SingleThreadRunsToCompletion)
{
   std::atomic<bool> ran{false};
   auto handle = conductor.thread("only", [&] { ran = true; });

   EXPECT_EQ(handle.state().state, ThreadState::Unstarted);
   conductor.conduct_test();

   EXPECT_TRUE(ran);
   EXPECT_TRUE(handle.is_terminated());
   EXPECT_EQ(handle.state().state, ThreadState::Terminated);
   EXPECT_TRUE(conductor.failures().empty());
}

TEST_F(ConductingTest, ClockOnlyAdvancesAsFarAsSomeoneWaits)
{
   conductor.thread([&] { conductor.wait_for_beat(3); });
   conductor.conduct_test();
   EXPECT_EQ(conductor.beat(), 3u);
}

TEST_F(ConductingTest, BeatsOrderThreeThreadsTheSameWayEveryRun)
{
   for (int run = 0; run < 100; ++run) {
      Conductor c;
      boost::mutex m;
      std::string trace;
      auto append = [&](char ch) {
         boost::lock_guard<boost::mutex> lk(m);
         trace += ch;
      };

      c.thread("a", [&] { c.wait_for_beat(1); append('A'); });
      c.thread("b", [&] { c.wait_for_beat(2); append('B'); });
      c.thread("c", [&] { c.wait_for_beat(3); append('C'); });
      c.conduct_test();

      ASSERT_EQ(trace, "ABC") << "run " << run;
      ASSERT_EQ(c.beat(), 3u);
   }
}

TEST_F(ConductingTest, MetronomeInterleavesThreeThreads)
{
   // Each thread owns every third beat
   auto metronome = [&](Beat first, char const* letters) {
      return [this, first, letters] {
         Beat beat = first;
         for (char const* c = letters; *c != '\0'; ++c, beat += 3) {
            conductor.wait_for_beat(beat);
            LOG_TEST("tock %c at beat %u", *c, conductor.beat());
            record(*c);
         }
      };
   };

   conductor.thread("first", metronome(0, "ADG"));
   conductor.thread("second", metronome(1, "BEH"));
   conductor.thread("third", metronome(2, "CFI"));
   conductor.conduct_test();

   EXPECT_EQ(recorded(), "ABCDEFGHI");
   EXPECT_EQ(conductor.beat(), 8u);
}

TEST_F(ConductingTest, TickIsTheCurrentBeat)
{
   conductor.thread([&] {
      EXPECT_EQ(conductor.tick(), 0u);
      conductor.wait_for_beat(2);
      EXPECT_EQ(conductor.tick(), 2u);
      EXPECT_EQ(conductor.beat(), 2u);
   });
   conductor.conduct_test();
}

/* ============================================================================
 * Blocking Outside The Clock
 * ========================================================================= */

TEST_F(ConductingTest, ThreadBlockedOnAFullQueueLetsTheClockAdvance)
{
   BoundedQueue<int> queue(1);

   conductor.thread("producer", [&] {
      queue.put(42);
      queue.put(17); // full: only the consumer can free it, after beat 1
      EXPECT_EQ(conductor.beat(), 1u);
   });

   conductor.thread("consumer", [&] {
      conductor.wait_for_beat(1);
      EXPECT_EQ(queue.take(), 42);
      EXPECT_EQ(queue.take(), 17);
   });

   conductor.conduct_test();
   EXPECT_EQ(queue.size(), 0u);
}

TEST_F(ConductingTest, ThreadBlockedOnALatchLetsTheClockAdvance)
{
   boost::latch latch(1);

   conductor.thread("waiter", [&] {
      latch.wait();
      EXPECT_EQ(conductor.beat(), 1u);
   });

   conductor.thread("opener", [&] {
      conductor.wait_for_beat(1);
      latch.count_down();
   });

   conductor.conduct_test();
}

TEST_F(ConductingTest, OtherThreadIsSeenWaitingOnItsBeat)
{
   ThreadHandle late = conductor.thread("late", [&] { conductor.wait_for_beat(2); });

   conductor.thread("early", [&, late] {
      conductor.wait_for_beat(1);
      ThreadObservation const seen = late.state();
      EXPECT_EQ(seen.state, ThreadState::BlockedOnBeat);
      EXPECT_EQ(seen.awaited_beat, 2u);
      EXPECT_TRUE(seen.blocked_on_future_beat(conductor.beat()));
   });

   conductor.conduct_test();
}

/* ============================================================================
 * Freezing
 * ========================================================================= */

TEST_F(ConductingTest, TimedOfferTimesOutWhileTheClockIsFrozen)
{
   BoundedQueue<int> queue(1);
   queue.put(1);

   conductor.thread("offerer", [&] {
      conductor.with_clock_frozen([&] {
         Beat const before = conductor.beat();
         EXPECT_TRUE(conductor.is_clock_frozen());
         EXPECT_FALSE(queue.offer(2, std::chrono::milliseconds{300}));
         EXPECT_EQ(conductor.beat(), before);
      });
      EXPECT_FALSE(conductor.is_clock_frozen());
   });

   conductor.thread("taker", [&] {
      conductor.wait_for_beat(1);
      EXPECT_EQ(queue.take(), 1);
   });

   conductor.conduct_test();
   EXPECT_EQ(queue.size(), 0u);
}

TEST_F(ConductingTest, TimedOfferSucceedsOnceTheClockMovesOn)
{
   BoundedQueue<int> queue(1);
   queue.put(1);

   conductor.thread("offerer", [&] {
      // Blocked in a timed wait past the grace period: the clock moves to beat 1
      EXPECT_TRUE(queue.offer(2, std::chrono::milliseconds{2000}));
      EXPECT_EQ(conductor.beat(), 1u);
   });

   conductor.thread("taker", [&] {
      conductor.wait_for_beat(1);
      EXPECT_EQ(queue.take(), 1);
   });

   conductor.conduct_test();
   EXPECT_EQ(queue.size(), 1u);
}

/* ============================================================================
 * Naming And Finish Block
 * ========================================================================= */

TEST_F(ConductingTest, GeneratedNamesFollowRegistrationOrder)
{
   auto first  = conductor.thread([] {});
   auto second = conductor.thread([] {});
   auto group  = conductor.threads(3, "worker", [] {});

   EXPECT_EQ(first.name(), "Conductor-Thread-0");
   EXPECT_EQ(second.name(), "Conductor-Thread-1");
   ASSERT_EQ(group.size(), 3u);
   EXPECT_EQ(group[0].name(), "worker(1)");
   EXPECT_EQ(group[1].name(), "worker(2)");
   EXPECT_EQ(group[2].name(), "worker(3)");

   conductor.conduct_test();
}

TEST_F(ConductingTest, ConcurrentUnnamedRegistrationsGetDistinctNames)
{
   constexpr int PER_THREAD = 50;
   std::atomic<int> rejected{0};
   std::vector<ThreadHandle> left, right;

   auto register_many = [&](std::vector<ThreadHandle>& out) {
      for (int i = 0; i < PER_THREAD; ++i) {
         try {
            out.push_back(conductor.thread([] {}));
         } catch (NotAllowedError const&) {
            ++rejected;
         }
      }
   };

   boost::thread a([&] { register_many(left); });
   boost::thread b([&] { register_many(right); });
   a.join();
   b.join();

   EXPECT_EQ(rejected.load(), 0);
   std::set<std::string> names;
   for (auto const& handle : left) names.insert(handle.name());
   for (auto const& handle : right) names.insert(handle.name());
   EXPECT_EQ(names.size(), 2u * PER_THREAD);

   conductor.conduct_test();
}

TEST_F(ConductingTest, ThreadsRunsEveryCopy)
{
   std::atomic<int> runs{0};
   auto handles = conductor.threads(5, [&] { ++runs; });

   EXPECT_EQ(handles.size(), 5u);
   EXPECT_EQ(handles[4].name(), "Conductor-Thread-4");
   conductor.conduct_test();
   EXPECT_EQ(runs.load(), 5);
}

TEST_F(ConductingTest, FinishBlockRunsOnConductingThreadAfterEveryThread)
{
   std::atomic<int> finished_threads{0};
   std::vector<ThreadHandle> handles = conductor.threads(3, [&] {
      conductor.wait_for_beat(1);
      ++finished_threads;
   });

   auto const conducting_thread = boost::this_thread::get_id();
   bool finish_ran = false;
   conductor.when_finished([&] {
      finish_ran = true;
      EXPECT_EQ(boost::this_thread::get_id(), conducting_thread);
      EXPECT_EQ(finished_threads.load(), 3);
      for (auto const& handle : handles) {
         EXPECT_TRUE(handle.is_terminated());
      }
      EXPECT_TRUE(conductor.conducting_has_finished());
   });

   conductor.conduct_test();
   EXPECT_TRUE(finish_ran);
}

TEST_F(ConductingTest, FinishBlockFailureIsTheResult)
{
   conductor.thread([] {});
   conductor.when_finished([] { throw std::logic_error("finish failed"); });

   EXPECT_THROW(conductor.conduct_test(), std::logic_error);
}

TEST_F(ConductingTest, SettingsOverrideTheDefaults)
{
   Conductor::Settings settings{
      .clock_period  = std::chrono::milliseconds{1},
      .blocked_grace = std::chrono::milliseconds{20},
   };
   EXPECT_EQ(settings.run_limit, config::RUN_LIMIT);
   EXPECT_EQ(settings.deadlock_periods, config::DEADLOCK_PERIODS);

   boost::latch latch(1);
   conductor.thread([&] { latch.wait(); });
   conductor.thread([&] { conductor.wait_for_beat(1); latch.count_down(); });
   conductor.conduct_test(settings);
   EXPECT_EQ(conductor.beat(), 1u);
}
