/**
 * @file conductor.hpp
 * @brief Baton Conductor API
 *
 * The Conductor runs a handful of test threads against a shared logical clock
 * so that racy or blocking code can be tested with a reproducible order of
 * events. Threads call wait_for_beat(n) to say "do not go on before beat n";
 * the Conductor advances the clock only when every thread is blocked, so
 * everything a thread does between two beats happens-before everything other
 * threads do after the next one.
 *
 * Example (bounded queue, capacity 1):
 *
 *   baton::Conductor conductor;
 *
 *   conductor.thread("producer", [&] {
 *      queue.put(42);
 *      queue.put(17);                    // blocks: queue is full
 *      EXPECT_EQ(conductor.beat(), 1u);  // only the consumer could free it
 *   });
 *
 *   conductor.thread("consumer", [&] {
 *      conductor.wait_for_beat(1);       // beat 1 comes once producer blocks
 *      EXPECT_EQ(queue.take(), 42);
 *      EXPECT_EQ(queue.take(), 17);
 *   });
 *
 *   conductor.when_finished([&] { EXPECT_TRUE(queue.empty()); });
 *   conductor.conduct_test();
 *
 * Lifecycle: register threads (and optionally a finish block), then call
 * conduct_test() exactly once. conduct_test() starts every thread, drives the
 * clock on the calling thread, joins everything and either returns normally or
 * rethrows the first failure.
 */

#ifndef BATON_CONDUCTOR_HPP
#define BATON_CONDUCTOR_HPP

#include "baton/clock.hpp"
#include "baton/errors.hpp"
#include "baton/thread_state.hpp"

#include <boost/thread/mutex.hpp>
#include <boost/thread/thread.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace baton
{

namespace config
{
   /**
    * @brief How long the coordinator sleeps between two samples of the threads
    */
   static constexpr std::chrono::milliseconds CLOCK_PERIOD{10};

   /**
    * @brief Wall-clock budget for one conduct_test() before it reports a timeout
    */
   static constexpr std::chrono::milliseconds RUN_LIMIT{5000};

   /**
    * @brief How long a thread must stay blocked outside the clock before the
    *        coordinator treats it as parked (safe to advance past)
    */
   static constexpr std::chrono::milliseconds BLOCKED_GRACE{100};

   /**
    * @brief After a failure, how long the survivors get to finish on their own,
    *        and later how long each one gets to exit once interrupted
    */
   static constexpr std::chrono::milliseconds FAILURE_DRAIN{1000};

   /**
    * @brief Consecutive clock periods of "everyone blocked, nobody on a beat"
    *        before conducting gives up with a DeadlockError
    */
   static constexpr std::uint32_t DEADLOCK_PERIODS = 50;
   static_assert(DEADLOCK_PERIODS > 0, "Deadlock detection needs at least one period");
}  // namespace config

/**
 * @brief Tuning for one conduct_test() call
 *
 * These constants trade speed for robustness. None of them is a correctness
 * contract; on a heavily loaded host a too small grace period can let the
 * clock advance past a thread that was merely slow.
 *
 * Example:
 *   conductor.conduct_test({.run_limit = std::chrono::milliseconds{500}});
 */
struct ConductorSettings
{
   std::chrono::milliseconds clock_period{config::CLOCK_PERIOD};
   std::chrono::milliseconds run_limit{config::RUN_LIMIT};
   std::chrono::milliseconds blocked_grace{config::BLOCKED_GRACE};
   std::chrono::milliseconds failure_drain{config::FAILURE_DRAIN};
   std::uint32_t deadlock_periods{config::DEADLOCK_PERIODS};
};

struct ThreadEntry;

/**
 * @brief Handle onto a registered thread
 *
 * Cheap to copy; stays valid after the Conductor is gone.
 */
class ThreadHandle
{
public:
   /**
    * @brief An empty handle; every accessor throws IllegalStateError
    */
   ThreadHandle() = default;

   [[nodiscard]] std::string const& name() const;

   /**
    * @brief What the thread is doing right now (BlockedOther included)
    */
   [[nodiscard]] ThreadObservation state() const;

   [[nodiscard]] bool is_terminated() const;

   /**
    * @brief Interrupt the thread (Boost.Thread interruption)
    *
    * The thread sees boost::thread_interrupted at its next interruption point
    * (wait_for_beat(), a boost::condition_variable wait, boost::this_thread::sleep_for ...).
    * Interrupting a thread that has not started yet delivers the interrupt as
    * soon as it starts. Interrupting a terminated thread does nothing.
    */
   void interrupt();

   explicit operator bool() const noexcept { return entry != nullptr; }

   friend bool operator==(ThreadHandle const& lhs, ThreadHandle const& rhs) noexcept { return lhs.entry == rhs.entry; }

private:
   friend class Conductor;
   explicit ThreadHandle(std::shared_ptr<ThreadEntry> entry) : entry(std::move(entry)) {}

   std::shared_ptr<ThreadEntry> entry;
};

/**
 * @brief An exception that escaped a thread body, with the thread's name
 */
struct Failure
{
   std::string thread_name;
   std::exception_ptr error;
};

class Conductor
{
public:
   using Body     = std::function<void()>;
   using Settings = ConductorSettings;

   Conductor();
   ~Conductor();
   Conductor(Conductor const&)            = delete;
   Conductor& operator=(Conductor const&) = delete;
   Conductor(Conductor&&)                 = delete;
   Conductor& operator=(Conductor&&)      = delete;

   /* ========================================================================
    * Registration
    * ===================================================================== */

   /**
    * @brief Register a thread body under a generated name ("Conductor-Thread-<n>")
    * @return Handle to the new thread
    * @throws IllegalStateError if conduct_test() has already been called
    */
   ThreadHandle thread(Body body);

   /**
    * @brief Register a named thread body
    * @throws IllegalStateError if conduct_test() has already been called
    * @throws NotAllowedError if the name is taken or the body is empty
    *
    * The thread does not run until conduct_test().
    */
   ThreadHandle thread(std::string name, Body body);

   /**
    * @brief Register count copies of the same body
    *
    * Names are generated as for thread(Body).
    */
   std::vector<ThreadHandle> threads(std::size_t count, Body const& body);

   /**
    * @brief Register count copies of the same body named "prefix(1)" ... "prefix(count)"
    */
   std::vector<ThreadHandle> threads(std::size_t count, std::string const& name_prefix, Body const& body);

   /* ========================================================================
    * Clock access (from thread bodies)
    * ===================================================================== */

   /**
    * @brief Block the calling conducted thread until the clock reaches beat
    * @throws IllegalStateError if the caller is not a thread of this Conductor
    * @throws boost::thread_interrupted if the thread is interrupted while waiting
    */
   void wait_for_beat(Beat beat);

   /**
    * @brief Current beat
    */
   [[nodiscard]] Beat beat() const;
   [[nodiscard]] Beat tick() const { return beat(); }

   /**
    * @brief Run fn with automatic clock advancement suspended
    *
    * Use this to check that a timed blocking call really times out instead of
    * being released by the clock moving on.
    */
   template<typename Fn>
   decltype(auto) with_clock_frozen(Fn&& fn)
   {
      return clock.with_clock_frozen(std::forward<Fn>(fn));
   }

   [[nodiscard]] bool is_clock_frozen() const;

   /* ========================================================================
    * Conducting
    * ===================================================================== */

   /**
    * @brief Register a block to run on the conducting thread once every
    *        registered thread has terminated normally
    * @throws IllegalStateError from any thread but the one that created this
    *         Conductor, on a second call, or once conducting has begun
    */
   void when_finished(Body block);

   /**
    * @brief Run the test with default settings
    */
   void conduct_test();

   /**
    * @brief Start every registered thread and drive the clock until they finish
    *
    * Returns normally if every thread body and the finish block returned
    * normally. Otherwise throws, after making sure no conducted thread is
    * left running:
    *  - the exception of the first registered thread that failed, unchanged
    *  - TimedOutError if settings.run_limit was exceeded
    *  - DeadlockError if every thread stayed blocked with nobody waiting on a beat
    *  - whatever the finish block threw
    *
    * @throws IllegalStateError if called more than once
    */
   void conduct_test(Settings const& settings);

   [[nodiscard]] bool conducting_has_begun() const noexcept;
   [[nodiscard]] bool conducting_has_finished() const noexcept;

   /**
    * @brief Every failure captured while conducting, in registration order
    *
    * Includes failures that were not rethrown because an earlier registered
    * thread failed too.
    */
   [[nodiscard]] std::vector<Failure> failures() const;

private:
   enum class Phase : uint8_t { Setup, Conducting, Finished };

   ThreadHandle add_entry(std::optional<std::string> requested_name, Body body);

   void finish_aborted(std::vector<std::shared_ptr<ThreadEntry>> const& roster, Settings const& settings);
   void collect_failures(std::vector<std::shared_ptr<ThreadEntry>> const& roster);

   Clock clock;

   mutable boost::mutex registry_mutex;
   std::vector<std::shared_ptr<ThreadEntry>> entries;
   std::vector<Failure> captured;
   Body finish_block;
   bool finish_registered{false};

   std::atomic<Phase> phase{Phase::Setup};
   boost::thread::id const creator;
};

} // namespace baton

#endif // BATON_CONDUCTOR_HPP
