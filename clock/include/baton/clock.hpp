/**
 * @file clock.hpp
 * @brief Baton logical Clock
 *
 * The Clock is a virtual time source for conducted tests. Time only advances
 * when explicitly told to, one beat at a time, which makes the interleaving of
 * the threads that wait on it reproducible.
 *
 * Architecture:
 *
 *   Conducted thread: Clock::wait_for_beat(n) blocks on a condition variable
 *    -> Coordinator: observes every thread blocked, calls Clock::try_advance()
 *       -> Clock: beat += 1, wakes every waiter whose beat has arrived
 *
 * The Clock knows nothing about threads or the Conductor. One Clock is owned
 * by each Conductor; there is no global instance.
 */

#ifndef BATON_CLOCK_HPP
#define BATON_CLOCK_HPP

#include <boost/thread/condition_variable.hpp>
#include <boost/thread/mutex.hpp>

#include <cstdint>
#include <type_traits>
#include <utility>

namespace baton
{

/**
 * @brief A discrete tick of the logical clock
 *
 * Beats start at 0 and only ever go up, one at a time.
 */
using Beat = std::uint32_t;

class Clock
{
public:
   Clock() = default;
   ~Clock() = default;
   Clock(Clock const&)            = delete;
   Clock& operator=(Clock const&) = delete;
   Clock(Clock&&)                 = delete;
   Clock& operator=(Clock&&)      = delete;

   /**
    * @brief Get the current beat (non-blocking)
    */
   [[nodiscard]] Beat current_beat() const;

   /**
    * @brief Block the calling thread until the clock reaches a beat
    * @param beat Beat to wait for
    *
    * Returns immediately if current_beat() >= beat. Otherwise waits on a
    * condition variable (no spinning) and returns once the beat has arrived,
    * never earlier.
    *
    * This is a Boost.Thread interruption point: if the waiting thread is
    * interrupted, boost::thread_interrupted is thrown.
    */
   void wait_for_beat(Beat beat);

   /**
    * @brief Advance the clock by exactly one beat
    *
    * Wakes every thread whose awaited beat has now arrived. If the clock is
    * frozen, blocks until it thaws (interruption point).
    */
   void advance();

   /**
    * @brief Advance the clock by one beat unless it is frozen
    * @return true if the clock advanced, false if it was frozen
    *
    * The frozen check and the increment happen under the same lock, so a
    * freeze that wins the race is always honoured.
    */
   [[nodiscard]] bool try_advance();

   /**
    * @brief Suspend automatic advancement
    *
    * Each freeze() must be balanced by an unfreeze(). Freezes taken by
    * different threads overlap; the clock thaws when the last one is released.
    * Prefer with_clock_frozen() which guarantees the balancing call.
    */
   void freeze();

   /**
    * @brief Release a freeze taken with freeze()
    *
    * Unfreezing a clock that is not frozen is a no-op.
    */
   void unfreeze();

   /**
    * @brief Check whether any freeze is currently held
    */
   [[nodiscard]] bool is_frozen() const;

   /**
    * @brief Check whether some thread waits for a beat that has not arrived
    *
    * Tracks the highest beat ever passed to wait_for_beat().
    */
   [[nodiscard]] bool is_any_thread_waiting_for_a_beat() const;

   /**
    * @brief Run a callable with the clock frozen
    * @param fn Callable to invoke
    * @return Whatever fn returns
    *
    * The clock is unfrozen on every exit path, including exceptions.
    * current_beat() read just before and just after this call is identical.
    */
   template<typename Fn>
   decltype(auto) with_clock_frozen(Fn&& fn)
   {
      FreezeGuard guard(*this);
      return std::forward<Fn>(fn)();
   }

   /**
    * @brief RAII freeze for a scope
    */
   class FreezeGuard
   {
   public:
      explicit FreezeGuard(Clock& clock) : clock(clock)
      {
         clock.freeze();
      }

      ~FreezeGuard()
      {
         clock.unfreeze();
      }

      FreezeGuard(FreezeGuard const&)            = delete;
      FreezeGuard& operator=(FreezeGuard const&) = delete;
      FreezeGuard(FreezeGuard&&)                 = delete;
      FreezeGuard& operator=(FreezeGuard&&)      = delete;

   private:
      Clock& clock;
   };

private:
   mutable boost::mutex m;
   boost::condition_variable beat_changed;
   boost::condition_variable thawed;

   Beat beat{0};
   Beat highest_beat_waited_on{0};
   std::uint32_t freeze_count{0};
};

} // namespace baton

#endif // BATON_CLOCK_HPP
