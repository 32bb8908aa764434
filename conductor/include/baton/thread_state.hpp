/**
 * @file thread_state.hpp
 * @brief Lifecycle states of a conducted thread
 */

#ifndef BATON_THREAD_STATE_HPP
#define BATON_THREAD_STATE_HPP

#include "baton/clock.hpp"

#include <cstdint>
#include <string>

namespace baton
{

/**
 * @brief Where a conducted thread is in its life
 *
 *   Unstarted -> Running <-> BlockedOnBeat(n) -> Terminated
 *                   |
 *                   +-- BlockedOther (observed, not recorded)
 *
 * BlockedOther is never stored by the thread itself. It is what the
 * coordinator concludes when a Running thread is reported asleep by the port.
 */
enum class ThreadState : uint8_t
{
   Unstarted,
   Running,
   BlockedOnBeat,
   BlockedOther,
   Terminated
};

/**
 * @brief A state as seen from outside the thread at one instant
 */
struct ThreadObservation
{
   ThreadState state{ThreadState::Unstarted};
   Beat awaited_beat{0}; ///< Only meaningful for BlockedOnBeat
   bool timed{false};    ///< BlockedOther inside a wait that will time out by itself

   [[nodiscard]] bool blocked_on_future_beat(Beat now) const noexcept
   {
      return state == ThreadState::BlockedOnBeat && awaited_beat > now;
   }
};

[[nodiscard]] std::string to_string(ThreadState state);

/**
 * @brief Render e.g. "BlockedOnBeat(3)" or "BlockedOther(timed)"
 */
[[nodiscard]] std::string to_string(ThreadObservation const& observation);

} // namespace baton

#endif // BATON_THREAD_STATE_HPP
