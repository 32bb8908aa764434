/**
 * @file clock.cpp
 * @brief Logical Clock implementation
 */

#include "baton/clock.hpp"

#include <boost/thread/lock_guard.hpp>
#include <boost/thread/lock_types.hpp>

#include "DEBUG_PRINT.hpp"

namespace baton
{

Beat Clock::current_beat() const
{
   boost::lock_guard<boost::mutex> lk(m);
   return beat;
}

void Clock::wait_for_beat(Beat awaited)
{
   boost::unique_lock<boost::mutex> lk(m);
   if (awaited > highest_beat_waited_on) highest_beat_waited_on = awaited;

   LOG_CLOCK("waiting for beat %u (now %u)", awaited, beat);
   // No lost wakeup: the beat is checked and the wait entered under the same lock advance() takes
   while (beat < awaited) {
      beat_changed.wait(lk);
   }
   LOG_CLOCK("released at beat %u", beat);
}

void Clock::advance()
{
   {
      boost::unique_lock<boost::mutex> lk(m);
      while (freeze_count > 0) {
         thawed.wait(lk);
      }
      LOG_CLOCK("advancing from %u to %u", beat, beat + 1);
      ++beat;
   }
   beat_changed.notify_all();
}

bool Clock::try_advance()
{
   {
      boost::lock_guard<boost::mutex> lk(m);
      if (freeze_count > 0) return false;
      LOG_CLOCK("advancing from %u to %u", beat, beat + 1);
      ++beat;
   }
   beat_changed.notify_all();
   return true;
}

void Clock::freeze()
{
   boost::lock_guard<boost::mutex> lk(m);
   ++freeze_count;
   LOG_CLOCK("frozen (depth %u)", freeze_count);
}

void Clock::unfreeze()
{
   bool now_thawed = false;
   {
      boost::lock_guard<boost::mutex> lk(m);
      if (freeze_count == 0) return;
      now_thawed = (--freeze_count == 0);
      LOG_CLOCK("unfrozen (depth %u)", freeze_count);
   }
   if (now_thawed) thawed.notify_all();
}

bool Clock::is_frozen() const
{
   boost::lock_guard<boost::mutex> lk(m);
   return freeze_count > 0;
}

bool Clock::is_any_thread_waiting_for_a_beat() const
{
   boost::lock_guard<boost::mutex> lk(m);
   return highest_beat_waited_on > beat;
}

} // namespace baton
