/**
 * @file thread_entry.cpp
 * @brief Conducted thread launcher, activity observation and ThreadHandle
 */

#include "thread_entry.hpp"

#include <boost/chrono/duration.hpp>
#include <boost/thread/lock_guard.hpp>

#include "DEBUG_PRINT.hpp"

namespace baton
{

// thread-local "am I a conducted thread, and which one?"
static thread_local ThreadEntry* tls_current = nullptr;

ThreadEntry* current_entry() noexcept
{
   return tls_current;
}

void ThreadEntry::start()
{
   boost::lock_guard<boost::mutex> lk(handle_mutex);

   state.store(ThreadState::Running, std::memory_order_release);
   try {
      handle = boost::thread([self = shared_from_this()] { self->run(); });
   } catch (...) {
      // Never ran: nothing will ever mark it Terminated but us
      state.store(ThreadState::Terminated, std::memory_order_release);
      throw;
   }

   if (interrupt_pending) {
      LOG_THREAD("delivering interrupt requested before %s started", name.c_str());
      handle.interrupt();
   }
}

void ThreadEntry::run()
{
   tls_current = this;
   native_id.store(baton_port_current_thread_id(), std::memory_order_release);
   LOG_THREAD("started");

   try {
      body();
      LOG_THREAD("returned normally");
   } catch (...) {
      failure = std::current_exception();
      failed_during_cleanup = interrupted_by_conductor.load(std::memory_order_acquire);
      LOG_THREAD("terminated by exception%s", failed_during_cleanup ? " (cleanup interrupt)" : "");
   }

   state.store(ThreadState::Terminated, std::memory_order_release);
   tls_current = nullptr;
}

void ThreadEntry::interrupt()
{
   boost::lock_guard<boost::mutex> lk(handle_mutex);
   if (state.load(std::memory_order_acquire) == ThreadState::Unstarted) {
      interrupt_pending = true;
      return;
   }
   handle.interrupt();
}

void ThreadEntry::interrupt_for_cleanup()
{
   interrupted_by_conductor.store(true, std::memory_order_release);
   interrupt();
}

bool ThreadEntry::join_for(std::chrono::milliseconds timeout)
{
   boost::lock_guard<boost::mutex> lk(handle_mutex);
   if (!handle.joinable()) return true;
   return handle.try_join_for(boost::chrono::milliseconds(timeout.count()));
}

void ThreadEntry::detach()
{
   boost::lock_guard<boost::mutex> lk(handle_mutex);
   if (handle.joinable()) handle.detach();
}

ThreadObservation ThreadEntry::observe() const
{
   ThreadState const before = state.load(std::memory_order_acquire);
   if (before == ThreadState::BlockedOnBeat) {
      return ThreadObservation{.state = before, .awaited_beat = awaited_beat.load(std::memory_order_relaxed)};
   }
   if (before != ThreadState::Running) return ThreadObservation{.state = before};

   auto const thread = native_id.load(std::memory_order_acquire);
   if (thread == 0) return ThreadObservation{.state = ThreadState::Running}; // Launched, not yet in run()

   auto const activity = baton_port_thread_activity(thread);

   // The port answer only describes the state we read if nothing moved meanwhile
   if (state.load(std::memory_order_acquire) != before) return ThreadObservation{.state = ThreadState::Running};

   switch (activity) {
      case BATON_PORT_THREAD_BLOCKED:
         return ThreadObservation{.state = ThreadState::BlockedOther, .timed = false};
      case BATON_PORT_THREAD_TIMED_BLOCKED:
         return ThreadObservation{.state = ThreadState::BlockedOther, .timed = true};
      case BATON_PORT_THREAD_UNKNOWN:
         // Cannot tell. Reported as a wait that ends by itself: eligible for
         // advancing after the grace period, never evidence of a deadlock.
         return ThreadObservation{.state = ThreadState::BlockedOther, .timed = true};
      case BATON_PORT_THREAD_RUNNING:
      case BATON_PORT_THREAD_GONE:
      default:
         return ThreadObservation{.state = ThreadState::Running};
   }
}

/* ============================================================================
 * ThreadHandle
 * ========================================================================= */

static ThreadEntry& checked(std::shared_ptr<ThreadEntry> const& entry)
{
   if (!entry) throw IllegalStateError("ThreadHandle does not refer to a registered thread.");
   return *entry;
}

std::string const& ThreadHandle::name() const
{
   return checked(entry).name;
}

ThreadObservation ThreadHandle::state() const
{
   return checked(entry).observe();
}

bool ThreadHandle::is_terminated() const
{
   return checked(entry).is_terminated();
}

void ThreadHandle::interrupt()
{
   checked(entry).interrupt();
}

} // namespace baton

extern "C" char const* baton_debug_thread_label(void)
{
   auto const* entry = baton::current_entry();
   return entry ? entry->name.c_str() : "main";
}
