// Bookkeeping for one conducted thread. Private to the conductor library.

#ifndef BATON_THREAD_ENTRY_HPP
#define BATON_THREAD_ENTRY_HPP

#include "baton/conductor.hpp"
#include "baton/port.h"

#include <boost/thread/mutex.hpp>
#include <boost/thread/thread.hpp>

#include <atomic>
#include <chrono>
#include <exception>
#include <memory>
#include <string>

// Invariants list:
// Only the entry's own thread writes state, awaited_beat, native_id and failure once started.
// failure and failed_during_cleanup are written before state is released as Terminated,
// so anyone who acquires Terminated may read them without a lock.
// The boost::thread handle is only touched under handle_mutex.

namespace baton
{

struct ThreadEntry : std::enable_shared_from_this<ThreadEntry>
{
   ThreadEntry(Conductor const* owner, std::string name, Conductor::Body&& body) :
      owner(owner), name(std::move(name)), body(std::move(body)) {}

   ThreadEntry(ThreadEntry const&)            = delete;
   ThreadEntry& operator=(ThreadEntry const&) = delete;

   Conductor const* const owner;
   std::string const name;
   Conductor::Body body;

   std::atomic<ThreadState> state{ThreadState::Unstarted};
   std::atomic<Beat> awaited_beat{0};
   std::atomic<baton_port_thread_id_t> native_id{0};
   std::atomic<bool> interrupted_by_conductor{false};

   std::exception_ptr failure;
   bool failed_during_cleanup{false};

   /**
    * Mark Running and launch the native thread. Throws boost::thread_resource_error
    * if the thread cannot be created.
    */
   void start();

   void interrupt();

   /**
    * Interrupt on behalf of the coordinator: whatever the thread throws from
    * here on is a consequence of the cleanup, not a test failure.
    */
   void interrupt_for_cleanup();

   /**
    * Join within the timeout. Returns false if the thread is still running.
    */
   bool join_for(std::chrono::milliseconds timeout);

   /**
    * Let go of a thread that would not exit. The entry stays alive for as long
    * as the thread does.
    */
   void detach();

   [[nodiscard]] ThreadObservation observe() const;

   [[nodiscard]] bool is_terminated() const noexcept
   {
      return state.load(std::memory_order_acquire) == ThreadState::Terminated;
   }

   [[nodiscard]] bool has_test_failure() const noexcept
   {
      return is_terminated() && failure && !failed_during_cleanup;
   }

private:
   void run();

   boost::mutex handle_mutex;
   boost::thread handle;
   bool interrupt_pending{false};
};

/**
 * @brief Entry of the conducted thread calling in, nullptr for any other thread
 */
[[nodiscard]] ThreadEntry* current_entry() noexcept;

/**
 * @brief Marks the current entry BlockedOnBeat for the lifetime of a clock wait
 */
class BeatWaitScope
{
public:
   BeatWaitScope(ThreadEntry& entry, Beat beat) : entry(entry)
   {
      entry.awaited_beat.store(beat, std::memory_order_relaxed);
      entry.state.store(ThreadState::BlockedOnBeat, std::memory_order_release);
   }

   ~BeatWaitScope()
   {
      entry.state.store(ThreadState::Running, std::memory_order_release);
   }

   BeatWaitScope(BeatWaitScope const&)            = delete;
   BeatWaitScope& operator=(BeatWaitScope const&) = delete;

private:
   ThreadEntry& entry;
};

} // namespace baton

#endif // BATON_THREAD_ENTRY_HPP
