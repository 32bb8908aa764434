/**
 * @file conductor.cpp
 * @brief Conductor registration API and the coordinator loop
 */

#include "baton/conductor.hpp"
#include "thread_entry.hpp"

#include <boost/chrono/duration.hpp>
#include <boost/thread/lock_guard.hpp>

#include <algorithm>
#include <optional>

#include "DEBUG_PRINT.hpp"

// Invariants list:
// entries is append-only while phase == Setup and is never modified afterwards.
// phase only moves forward: Setup -> Conducting -> Finished.
// The coordinator never holds registry_mutex while it waits on a conducted thread.

namespace baton
{

namespace
{

using SteadyClock = std::chrono::steady_clock;
using Roster      = std::vector<std::shared_ptr<ThreadEntry>>;

void pause(std::chrono::milliseconds period)
{
   boost::this_thread::sleep_for(boost::chrono::milliseconds(period.count()));
}

/**
 * @brief The polling loop that decides when the clock may move
 *
 * Runs on the thread that called conduct_test(). Each round it samples every
 * entry, then either finishes, gives up, advances the clock, or sleeps for one
 * clock period. It is a poll and not a wakeup-driven wait because a thread that
 * blocks inside arbitrary user code sends no notification.
 */
class Coordinator
{
public:
   enum class Outcome : uint8_t { Succeeded, Failed, TimedOut, Deadlocked };

   Coordinator(Clock& clock, Roster const& roster, ConductorSettings const& settings) :
      clock(clock), roster(roster), settings(settings),
      observations(roster.size()), blocked_since(roster.size()) {}

   Outcome conduct()
   {
      auto const started_at = SteadyClock::now();
      std::uint32_t deadlock_periods_seen = 0;

      while (true) {
         sample();

         if (any_failed())     return Outcome::Failed;
         if (all_terminated()) return Outcome::Succeeded;

         if (SteadyClock::now() - started_at > settings.run_limit) {
            LOG_CONDUCTOR("run limit of %lld ms exceeded", static_cast<long long>(settings.run_limit.count()));
            return Outcome::TimedOut;
         }

         if (ready_to_advance() && clock.try_advance()) {
            deadlock_periods_seen = 0;
            continue;
         }

         if (looks_deadlocked()) {
            if (++deadlock_periods_seen >= settings.deadlock_periods) return Outcome::Deadlocked;
         } else {
            deadlock_periods_seen = 0;
         }

         pause(settings.clock_period);
      }
   }

   /**
    * @brief After a failure: stop advancing and give the survivors a bounded
    *        chance to finish by themselves
    *
    * Stops early once nobody can make progress without the clock (everyone
    * left is waiting on a beat or parked outside the clock).
    */
   void drain()
   {
      auto const deadline = SteadyClock::now() + settings.failure_drain;
      while (SteadyClock::now() < deadline) {
         sample();
         if (all_settled()) return;
         pause(settings.clock_period);
      }
      LOG_CONDUCTOR("failure drain expired with threads still running");
   }

   [[nodiscard]] std::vector<ThreadReport> live_threads() const
   {
      std::vector<ThreadReport> reports;
      for (std::size_t i = 0; i < roster.size(); ++i) {
         if (observations[i].state == ThreadState::Terminated) continue;
         reports.push_back(ThreadReport{.name = roster[i]->name, .observation = observations[i]});
      }
      return reports;
   }

   [[nodiscard]] std::chrono::milliseconds deadlock_window() const
   {
      return settings.clock_period * settings.deadlock_periods;
   }

private:
   void sample()
   {
      now = SteadyClock::now();
      beat = clock.current_beat();

      for (std::size_t i = 0; i < roster.size(); ++i) {
         observations[i] = roster[i]->observe();
         if (observations[i].state == ThreadState::BlockedOther) {
            if (!blocked_since[i]) blocked_since[i] = now;
         } else {
            blocked_since[i].reset();
         }
      }
   }

   [[nodiscard]] bool any_failed() const
   {
      return std::any_of(roster.begin(), roster.end(), [](auto const& entry) { return entry->has_test_failure(); });
   }

   [[nodiscard]] bool all_terminated() const
   {
      return std::all_of(observations.begin(), observations.end(),
                         [](ThreadObservation const& o) { return o.state == ThreadState::Terminated; });
   }

   [[nodiscard]] bool parked(std::size_t i) const
   {
      return observations[i].state == ThreadState::BlockedOther
          && blocked_since[i]
          && now - *blocked_since[i] >= settings.blocked_grace;
   }

   // Every live thread is waiting on a future beat or parked, and at least one
   // of them waits on a beat (otherwise advancing could not release anyone).
   [[nodiscard]] bool ready_to_advance() const
   {
      bool someone_waits_on_a_beat = false;
      for (std::size_t i = 0; i < roster.size(); ++i) {
         auto const& o = observations[i];
         if (o.state == ThreadState::Terminated) continue;
         if (o.blocked_on_future_beat(beat)) {
            someone_waits_on_a_beat = true;
            continue;
         }
         if (!parked(i)) return false;
      }
      return someone_waits_on_a_beat;
   }

   // Every live thread is parked in a wait with no deadline
   [[nodiscard]] bool looks_deadlocked() const
   {
      bool any_live = false;
      for (std::size_t i = 0; i < roster.size(); ++i) {
         auto const& o = observations[i];
         if (o.state == ThreadState::Terminated) continue;
         any_live = true;
         if (o.state != ThreadState::BlockedOther || o.timed || !parked(i)) return false;
      }
      return any_live;
   }

   [[nodiscard]] bool all_settled() const
   {
      for (std::size_t i = 0; i < roster.size(); ++i) {
         auto const& o = observations[i];
         if (o.state == ThreadState::Terminated || o.blocked_on_future_beat(beat) || parked(i)) continue;
         return false;
      }
      return true;
   }

   Clock& clock;
   Roster const& roster;
   ConductorSettings const& settings;

   SteadyClock::time_point now{};
   Beat beat{0};
   std::vector<ThreadObservation> observations;
   std::vector<std::optional<SteadyClock::time_point>> blocked_since;
};

} // namespace

/* ============================================================================
 * Construction
 * ========================================================================= */

Conductor::Conductor() : creator(boost::this_thread::get_id()) {}

Conductor::~Conductor() = default;

/* ============================================================================
 * Registration
 * ========================================================================= */

ThreadHandle Conductor::thread(Body body)
{
   return add_entry(std::nullopt, std::move(body));
}

ThreadHandle Conductor::thread(std::string name, Body body)
{
   return add_entry(std::move(name), std::move(body));
}

// Name generation and the append share one critical section, so concurrent
// unnamed registrations never pick the same index.
ThreadHandle Conductor::add_entry(std::optional<std::string> requested_name, Body body)
{
   boost::lock_guard<boost::mutex> lk(registry_mutex);

   std::string name = requested_name ? std::move(*requested_name)
                                     : "Conductor-Thread-" + std::to_string(entries.size());
   if (!body) throw NotAllowedError("Cannot register thread '" + name + "' without a body.");

   if (phase.load(std::memory_order_acquire) != Phase::Setup) {
      throw IllegalStateError("Cannot register thread '" + name + "': conductTest has already been called.");
   }
   auto const taken = std::any_of(entries.begin(), entries.end(), [&](auto const& entry) { return entry->name == name; });
   if (taken) {
      throw NotAllowedError("Cannot register two threads with the same name. Duplicate name: " + name + ".");
   }

   entries.push_back(std::make_shared<ThreadEntry>(this, std::move(name), std::move(body)));
   LOG_CONDUCTOR("registered thread %s", entries.back()->name.c_str());
   return ThreadHandle(entries.back());
}

std::vector<ThreadHandle> Conductor::threads(std::size_t count, Body const& body)
{
   std::vector<ThreadHandle> handles;
   handles.reserve(count);
   for (std::size_t i = 0; i < count; ++i) {
      handles.push_back(thread(body));
   }
   return handles;
}

std::vector<ThreadHandle> Conductor::threads(std::size_t count, std::string const& name_prefix, Body const& body)
{
   std::vector<ThreadHandle> handles;
   handles.reserve(count);
   for (std::size_t i = 1; i <= count; ++i) {
      handles.push_back(thread(name_prefix + "(" + std::to_string(i) + ")", body));
   }
   return handles;
}

/* ============================================================================
 * Clock access
 * ========================================================================= */

void Conductor::wait_for_beat(Beat awaited)
{
   ThreadEntry* self = current_entry();
   if (!self || self->owner != this) {
      throw IllegalStateError("waitForBeat can only be called by a thread started by this Conductor.");
   }

   BeatWaitScope scope(*self, awaited);
   clock.wait_for_beat(awaited);
}

Beat Conductor::beat() const
{
   return clock.current_beat();
}

bool Conductor::is_clock_frozen() const
{
   return clock.is_frozen();
}

/* ============================================================================
 * Conducting
 * ========================================================================= */

void Conductor::when_finished(Body block)
{
   if (boost::this_thread::get_id() != creator) {
      throw IllegalStateError("whenFinished can only be called by thread that created Conductor.");
   }

   boost::lock_guard<boost::mutex> lk(registry_mutex);
   if (phase.load(std::memory_order_acquire) != Phase::Setup) {
      throw IllegalStateError("whenFinished cannot be called after conductTest has been called.");
   }
   if (finish_registered) {
      throw IllegalStateError("whenFinished can only be called once per Conductor.");
   }
   finish_block      = std::move(block);
   finish_registered = true;
}

void Conductor::conduct_test()
{
   conduct_test(Settings{});
}

void Conductor::conduct_test(Settings const& settings)
{
   Roster roster;
   {
      boost::lock_guard<boost::mutex> lk(registry_mutex);
      if (phase.load(std::memory_order_acquire) != Phase::Setup) {
         throw IllegalStateError("conductTest can only be called once per Conductor.");
      }
      phase.store(Phase::Conducting, std::memory_order_release);
      roster = entries;
   }

   LOG_CONDUCTOR("conducting %zu threads", roster.size());

   for (auto const& entry : roster) {
      try {
         entry->start();
      } catch (...) {
         LOG_CONDUCTOR("could not start %s", entry->name.c_str());
         finish_aborted(roster, settings);
         throw;
      }
   }

   Coordinator coordinator(clock, roster, settings);
   switch (coordinator.conduct()) {
      case Coordinator::Outcome::Succeeded:
         break;

      case Coordinator::Outcome::Failed: {
         coordinator.drain();
         finish_aborted(roster, settings);
         auto const first = std::find_if(roster.begin(), roster.end(), [](auto const& entry) { return entry->has_test_failure(); });
         LOG_CONDUCTOR("rethrowing failure of %s", (*first)->name.c_str());
         std::rethrow_exception((*first)->failure);
      }

      case Coordinator::Outcome::TimedOut: {
         auto reports = coordinator.live_threads();
         finish_aborted(roster, settings);
         throw TimedOutError(settings.run_limit, std::move(reports));
      }

      case Coordinator::Outcome::Deadlocked: {
         auto reports = coordinator.live_threads();
         finish_aborted(roster, settings);
         throw DeadlockError(coordinator.deadlock_window(), std::move(reports));
      }
   }

   for (auto const& entry : roster) {
      if (!entry->join_for(settings.failure_drain)) {
         LOG_CONDUCTOR("%s terminated but did not exit, detaching", entry->name.c_str());
         entry->detach();
      }
   }
   collect_failures(roster);
   phase.store(Phase::Finished, std::memory_order_release);
   LOG_CONDUCTOR("all threads finished at beat %u", clock.current_beat());

   if (finish_block) finish_block();
}

void Conductor::finish_aborted(Roster const& roster, Settings const& settings)
{
   for (auto const& entry : roster) {
      if (!entry->is_terminated()) entry->interrupt_for_cleanup();
   }
   for (auto const& entry : roster) {
      if (!entry->join_for(settings.failure_drain)) {
         // Blocked somewhere that is not an interruption point
         LOG_CONDUCTOR("%s ignored interruption, detaching", entry->name.c_str());
         entry->detach();
      }
   }
   collect_failures(roster);
   phase.store(Phase::Finished, std::memory_order_release);
}

void Conductor::collect_failures(Roster const& roster)
{
   boost::lock_guard<boost::mutex> lk(registry_mutex);
   captured.clear();
   for (auto const& entry : roster) {
      if (entry->has_test_failure()) captured.push_back(Failure{.thread_name = entry->name, .error = entry->failure});
   }
}

bool Conductor::conducting_has_begun() const noexcept
{
   return phase.load(std::memory_order_acquire) != Phase::Setup;
}

bool Conductor::conducting_has_finished() const noexcept
{
   return phase.load(std::memory_order_acquire) == Phase::Finished;
}

std::vector<Failure> Conductor::failures() const
{
   boost::lock_guard<boost::mutex> lk(registry_mutex);
   return captured;
}

} // namespace baton
