/**
 * @file errors.cpp
 * @brief Diagnostic rendering for conductor errors and thread states
 */

#include "baton/errors.hpp"

#include <sstream>
#include <utility>

namespace baton
{

std::string to_string(ThreadState state)
{
   switch (state) {
      case ThreadState::Unstarted:     return "Unstarted";
      case ThreadState::Running:       return "Running";
      case ThreadState::BlockedOnBeat: return "BlockedOnBeat";
      case ThreadState::BlockedOther:  return "BlockedOther";
      case ThreadState::Terminated:    return "Terminated";
   }
   return "???";
}

std::string to_string(ThreadObservation const& observation)
{
   std::string text = to_string(observation.state);
   if (observation.state == ThreadState::BlockedOnBeat) {
      text += "(" + std::to_string(observation.awaited_beat) + ")";
   } else if (observation.state == ThreadState::BlockedOther && observation.timed) {
      text += "(timed)";
   }
   return text;
}

static std::string describe(std::string const& headline, std::vector<ThreadReport> const& threads)
{
   std::ostringstream out;
   out << headline;
   if (threads.empty()) return out.str();

   out << " Threads still alive:";
   for (auto const& report : threads) {
      out << "\n  " << report.name << ": " << to_string(report.observation);
   }
   return out.str();
}

TimedOutError::TimedOutError(std::chrono::milliseconds run_limit, std::vector<ThreadReport> threads)
   : TimedOutError("Timeout! Test ran longer than " + std::to_string(run_limit.count()) + " ms.", std::move(threads))
{
}

TimedOutError::TimedOutError(std::string const& headline, std::vector<ThreadReport> threads)
   : std::runtime_error(describe(headline, threads)), reports(std::move(threads))
{
}

DeadlockError::DeadlockError(std::chrono::milliseconds blocked_for, std::vector<ThreadReport> threads)
   : TimedOutError("Apparent Deadlock! Threads blocked without waiting for a beat for " + std::to_string(blocked_for.count()) + " ms.",
                   std::move(threads))
{
}

} // namespace baton
