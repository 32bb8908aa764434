/**
 * @file errors.hpp
 * @brief Exceptions raised by the Conductor
 *
 * Failures thrown by conducted thread bodies are never wrapped: conduct_test()
 * rethrows the exception object the body threw. The types here cover everything the
 * Conductor itself has to say.
 */

#ifndef BATON_ERRORS_HPP
#define BATON_ERRORS_HPP

#include "baton/thread_state.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace baton
{

/**
 * @brief The Conductor was used out of order
 *
 * Registering a thread after conducting began, conducting twice,
 * registering a finish block from the wrong thread or twice.
 */
class IllegalStateError : public std::logic_error
{
public:
   using std::logic_error::logic_error;
};

/**
 * @brief A registration argument was rejected (e.g. duplicate thread name)
 */
class NotAllowedError : public std::invalid_argument
{
public:
   using std::invalid_argument::invalid_argument;
};

/**
 * @brief Last known whereabouts of one conducted thread
 */
struct ThreadReport
{
   std::string name;
   ThreadObservation observation;
};

/**
 * @brief Conducting exceeded its run limit without finishing or failing
 *
 * what() lists every thread that was still alive and what it was doing.
 */
class TimedOutError : public std::runtime_error
{
public:
   TimedOutError(std::chrono::milliseconds run_limit, std::vector<ThreadReport> threads);

   [[nodiscard]] std::vector<ThreadReport> const& threads() const noexcept { return reports; }

protected:
   TimedOutError(std::string const& headline, std::vector<ThreadReport> threads);

private:
   std::vector<ThreadReport> reports;
};

/**
 * @brief Every live thread sat blocked, none of them on a beat, for too long
 */
class DeadlockError : public TimedOutError
{
public:
   DeadlockError(std::chrono::milliseconds blocked_for, std::vector<ThreadReport> threads);
};

} // namespace baton

#endif // BATON_ERRORS_HPP
