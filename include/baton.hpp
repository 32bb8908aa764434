/**
 * Baton Application Programming Interface
 *
 * Deterministic, beat-driven testing of multi-threaded code.
 */
#ifndef BATON_HPP
#define BATON_HPP

#include "baton/clock.hpp"
#include "baton/conductor.hpp"
#include "baton/errors.hpp"
#include "baton/thread_state.hpp"

#endif // BATON_HPP
