/**
 * @file port.h
 * @brief Baton Port Layer API (C ABI)
 *
 * This is the OS abstraction layer between the Baton conductor and the
 * platform's thread bookkeeping. The conductor can see when a conducted
 * thread blocks on its own clock, but it cannot see a thread that blocks
 * inside arbitrary user code (a latch, a queue, a sleep). The port answers
 * that question by asking the operating system directly.
 *
 * All functions use C linkage. Port implementations must provide all
 * functions declared here.
 */

#ifndef BATON_PORT_H
#define BATON_PORT_H

#include "port_traits.h"

#include <stddef.h>
#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Native thread identifier as understood by the port
 *
 * On Linux this is the kernel tid. Zero is never a valid id.
 */
typedef int64_t baton_port_thread_id_t;

/**
 * @brief What the operating system says a thread is doing right now
 */
typedef enum baton_port_thread_activity
{
   BATON_PORT_THREAD_UNKNOWN       = 0, ///< Port cannot tell (probe unavailable)
   BATON_PORT_THREAD_RUNNING       = 1, ///< On a CPU or runnable
   BATON_PORT_THREAD_BLOCKED       = 2, ///< Sleeping with no deadline
   BATON_PORT_THREAD_TIMED_BLOCKED = 3, ///< Sleeping until a deadline (sleep, timed wait)
   BATON_PORT_THREAD_GONE          = 4, ///< Thread no longer exists
} baton_port_thread_activity_t;

/* ============================================================================
 * Thread Identification
 * ========================================================================= */

/**
 * @brief Get the native id of the calling thread
 * @return Non-zero thread id
 */
baton_port_thread_id_t baton_port_current_thread_id(void);

/* ============================================================================
 * Thread Activity Probe
 * ========================================================================= */

/**
 * @brief Check whether this port can observe other threads at all
 * @return false if baton_port_thread_activity() will only ever report UNKNOWN
 */
bool baton_port_can_probe_threads(void);

/**
 * @brief Sample the activity of a thread in this process
 * @param thread Id previously returned by baton_port_current_thread_id()
 *
 * The answer is a snapshot and may be stale by the time the caller acts on it.
 * Must be safe to call from any thread, concurrently.
 */
baton_port_thread_activity_t baton_port_thread_activity(baton_port_thread_id_t thread);


#ifdef __cplusplus
}
#endif

#endif /* BATON_PORT_H */
