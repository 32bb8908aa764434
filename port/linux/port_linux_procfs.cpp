/**
 * port_linux_procfs.cpp
 *
 * Thread activity probe backed by /proc/self/task/<tid>/{stat,syscall}.
 */
#include "baton/port.h"
#include "port_traits.h"

#include <linux/futex.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <array>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "DEBUG_PRINT.hpp"

namespace
{

using LineBuffer = std::array<char, BATON_PORT_PROCFS_LINE_MAX>;

// Reads the first line of /proc/self/task/<tid>/<leaf>. Returns false if the file
// is missing (thread gone) or unreadable (kernel without the entry, permissions).
bool read_task_file(baton_port_thread_id_t thread, char const* leaf, LineBuffer& line)
{
   std::array<char, 64> path{};
   std::snprintf(path.data(), path.size(), "%s/%lld/%s", BATON_PORT_PROCFS_ROOT, static_cast<long long>(thread), leaf);

   std::FILE* file = std::fopen(path.data(), "r");
   if (!file) return false;

   bool const ok = std::fgets(line.data(), static_cast<int>(line.size()), file) != nullptr;
   std::fclose(file);
   return ok;
}

// Scheduler state letter from the stat line. The comm field is wrapped in
// parentheses and may itself contain ')' so scan from the last one.
char scheduler_state(LineBuffer const& stat_line)
{
   char const* close = std::strrchr(stat_line.data(), ')');
   if (!close || close[1] != ' ' || close[2] == '\0') return '?';
   return close[2];
}

struct SyscallSample
{
   long number{-1};
   std::array<std::uint64_t, 6> args{};
};

// Format: "<nr> <arg0> ... <arg5> <sp> <pc>", or "running", or "-1 <sp> <pc>"
bool parse_syscall(LineBuffer const& line, SyscallSample& sample)
{
   char const* cursor = line.data();
   char* end = nullptr;

   sample.number = std::strtol(cursor, &end, 10);
   if (end == cursor) return false;
   if (sample.number < 0) return true;

   for (auto& arg : sample.args) {
      cursor = end;
      arg = std::strtoull(cursor, &end, 16);
      if (end == cursor) return false;
   }
   return true;
}

bool futex_wait_has_timeout(SyscallSample const& sample)
{
   switch (static_cast<int>(sample.args[1]) & FUTEX_CMD_MASK) {
      case FUTEX_WAIT:
      case FUTEX_WAIT_BITSET:
      case FUTEX_LOCK_PI:
      case FUTEX_WAIT_REQUEUE_PI:
         return sample.args[3] != 0;
      default:
         return false;
   }
}

bool is_timed_wait(SyscallSample const& sample)
{
   // Integer timeouts travel as register-width hex; -1 (infinite) shows up as all ones.
   auto const int_timeout = [](std::uint64_t raw) { return static_cast<std::int32_t>(raw) >= 0; };

   switch (sample.number) {
      case SYS_nanosleep:
      case SYS_clock_nanosleep:
         return true;
      case SYS_futex:
         return futex_wait_has_timeout(sample);
#ifdef SYS_poll
      case SYS_poll:
         return int_timeout(sample.args[2]);
#endif
      case SYS_ppoll:
         return sample.args[2] != 0;
#ifdef SYS_epoll_wait
      case SYS_epoll_wait:
         return int_timeout(sample.args[3]);
#endif
      case SYS_epoll_pwait:
         return int_timeout(sample.args[3]);
#ifdef SYS_select
      case SYS_select:
         return sample.args[4] != 0;
#endif
      case SYS_pselect6:
         return sample.args[4] != 0;
      default:
         return false;
   }
}

baton_port_thread_activity_t classify_sleeper(baton_port_thread_id_t thread)
{
   LineBuffer line{};
   if (!read_task_file(thread, "syscall", line)) return BATON_PORT_THREAD_UNKNOWN;
   if (std::strncmp(line.data(), "running", 7) == 0) return BATON_PORT_THREAD_RUNNING;

   SyscallSample sample;
   if (!parse_syscall(line, sample)) return BATON_PORT_THREAD_UNKNOWN;
   if (sample.number < 0) return BATON_PORT_THREAD_BLOCKED; // Blocked outside a syscall (e.g. page fault)

   return is_timed_wait(sample) ? BATON_PORT_THREAD_TIMED_BLOCKED : BATON_PORT_THREAD_BLOCKED;
}

} // namespace

baton_port_thread_id_t baton_port_current_thread_id(void)
{
   static thread_local baton_port_thread_id_t tid = static_cast<baton_port_thread_id_t>(::syscall(SYS_gettid));
   return tid;
}

bool baton_port_can_probe_threads(void)
{
   static bool const available = ::access(BATON_PORT_PROCFS_ROOT, R_OK) == 0;
   return available;
}

baton_port_thread_activity_t baton_port_thread_activity(baton_port_thread_id_t thread)
{
   if (thread == 0 || !baton_port_can_probe_threads()) return BATON_PORT_THREAD_UNKNOWN;

   LineBuffer stat_line{};
   if (!read_task_file(thread, "stat", stat_line)) return BATON_PORT_THREAD_GONE;

   switch (scheduler_state(stat_line)) {
      case 'R':
         return BATON_PORT_THREAD_RUNNING;
      case 'S':
      case 'D':
         return classify_sleeper(thread);
      case 'T':
      case 't':
         return BATON_PORT_THREAD_BLOCKED; // Stopped by a debugger or signal
      case 'Z':
      case 'X':
      case 'x':
         return BATON_PORT_THREAD_GONE;
      default:
         LOG_PORT("unrecognised scheduler state for tid %lld", static_cast<long long>(thread));
         return BATON_PORT_THREAD_UNKNOWN;
   }
}
