// Just for debugging ;)
#ifndef BATON_DEBUG_PRINT_HPP
#define BATON_DEBUG_PRINT_HPP

#include <cstdint>
#include <cstdio>
#include <utility>

// Provided by the conductor: name of the conducted thread calling in, or "main"
extern "C" char const* baton_debug_thread_label(void);

namespace baton::debug
{
   enum class Channel
   {
      Clock,
      Conductor,
      Thread,
      Port,
      Test
   };

#if DEBUG_PRINT_ENABLE
   // Simple ANSI colour table
   inline const char* color(Channel ch) noexcept
   {
      switch (ch) {
         case Channel::Clock:     return "\x1b[36m"; // cyan
         case Channel::Conductor: return "\x1b[35m"; // magenta
         case Channel::Thread:    return "\x1b[34m"; // blue
         case Channel::Port:      return "\x1b[33m"; // yellow
         case Channel::Test:      return "\x1b[32m"; // green
      }
      return "\x1b[0m";
   }

   inline const char* label(Channel ch) noexcept
   {
      switch (ch) {
         case Channel::Clock:     return "CLOCK ";
         case Channel::Conductor: return "COND  ";
         case Channel::Thread:    return "THREAD";
         case Channel::Port:      return "PORT  ";
         case Channel::Test:      return "TEST  ";
      }
      return "????";
   }

   inline constexpr const char* reset() noexcept { return "\x1b[0m"; }

   template <typename... Args>
   inline void print(Channel ch, const char* fmt, Args... args)
   {
      // prefix with conducted thread name + channel label
      std::printf("%s[%-20s][%s] ",
                  color(ch),
                  baton_debug_thread_label(),
                  label(ch));
      if constexpr (sizeof...(args) == 0) std::printf("%s", fmt);
      else std::printf(fmt, args...);
      std::printf("%s\n", reset());
      std::fflush(stdout);
   }
#endif

}

// Convenience macros
#if DEBUG_PRINT_ENABLE
#  define LOG_CLOCK(fmt, ...)      baton::debug::print(baton::debug::Channel::Clock,     fmt, ##__VA_ARGS__)
#  define LOG_CONDUCTOR(fmt, ...)  baton::debug::print(baton::debug::Channel::Conductor, fmt, ##__VA_ARGS__)
#  define LOG_THREAD(fmt, ...)     baton::debug::print(baton::debug::Channel::Thread,    fmt, ##__VA_ARGS__)
#  define LOG_PORT(fmt, ...)       baton::debug::print(baton::debug::Channel::Port,      fmt, ##__VA_ARGS__)
#  define LOG_TEST(fmt, ...)       baton::debug::print(baton::debug::Channel::Test,      fmt, ##__VA_ARGS__)
#else
#  define LOG_CLOCK(...)     ((void)0)
#  define LOG_CONDUCTOR(...) ((void)0)
#  define LOG_THREAD(...)    ((void)0)
#  define LOG_PORT(...)      ((void)0)
#  define LOG_TEST(...)      ((void)0)

#endif

#endif
