#pragma once

#include "fmt/format.h"
#include "mocap/config.hpp"
#include "string-utils.hpp"

#include <cassert>
#include <iostream>
#include <mutex>

#ifdef DEBUG_BUILD
#define DLOG(m) ::mocap::Logger::report(0, __FILE__, __LINE__, ::mocap::str(m))
#else
#define DLOG(m)
#endif

#define INFO(m)                      \
   if(::mocap::get_log_level() <= 1) \
   ::mocap::Logger::report(1, __FILE__, __LINE__, ::mocap::str(m))
#define WARN(m)                      \
   if(::mocap::get_log_level() <= 2) \
   ::mocap::Logger::report(2, __FILE__, __LINE__, ::mocap::str(m))
#define LOG_ERR(m)                   \
   if(::mocap::get_log_level() <= 3) \
   ::mocap::Logger::report(3, __FILE__, __LINE__, ::mocap::str(m))
#define FATAL(m) ::mocap::Logger::report(4, __FILE__, __LINE__, ::mocap::str(m))
#define TRACE(m)                    \
   if(::mocap::mocap_trace_mode()) \
   ::mocap::Logger::report(5, __FILE__, __LINE__, ::mocap::str(m))

namespace mocap
{
using fmt::format;
using std::string;

inline void logger_enable_colours(bool value);
inline bool logger_colours_enabled();

inline int get_log_level();
inline void set_log_info();  // 1
inline void set_log_warn();  // 2
inline void set_log_error(); // 3
// Fatal is always logged

class Logger;

// For **documentation** see implementation of this function
inline void logging_example();

} // namespace mocap

// -------------------------------------------------------------- Implementation

namespace mocap
{
class Logger
{
 private:
   static Logger* instance()
   {
      static Logger instance_; // This is now thread-safe in C++11
      return &instance_;
   }

   static const char* level_to_string(int level)
   {
      if(colours_enabled()) {
         switch(level) {
         case 0: return ANSI_COLOUR_CYAN "DEBUG" ANSI_COLOUR_RESET;
         case 1: return ANSI_COLOUR_BLUE "INFO " ANSI_COLOUR_RESET;
         case 2: return ANSI_COLOUR_YELLOW "WARN " ANSI_COLOUR_RESET;
         case 3: return ANSI_COLOUR_RED "ERROR" ANSI_COLOUR_RESET;
         case 4: return ANSI_COLOUR_RED "FATAL" ANSI_COLOUR_RESET;
         case 5:
            return "\x1b[42m\x1b[97m"
                   "TRACE" ANSI_COLOUR_RESET;
         default: assert(false); break;
         }
      } else {
         switch(level) {
         case 0: return "DEBUG";
         case 1: return "INFO ";
         case 2: return "WARN ";
         case 3: return "ERROR";
         case 4: return "FATAL";
         case 5: return "TRACE";
         default: assert(false); break;
         }
      }
      return "?";
   }

   bool colours_;
   int log_level_;

   Logger() { init(); }
   ~Logger() = default;

   void init()
   {
      colours_   = true;
      log_level_ = 0;
   }

 public:
   static void
   report(int level, const char* file, int lineno, const string& msg)
   {
      if((level >= log_level() && level <= 5) || level == 0) {
         std::ostream& out = std::cout;
         sync_write([&]() {
            out << level_to_string(level) << " " << ANSI_COLOUR_GREY << file
                << ":" << lineno << ANSI_COLOUR_RESET << " " << msg << "\n";
         });
         if(level == 4) {
            exit(1); // Die on fatal
         }
      }
   }

   static int log_level() { return instance()->log_level_; }

   static void set_log_level(int level)
   {
      if(level > 0 && level <= 5)
         instance()->log_level_ = level;
      else
         report(
             2, __FILE__, __LINE__, format("Invalid log level: {}", level));
   }

   static bool colours_enabled() { return instance()->colours_; }

   static void enable_colours(bool value) { instance()->colours_ = value; }
};

} // namespace mocap

inline int ::mocap::get_log_level() { return ::mocap::Logger::log_level(); }
inline void ::mocap::set_log_info() { ::mocap::Logger::set_log_level(1); }
inline void ::mocap::set_log_warn() { ::mocap::Logger::set_log_level(2); }
inline void ::mocap::set_log_error() { ::mocap::Logger::set_log_level(3); }

inline void ::mocap::logger_enable_colours(bool value)
{
   ::mocap::Logger::enable_colours(value);
}
inline bool ::mocap::logger_colours_enabled()
{
   return ::mocap::Logger::colours_enabled();
}

namespace mocap
{
// --------------------------------------------------------------- Documentation
inline void logging_example()
{
   DLOG("Some message"); // only in debug builds
   INFO(format("some info {}", 3));

   WARN(format("Do not like: '{}'", "rain"));
   LOG_ERR("Some error message");

   // Only when MOCAP_TRACE_MODE=1
   TRACE(format("frame {} of {}", 7, 10));

   // FATAL logs an error and calls exit(1)
   FATAL("Okay, hitting the kill-switch");
}

} // namespace mocap
