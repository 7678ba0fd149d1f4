#pragma once

#include <algorithm>
#include <cctype>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "fmt/format.h"

namespace mocap
{
using std::string;
using std::string_view;

// ------------------------------------------------------------ Terminal Colours

#define ANSI_COLOUR_RED "\x1b[31m"
#define ANSI_COLOUR_GREEN "\x1b[32m"
#define ANSI_COLOUR_YELLOW "\x1b[33m"
#define ANSI_COLOUR_BLUE "\x1b[34m"
#define ANSI_COLOUR_CYAN "\x1b[36m"
#define ANSI_COLOUR_GREY "\x1b[37m"

#define ANSI_COLOUR_RESET "\x1b[0m"

// -------------------------------------------------------------------- str shim
//
// `str(x)` is what the logging macros call on their argument.

inline string& str(string& s) { return s; }
inline const string& str(const string& s) { return s; }
inline string str(const char* p) { return string(p); }
inline string str(const string_view s) { return string(s.data(), s.size()); }

inline string str(bool v) { return v ? "true" : "false"; }
inline string str(char c) { return string(1, c); }

template<typename T>
inline std::enable_if_t<std::is_integral_v<T>, string> str(T v)
{
   return fmt::format("{}", v);
}

inline string str(float v) { return fmt::format("{:f}", v); }
inline string str(double v) { return fmt::format("{:f}", v); }

// ---------------------------------------------------------------------- Indent

inline std::string indent(const string& s, int level)
{
   const std::string indent_s(size_t(level), char(' '));
   std::stringstream ss{""};
   std::istringstream input{s};
   for(string line; std::getline(input, line);)
      ss << indent_s << line << std::endl;
   string ret = ss.str();
   // Remove endl character if 's' doesn't have one
   if(s.size() > 0 && s[0] != '\n') ret.pop_back();
   return ret;
}

// ----------------------------------------------------------------- str replace

std::string str_replace(const std::string_view search,
                        const std::string_view replace,
                        const std::string_view subject) noexcept;

// --------------------------------------------------------------------- Implode

template<typename InputIt, typename F>
string implode(InputIt first, InputIt last, const std::string_view glue, F f)
{
   std::stringstream stream("");
   bool start = true;
   while(first != last) {
      if(start)
         start = false;
      else
         stream << glue;
      stream << str(f(*first++));
   }
   return stream.str();
}

template<typename InputIt>
string implode(InputIt first, InputIt last, const std::string_view glue)
{
   auto f = [](const decltype(*first)& v) -> std::string { return str(v); };
   return implode(first, last, glue, f);
}

std::vector<std::string> explode(const std::string_view line,
                                 const std::string_view delims,
                                 const bool collapse_empty_fields
                                 = false) noexcept(false); // std::bad_alloc

// ----------------------------------------------------------------- Begins with

template<class U, class V>
constexpr bool begins_with(const U& input, const V& match)
{
   return input.size() >= match.size()
          and std::equal(cbegin(match), cend(match), begin(input));
}

template<class U, class V>
constexpr bool ends_with(const U& input, const V& match)
{
   return input.size() >= match.size()
          and std::equal(crbegin(match), crend(match), rbegin(input));
}

// ------------------------------------------------------------------------ Trim

// Removes leading and trailing whitespace, in place
void trim(std::string& s) noexcept;

inline string trim_copy(const std::string_view s)
{
   string ret(s.data(), s.size());
   trim(ret);
   return ret;
}

// --------------------------------------------------------- synchronized output

inline void sync_write(std::function<void()> thunk)
{
   static std::mutex padlock;
   std::lock_guard<decltype(padlock)> lock(padlock);
   thunk();
}

// ------------------------------------------------------------------ lower-case

string string_to_lowercase(const std::string_view s) noexcept;

} // namespace mocap
