#pragma once

#include "mocap/foundation.hpp"

namespace mocap::cli
{
inline string safe_arg_str(int argc, char** argv, int& i) noexcept(false)
{
   const auto arg = argv[i];
   if(++i >= argc)
      throw std::runtime_error(
          format("expected a value after argument '{}'", arg));
   return string(argv[i]);
}

inline real safe_arg_real(int argc, char** argv, int& i) noexcept(false)
{
   const auto arg = argv[i];
   const auto s   = safe_arg_str(argc, argv, i);
   char* end      = nullptr;
   const auto ret = strtod(s.c_str(), &end);
   if(s.empty() || *end != '\0')
      throw std::runtime_error(
          format("expected a number after argument '{}', got '{}'", arg, s));
   return ret;
}

} // namespace mocap::cli
