#pragma once

namespace mocap::dump_default_params
{
inline string brief() noexcept
{
   return "Dumps the default 'params.json' to stdout, or to file.";
}

int run_main(int argc, char** argv);
} // namespace mocap::dump_default_params
