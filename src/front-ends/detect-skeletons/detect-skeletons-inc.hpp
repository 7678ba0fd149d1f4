#pragma once

namespace mocap::detect_skeletons
{
inline string brief() noexcept
{
   return "Extracts 2D skeleton landmarks from every camera of a session.";
}

int run_main(int argc, char** argv);
} // namespace mocap::detect_skeletons
