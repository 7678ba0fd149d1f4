#pragma once

#include <string>

namespace mocap
{
#ifdef TESTCASE_BUILD
constexpr bool k_is_testcase_build = true;
#else
constexpr bool k_is_testcase_build = false;
#endif

constexpr bool k_is_cli_build = !k_is_testcase_build;

#ifdef DEBUG_BUILD
constexpr bool k_is_debug_build = true;
#else
constexpr bool k_is_debug_build = false;
#endif

#ifdef RELEASE_BUILD
constexpr bool k_is_release_build = true;
#else
constexpr bool k_is_release_build = false;
#endif

#ifdef ADDRESS_SANITIZE
constexpr bool k_is_asan_build = true;
#else
constexpr bool k_is_asan_build = false;
#endif

#ifdef MOCAP_WITH_MEDIAPIPE
constexpr bool k_has_mediapipe = true;
#else
constexpr bool k_has_mediapipe = false;
#endif

constexpr const char* k_version = MOCAP_VERSION;

// Must be called before any of the functions below
void load_environment_variables() noexcept;

const std::string& mocap_data_dir() noexcept;
const std::string& mocap_replay_dir() noexcept;
const std::string& mocap_mediapipe_graph() noexcept;

bool mocap_trace_mode() noexcept;

std::string environment_info() noexcept;

} // namespace mocap
