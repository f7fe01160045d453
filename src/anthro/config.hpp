
#pragma once

#include <string>

namespace Json
{
class Value;
}

#ifndef ANTHRO_VERSION
#define ANTHRO_VERSION "0.0.0"
#endif

#ifndef ANTHRO_INSTALLATION_ROOT
#define ANTHRO_INSTALLATION_ROOT ""
#endif

namespace anthro
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

constexpr const char* k_installation_root = ANTHRO_INSTALLATION_ROOT;

constexpr const char* k_version = ANTHRO_VERSION;

// Must be called before any of the functions below
void load_environment_variables() noexcept;

// NOT thread safe
void set_environment_variables(const Json::Value& o) noexcept;

// Directory holding the default measurement plan and reference mesh.
const std::string& anthro_data_dir() noexcept;

bool anthro_trace_mode() noexcept;
int anthro_log_level() noexcept;

std::string environment_info() noexcept;

} // namespace anthro
