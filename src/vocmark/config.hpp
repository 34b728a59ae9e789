
#pragma once

#include <string>

namespace vocmark
{
#ifdef TESTCASE_BUILD
constexpr bool k_is_testcase_build = true;
#else
constexpr bool k_is_testcase_build = false;
#endif

#ifdef DEBUG_BUILD
constexpr bool k_is_debug_build = true;
#else
constexpr bool k_is_debug_build = false;
#endif

#ifndef VOCMARK_VERSION
#define VOCMARK_VERSION "0.0.0"
#endif

constexpr const char* k_version = VOCMARK_VERSION;

/**
 * Reads VOCMARK_TRACE_MODE, VOCMARK_LOG_LEVEL and VOCMARK_NO_COLOURS, and
 * configures the logger. Call once at startup; later calls do nothing.
 */
void load_environment_variables() noexcept;

bool vocmark_trace_mode() noexcept;

// Build flags and environment settings, one per line.
std::string environment_info() noexcept;

} // namespace vocmark
