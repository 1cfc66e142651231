#pragma once
/**
 * @file nb_base.hpp
 * @brief Layer 1: Basic modules built on nb_platform.
 *
 * Provides format_tools, debug_info, scope_guard, result and module_def for lifecycle
 * module registration. Include this when you need formatting, debug utilities, or basic
 * RAII guards.
 */
#include "nb_platform.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <fmt/chrono.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/scope_guard.hpp"
#include "utils/result.hpp"
#include "utils/module_def.hpp"
