// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.
#pragma once

#undef SPDLOG_ACTIVE_LEVEL
#ifndef NDEBUG
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#else
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#endif
#include <exception>
#include <source_location>
#include <string>

#include <fmt/format.h>
#include <fmt/std.h>
#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

#include <boost/preprocessor/comparison/equal.hpp>
#include <boost/preprocessor/control/if.hpp>
#include <boost/preprocessor/variadic/size.hpp>

namespace kestrel::logging {

/// Logs the failed kernel invariant at critical level and terminates.
[[noreturn]] void AssertFailed(std::source_location location, const char *expression, const std::string &message);

/// Replaces the default logger with one writing to stderr. Used by test
/// binaries that do not install the flag driven logger.
void RedirectToStderr();

}  // namespace kestrel::logging

// Expands to an empty string when the assertion has no message arguments.
#define KS_ASSERT_MESSAGE(...) \
  BOOST_PP_IF(BOOST_PP_EQUAL(BOOST_PP_VARIADIC_SIZE(__VA_ARGS__), 0), std::string{}, fmt::format(__VA_ARGS__))

/// Checks an internal invariant in every build type. Never use it for errors
/// a caller can cause; those are reported with exceptions.
#define KS_ASSERT(expr, ...)                                                                                      \
  do {                                                                                                            \
    if (!(expr)) [[unlikely]] {                                                                                   \
      [&]() __attribute__((noinline, cold, noreturn)) {                                                           \
        ::kestrel::logging::AssertFailed(std::source_location::current(), #expr, KS_ASSERT_MESSAGE(__VA_ARGS__)); \
      }();                                                                                                        \
    }                                                                                                             \
  } while (false)

#ifndef NDEBUG
#define DKS_ASSERT(expr, ...) KS_ASSERT(expr, __VA_ARGS__)
#else
#define DKS_ASSERT(...) \
  do {                  \
  } while (false)
#endif

#define LOG_FATAL(...)             \
  do {                             \
    spdlog::critical(__VA_ARGS__); \
    std::terminate();              \
  } while (false)
