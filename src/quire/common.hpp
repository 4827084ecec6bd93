/* Quire
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include <boost/system/error_code.hpp>
#include <boost/chrono/chrono.hpp>
#include <functional>

/* We build in C++17 mode ourselves; and the public headers use `std::optional`, `std::variant` and
 * `std::string_view`, so the user must too. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any quire/ API headers, use C++17 compile mode or later."
#endif

// Macros.  These (conceptually) belong to the `quire` namespace (hence the prefix for each macro).

#ifdef QUIRE_DOXYGEN_ONLY // Compiler ignores; Doxygen sees.

/// Macro that is defined if and only if the compiling environment is Linux.
#  define QUIRE_OS_LINUX

/// Macro that is defined if and only if the compiling environment is Mac OS X or higher macOS.
#  define QUIRE_OS_MAC

#else // if !defined(QUIRE_DOXYGEN_ONLY)

#  ifdef __linux__
#    define QUIRE_OS_LINUX
#  elif defined(__APPLE__)
#    define QUIRE_OS_MAC
#  else
#    error "Quire relies on POSIX local-time and terminal facilities; only Linux and macOS are supported."
#  endif

#endif // elif !defined(QUIRE_DOXYGEN_ONLY)

/**
 * Catch-all namespace for the Quire project: a structured logging pipeline.
 *
 * Quire lets every component of a service emit leveled records carrying call-site origin, thread-scoped
 * context fields, per-call extra fields and, optionally, a captured exception; and lets the deployment decide
 * (via a Logger_config, typically chosen from a preset keyed by environment) which filters, formatters and
 * sinks those records flow through.  The main entry points are quire::log::get_logger() and the `QUIRE_LOG_*()`
 * macros in quire/log/logger.hpp.
 *
 * The sub-namespaces are:
 *   - quire::log: the pipeline proper (records, filters, formatters, handlers, context, logger, registry).
 *   - quire::util: small general-purpose helpers used throughout.
 *   - quire::error: the error-reporting conventions (boost.system based) used by the rest.
 */
namespace quire
{

// Types.

/**
 * Short-hand for a boost.system error code (which basically encapsulates an integer/`enum` error code and a
 * pointer through which to obtain a statically stored message string).  Quire configuration-time failures are
 * described by these; see quire::log::error::Code for the codes Quire itself defines.
 */
using Error_code = boost::system::error_code;

/// Short-hand for polymorphic function (a-la `std::function<>`).
template<typename Signature>
using Function = std::function<Signature>;

/**
 * Monotonic clock used for measuring elapsed time, e.g. by quire::log::Logger::measure_time().
 * Never adjusted by wall-clock changes.
 */
using Steady_clock = boost::chrono::steady_clock;

} // namespace quire
