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

/* #include this, not <fmt/...> directly, to use {fmt} in Quire: some gcc versions emit bogus
 * -Wstringop-overflow warnings from inside {fmt} templates with heavy inlining on.
 * See https://github.com/fmtlib/fmt/issues/2708. */

#if defined(__GNUC__) && !defined(__clang__)
#  define QUIRE_GCC_COMPILER
#endif

#ifdef QUIRE_GCC_COMPILER
#  pragma GCC diagnostic push
#  pragma GCC diagnostic ignored "-Wstringop-overflow"
#endif

#include <fmt/format.h>
#include <fmt/chrono.h>

#ifdef QUIRE_GCC_COMPILER
#  pragma GCC diagnostic pop
#  undef QUIRE_GCC_COMPILER
#endif
