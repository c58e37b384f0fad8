//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

// Single entry point for logging. Loguru is built with LOGURU_USE_FMTLIB so
// that every LOG_F / CHECK_F format string uses {fmt} syntax.

#if !defined(LOGURU_USE_FMTLIB)
#  define LOGURU_USE_FMTLIB 1
#endif
#if !defined(LOGURU_WITH_STREAMS)
#  define LOGURU_WITH_STREAMS 0
#endif

#include <loguru.hpp>
