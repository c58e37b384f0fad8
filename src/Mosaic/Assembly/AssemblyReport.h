//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <system_error>
#include <vector>

#include <Mosaic/Assembly/AssemblyDiagnostics.h>

namespace mosaic::assembly {

//! Kind of file written by an assembly.
enum class OutputKind : uint8_t {
  kStage = 0,
  kFragment,
};

//! One file committed by an assembly.
struct AssemblyOutput final {
  OutputKind kind = OutputKind::kStage;
  std::filesystem::path path;

  //! Size of the committed contents in bytes.
  uint64_t size_bytes = 0;
};

//! Summary of one assembly run.
struct AssemblyReport final {
  //! Export directory of the batch.
  std::filesystem::path root;

  //! True if the batch assembled and every output was committed.
  bool success = false;

  //! The fatal error when `success` is false.
  std::error_code error;

  //! Diagnostics in deterministic (input) order.
  Diagnostics diagnostics;

  //! Files committed; empty when the batch failed.
  std::vector<AssemblyOutput> outputs;

  //! Counts for quick summaries.
  uint32_t fragments = 0;
  uint32_t nodes = 0;
  uint32_t variant_groups = 0;
  uint32_t rewritten_fragments = 0;

  //! Wall-clock duration of the run.
  std::optional<std::chrono::microseconds> total_duration;
};

} // namespace mosaic::assembly
