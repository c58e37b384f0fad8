//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <expected>
#include <filesystem>
#include <memory>
#include <system_error>

#include <Mosaic/Assembly/AssemblyOptions.h>
#include <Mosaic/Assembly/AssemblyReport.h>
#include <Mosaic/Assembly/AttributeStore.h>
#include <Mosaic/Assembly/BatchLoader.h>
#include <Mosaic/Assembly/api_export.h>

namespace mosaic::assembly {

//! Runs one assembly: rewrite fragments, rebuild the hierarchy, emit the
//! stage, and commit everything at once.
/*!
 ### Pipeline

 1. Options are validated; an attribute store is loaded from
    `attribute_store_path` when none was injected.
 2. Every fragment is opened as an Sdf layer, stripped of its wrapper (when
    enabled) and read for authored properties, on a ThreadPool of
    `rewrite_threads` workers. Results land in per-fragment slots and are
    merged in input order.
 3. Each record's properties come from its sidecar, else the attribute
    store, else the fragment's own authored properties.
 4. The hierarchy is reconstructed and the stage document emitted.
 5. Rewritten fragments and the stage are exported through a StagedFileSet,
    so either all of them are replaced or none is.

 Any fatal error stops the run before step 5: no file is modified and the
 report carries the error. The optional JSON report is written in both
 cases.
*/
class StageAssembler {
public:
  MSC_ASM_API explicit StageAssembler(AssemblyOptions options,
    std::shared_ptr<const AttributeStore> attributes = nullptr);

  //! Assemble an already loaded batch.
  MSC_ASM_NDAPI auto Assemble(const AssemblyBatch& batch) const
    -> AssemblyReport;

  //! Load the batch of `export_dir`, then assemble it.
  MSC_ASM_NDAPI auto AssembleDirectory(
    const std::filesystem::path& export_dir) const -> AssemblyReport;

  //! Stage document path for a batch rooted at `root`.
  MSC_ASM_NDAPI auto StagePathFor(const std::filesystem::path& root) const
    -> std::filesystem::path;

  [[nodiscard]] auto GetOptions() const noexcept -> const AssemblyOptions&
  {
    return options_;
  }

private:
  auto AssembleBatch(const AssemblyBatch& batch) const -> AssemblyReport;

  auto Run(const AssemblyBatch& batch, AssemblyReport& report) const
    -> std::expected<void, std::error_code>;

  auto WriteReport(const AssemblyReport& report) const -> void;

  AssemblyOptions options_;
  std::shared_ptr<const AttributeStore> attributes_;
};

} // namespace mosaic::assembly
