//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string_view>
#include <system_error>
#include <vector>

#include <Mosaic/Assembly/AssemblyDiagnostics.h>
#include <Mosaic/Assembly/FragmentRecord.h>
#include <Mosaic/Assembly/api_export.h>

namespace mosaic::assembly {

//! Where the records of a batch came from.
enum class BatchSource : uint8_t {
  //! One `<stem>.hierarchy.json` sidecar per fragment.
  kSidecars = 0,
  //! A single legacy `_hierarchy.txt` with `name|parent` lines.
  kLegacyHierarchy,
  //! No metadata at all: every fragment is a root-level object.
  kFlat,
};

MSC_ASM_NDAPI auto to_string(BatchSource source) -> std::string_view;

//! All fragment records of one export directory.
struct AssemblyBatch final {
  std::filesystem::path root;
  BatchSource source = BatchSource::kFlat;
  std::vector<FragmentRecord> records;
};

inline constexpr std::string_view kSidecarSuffix = ".hierarchy.json";
inline constexpr std::string_view kLegacyHierarchyFile = "_hierarchy.txt";
inline constexpr std::string_view kStageSuffix = "_stage.usda";

//! Read one sidecar file into a record. `file` is resolved against the
//! sidecar's directory. Fails with kInvalidMetadata.
MSC_ASM_NDAPI auto ReadSidecar(const std::filesystem::path& sidecar,
  Diagnostics& diagnostics) -> std::expected<FragmentRecord, std::error_code>;

//! Build records from a legacy hierarchy file.
/*!
 Each `name|parent` line declares an object (empty parent: root level,
 `#` starts a comment). Objects with a fragment file under `export_dir`
 become records; the others are treated as group containers. A parent cycle
 fails with kInvalidMetadata.
*/
MSC_ASM_NDAPI auto ReadLegacyHierarchy(const std::filesystem::path& file,
  const std::filesystem::path& export_dir, Diagnostics& diagnostics)
  -> std::expected<std::vector<FragmentRecord>, std::error_code>;

//! Fragment files (`.usda`, `.usd`, `.usdc`) under `export_dir`, sorted.
/*!
 Directories whose name starts with `.` or `_` are skipped, as are
 previously assembled `*_stage.usda` documents.
*/
MSC_ASM_NDAPI auto FindFragmentFiles(const std::filesystem::path& export_dir)
  -> std::vector<std::filesystem::path>;

//! Load the batch of an export directory.
/*!
 Sidecars take precedence, then the legacy hierarchy file, then a flat scan.
 Sidecar records are ordered by their optional `order` field, then by path.
 A sidecar naming a missing fragment file is reported as a warning.
*/
MSC_ASM_NDAPI auto LoadBatch(const std::filesystem::path& export_dir,
  Diagnostics& diagnostics) -> std::expected<AssemblyBatch, std::error_code>;

} // namespace mosaic::assembly
