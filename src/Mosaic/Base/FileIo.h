//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <expected>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <Mosaic/Base/Macros.h>
#include <Mosaic/Base/api_export.h>

namespace mosaic {

//! Read a whole file as bytes into a string.
MSC_BASE_NDAPI auto ReadTextFile(const std::filesystem::path& path)
  -> std::expected<std::string, std::error_code>;

//! Writes one staged file to the temporary path it is given.
using StagedWriter = std::function<std::expected<void, std::error_code>(
  const std::filesystem::path& temp)>;

//! Write `contents` to `path` through a sibling temporary file and a rename,
//! so readers never observe a partially written file.
MSC_BASE_NDAPI auto WriteFileAtomically(const std::filesystem::path& path,
  std::string_view contents) -> std::expected<void, std::error_code>;

//! Same as above, with the file produced by `writer` at the temporary path.
MSC_BASE_NDAPI auto WriteFileAtomically(const std::filesystem::path& path,
  StagedWriter writer) -> std::expected<void, std::error_code>;

//! A set of file writes that become visible together or not at all.
/*!
 Entries are staged with Stage(), as in-memory contents or as a writer that
 produces the file itself. Commit() first writes every entry to a temporary
 file next to its target; only when all temporaries are on disk are they
 published. If any temporary write fails, all temporaries are removed and no
 target is touched.

 Publishing moves each existing target to a backup beside it, then renames
 the temporary over the target. If any step fails, every target already
 published is restored from its backup (or removed when it did not exist
 before), so a failed commit leaves all targets as they were.

 Temporary and backup paths keep the target's extension, so writers that
 pick a file format from the extension work unchanged.

 A StagedFileSet is single-use: after Commit() it is empty.
*/
class StagedFileSet {
public:
  StagedFileSet() = default;
  MSC_BASE_API ~StagedFileSet();

  MOSAIC_MAKE_NON_COPYABLE(StagedFileSet)
  MOSAIC_DEFAULT_MOVABLE(StagedFileSet)

  //! Stage `contents` for `target`. Staging the same target twice keeps the
  //! latest contents.
  MSC_BASE_API auto Stage(std::filesystem::path target, std::string contents)
    -> void;

  //! Stage a writer for `target`. It is called once, during Commit(), with
  //! the temporary path to create.
  MSC_BASE_API auto Stage(std::filesystem::path target, StagedWriter writer)
    -> void;

  MSC_BASE_NDAPI auto Commit() -> std::expected<void, std::error_code>;

  [[nodiscard]] auto Empty() const noexcept -> bool { return entries_.empty(); }
  [[nodiscard]] auto Size() const noexcept -> size_t
  {
    return entries_.size();
  }

  //! Targets in staging order.
  MSC_BASE_NDAPI auto Targets() const -> std::vector<std::filesystem::path>;

  //! Temporary file path used for `target`, e.g. `Chair.mosaic-tmp.usda`.
  MSC_BASE_NDAPI static auto TemporaryPathFor(
    const std::filesystem::path& target) -> std::filesystem::path;

  //! Backup path of `target` while it is being replaced.
  MSC_BASE_NDAPI static auto BackupPathFor(const std::filesystem::path& target)
    -> std::filesystem::path;

private:
  struct Entry {
    std::filesystem::path target;
    StagedWriter writer;
  };

  std::vector<Entry> entries_;
};

} // namespace mosaic
