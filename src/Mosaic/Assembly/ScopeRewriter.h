//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <pxr/usd/sdf/layer.h>

#include <Mosaic/Assembly/AssemblyDiagnostics.h>
#include <Mosaic/Assembly/api_export.h>

namespace mosaic::assembly {

enum class RewriteStatus : uint8_t {
  //! The wrapper was removed; the layer changed.
  kRewritten = 0,
  //! No wrapper and a valid default prim; nothing to do.
  kAlreadyFlat,
  //! The layout was not recognized; the layer was left untouched.
  kSkipped,
};

MSC_ASM_NDAPI auto to_string(RewriteStatus status) -> std::string_view;

struct RewriteOutcome final {
  RewriteStatus status = RewriteStatus::kSkipped;
  //! Default prim after the rewrite (or the existing one when flat).
  std::string default_prim;
  //! Number of target, connection, inherit and internal reference paths
  //! that were rewritten.
  size_t remapped_paths = 0;
  //! Number of skeleton joint tokens that were rewritten.
  size_t remapped_joints = 0;

  [[nodiscard]] auto Changed() const noexcept -> bool
  {
    return status == RewriteStatus::kRewritten;
  }
};

//! Removes the exporter's synthetic top-level wrapper from a fragment.
/*!
 The exporter writes every fragment under a wrapper prim (`/root`, sometimes
 nested as `/root/root`), next to material scopes such as `mtl`. The rewriter
 moves the wrapper's content to the layer root with an SdfBatchNamespaceEdit,
 optionally nests material scopes under the single content prim, fixes every
 path that pointed through the wrapper, removes the wrapper and sets
 `defaultPrim`.

 A `SkelRoot` wrapper is kept, since skinned content must stay under it. A
 nested `/root/root` is collapsed into `/root`, and when the wrapper holds a
 skeleton next to a single `Scene` or `Scene_*` prim, that prim's children
 move up into `/root`. `defaultPrim` becomes the wrapper.

 Skeleton joint lists (`skel:joints`, `joints`) store prim paths as tokens;
 they follow the same moves and keep their relative or absolute form.

 The operation is idempotent: a rewritten layer reports kAlreadyFlat and is
 not modified again.

 Layouts it does not recognize (no wrapper, an empty wrapper, a name
 collision at the destination) produce a kWrapperShapeMismatch warning and
 leave the layer untouched.
*/
class ScopeRewriter {
public:
  struct Config final {
    std::string wrapper_name = "root";
    std::vector<std::string> material_scope_names { "mtl", "Looks",
      "Materials" };
    //! Move material scopes under the content prim when there is exactly one.
    bool nest_material_scopes = true;
  };

  explicit ScopeRewriter(Config config)
    : config_(std::move(config))
  {
  }

  //! Rewrite an in-memory layer. `source` names it in diagnostics.
  MSC_ASM_NDAPI auto Rewrite(const PXR_NS::SdfLayerHandle& fragment,
    std::string_view source, Diagnostics& diagnostics) const
    -> RewriteOutcome;

  //! Rewrite a fragment file in place, atomically and only when it changes.
  /*!
   Unreadable fragments are reported as warnings and skipped. Only a failure
   to write the rewritten file is returned as an error.
  */
  MSC_ASM_NDAPI auto RewriteFile(const std::filesystem::path& path,
    Diagnostics& diagnostics) const
    -> std::expected<RewriteOutcome, std::error_code>;

  [[nodiscard]] auto GetConfig() const noexcept -> const Config&
  {
    return config_;
  }

private:
  auto KeepSkelRoot(const PXR_NS::SdfLayerHandle& fragment,
    const PXR_NS::SdfPath& deepest, std::string_view source,
    Diagnostics& diagnostics) const -> RewriteOutcome;

  Config config_;
};

} // namespace mosaic::assembly
