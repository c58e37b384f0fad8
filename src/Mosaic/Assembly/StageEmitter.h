//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <filesystem>
#include <span>
#include <string>

#include <pxr/usd/sdf/layer.h>
#include <pxr/usd/sdf/primSpec.h>

#include <Mosaic/Assembly/AssemblyDiagnostics.h>
#include <Mosaic/Assembly/AssemblyOptions.h>
#include <Mosaic/Assembly/FragmentRecord.h>
#include <Mosaic/Assembly/HierarchyReconstructor.h>
#include <Mosaic/Assembly/api_export.h>

namespace mosaic::assembly {

//! Produces the composition document from a reconstructed hierarchy.
/*!
 The document has one top-level Xform (the tree root) of kind `assembly`,
 declared as `defaultPrim`. Every node becomes a prim typed from its
 resolved geom type; fragment-backed nodes get a reference, or a payload
 when their `payload` property is set, to the fragment file. Variant groups
 get one variant per member, holding that member's arc, properties and
 children, with the default selection authored on the group. A group takes
 the prim type of its default member; members that resolve to another type
 are reported.

 The document is authored directly as Sdf specs; fragments are never opened
 or composed here.

 Asset paths are written relative to the document (`./Chair.usda`) unless
 absolute paths were requested.
*/
class StageEmitter {
public:
  StageEmitter(AssemblyOptions options, std::filesystem::path document_path)
    : options_(std::move(options))
    , document_path_(std::move(document_path))
  {
  }

  //! Build the document layer. Dropped properties are reported as warnings.
  MSC_ASM_NDAPI auto Emit(const HierarchyTree& tree,
    std::span<const FragmentRecord> records, Diagnostics& diagnostics) const
    -> PXR_NS::SdfLayerRefPtr;

  //! Emit and serialize to usda text.
  MSC_ASM_NDAPI auto EmitText(const HierarchyTree& tree,
    std::span<const FragmentRecord> records, Diagnostics& diagnostics) const
    -> std::string;

  //! Asset path of `fragment` as written in the document.
  MSC_ASM_NDAPI auto AssetPathFor(const std::filesystem::path& fragment) const
    -> std::string;

private:
  auto EmitNode(const PXR_NS::SdfPrimSpecHandle& prim,
    const HierarchyTree& tree, NodeId id,
    std::span<const FragmentRecord> records, Diagnostics& diagnostics) const
    -> void;

  auto AuthorNode(const PXR_NS::SdfPrimSpecHandle& prim,
    const HierarchyTree& tree, NodeId id,
    std::span<const FragmentRecord> records, Diagnostics& diagnostics) const
    -> void;

  AssemblyOptions options_;
  std::filesystem::path document_path_;
};

} // namespace mosaic::assembly
