//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <filesystem>
#include <optional>

#include <pxr/usd/sdf/layer.h>

#include <Mosaic/Assembly/AssemblyDiagnostics.h>
#include <Mosaic/Assembly/PropertySet.h>
#include <Mosaic/Assembly/api_export.h>

namespace mosaic::assembly {

//! Open a fragment file as a detached Sdf layer.
/*!
 The layer is opened anonymously so edits made to it never leak into the
 layer registry; saving it is the caller's job (see SdfLayer::Export).

 A missing file or one USD cannot read is not fatal: a kUnreadableFragment
 warning carrying the reported errors is recorded and null returned, and the
 fragment is then referenced as-is.
*/
MSC_ASM_NDAPI auto OpenFragmentLayer(const std::filesystem::path& path,
  Diagnostics& diagnostics) -> PXR_NS::SdfLayerRefPtr;

//! The prim the fragment is referenced through: its `defaultPrim`, else its
//! first root prim that is not a class.
MSC_ASM_NDAPI auto FragmentRootPrim(const PXR_NS::SdfLayerHandle& fragment)
  -> PXR_NS::SdfPrimSpecHandle;

//! Properties authored on the fragment's root prim.
/*!
 Used when the object had no attribute holder. Reads `kind`, `instanceable`,
 `active`, `assetInfo.version`, `customData.geomType`, `customData.usePayload`
 and the `purpose`, `visibility` and `model:drawMode` attributes. Returns
 nullopt when none of them is authored.
*/
MSC_ASM_NDAPI auto ReadAuthoredProperties(
  const PXR_NS::SdfLayerHandle& fragment) -> std::optional<PropertyOverrides>;

} // namespace mosaic::assembly
