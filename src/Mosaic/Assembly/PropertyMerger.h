//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>

#include <Mosaic/Assembly/PropertySet.h>
#include <Mosaic/Assembly/SuffixResolver.h>
#include <Mosaic/Assembly/api_export.h>

namespace mosaic::assembly {

//! Resolve the properties of one object.
/*!
 Layers, lowest first: compiled-in PropertySet defaults, the attribute-holder
 overrides (only the fields they set), then the suffix-derived purpose and
 payload. A suffix always wins over an attribute holder for those two fields;
 the conflict is logged, not reported as an error.
*/
MSC_ASM_NDAPI auto MergeProperties(
  const std::optional<PropertyOverrides>& overrides, const SuffixTags& tags)
  -> PropertySet;

} // namespace mosaic::assembly
