//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <Mosaic/Assembly/AssemblyDiagnostics.h>
#include <Mosaic/Assembly/PropertySet.h>
#include <Mosaic/Assembly/api_export.h>

namespace mosaic::assembly {

//! Semantic roles encoded in an object name's trailing suffix chain.
struct SuffixTags final {
  //! Object name with the recognized chain removed.
  std::string base_name;

  //! Set to `base_name` when the name carries a variant tag.
  std::optional<std::string> variant_group;

  //! Selector label of the variant (the digits of `VARIANT<digits>`).
  std::optional<std::string> variant_member;

  std::optional<Purpose> purpose_override;
  std::optional<bool> payload_override;

  [[nodiscard]] auto HasVariant() const noexcept -> bool
  {
    return variant_member.has_value();
  }
  [[nodiscard]] auto HasTags() const noexcept -> bool
  {
    return variant_member || purpose_override || payload_override;
  }
};

//! Tags plus the MalformedSuffix warnings raised while resolving them.
struct SuffixResolution final {
  SuffixTags tags;
  Diagnostics diagnostics;
};

//! Resolve the suffix chain of an object name.
/*!
 The chain is a run of trailing `_`-separated tokens drawn from
 `VARIANT<digits>`, `RENDER`, `PROXY`, `GUIDE` and `PAYLOAD`, in any order.
 Tags are case-sensitive. Scanning goes right to left and stops at the first
 token that is not a tag.

 Recoverable problems produce a kMalformedSuffix warning and keep text
 literal:
 - `VARIANT` without digits, or followed by non-digits, stays in the base
   name and ends the chain;
 - a chain that repeats a tag, carries two purposes or two variant tags, or
   that would leave an empty base name is not stripped at all.

 Resolving the returned `base_name` again yields no tags.

 ### Examples

 | Name | base | variant | purpose | payload |
 |------|------|---------|---------|---------|
 | `Chair_RENDER_VARIANT1` | `Chair` | `1` | render | - |
 | `Rock_PAYLOAD` | `Rock` | - | - | true |
 | `Lamp_VARIANT` | `Lamp_VARIANT` | - | - | - |
*/
MSC_ASM_NDAPI auto ResolveSuffixes(std::string_view object_name)
  -> SuffixResolution;

} // namespace mosaic::assembly
