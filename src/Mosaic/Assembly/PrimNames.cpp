//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <cctype>

#include <pxr/base/tf/stringUtils.h>
#include <pxr/usd/sdf/path.h>

#include <Mosaic/Assembly/PrimNames.h>

using PXR_NS::SdfPath;
using PXR_NS::TfMakeValidIdentifier;

namespace mosaic::assembly {

auto IsValidPrimName(std::string_view name) -> bool
{
  return !name.empty() && SdfPath::IsValidIdentifier(std::string(name));
}

auto MakeValidPrimName(std::string_view name) -> std::string
{
  if (name.empty()) {
    return "prim";
  }
  std::string candidate;
  if (std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
    candidate.push_back('_');
  }
  candidate.append(name);
  return TfMakeValidIdentifier(candidate);
}

} // namespace mosaic::assembly
