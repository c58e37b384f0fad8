//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Mosaic/Assembly/FragmentRecord.h>
#include <Mosaic/Base/StringUtils.h>

namespace mosaic::assembly {

auto to_string(const ContainerClass value) -> std::string_view
{
  switch (value) {
  case ContainerClass::kGroup:
    return "group";
  case ContainerClass::kDummy:
    return "dummy";
  case ContainerClass::kPoint:
    return "point";
  case ContainerClass::kLayer:
    return "layer";
  }
  return "__NotSupported__";
}

auto ParseContainerClass(std::string_view text) -> std::optional<ContainerClass>
{
  const auto lowered = string_utils::ToLower(string_utils::Trim(text));
  for (const auto value : { ContainerClass::kGroup, ContainerClass::kDummy,
         ContainerClass::kPoint, ContainerClass::kLayer }) {
    if (lowered == to_string(value)) {
      return value;
    }
  }
  return std::nullopt;
}

} // namespace mosaic::assembly
