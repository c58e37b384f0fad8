//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <Mosaic/Assembly/PropertySet.h>
#include <Mosaic/Assembly/api_export.h>

namespace mosaic::assembly {

//! Host-tool class of an ancestor that has no export of its own.
enum class ContainerClass : uint8_t {
  //! A plain group node.
  kGroup = 0,
  //! A helper/dummy object used to parent other objects.
  kDummy,
  //! A point helper.
  kPoint,
  //! A scene layer used for organization only.
  kLayer,
};

MSC_ASM_NDAPI auto to_string(ContainerClass value) -> std::string_view;
MSC_ASM_NDAPI auto ParseContainerClass(std::string_view text)
  -> std::optional<ContainerClass>;

//! Metadata of one exported fragment file.
/*!
 Records are produced by the batch loader (or built directly by callers) and
 are immutable once assembly starts.
*/
struct FragmentRecord final {
  //! Exported fragment file.
  std::filesystem::path file_path;

  //! Scene-object name, suffixes included (e.g. `Chair_RENDER_VARIANT1`).
  std::string object_name;

  //! Ancestor names, outermost first; empty for a root-level export.
  std::vector<std::string> parent_path;

  //! Ancestors that are containers without an export of their own.
  std::map<std::string, ContainerClass, std::less<>> ancestor_containers;

  //! Properties captured from the object's attribute holder, if it had one.
  std::optional<PropertyOverrides> property_overrides;

  //! The exporter moved the object to the origin before writing it.
  bool moved_to_origin = false;

  //! Where this record was read from; empty when built in code.
  std::filesystem::path sidecar_path;
};

} // namespace mosaic::assembly
