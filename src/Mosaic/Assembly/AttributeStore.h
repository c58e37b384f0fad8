//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <Mosaic/Assembly/PropertySet.h>
#include <Mosaic/Assembly/api_export.h>

namespace mosaic::assembly {

//! Read-only lookup of attribute-holder properties by scene-object name.
/*!
 Stands in for the host tool's per-object attribute holders. The assembler
 consults it for objects whose metadata carried no properties.
*/
class AttributeStore {
public:
  virtual ~AttributeStore() = default;

  //! Properties captured for `object_name`, or nullopt if it had no holder.
  [[nodiscard]] virtual auto Lookup(std::string_view object_name) const
    -> std::optional<PropertyOverrides>
    = 0;
};

//! Attribute store backed by a JSON file: `{ "<object>": { properties } }`.
class JsonAttributeStore final : public AttributeStore {
public:
  //! Load and schema-validate a store file. Errors go to `error_stream`.
  MSC_ASM_NDAPI static auto Load(const std::filesystem::path& path,
    std::ostream& error_stream = std::cerr)
    -> std::optional<JsonAttributeStore>;

  MSC_ASM_NDAPI auto Lookup(std::string_view object_name) const
    -> std::optional<PropertyOverrides> override;

  [[nodiscard]] auto Size() const noexcept -> size_t
  {
    return entries_.size();
  }

private:
  std::map<std::string, PropertyOverrides, std::less<>> entries_;
};

} // namespace mosaic::assembly
