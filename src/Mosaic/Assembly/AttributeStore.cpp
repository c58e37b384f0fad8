//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Mosaic/Assembly/AttributeStore.h>
#include <Mosaic/Assembly/Internal/JsonSupport.h>
#include <Mosaic/Assembly/Internal/Schemas.h>
#include <Mosaic/Base/Logging.h>

namespace mosaic::assembly {

auto JsonAttributeStore::Load(const std::filesystem::path& path,
  std::ostream& error_stream) -> std::optional<JsonAttributeStore>
{
  const auto parsed = internal::ReadJsonFile(path, "attribute store", error_stream);
  if (!parsed) {
    return std::nullopt;
  }
  static const internal::SchemaValidator validator(
    internal::kAttributeStoreSchema);
  if (const auto errors = validator.Validate(*parsed)) {
    error_stream << "ERROR: attribute store validation failed ("
                 << path.string() << "):\n"
                 << *errors;
    return std::nullopt;
  }

  JsonAttributeStore store;
  for (const auto& [name, properties] : parsed->items()) {
    store.entries_.emplace(name, internal::ReadPropertyOverrides(properties));
  }
  LOG_F(INFO, "Loaded {} attribute holder(s) from '{}'", store.entries_.size(),
    path.string());
  return store;
}

auto JsonAttributeStore::Lookup(std::string_view object_name) const
  -> std::optional<PropertyOverrides>
{
  const auto it = entries_.find(object_name);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace mosaic::assembly
