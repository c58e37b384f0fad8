//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json-schema.hpp>
#include <nlohmann/json.hpp>

#include <Mosaic/Assembly/PropertySet.h>

namespace mosaic::assembly::internal {

//! Validates documents against one JSON schema, collecting every error.
class SchemaValidator {
public:
  explicit SchemaValidator(std::string_view schema);

  //! nullopt when valid, otherwise a bullet list of errors.
  auto Validate(const nlohmann::json& instance) const
    -> std::optional<std::string>;

private:
  mutable nlohmann::json_schema::json_validator validator_;
};

//! Parse a JSON file; errors go to `error_stream` prefixed with `what`.
auto ReadJsonFile(const std::filesystem::path& path, std::string_view what,
  std::ostream& error_stream) -> std::optional<nlohmann::json>;

//! Decode a schema-validated `properties` object.
auto ReadPropertyOverrides(const nlohmann::json& obj) -> PropertyOverrides;

//! `path` if absolute, otherwise resolved against `root`.
auto ResolvePath(const std::filesystem::path& root, const std::string& path)
  -> std::filesystem::path;

} // namespace mosaic::assembly::internal
