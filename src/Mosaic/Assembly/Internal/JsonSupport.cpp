//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <fstream>
#include <sstream>
#include <vector>

#include <Mosaic/Assembly/Internal/JsonSupport.h>

namespace mosaic::assembly::internal {

namespace {

  using nlohmann::json;
  using nlohmann::json_schema::error_handler;

  class CollectingErrorHandler final : public error_handler {
  public:
    void error(const json::json_pointer& ptr, const json& instance,
      const std::string& message) override
    {
      std::ostringstream out;
      const auto path = ptr.to_string();
      out << (path.empty() ? "<root>" : path) << ": " << message;
      if (!instance.is_discarded()) {
        out << " (value=" << instance.dump() << ")";
      }
      errors_.push_back(out.str());
    }

    [[nodiscard]] auto HasErrors() const noexcept -> bool
    {
      return !errors_.empty();
    }

    [[nodiscard]] auto ToString() const -> std::string
    {
      std::ostringstream out;
      for (const auto& error : errors_) {
        out << "- " << error << "\n";
      }
      return out.str();
    }

  private:
    std::vector<std::string> errors_;
  };

  auto OptionalBool(const json& obj, const char* name) -> std::optional<bool>
  {
    if (!obj.contains(name) || !obj[name].is_boolean()) {
      return std::nullopt;
    }
    return obj[name].get<bool>();
  }

  auto OptionalString(const json& obj, const char* name)
    -> std::optional<std::string>
  {
    if (!obj.contains(name) || !obj[name].is_string()) {
      return std::nullopt;
    }
    return obj[name].get<std::string>();
  }

} // namespace

SchemaValidator::SchemaValidator(std::string_view schema)
{
  validator_.set_root_schema(json::parse(schema));
}

auto SchemaValidator::Validate(const json& instance) const
  -> std::optional<std::string>
{
  try {
    CollectingErrorHandler handler;
    [[maybe_unused]] auto _ = validator_.validate(instance, handler);
    if (handler.HasErrors()) {
      return handler.ToString();
    }
    return std::nullopt;
  } catch (const std::exception& e) {
    return std::string(e.what());
  }
}

auto ReadJsonFile(const std::filesystem::path& path, std::string_view what,
  std::ostream& error_stream) -> std::optional<json>
{
  std::ifstream input(path);
  if (!input) {
    error_stream << "ERROR: failed to open " << what << ": " << path.string()
                 << "\n";
    return std::nullopt;
  }

  try {
    json parsed;
    input >> parsed;
    return parsed;
  } catch (const std::exception& e) {
    error_stream << "ERROR: invalid " << what << " JSON (" << path.string()
                 << "): " << e.what() << "\n";
    return std::nullopt;
  }
}

auto ReadPropertyOverrides(const json& obj) -> PropertyOverrides
{
  PropertyOverrides overrides;
  if (const auto v = OptionalString(obj, "geomType")) {
    overrides.geom_type = ParseGeomType(*v);
  }
  if (const auto v = OptionalString(obj, "kind")) {
    overrides.kind = ParseKind(*v);
  }
  if (const auto v = OptionalString(obj, "purpose")) {
    overrides.purpose = ParsePurpose(*v);
  }
  if (const auto v = OptionalString(obj, "drawMode")) {
    overrides.draw_mode = ParseDrawMode(*v);
  }
  overrides.instanceable = OptionalBool(obj, "instanceable");
  overrides.hidden = OptionalBool(obj, "hidden");
  overrides.active = OptionalBool(obj, "active");
  overrides.payload = OptionalBool(obj, "payload");
  overrides.asset_version = OptionalString(obj, "assetVersion");
  return overrides;
}

auto ResolvePath(const std::filesystem::path& root, const std::string& path)
  -> std::filesystem::path
{
  std::filesystem::path resolved(path);
  if (resolved.is_absolute()) {
    return resolved.lexically_normal();
  }
  return (root / resolved).lexically_normal();
}

} // namespace mosaic::assembly::internal
