//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Mosaic/Assembly/AssemblyConfig.h>
#include <Mosaic/Assembly/Internal/JsonSupport.h>
#include <Mosaic/Assembly/Internal/Schemas.h>
#include <Mosaic/Base/Logging.h>

namespace mosaic::assembly {

namespace {

  using nlohmann::json;

  auto OptionsFromJson(const json& cfg, const std::filesystem::path& base_dir,
    std::ostream& error_stream) -> std::optional<AssemblyOptions>
  {
    static const internal::SchemaValidator validator(
      internal::kAssemblyConfigSchema);
    if (const auto errors = validator.Validate(cfg)) {
      error_stream << "ERROR: assembly config validation failed:\n"
                   << *errors;
      return std::nullopt;
    }

    AssemblyOptions options;
    if (cfg.contains("defaultPrim")) {
      options.default_prim_name = cfg["defaultPrim"].get<std::string>();
    }
    if (cfg.contains("upAxis")) {
      options.up_axis = cfg["upAxis"].get<std::string>();
    }
    if (cfg.contains("metersPerUnit")) {
      options.meters_per_unit = cfg["metersPerUnit"].get<double>();
    }
    if (cfg.contains("fps")) {
      options.frames_per_second = cfg["fps"].get<double>();
    }
    if (cfg.contains("startFrame")) {
      options.start_time_code = cfg["startFrame"].get<double>();
    }
    if (cfg.contains("endFrame")) {
      options.end_time_code = cfg["endFrame"].get<double>();
    }
    if (cfg.contains("variantSetName")) {
      options.variant_set_name = cfg["variantSetName"].get<std::string>();
    }
    if (cfg.contains("relativeAssetPaths")) {
      options.relative_asset_paths = cfg["relativeAssetPaths"].get<bool>();
    }
    if (cfg.contains("stripWrapper")) {
      options.strip_wrapper = cfg["stripWrapper"].get<bool>();
    }
    if (cfg.contains("nestMaterialScopes")) {
      options.nest_material_scopes = cfg["nestMaterialScopes"].get<bool>();
    }
    if (cfg.contains("wrapperName")) {
      options.wrapper_name = cfg["wrapperName"].get<std::string>();
    }
    if (cfg.contains("materialScopeNames")) {
      options.material_scope_names
        = cfg["materialScopeNames"].get<std::vector<std::string>>();
    }
    if (cfg.contains("rewriteThreads")) {
      options.rewrite_threads = cfg["rewriteThreads"].get<uint32_t>();
    }
    if (cfg.contains("output")) {
      options.output_path
        = internal::ResolvePath(base_dir, cfg["output"].get<std::string>());
    }
    if (cfg.contains("report")) {
      options.report_path
        = internal::ResolvePath(base_dir, cfg["report"].get<std::string>());
    }
    if (cfg.contains("attributeStore")) {
      options.attribute_store_path = internal::ResolvePath(
        base_dir, cfg["attributeStore"].get<std::string>());
    }

    if (!options.Validate(error_stream)) {
      return std::nullopt;
    }
    return options;
  }

} // namespace

auto LoadAssemblyOptions(const std::filesystem::path& path,
  std::ostream& error_stream) -> std::optional<AssemblyOptions>
{
  const auto parsed
    = internal::ReadJsonFile(path, "assembly config", error_stream);
  if (!parsed) {
    return std::nullopt;
  }
  auto options = OptionsFromJson(
    *parsed, std::filesystem::absolute(path).parent_path(), error_stream);
  if (options) {
    LOG_F(INFO, "Loaded assembly config '{}'", path.string());
  }
  return options;
}

auto ParseAssemblyOptions(std::string_view json_text,
  const std::filesystem::path& base_dir, std::ostream& error_stream)
  -> std::optional<AssemblyOptions>
{
  json parsed;
  try {
    parsed = json::parse(json_text);
  } catch (const std::exception& e) {
    error_stream << "ERROR: invalid assembly config JSON: " << e.what()
                 << "\n";
    return std::nullopt;
  }
  return OptionsFromJson(parsed, base_dir, error_stream);
}

} // namespace mosaic::assembly
