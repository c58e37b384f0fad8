//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <array>
#include <utility>

#include <Mosaic/Assembly/PropertySet.h>
#include <Mosaic/Base/StringUtils.h>

namespace mosaic::assembly {

namespace {

  template <typename Enum, size_t N>
  auto ParseToken(std::string_view text,
    const std::array<std::pair<std::string_view, Enum>, N>& table)
    -> std::optional<Enum>
  {
    const auto lowered = string_utils::ToLower(string_utils::Trim(text));
    for (const auto& [token, value] : table) {
      if (string_utils::ToLower(token) == lowered) {
        return value;
      }
    }
    return std::nullopt;
  }

  constexpr std::array<std::pair<std::string_view, GeomType>, 3> kGeomTypes {
    { { "auto", GeomType::kAuto }, { "Xform", GeomType::kXform },
      { "Scope", GeomType::kScope } }
  };

  constexpr std::array<std::pair<std::string_view, Kind>, 6> kKinds { {
    { "none", Kind::kNone },
    { "assembly", Kind::kAssembly },
    { "group", Kind::kGroup },
    { "component", Kind::kComponent },
    { "subcomponent", Kind::kSubcomponent },
    { "model", Kind::kModel },
  } };

  constexpr std::array<std::pair<std::string_view, Purpose>, 4> kPurposes {
    { { "default", Purpose::kDefault }, { "render", Purpose::kRender },
      { "proxy", Purpose::kProxy }, { "guide", Purpose::kGuide } }
  };

  constexpr std::array<std::pair<std::string_view, DrawMode>, 4> kDrawModes {
    { { "default", DrawMode::kDefault }, { "bounds", DrawMode::kBounds },
      { "origin", DrawMode::kOrigin }, { "cards", DrawMode::kCards } }
  };

  template <typename Enum, size_t N>
  auto TokenOf(
    Enum value, const std::array<std::pair<std::string_view, Enum>, N>& table)
    -> std::string_view
  {
    for (const auto& [token, v] : table) {
      if (v == value) {
        return token;
      }
    }
    return "__NotSupported__";
  }

} // namespace

auto to_string(const GeomType value) -> std::string_view
{
  return TokenOf(value, kGeomTypes);
}

auto to_string(const Kind value) -> std::string_view
{
  return TokenOf(value, kKinds);
}

auto to_string(const Purpose value) -> std::string_view
{
  return TokenOf(value, kPurposes);
}

auto to_string(const DrawMode value) -> std::string_view
{
  return TokenOf(value, kDrawModes);
}

auto ParseGeomType(std::string_view text) -> std::optional<GeomType>
{
  return ParseToken(text, kGeomTypes);
}

auto ParseKind(std::string_view text) -> std::optional<Kind>
{
  return ParseToken(text, kKinds);
}

auto ParsePurpose(std::string_view text) -> std::optional<Purpose>
{
  return ParseToken(text, kPurposes);
}

auto ParseDrawMode(std::string_view text) -> std::optional<DrawMode>
{
  return ParseToken(text, kDrawModes);
}

auto PropertyOverrides::From(const PropertySet& properties)
  -> PropertyOverrides
{
  return PropertyOverrides {
    .geom_type = properties.geom_type,
    .kind = properties.kind,
    .purpose = properties.purpose,
    .instanceable = properties.instanceable,
    .hidden = properties.hidden,
    .active = properties.active,
    .payload = properties.payload,
    .asset_version = properties.asset_version,
    .draw_mode = properties.draw_mode,
  };
}

auto ApplyOverrides(PropertySet& properties, const PropertyOverrides& overrides)
  -> void
{
  if (overrides.geom_type) {
    properties.geom_type = *overrides.geom_type;
  }
  if (overrides.kind) {
    properties.kind = *overrides.kind;
  }
  if (overrides.purpose) {
    properties.purpose = *overrides.purpose;
  }
  if (overrides.instanceable) {
    properties.instanceable = *overrides.instanceable;
  }
  if (overrides.hidden) {
    properties.hidden = *overrides.hidden;
  }
  if (overrides.active) {
    properties.active = *overrides.active;
  }
  if (overrides.payload) {
    properties.payload = *overrides.payload;
  }
  if (overrides.asset_version) {
    properties.asset_version = overrides.asset_version;
  }
  if (overrides.draw_mode) {
    properties.draw_mode = *overrides.draw_mode;
  }
}

} // namespace mosaic::assembly
