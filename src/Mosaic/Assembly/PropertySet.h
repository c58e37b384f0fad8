//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <Mosaic/Assembly/api_export.h>

namespace mosaic::assembly {

//! Prim type to emit for a node.
enum class GeomType : uint8_t {
  //! Chosen from the node's role (see HierarchyReconstructor).
  kAuto = 0,
  kXform,
  kScope,
};

//! Model kind metadata.
enum class Kind : uint8_t {
  kNone = 0,
  kAssembly,
  kGroup,
  kComponent,
  kSubcomponent,
  kModel,
};

//! Render purpose.
enum class Purpose : uint8_t {
  kDefault = 0,
  kRender,
  kProxy,
  kGuide,
};

//! `model:drawMode` of GeomModelAPI.
enum class DrawMode : uint8_t {
  kDefault = 0,
  kBounds,
  kOrigin,
  kCards,
};

// to_string returns the token authored in the scene document (`Xform`,
// `component`, `proxy`, `bounds`); kNone/kAuto return "none"/"auto".
MSC_ASM_NDAPI auto to_string(GeomType value) -> std::string_view;
MSC_ASM_NDAPI auto to_string(Kind value) -> std::string_view;
MSC_ASM_NDAPI auto to_string(Purpose value) -> std::string_view;
MSC_ASM_NDAPI auto to_string(DrawMode value) -> std::string_view;

// Parsing is case-insensitive and accepts exactly the to_string tokens.
MSC_ASM_NDAPI auto ParseGeomType(std::string_view text)
  -> std::optional<GeomType>;
MSC_ASM_NDAPI auto ParseKind(std::string_view text) -> std::optional<Kind>;
MSC_ASM_NDAPI auto ParsePurpose(std::string_view text)
  -> std::optional<Purpose>;
MSC_ASM_NDAPI auto ParseDrawMode(std::string_view text)
  -> std::optional<DrawMode>;

//! Fully resolved configuration of one prim.
/*!
 Default-constructed values are the compiled-in defaults: an object with no
 attribute holder and no suffix is a plain, active, referenced prim.
*/
struct PropertySet final {
  GeomType geom_type = GeomType::kAuto;
  Kind kind = Kind::kNone;
  Purpose purpose = Purpose::kDefault;
  bool instanceable = false;
  bool hidden = false;
  bool active = true;
  //! Load the fragment through a payload arc instead of a reference.
  bool payload = false;
  std::optional<std::string> asset_version;
  DrawMode draw_mode = DrawMode::kDefault;

  auto operator==(const PropertySet&) const -> bool = default;
};

//! A partially populated property set, as captured from an attribute holder.
//! Only fields that are set override the layer below.
struct PropertyOverrides final {
  std::optional<GeomType> geom_type;
  std::optional<Kind> kind;
  std::optional<Purpose> purpose;
  std::optional<bool> instanceable;
  std::optional<bool> hidden;
  std::optional<bool> active;
  std::optional<bool> payload;
  std::optional<std::string> asset_version;
  std::optional<DrawMode> draw_mode;

  auto operator==(const PropertyOverrides&) const -> bool = default;

  //! Overrides that set every field to the values of `properties`.
  MSC_ASM_NDAPI static auto From(const PropertySet& properties)
    -> PropertyOverrides;

  [[nodiscard]] auto Empty() const noexcept -> bool
  {
    return !geom_type && !kind && !purpose && !instanceable && !hidden
      && !active && !payload && !asset_version && !draw_mode;
  }
};

//! Apply every set field of `overrides` onto `properties`.
MSC_ASM_API auto ApplyOverrides(
  PropertySet& properties, const PropertyOverrides& overrides) -> void;

} // namespace mosaic::assembly
