//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <Mosaic/Assembly/api_export.h>

namespace mosaic::assembly {

//! Settings of one assembly run, resolved once and passed explicitly.
struct AssemblyOptions final {
  //=== Document ===-------------------------------------------------------//

  //! Name of the single top-level prim. Made a valid identifier; empty
  //! falls back to `World`.
  std::string default_prim_name = "World";

  std::string up_axis = "Z";
  double meters_per_unit = 0.01;
  std::optional<double> frames_per_second;
  std::optional<double> start_time_code;
  std::optional<double> end_time_code;

  //! Variant set created on variant groups.
  std::string variant_set_name = "modelVariant";

  //! Write `./relative` asset paths; absolute paths otherwise.
  bool relative_asset_paths = true;

  //=== Fragment rewriting ===---------------------------------------------//

  //! Remove the exporter's wrapper prim from fragments.
  bool strip_wrapper = true;

  //! Move material scopes under the single content prim.
  bool nest_material_scopes = true;

  std::string wrapper_name = "root";
  std::vector<std::string> material_scope_names { "mtl", "Looks",
    "Materials" };

  //! Worker threads used to rewrite fragments; 0 and 1 mean inline.
  uint32_t rewrite_threads = 1;

  //=== Inputs and outputs ===---------------------------------------------//

  //! Stage document path. Default: `<export dir>/<Folder>_stage.usda`.
  std::optional<std::filesystem::path> output_path;

  //! Where to write a JSON report; none when unset.
  std::optional<std::filesystem::path> report_path;

  //! JSON attribute store consulted for objects without sidecar properties.
  std::optional<std::filesystem::path> attribute_store_path;

  //! Check the options, reporting problems to `error_stream`.
  MSC_ASM_NDAPI auto Validate(std::ostream& error_stream) const -> bool;

  //! `default_prim_name` as a valid prim identifier.
  MSC_ASM_NDAPI auto ResolvedDefaultPrimName() const -> std::string;
};

} // namespace mosaic::assembly
