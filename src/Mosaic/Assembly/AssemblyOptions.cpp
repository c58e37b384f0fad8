//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Mosaic/Assembly/AssemblyOptions.h>
#include <Mosaic/Assembly/PrimNames.h>
#include <Mosaic/Base/StringUtils.h>

namespace mosaic::assembly {

auto AssemblyOptions::ResolvedDefaultPrimName() const -> std::string
{
  const auto trimmed = string_utils::Trim(default_prim_name);
  if (trimmed.empty()) {
    return "World";
  }
  return MakeValidPrimName(trimmed);
}

auto AssemblyOptions::Validate(std::ostream& error_stream) const -> bool
{
  bool ok = true;
  if (up_axis != "Y" && up_axis != "Z") {
    error_stream << "ERROR: upAxis must be 'Y' or 'Z', got '" << up_axis
                 << "'\n";
    ok = false;
  }
  if (!(meters_per_unit > 0.0)) {
    error_stream << "ERROR: metersPerUnit must be > 0\n";
    ok = false;
  }
  if (frames_per_second && !(*frames_per_second > 0.0)) {
    error_stream << "ERROR: fps must be > 0\n";
    ok = false;
  }
  if (start_time_code && end_time_code && *end_time_code < *start_time_code) {
    error_stream << "ERROR: endFrame must not precede startFrame\n";
    ok = false;
  }
  if (!IsValidPrimName(variant_set_name)) {
    error_stream << "ERROR: variantSetName '" << variant_set_name
                 << "' is not a valid identifier\n";
    ok = false;
  }
  if (strip_wrapper && !IsValidPrimName(wrapper_name)) {
    error_stream << "ERROR: wrapperName '" << wrapper_name
                 << "' is not a valid prim name\n";
    ok = false;
  }
  for (const auto& name : material_scope_names) {
    if (!IsValidPrimName(name)) {
      error_stream << "ERROR: material scope name '" << name
                   << "' is not a valid prim name\n";
      ok = false;
    }
  }
  return ok;
}

} // namespace mosaic::assembly
