//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <filesystem>
#include <iostream>
#include <optional>
#include <string_view>

#include <Mosaic/Assembly/AssemblyOptions.h>
#include <Mosaic/Assembly/api_export.h>

namespace mosaic::assembly {

//! Load assembly options from a JSON configuration file.
/*!
 The document is validated against the configuration schema; keys that are
 absent keep their `AssemblyOptions` defaults. Relative `output`, `report`
 and `attributeStore` paths are resolved against the configuration file's
 directory.

 @return The options, or nullopt after reporting every problem to
         `error_stream`.
*/
MSC_ASM_NDAPI auto LoadAssemblyOptions(const std::filesystem::path& path,
  std::ostream& error_stream = std::cerr) -> std::optional<AssemblyOptions>;

//! Same as LoadAssemblyOptions, from an in-memory JSON document.
MSC_ASM_NDAPI auto ParseAssemblyOptions(std::string_view json_text,
  const std::filesystem::path& base_dir,
  std::ostream& error_stream = std::cerr) -> std::optional<AssemblyOptions>;

} // namespace mosaic::assembly
