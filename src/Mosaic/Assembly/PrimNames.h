//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>

#include <Mosaic/Assembly/api_export.h>

namespace mosaic::assembly {

//! True if `name` can be used as a prim name in a USD path.
MSC_ASM_NDAPI auto IsValidPrimName(std::string_view name) -> bool;

//! Turn an arbitrary authored name into a legal prim name.
/*!
 Invalid characters become `_`, a leading digit gets a `_` prefix so the
 digit survives, and an empty name becomes `prim`.
*/
MSC_ASM_NDAPI auto MakeValidPrimName(std::string_view name) -> std::string;

} // namespace mosaic::assembly
