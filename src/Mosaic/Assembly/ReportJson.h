//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

#include <Mosaic/Assembly/AssemblyReport.h>
#include <Mosaic/Assembly/api_export.h>

namespace mosaic::assembly {

using nlohmann::ordered_json;

inline constexpr std::string_view kReportVersion = "1";

MSC_ASM_NDAPI auto to_string(OutputKind kind) -> std::string_view;

MSC_ASM_NDAPI auto BuildDiagnosticsJson(const Diagnostics& diagnostics)
  -> ordered_json;

MSC_ASM_NDAPI auto BuildOutputsJson(const std::vector<AssemblyOutput>& outputs)
  -> ordered_json;

//! Full report document: version, status, counts, outputs and diagnostics.
MSC_ASM_NDAPI auto BuildReportJson(const AssemblyReport& report)
  -> ordered_json;

} // namespace mosaic::assembly
