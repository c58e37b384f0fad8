//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <Mosaic/Assembly/AssemblyError.h>

namespace mosaic::assembly {

//! Severity of an assembly diagnostic.
enum class DiagnosticSeverity : uint8_t {
  kInfo = 0,
  kWarning,
  kError,
};

[[nodiscard]] inline auto to_string(DiagnosticSeverity severity)
  -> std::string_view
{
  switch (severity) {
  case DiagnosticSeverity::kInfo:
    return "Info";
  case DiagnosticSeverity::kWarning:
    return "Warning";
  case DiagnosticSeverity::kError:
    return "Error";
  }
  return "Unknown";
}

//! One diagnostic emitted while assembling a batch.
struct AssemblyDiagnostic final {
  DiagnosticSeverity severity = DiagnosticSeverity::kInfo;

  //! Error kind, empty for purely informational entries.
  std::error_code error;

  //! Stable identifier (e.g. "suffix.malformed_variant").
  std::string code;

  //! Human-readable message.
  std::string message;

  //! Optional fragment or sidecar file the diagnostic refers to.
  std::string source_path;

  //! Optional object name or prim path.
  std::string object_path;
};

using Diagnostics = std::vector<AssemblyDiagnostic>;

[[nodiscard]] inline auto MakeDiagnostic(DiagnosticSeverity severity,
  std::error_code error, std::string code, std::string message,
  std::string source_path = {}, std::string object_path = {})
  -> AssemblyDiagnostic
{
  return AssemblyDiagnostic {
    .severity = severity,
    .error = error,
    .code = std::move(code),
    .message = std::move(message),
    .source_path = std::move(source_path),
    .object_path = std::move(object_path),
  };
}

[[nodiscard]] inline auto HasErrors(const Diagnostics& diagnostics) -> bool
{
  return std::ranges::any_of(diagnostics, [](const AssemblyDiagnostic& d) {
    return d.severity == DiagnosticSeverity::kError;
  });
}

} // namespace mosaic::assembly
