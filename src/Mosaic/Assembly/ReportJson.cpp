//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>

#include <Mosaic/Assembly/ReportJson.h>
#include <Mosaic/Base/Logging.h>

namespace mosaic::assembly {

namespace {

  auto SeverityToString(const DiagnosticSeverity severity) -> std::string_view
  {
    switch (severity) {
    case DiagnosticSeverity::kInfo:
      return "info";
    case DiagnosticSeverity::kWarning:
      return "warning";
    case DiagnosticSeverity::kError:
      return "error";
    }
    return "unknown";
  }

} // namespace

auto to_string(const OutputKind kind) -> std::string_view
{
  switch (kind) {
  case OutputKind::kStage:
    return "stage";
  case OutputKind::kFragment:
    return "fragment";
  }
  return "__NotSupported__";
}

auto BuildDiagnosticsJson(const Diagnostics& diagnostics) -> ordered_json
{
  ordered_json entries = ordered_json::array();
  std::ranges::for_each(diagnostics, [&](const AssemblyDiagnostic& diag) {
    ordered_json entry = ordered_json::object();
    entry["severity"] = std::string(SeverityToString(diag.severity));
    entry["code"] = diag.code;
    entry["message"] = diag.message;
    if (diag.error) {
      entry["error"] = diag.error.message();
    }
    if (!diag.source_path.empty()) {
      entry["source_path"] = diag.source_path;
    }
    if (!diag.object_path.empty()) {
      entry["object_path"] = diag.object_path;
    }
    entries.push_back(std::move(entry));
  });
  return entries;
}

auto BuildOutputsJson(const std::vector<AssemblyOutput>& outputs)
  -> ordered_json
{
  ordered_json entries = ordered_json::array();
  for (const auto& output : outputs) {
    CHECK_F(!output.path.empty(), "Output path must be non-empty");
    entries.push_back({
      { "kind", std::string(to_string(output.kind)) },
      { "path", output.path.generic_string() },
      { "size_bytes", output.size_bytes },
    });
  }
  return entries;
}

auto BuildReportJson(const AssemblyReport& report) -> ordered_json
{
  ordered_json doc = ordered_json::object();
  doc["version"] = std::string(kReportVersion);
  doc["root"] = report.root.generic_string();
  doc["status"] = report.success ? "succeeded" : "failed";
  if (report.error) {
    doc["error"] = report.error.message();
  }
  doc["counts"] = {
    { "fragments", report.fragments },
    { "nodes", report.nodes },
    { "variant_groups", report.variant_groups },
    { "rewritten_fragments", report.rewritten_fragments },
  };
  if (report.total_duration) {
    doc["total_ms"] = std::chrono::duration<double, std::milli>(
      *report.total_duration)
                        .count();
  }
  doc["outputs"] = BuildOutputsJson(report.outputs);
  doc["diagnostics"] = BuildDiagnosticsJson(report.diagnostics);
  return doc;
}

} // namespace mosaic::assembly
