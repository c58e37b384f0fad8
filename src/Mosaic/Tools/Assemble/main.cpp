//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string_view>
#include <vector>

#include <fmt/color.h>
#include <fmt/format.h>

#include <Mosaic/Assembly/AssemblyConfig.h>
#include <Mosaic/Assembly/StageAssembler.h>
#include <Mosaic/Base/Logging.h>

namespace {

using mosaic::assembly::AssemblyOptions;
using mosaic::assembly::AssemblyReport;
using mosaic::assembly::DiagnosticSeverity;

constexpr int kExitSuccess = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailed = 2;

constexpr std::string_view kErrorGlyph = "×";
constexpr std::string_view kWarningGlyph = "▲";
constexpr std::string_view kSuccessGlyph = "✓";

auto PrintUsage(std::string_view program) -> void
{
  fmt::print(stderr,
    "Usage: {} [-v <level>] [--no-color] <export-dir> [<config.json>]\n",
    program);
}

auto PrintReport(const AssemblyReport& report, const bool no_color) -> void
{
  const auto print_line = [no_color](const fmt::text_style style,
                            std::string_view glyph, const std::string& text) {
    if (no_color) {
      fmt::print(stdout, "{} {}\n", glyph, text);
    } else {
      fmt::print(stdout, style, "{} {}\n", glyph, text);
    }
  };

  for (const auto& diag : report.diagnostics) {
    if (diag.severity == DiagnosticSeverity::kInfo) {
      continue;
    }
    const bool is_error = diag.severity == DiagnosticSeverity::kError;
    auto text = diag.object_path.empty()
      ? fmt::format("[{}] {}", diag.code, diag.message)
      : fmt::format("[{}] {}: {}", diag.code, diag.object_path, diag.message);
    print_line(fmt::fg(is_error ? fmt::rgb(220, 38, 38) : fmt::rgb(234, 179, 8)),
      is_error ? kErrorGlyph : kWarningGlyph, text);
  }

  if (!report.success) {
    print_line(fmt::fg(fmt::rgb(220, 38, 38)), kErrorGlyph,
      fmt::format("assembly failed: {}", report.error.message()));
    return;
  }
  print_line(fmt::fg(fmt::color::cyan), kSuccessGlyph,
    fmt::format("{} fragment(s), {} node(s), {} variant group(s), {} "
                "fragment(s) rewritten",
      report.fragments, report.nodes, report.variant_groups,
      report.rewritten_fragments));
  for (const auto& output : report.outputs) {
    if (output.kind == mosaic::assembly::OutputKind::kStage) {
      print_line(fmt::fg(fmt::color::white), kSuccessGlyph,
        fmt::format("stage: {}", output.path.string()));
    }
  }
}

} // namespace

auto main(int argc, char** argv) -> int
{
  loguru::g_preamble_date = false;
  loguru::g_preamble_file = true;
  loguru::g_preamble_verbose = false;
  loguru::g_preamble_time = true;
  loguru::g_preamble_uptime = false;
  loguru::g_preamble_thread = true;
  loguru::g_preamble_header = false;
  loguru::g_stderr_verbosity = loguru::Verbosity_WARNING;

  // Consumes -v <level> from the arguments.
  loguru::init(argc, argv);
  loguru::set_thread_name("main");

  int exit_code = kExitSuccess;
  try {
    bool no_color = false;
    bool show_help = false;
    std::vector<std::string_view> positional;
    for (int i = 1; i < argc; ++i) {
      const std::string_view arg(argv[i]);
      if (arg == "--no-color") {
        no_color = true;
      } else if (arg == "-h" || arg == "--help") {
        show_help = true;
        break;
      } else if (arg.starts_with('-')) {
        std::cerr << "ERROR: unknown option '" << arg << "'\n";
        exit_code = kExitUsage;
        break;
      } else {
        positional.push_back(arg);
      }
    }
    loguru::g_colorlogtostderr = !no_color;

    if (show_help) {
      PrintUsage(argv[0]);
    } else if (exit_code == kExitSuccess && positional.empty()) {
      PrintUsage(argv[0]);
      exit_code = kExitUsage;
    } else if (exit_code == kExitSuccess) {
      AssemblyOptions options;
      if (positional.size() > 2) {
        PrintUsage(argv[0]);
        exit_code = kExitUsage;
      } else if (positional.size() == 2) {
        auto loaded = mosaic::assembly::LoadAssemblyOptions(
          std::filesystem::path(positional[1]), std::cerr);
        if (!loaded) {
          exit_code = kExitUsage;
        } else {
          options = std::move(*loaded);
        }
      }

      if (exit_code == kExitSuccess) {
        const mosaic::assembly::StageAssembler assembler(std::move(options));
        const auto report
          = assembler.AssembleDirectory(std::filesystem::path(positional[0]));
        PrintReport(report, no_color);
        exit_code = report.success ? kExitSuccess : kExitFailed;
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "ERROR: " << ex.what() << "\n";
    exit_code = kExitFailed;
  }

  loguru::flush();
  loguru::g_stderr_verbosity = loguru::Verbosity_OFF;
  loguru::shutdown();

  return exit_code;
}
