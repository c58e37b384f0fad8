//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <chrono>
#include <future>
#include <iterator>
#include <sstream>
#include <system_error>
#include <vector>

#include <fmt/format.h>

#include <Mosaic/Assembly/FragmentReader.h>
#include <Mosaic/Assembly/HierarchyReconstructor.h>
#include <Mosaic/Assembly/PrimNames.h>
#include <Mosaic/Assembly/ReportJson.h>
#include <Mosaic/Assembly/ScopeRewriter.h>
#include <Mosaic/Assembly/StageAssembler.h>
#include <Mosaic/Assembly/StageEmitter.h>
#include <Mosaic/Base/FileIo.h>
#include <Mosaic/Base/Logging.h>
#include <Mosaic/Base/ThreadPool.h>

namespace mosaic::assembly {

namespace {

  //! Result slot of one fragment, filled by exactly one worker.
  struct FragmentSlot {
    PXR_NS::SdfLayerRefPtr layer;
    RewriteOutcome outcome;
    std::optional<PropertyOverrides> authored;
    Diagnostics diagnostics;
  };

  //! Stages `fragment` for export to `target` at commit time.
  auto ExportWriter(PXR_NS::SdfLayerRefPtr fragment) -> StagedWriter
  {
    return [fragment = std::move(fragment)](const std::filesystem::path& temp)
             -> std::expected<void, std::error_code> {
      if (!fragment->Export(temp.string())) {
        return std::unexpected(std::make_error_code(std::errc::io_error));
      }
      return {};
    };
  }

  auto SizeOf(const std::filesystem::path& path) -> uint64_t
  {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : size;
  }

  auto Fail(AssemblyReport& report, const AssemblyError error,
    std::string code, std::string message) -> std::unexpected<std::error_code>
  {
    LOG_F(ERROR, "{}", message);
    report.diagnostics.push_back(MakeDiagnostic(DiagnosticSeverity::kError,
      error, std::move(code), std::move(message), report.root.string()));
    return std::unexpected(make_error_code(error));
  }

  auto FolderName(const std::filesystem::path& root) -> std::string
  {
    const auto normal = root.lexically_normal();
    auto name = normal.filename().string();
    if (name.empty()) {
      name = normal.parent_path().filename().string();
    }
    return MakeValidPrimName(name);
  }

} // namespace

StageAssembler::StageAssembler(
  AssemblyOptions options, std::shared_ptr<const AttributeStore> attributes)
  : options_(std::move(options))
  , attributes_(std::move(attributes))
{
}

auto StageAssembler::StagePathFor(const std::filesystem::path& root) const
  -> std::filesystem::path
{
  if (options_.output_path) {
    return *options_.output_path;
  }
  return root / (FolderName(root) + std::string(kStageSuffix));
}

auto StageAssembler::AssembleDirectory(
  const std::filesystem::path& export_dir) const -> AssemblyReport
{
  Diagnostics diagnostics;
  auto batch = LoadBatch(export_dir, diagnostics);
  if (!batch) {
    AssemblyReport report {
      .root = export_dir,
      .error = batch.error(),
      .diagnostics = std::move(diagnostics),
    };
    WriteReport(report);
    return report;
  }
  auto report = AssembleBatch(*batch);
  report.diagnostics.insert(report.diagnostics.begin(),
    std::make_move_iterator(diagnostics.begin()),
    std::make_move_iterator(diagnostics.end()));
  WriteReport(report);
  return report;
}

auto StageAssembler::Assemble(const AssemblyBatch& batch) const
  -> AssemblyReport
{
  auto report = AssembleBatch(batch);
  WriteReport(report);
  return report;
}

auto StageAssembler::AssembleBatch(const AssemblyBatch& batch) const
  -> AssemblyReport
{
  LOG_SCOPE_F(INFO, "Assemble '{}'", batch.root.string());
  const auto started = std::chrono::steady_clock::now();

  AssemblyReport report { .root = batch.root };
  report.fragments = static_cast<uint32_t>(batch.records.size());
  if (auto result = Run(batch, report); !result) {
    report.error = result.error();
    report.outputs.clear();
  } else {
    report.success = true;
  }
  report.total_duration = std::chrono::duration_cast<std::chrono::microseconds>(
    std::chrono::steady_clock::now() - started);

  LOG_F(INFO, "{}: {} fragment(s), {} node(s), {} variant group(s), {} output(s)",
    report.success ? "succeeded" : "failed", report.fragments, report.nodes,
    report.variant_groups, report.outputs.size());
  return report;
}

auto StageAssembler::Run(const AssemblyBatch& batch,
  AssemblyReport& report) const -> std::expected<void, std::error_code>
{
  // Options and attribute store
  {
    std::ostringstream errors;
    if (!options_.Validate(errors)) {
      return Fail(report, AssemblyError::kInvalidOptions, "options.invalid",
        errors.str());
    }
  }
  auto attributes = attributes_;
  if (!attributes && options_.attribute_store_path) {
    std::ostringstream errors;
    auto store = JsonAttributeStore::Load(*options_.attribute_store_path, errors);
    if (!store) {
      return Fail(report, AssemblyError::kInvalidOptions,
        "options.attribute_store", errors.str());
    }
    attributes = std::make_shared<JsonAttributeStore>(std::move(*store));
  }

  // Rewrite fragments and read their authored properties
  const auto& records = batch.records;
  std::vector<FragmentSlot> slots(records.size());
  {
    LOG_SCOPE_F(INFO, "Rewrite fragments");
    const ScopeRewriter rewriter(ScopeRewriter::Config {
      .wrapper_name = options_.wrapper_name,
      .material_scope_names = options_.material_scope_names,
      .nest_material_scopes = options_.nest_material_scopes,
    });
    const auto needs_authored = [&](const FragmentRecord& record) {
      return !record.property_overrides
        && !(attributes && attributes->Lookup(record.object_name));
    };
    const auto process = [&](const size_t index) {
      const auto& record = records[index];
      auto& slot = slots[index];
      const bool read_authored = needs_authored(record);
      if (!options_.strip_wrapper && !read_authored) {
        return;
      }
      slot.layer = OpenFragmentLayer(record.file_path, slot.diagnostics);
      if (!slot.layer) {
        return;
      }
      if (options_.strip_wrapper) {
        slot.outcome = rewriter.Rewrite(
          slot.layer, record.file_path.string(), slot.diagnostics);
      }
      if (read_authored) {
        slot.authored = ReadAuthoredProperties(slot.layer);
      }
    };

    const auto workers = std::min<size_t>(
      std::max<uint32_t>(options_.rewrite_threads, 1U), records.size());
    if (workers <= 1) {
      for (size_t i = 0; i < records.size(); ++i) {
        process(i);
      }
    } else {
      ThreadPool pool(static_cast<unsigned>(workers), "rewrite");
      std::vector<std::future<void>> pending;
      pending.reserve(records.size());
      for (size_t i = 0; i < records.size(); ++i) {
        pending.push_back(pool.Run(process, i));
      }
      for (auto& task : pending) {
        task.get();
      }
    }
  }

  std::vector<FragmentRecord> resolved(records.begin(), records.end());
  for (size_t i = 0; i < slots.size(); ++i) {
    auto& slot = slots[i];
    std::ranges::move(slot.diagnostics, std::back_inserter(report.diagnostics));
    if (slot.outcome.Changed()) {
      ++report.rewritten_fragments;
    }
    auto& record = resolved[i];
    if (record.property_overrides) {
      continue;
    }
    if (attributes) {
      record.property_overrides = attributes->Lookup(record.object_name);
    }
    if (!record.property_overrides) {
      record.property_overrides = slot.authored;
    }
  }

  // Hierarchy
  const HierarchyReconstructor reconstructor(HierarchyReconstructor::Config {
    .root_name = options_.ResolvedDefaultPrimName(),
    .variant_set_name = options_.variant_set_name,
  });
  auto tree = reconstructor.Reconstruct(resolved, report.diagnostics);
  if (!tree) {
    return std::unexpected(tree.error());
  }
  report.nodes = static_cast<uint32_t>(tree->Size());
  for (NodeId id = 0; id < tree->Size(); ++id) {
    if (tree->Node(id).role == NodeRole::kVariantGroup) {
      ++report.variant_groups;
    }
  }

  // Emit and commit
  const auto stage_path = StagePathFor(batch.root);
  const StageEmitter emitter(options_, stage_path);
  auto stage = emitter.Emit(*tree, resolved, report.diagnostics);

  StagedFileSet outputs;
  std::vector<AssemblyOutput> committed;
  for (size_t i = 0; i < slots.size(); ++i) {
    if (!slots[i].outcome.Changed()) {
      continue;
    }
    committed.push_back(AssemblyOutput {
      .kind = OutputKind::kFragment,
      .path = records[i].file_path,
    });
    outputs.Stage(records[i].file_path, ExportWriter(slots[i].layer));
  }
  committed.push_back(AssemblyOutput {
    .kind = OutputKind::kStage,
    .path = stage_path,
  });
  outputs.Stage(stage_path, ExportWriter(std::move(stage)));

  if (auto result = outputs.Commit(); !result) {
    return Fail(report, AssemblyError::kCommitFailed, "commit.failed",
      fmt::format("cannot commit assembly outputs: {}",
        result.error().message()));
  }
  for (auto& output : committed) {
    output.size_bytes = SizeOf(output.path);
  }
  report.outputs = std::move(committed);
  LOG_F(INFO, "Stage written to '{}'", stage_path.string());
  return {};
}

auto StageAssembler::WriteReport(const AssemblyReport& report) const -> void
{
  if (!options_.report_path) {
    return;
  }
  const auto text = BuildReportJson(report).dump(2);
  if (auto written = WriteFileAtomically(*options_.report_path, text);
    !written) {
    LOG_F(WARNING, "Cannot write report '{}': {}",
      options_.report_path->string(), written.error().message());
  }
}

} // namespace mosaic::assembly
