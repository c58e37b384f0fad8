//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <deque>
#include <fstream>
#include <map>
#include <set>
#include <sstream>

#include <fmt/format.h>

#include <Mosaic/Assembly/BatchLoader.h>
#include <Mosaic/Assembly/Internal/JsonSupport.h>
#include <Mosaic/Assembly/Internal/Schemas.h>
#include <Mosaic/Base/Logging.h>
#include <Mosaic/Base/StringUtils.h>

namespace mosaic::assembly {

namespace {

  using nlohmann::json;

  auto InvalidMetadata(const std::filesystem::path& source, std::string code,
    std::string message, Diagnostics& diagnostics)
    -> std::unexpected<std::error_code>
  {
    LOG_F(ERROR, "{}: {}", source.string(), message);
    diagnostics.push_back(MakeDiagnostic(DiagnosticSeverity::kError,
      AssemblyError::kInvalidMetadata, std::move(code), std::move(message),
      source.string()));
    return std::unexpected(make_error_code(AssemblyError::kInvalidMetadata));
  }

  auto IsSkippedDirectory(const std::filesystem::path& dir) -> bool
  {
    const auto name = dir.filename().string();
    return name.starts_with('.') || name.starts_with('_');
  }

  //! Files under `root` accepted by `keep`, skipping hidden directories.
  template <typename Predicate>
  auto ScanFiles(const std::filesystem::path& root, Predicate keep)
    -> std::vector<std::filesystem::path>
  {
    std::vector<std::filesystem::path> found;
    std::error_code ec;
    auto it = std::filesystem::recursive_directory_iterator(root, ec);
    if (ec) {
      LOG_F(WARNING, "Cannot scan '{}': {}", root.string(), ec.message());
      return found;
    }
    for (const auto end = std::filesystem::recursive_directory_iterator();
      it != end; it.increment(ec)) {
      if (ec) {
        LOG_F(WARNING, "Scan error under '{}': {}", root.string(),
          ec.message());
        break;
      }
      if (it->is_directory(ec)) {
        if (IsSkippedDirectory(it->path())) {
          it.disable_recursion_pending();
        }
        continue;
      }
      if (it->is_regular_file(ec) && keep(it->path())) {
        found.push_back(it->path());
      }
    }
    std::ranges::sort(found);
    return found;
  }

  auto IsSidecar(const std::filesystem::path& path) -> bool
  {
    return path.filename().string().ends_with(kSidecarSuffix);
  }

  struct SidecarEntry {
    uint64_t order = 0;
    bool has_order = false;
    FragmentRecord record;
  };

  auto ReadSidecarEntry(const std::filesystem::path& sidecar,
    Diagnostics& diagnostics) -> std::expected<SidecarEntry, std::error_code>
  {
    std::ostringstream errors;
    const auto parsed = internal::ReadJsonFile(sidecar, "sidecar", errors);
    if (!parsed) {
      return InvalidMetadata(
        sidecar, "batch.invalid_sidecar", errors.str(), diagnostics);
    }
    static const internal::SchemaValidator validator(internal::kSidecarSchema);
    if (const auto problems = validator.Validate(*parsed)) {
      return InvalidMetadata(sidecar, "batch.invalid_sidecar",
        fmt::format("schema validation failed:\n{}", *problems), diagnostics);
    }

    const auto& obj = *parsed;
    SidecarEntry entry;
    auto& record = entry.record;
    record.sidecar_path = sidecar;
    record.file_path = internal::ResolvePath(
      sidecar.parent_path(), obj["file"].get<std::string>());
    record.object_name = obj["object"].get<std::string>();
    if (obj.contains("parents")) {
      record.parent_path = obj["parents"].get<std::vector<std::string>>();
    }
    if (obj.contains("containers")) {
      for (const auto& [name, cls] : obj["containers"].items()) {
        const auto parsed_class
          = ParseContainerClass(cls.get<std::string>());
        if (!parsed_class) {
          return InvalidMetadata(sidecar, "batch.invalid_sidecar",
            fmt::format("unknown container class for '{}'", name),
            diagnostics);
        }
        if (std::ranges::find(record.parent_path, name)
          == record.parent_path.end()) {
          return InvalidMetadata(sidecar, "batch.invalid_sidecar",
            fmt::format("container '{}' is not an ancestor of '{}'", name,
              record.object_name),
            diagnostics);
        }
        record.ancestor_containers.emplace(name, *parsed_class);
      }
    }
    if (obj.contains("movedToOrigin")) {
      record.moved_to_origin = obj["movedToOrigin"].get<bool>();
    }
    if (obj.contains("properties")) {
      record.property_overrides
        = internal::ReadPropertyOverrides(obj["properties"]);
    }
    if (obj.contains("order")) {
      entry.order = obj["order"].get<uint64_t>();
      entry.has_order = true;
    }
    return entry;
  }

  auto WarnMissingFragment(const FragmentRecord& record,
    Diagnostics& diagnostics) -> void
  {
    std::error_code ec;
    if (std::filesystem::exists(record.file_path, ec)) {
      return;
    }
    auto message = fmt::format("fragment file '{}' of '{}' does not exist",
      record.file_path.string(), record.object_name);
    LOG_F(WARNING, "{}", message);
    diagnostics.push_back(MakeDiagnostic(DiagnosticSeverity::kWarning,
      AssemblyError::kUnreadableFragment, "batch.missing_fragment",
      std::move(message), record.sidecar_path.string(), record.object_name));
  }

  auto ExtensionRank(const std::filesystem::path& path) -> int
  {
    const auto ext = path.extension().string();
    if (ext == ".usda") {
      return 0;
    }
    if (ext == ".usd") {
      return 1;
    }
    return 2;
  }

} // namespace

auto to_string(const BatchSource source) -> std::string_view
{
  switch (source) {
  case BatchSource::kSidecars:
    return "Sidecars";
  case BatchSource::kLegacyHierarchy:
    return "LegacyHierarchy";
  case BatchSource::kFlat:
    return "Flat";
  }
  return "__NotSupported__";
}

auto ReadSidecar(const std::filesystem::path& sidecar,
  Diagnostics& diagnostics) -> std::expected<FragmentRecord, std::error_code>
{
  auto entry = ReadSidecarEntry(sidecar, diagnostics);
  if (!entry) {
    return std::unexpected(entry.error());
  }
  return std::move(entry->record);
}

auto FindFragmentFiles(const std::filesystem::path& export_dir)
  -> std::vector<std::filesystem::path>
{
  return ScanFiles(export_dir, [](const std::filesystem::path& path) {
    const auto ext = path.extension().string();
    if (ext != ".usda" && ext != ".usd" && ext != ".usdc") {
      return false;
    }
    const auto name = path.filename().string();
    // Leftovers of an interrupted commit are not fragments.
    if (name.contains(".mosaic-tmp.") || name.contains(".mosaic-bak.")) {
      return false;
    }
    return !name.ends_with(kStageSuffix);
  });
}

auto ReadLegacyHierarchy(const std::filesystem::path& file,
  const std::filesystem::path& export_dir, Diagnostics& diagnostics)
  -> std::expected<std::vector<FragmentRecord>, std::error_code>
{
  std::ifstream input(file);
  if (!input) {
    return InvalidMetadata(file, "batch.invalid_hierarchy",
      "cannot open hierarchy file", diagnostics);
  }

  // name -> parent, in declaration order
  std::vector<std::string> order;
  std::map<std::string, std::string, std::less<>> parent_of;
  std::string line;
  size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    const auto text = string_utils::Trim(line);
    if (text.empty() || text.starts_with('#')) {
      continue;
    }
    const auto fields = string_utils::Split(text, '|');
    if (fields.size() != 2 || string_utils::Trim(fields[0]).empty()) {
      return InvalidMetadata(file, "batch.invalid_hierarchy",
        fmt::format("line {}: expected 'name|parent'", line_number),
        diagnostics);
    }
    const std::string name(string_utils::Trim(fields[0]));
    const std::string parent(string_utils::Trim(fields[1]));
    if (!parent_of.emplace(name, parent).second) {
      LOG_F(WARNING, "{}: line {}: '{}' declared twice, keeping the first",
        file.filename().string(), line_number, name);
      continue;
    }
    order.push_back(name);
  }

  std::map<std::string, std::filesystem::path, std::less<>> files;
  for (const auto& path : FindFragmentFiles(export_dir)) {
    const auto stem = path.stem().string();
    const auto [it, inserted] = files.emplace(stem, path);
    if (!inserted && ExtensionRank(path) < ExtensionRank(it->second)) {
      it->second = path;
    }
  }

  std::vector<FragmentRecord> records;
  std::set<std::string, std::less<>> listed;
  for (const auto& name : order) {
    listed.insert(name);
    const auto file_it = files.find(name);
    if (file_it == files.end()) {
      DLOG_F(1, "'{}' has no fragment file, treated as a container", name);
      continue;
    }

    FragmentRecord record {
      .file_path = file_it->second,
      .object_name = name,
      .sidecar_path = file,
    };
    std::deque<std::string> chain;
    std::set<std::string, std::less<>> seen { name };
    for (auto parent = parent_of.find(name)->second; !parent.empty();) {
      if (!seen.insert(parent).second) {
        return InvalidMetadata(file, "batch.hierarchy_cycle",
          fmt::format("parent cycle through '{}'", parent), diagnostics);
      }
      chain.push_front(parent);
      // Only declared names without a file are containers. An undeclared
      // parent stays unresolved and fails the reconstruction.
      if (!files.contains(parent) && parent_of.contains(parent)) {
        record.ancestor_containers.emplace(parent, ContainerClass::kGroup);
      }
      const auto next = parent_of.find(parent);
      parent = next == parent_of.end() ? std::string {} : next->second;
    }
    record.parent_path.assign(chain.begin(), chain.end());
    records.push_back(std::move(record));
  }

  for (const auto& [stem, path] : files) {
    if (listed.contains(stem)) {
      continue;
    }
    diagnostics.push_back(MakeDiagnostic(DiagnosticSeverity::kInfo, {},
      "batch.unlisted_fragment",
      fmt::format("'{}' is not in the hierarchy file; placed at the root",
        path.filename().string()),
      path.string(), stem));
    records.push_back(FragmentRecord {
      .file_path = path, .object_name = stem, .sidecar_path = file });
  }
  return records;
}

auto LoadBatch(const std::filesystem::path& export_dir,
  Diagnostics& diagnostics) -> std::expected<AssemblyBatch, std::error_code>
{
  LOG_SCOPE_F(INFO, "Load batch '{}'", export_dir.string());

  std::error_code ec;
  if (!std::filesystem::is_directory(export_dir, ec)) {
    return InvalidMetadata(export_dir, "batch.no_export_dir",
      "export directory does not exist", diagnostics);
  }

  AssemblyBatch batch { .root = std::filesystem::absolute(export_dir) };

  if (const auto sidecars = ScanFiles(batch.root, IsSidecar);
    !sidecars.empty()) {
    std::vector<SidecarEntry> entries;
    entries.reserve(sidecars.size());
    for (const auto& sidecar : sidecars) {
      auto entry = ReadSidecarEntry(sidecar, diagnostics);
      if (!entry) {
        return std::unexpected(entry.error());
      }
      WarnMissingFragment(entry->record, diagnostics);
      entries.push_back(std::move(*entry));
    }
    // Sidecars with an export order come first, in that order; the rest
    // keep their (sorted) path order.
    std::ranges::stable_sort(entries, [](const auto& a, const auto& b) {
      if (a.has_order != b.has_order) {
        return a.has_order;
      }
      return a.has_order && a.order < b.order;
    });
    for (auto& entry : entries) {
      batch.records.push_back(std::move(entry.record));
    }
    batch.source = BatchSource::kSidecars;
  } else if (const auto legacy = batch.root / kLegacyHierarchyFile;
    std::filesystem::is_regular_file(legacy, ec)) {
    auto records = ReadLegacyHierarchy(legacy, batch.root, diagnostics);
    if (!records) {
      return std::unexpected(records.error());
    }
    batch.records = std::move(*records);
    batch.source = BatchSource::kLegacyHierarchy;
  } else {
    for (const auto& path : FindFragmentFiles(batch.root)) {
      batch.records.push_back(FragmentRecord {
        .file_path = path,
        .object_name = path.stem().string(),
      });
    }
    batch.source = BatchSource::kFlat;
  }

  LOG_F(INFO, "{} fragment(s) from {}", batch.records.size(),
    to_string(batch.source));
  return batch;
}

} // namespace mosaic::assembly
