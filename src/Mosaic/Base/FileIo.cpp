//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <optional>

#include <Mosaic/Base/FileIo.h>
#include <Mosaic/Base/Finally.h>
#include <Mosaic/Base/Logging.h>

namespace mosaic {

namespace {

  auto LastErrorOr(const std::errc fallback) -> std::error_code
  {
    if (errno != 0) {
      return { errno, std::generic_category() };
    }
    return std::make_error_code(fallback);
  }

  auto WriteWholeFile(const std::filesystem::path& path,
    std::string_view contents) -> std::expected<void, std::error_code>
  {
    errno = 0;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
      return std::unexpected(LastErrorOr(std::errc::io_error));
    }
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.flush();
    if (!out) {
      return std::unexpected(std::make_error_code(std::errc::io_error));
    }
    return {};
  }

  auto RemoveQuietly(const std::filesystem::path& path) noexcept -> void
  {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
      LOG_F(WARNING, "Could not remove '{}': {}", path.string(),
        ec.message());
    }
  }

  //! `Chair.usda` + `.tag` -> `Chair.tag.usda`.
  auto SiblingWithTag(const std::filesystem::path& target, std::string_view tag)
    -> std::filesystem::path
  {
    auto name = target.stem().string();
    name.append(tag);
    name.append(target.extension().string());
    return target.parent_path() / name;
  }

  auto Restore(const std::filesystem::path& backup,
    const std::filesystem::path& target) noexcept -> void
  {
    std::error_code ec;
    std::filesystem::rename(backup, target, ec);
    if (ec) {
      LOG_F(ERROR, "Cannot restore '{}' from '{}': {}", target.string(),
        backup.string(), ec.message());
    }
  }

  struct Published {
    std::filesystem::path target;
    //! Where the previous target was moved; empty if there was none.
    std::optional<std::filesystem::path> backup;
  };

  //! Undo published renames, newest first.
  auto RollBack(const std::vector<Published>& published) noexcept -> void
  {
    for (auto it = published.rbegin(); it != published.rend(); ++it) {
      if (it->backup) {
        Restore(*it->backup, it->target);
      } else {
        RemoveQuietly(it->target);
      }
    }
    if (!published.empty()) {
      LOG_F(WARNING, "Rolled back {} published file(s)", published.size());
    }
  }

} // namespace

auto ReadTextFile(const std::filesystem::path& path)
  -> std::expected<std::string, std::error_code>
{
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return std::unexpected(
      ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory));
  }
  errno = 0;
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::unexpected(LastErrorOr(std::errc::io_error));
  }
  std::string contents { std::istreambuf_iterator<char>(in),
    std::istreambuf_iterator<char>() };
  if (in.bad()) {
    return std::unexpected(std::make_error_code(std::errc::io_error));
  }
  return contents;
}

auto WriteFileAtomically(const std::filesystem::path& path,
  std::string_view contents) -> std::expected<void, std::error_code>
{
  StagedFileSet staged;
  staged.Stage(path, std::string(contents));
  return staged.Commit();
}

auto WriteFileAtomically(const std::filesystem::path& path,
  StagedWriter writer) -> std::expected<void, std::error_code>
{
  StagedFileSet staged;
  staged.Stage(path, std::move(writer));
  return staged.Commit();
}

StagedFileSet::~StagedFileSet() = default;

auto StagedFileSet::Stage(std::filesystem::path target, std::string contents)
  -> void
{
  Stage(std::move(target),
    [contents = std::move(contents)](const std::filesystem::path& temp) {
      return WriteWholeFile(temp, contents);
    });
}

auto StagedFileSet::Stage(std::filesystem::path target, StagedWriter writer)
  -> void
{
  CHECK_F(static_cast<bool>(writer), "staged writer for '{}' is empty",
    target.string());
  const auto it = std::ranges::find_if(
    entries_, [&](const Entry& e) { return e.target == target; });
  if (it != entries_.end()) {
    it->writer = std::move(writer);
    return;
  }
  entries_.push_back(
    { .target = std::move(target), .writer = std::move(writer) });
}

auto StagedFileSet::Targets() const -> std::vector<std::filesystem::path>
{
  std::vector<std::filesystem::path> targets;
  targets.reserve(entries_.size());
  for (const auto& e : entries_) {
    targets.push_back(e.target);
  }
  return targets;
}

auto StagedFileSet::TemporaryPathFor(const std::filesystem::path& target)
  -> std::filesystem::path
{
  return SiblingWithTag(target, ".mosaic-tmp");
}

auto StagedFileSet::BackupPathFor(const std::filesystem::path& target)
  -> std::filesystem::path
{
  return SiblingWithTag(target, ".mosaic-bak");
}

auto StagedFileSet::Commit() -> std::expected<void, std::error_code>
{
  auto entries = std::move(entries_);
  entries_.clear();

  std::vector<std::filesystem::path> written;
  written.reserve(entries.size());
  auto cleanup = Finally([&written] {
    for (const auto& temp : written) {
      RemoveQuietly(temp);
    }
  });

  // Phase 1: every temporary must land on disk before any target changes.
  for (const auto& e : entries) {
    const auto temp = TemporaryPathFor(e.target);
    if (const auto parent = e.target.parent_path(); !parent.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(parent, ec);
      if (ec) {
        LOG_F(ERROR, "Cannot create directory '{}': {}", parent.string(),
          ec.message());
        return std::unexpected(ec);
      }
    }
    if (auto result = e.writer(temp); !result) {
      LOG_F(ERROR, "Cannot write '{}': {}", temp.string(),
        result.error().message());
      RemoveQuietly(temp);
      return std::unexpected(result.error());
    }
    written.push_back(temp);
  }

  // Phase 2: publish, keeping a backup of every replaced target until all
  // renames succeeded.
  std::vector<Published> published;
  published.reserve(entries.size());
  for (size_t i = 0; i < entries.size(); ++i) {
    const auto& target = entries[i].target;
    Published current { .target = target };
    std::error_code ec;
    if (std::filesystem::is_regular_file(target, ec)) {
      current.backup = BackupPathFor(target);
      std::filesystem::rename(target, *current.backup, ec);
      if (ec) {
        LOG_F(ERROR, "Cannot back up '{}': {}", target.string(), ec.message());
        RollBack(published);
        return std::unexpected(ec);
      }
    }
    std::filesystem::rename(written[i], target, ec);
    if (ec) {
      LOG_F(ERROR, "Cannot replace '{}': {}", target.string(), ec.message());
      if (current.backup) {
        Restore(*current.backup, target);
      }
      RollBack(published);
      return std::unexpected(ec);
    }
    published.push_back(std::move(current));
  }

  cleanup.Dismiss();
  for (const auto& p : published) {
    if (p.backup) {
      RemoveQuietly(*p.backup);
    }
  }
  DLOG_F(1, "Committed {} file(s)", entries.size());
  return {};
}

} // namespace mosaic
