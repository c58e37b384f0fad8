//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <pxr/base/vt/types.h>
#include <pxr/usd/sdf/attributeSpec.h>
#include <pxr/usd/sdf/namespaceEdit.h>
#include <pxr/usd/sdf/path.h>
#include <pxr/usd/sdf/primSpec.h>
#include <pxr/usd/sdf/reference.h>
#include <pxr/usd/sdf/relationshipSpec.h>

#include <Mosaic/Assembly/FragmentReader.h>
#include <Mosaic/Assembly/ScopeRewriter.h>
#include <Mosaic/Base/FileIo.h>
#include <Mosaic/Base/Logging.h>
#include <Mosaic/Base/StringUtils.h>

using PXR_NS::SdfBatchNamespaceEdit;
using PXR_NS::SdfLayerHandle;
using PXR_NS::SdfNamespaceEdit;
using PXR_NS::SdfNamespaceEditDetail;
using PXR_NS::SdfNamespaceEditDetailVector;
using PXR_NS::SdfPath;
using PXR_NS::SdfPrimSpecHandle;
using PXR_NS::SdfReference;
using PXR_NS::SdfSpecifierClass;
using PXR_NS::SdfSpecTypeAttribute;
using PXR_NS::SdfSpecTypePrim;
using PXR_NS::SdfSpecTypeRelationship;
using PXR_NS::TfToken;
using PXR_NS::VtTokenArray;
using PXR_NS::VtValue;

namespace mosaic::assembly {

namespace {

  constexpr auto kSkelRoot = "SkelRoot";
  constexpr auto kSkeleton = "Skeleton";
  constexpr auto kSkeletonScope = "Bones";
  constexpr std::string_view kClassPrefix = "_class_";
  constexpr std::string_view kSceneWrapper = "scene";

  auto Mismatch(std::string_view source, std::string message,
    Diagnostics& diagnostics) -> RewriteOutcome
  {
    LOG_F(WARNING, "{}: {}", source, message);
    diagnostics.push_back(MakeDiagnostic(DiagnosticSeverity::kWarning,
      AssemblyError::kWrapperShapeMismatch, "scope.wrapper_shape_mismatch",
      std::move(message), std::string(source)));
    return RewriteOutcome { .status = RewriteStatus::kSkipped };
  }

  auto IsConcrete(const SdfPrimSpecHandle& prim) -> bool
  {
    return prim->GetSpecifier() != SdfSpecifierClass
      && !prim->GetName().starts_with(kClassPrefix);
  }

  //! `Scene` or `Scene_<anything>`, in any case.
  auto IsSceneWrapperName(std::string_view name) -> bool
  {
    if (!string_utils::ToLower(name).starts_with(kSceneWrapper)) {
      return false;
    }
    return name.size() == kSceneWrapper.size()
      || name[kSceneWrapper.size()] == '_';
  }

  auto Children(const SdfPrimSpecHandle& prim) -> std::vector<SdfPrimSpecHandle>
  {
    std::vector<SdfPrimSpecHandle> children;
    for (const auto& child : prim->GetNameChildren()) {
      children.push_back(child);
    }
    return children;
  }

  auto RootPrimNamed(const SdfLayerHandle& fragment, const TfToken& name)
    -> SdfPrimSpecHandle
  {
    for (const auto& prim : fragment->GetRootPrims()) {
      if (prim->GetNameToken() == name) {
        return prim;
      }
    }
    return {};
  }

  //! Applies `edit` to `fragment`, or returns why it cannot be applied. A
  //! failed edit leaves the layer unchanged.
  auto ApplyEdit(const SdfLayerHandle& fragment,
    const SdfBatchNamespaceEdit& edit) -> std::optional<std::string>
  {
    SdfNamespaceEditDetailVector details;
    if (fragment->CanApply(edit, &details) == SdfNamespaceEditDetail::Error) {
      std::vector<std::string> reasons;
      for (const auto& detail : details) {
        reasons.push_back(detail.reason);
      }
      return fmt::format("namespace edit rejected: {}", fmt::join(reasons, "; "));
    }
    if (!fragment->Apply(edit)) {
      return std::string("namespace edit failed");
    }
    return std::nullopt;
  }

  //! Prefix moves, applied in the order they were added.
  class PathRemap {
  public:
    auto Add(SdfPath from, SdfPath to) -> void
    {
      moves_.emplace_back(std::move(from), std::move(to));
    }

    [[nodiscard]] auto Empty() const noexcept -> bool { return moves_.empty(); }

    //! The moved path, or nullopt when no move applies.
    auto operator()(const SdfPath& path) const -> std::optional<SdfPath>
    {
      auto result = path;
      bool moved = false;
      for (const auto& [from, to] : moves_) {
        if (!result.HasPrefix(from)) {
          continue;
        }
        // Properties of a prim that disappears have nowhere to go.
        if (to.IsAbsoluteRootPath() && result.GetPrimPath() == from) {
          continue;
        }
        result = result.ReplacePrefix(from, to);
        moved = true;
      }
      return moved ? std::optional(result) : std::nullopt;
    }

  private:
    std::vector<std::pair<SdfPath, SdfPath>> moves_;
  };

  auto SpecPaths(const SdfLayerHandle& fragment) -> std::vector<SdfPath>
  {
    std::vector<SdfPath> paths;
    fragment->Traverse(SdfPath::AbsoluteRootPath(),
      [&paths](const SdfPath& path) { paths.push_back(path); });
    return paths;
  }

  //! Rewrites relationship targets, attribute connections, inherits,
  //! specializes and internal references.
  auto RemapPathLists(const SdfLayerHandle& fragment,
    const std::vector<SdfPath>& specs, const PathRemap& remap) -> size_t
  {
    size_t count = 0;
    const auto edit = [&](const SdfPath& path) -> std::optional<SdfPath> {
      if (auto moved = remap(path)) {
        ++count;
        return moved;
      }
      return path;
    };
    const auto edit_reference
      = [&](const SdfReference& reference) -> std::optional<SdfReference> {
      if (!reference.GetAssetPath().empty()
        || reference.GetPrimPath().IsEmpty()) {
        return reference;
      }
      const auto moved = remap(reference.GetPrimPath());
      if (!moved) {
        return reference;
      }
      ++count;
      auto updated = reference;
      updated.SetPrimPath(*moved);
      return updated;
    };

    for (const auto& path : specs) {
      switch (fragment->GetSpecType(path)) {
      case SdfSpecTypePrim: {
        const auto prim = fragment->GetPrimAtPath(path);
        prim->GetInheritPathList().ModifyItemEdits(edit);
        prim->GetSpecializesList().ModifyItemEdits(edit);
        prim->GetReferenceList().ModifyItemEdits(edit_reference);
        break;
      }
      case SdfSpecTypeRelationship:
        fragment->GetRelationshipAtPath(path)
          ->GetTargetPathList()
          .ModifyItemEdits(edit);
        break;
      case SdfSpecTypeAttribute:
        fragment->GetAttributeAtPath(path)
          ->GetConnectionPathList()
          .ModifyItemEdits(edit);
        break;
      default:
        break;
      }
    }
    return count;
  }

  struct JointContext {
    const SdfLayerHandle& fragment;
    const PathRemap& remap;
    //! Leading `Scene_x/` of relative tokens whose wrapper was flattened.
    std::string relative_strip;
    //! Prim a dangling absolute token is retried under, if any.
    SdfPath content_root;
  };

  auto RemapJointToken(const JointContext& context, const std::string& token)
    -> std::optional<std::string>
  {
    if (token.empty()) {
      return std::nullopt;
    }
    const bool absolute = token.front() == '/';
    const auto as_absolute = absolute ? token : "/" + token;
    if (!SdfPath::IsValidPathString(as_absolute)) {
      return std::nullopt;
    }
    const SdfPath path(as_absolute);

    auto moved = context.remap(path);
    if (!moved && !absolute && !context.relative_strip.empty()
      && token.starts_with(context.relative_strip)
      && token.size() > context.relative_strip.size()) {
      return token.substr(context.relative_strip.size());
    }
    if (!moved && !context.content_root.IsEmpty()
      && !context.fragment->GetPrimAtPath(path)) {
      const auto prefixed = context.content_root.GetString() + as_absolute;
      if (SdfPath::IsValidPathString(prefixed)
        && context.fragment->GetPrimAtPath(SdfPath(prefixed))) {
        moved = SdfPath(prefixed);
      }
    }
    if (!moved) {
      return std::nullopt;
    }
    auto text = moved->GetString();
    if (!absolute && text.starts_with('/')) {
      text.erase(0, 1);
    }
    return text == token ? std::nullopt : std::optional(std::move(text));
  }

  //! Rewrites `skel:joints` and `joints` token arrays, keeping each token's
  //! relative or absolute form.
  auto RemapJointTokens(
    const JointContext& context, const std::vector<SdfPath>& specs) -> size_t
  {
    size_t count = 0;
    for (const auto& path : specs) {
      if (context.fragment->GetSpecType(path) != SdfSpecTypeAttribute) {
        continue;
      }
      const auto& name = path.GetName();
      if (name != "skel:joints" && name != "joints") {
        continue;
      }
      const auto attribute = context.fragment->GetAttributeAtPath(path);
      if (!attribute->HasDefaultValue()) {
        continue;
      }
      const auto value = attribute->GetDefaultValue();
      if (!value.IsHolding<VtTokenArray>()) {
        continue;
      }
      auto tokens = value.UncheckedGet<VtTokenArray>();
      size_t changed = 0;
      for (auto& token : tokens) {
        if (auto moved = RemapJointToken(context, token.GetString())) {
          token = TfToken(*moved);
          ++changed;
        }
      }
      if (changed != 0) {
        attribute->SetDefaultValue(VtValue(tokens));
        count += changed;
      }
    }
    return count;
  }

} // namespace

auto to_string(const RewriteStatus status) -> std::string_view
{
  switch (status) {
  case RewriteStatus::kRewritten:
    return "Rewritten";
  case RewriteStatus::kAlreadyFlat:
    return "AlreadyFlat";
  case RewriteStatus::kSkipped:
    return "Skipped";
  }
  return "__NotSupported__";
}

auto ScopeRewriter::Rewrite(const SdfLayerHandle& fragment,
  std::string_view source, Diagnostics& diagnostics) const -> RewriteOutcome
{
  CHECK_F(static_cast<bool>(fragment), "no layer to rewrite for '{}'", source);

  const TfToken wrapper_name(config_.wrapper_name);
  const auto wrapper = RootPrimNamed(fragment, wrapper_name);
  if (!wrapper) {
    const auto default_prim = fragment->GetDefaultPrim();
    if (!default_prim.IsEmpty() && RootPrimNamed(fragment, default_prim)) {
      DLOG_F(1, "{}: already flat, default prim '{}'", source,
        default_prim.GetString());
      diagnostics.push_back(MakeDiagnostic(DiagnosticSeverity::kInfo, {},
        "scope.already_flat",
        fmt::format("no '{}' wrapper; default prim '{}' kept",
          config_.wrapper_name, default_prim.GetString()),
        std::string(source)));
      return RewriteOutcome {
        .status = RewriteStatus::kAlreadyFlat,
        .default_prim = default_prim.GetString(),
      };
    }
    return Mismatch(source,
      fmt::format("no '{}' wrapper prim and no valid default prim",
        config_.wrapper_name),
      diagnostics);
  }

  // Exporters occasionally nest the wrapper: /root/root/...
  auto deepest = wrapper;
  for (;;) {
    const auto children = Children(deepest);
    if (children.size() != 1 || children.front()->GetNameToken() != wrapper_name
      || children.front()->GetTypeName() == kSkelRoot) {
      break;
    }
    deepest = children.front();
  }
  if (wrapper->GetTypeName() == kSkelRoot) {
    return KeepSkelRoot(fragment, deepest->GetPath(), source, diagnostics);
  }

  const auto strip_prefix = deepest->GetPath();
  const auto children = Children(deepest);
  if (children.empty()) {
    return Mismatch(source,
      fmt::format("wrapper '{}' has no children", strip_prefix.GetString()),
      diagnostics);
  }

  const auto is_material = [this](const SdfPrimSpecHandle& prim) {
    return std::ranges::find(config_.material_scope_names, prim->GetName())
      != config_.material_scope_names.end();
  };

  std::vector<SdfPrimSpecHandle> content;
  std::vector<SdfPrimSpecHandle> concrete;
  std::vector<TfToken> materials;
  for (const auto& child : children) {
    if (is_material(child)) {
      materials.push_back(child->GetNameToken());
      continue;
    }
    content.push_back(child);
    if (IsConcrete(child)) {
      concrete.push_back(child);
    }
  }
  if (content.empty()) {
    return Mismatch(source,
      fmt::format(
        "wrapper '{}' only holds material scopes", strip_prefix.GetString()),
      diagnostics);
  }

  const auto default_prim
    = (concrete.empty() ? content.front() : concrete.front())->GetNameToken();
  auto nest = config_.nest_material_scopes && concrete.size() == 1
    && !materials.empty();
  if (nest) {
    const auto target = concrete.front()->GetPath();
    const bool clash = std::ranges::any_of(materials,
      [&](const TfToken& m) {
        return static_cast<bool>(fragment->GetPrimAtPath(target.AppendChild(m)));
      });
    if (clash) {
      DLOG_F(1, "{}: '{}' already has a material scope child, not nesting",
        source, default_prim.GetString());
      nest = false;
    }
  }

  // Everything that lands at the layer root must not collide with an
  // existing root prim, the wrapper included.
  for (const auto& child : children) {
    if (nest && is_material(child)) {
      continue;
    }
    if (RootPrimNamed(fragment, child->GetNameToken())) {
      return Mismatch(source,
        fmt::format("moving '{}' to the layer root collides with an existing "
                    "prim",
          child->GetName()),
        diagnostics);
    }
  }

  const auto root = SdfPath::AbsoluteRootPath();
  const auto nest_root = root.AppendChild(default_prim);
  SdfBatchNamespaceEdit edit;
  PathRemap remap;
  for (const auto& child : children) {
    if (!(nest && is_material(child))) {
      edit.Add(child->GetPath(), root.AppendChild(child->GetNameToken()));
    }
  }
  if (nest) {
    for (const auto& m : materials) {
      edit.Add(strip_prefix.AppendChild(m), nest_root.AppendChild(m));
      remap.Add(strip_prefix.AppendChild(m), nest_root.AppendChild(m));
    }
  }
  remap.Add(strip_prefix, root);
  edit.Add(SdfNamespaceEdit::Remove(wrapper->GetPath()));

  if (!wrapper->GetProperties().empty()) {
    DLOG_F(1, "{}: dropping {} propert(ies) authored on the wrapper", source,
      wrapper->GetProperties().size());
  }
  if (auto failed = ApplyEdit(fragment, edit)) {
    return Mismatch(source, std::move(*failed), diagnostics);
  }

  const auto specs = SpecPaths(fragment);
  const auto remapped = RemapPathLists(fragment, specs, remap);
  const auto joints = RemapJointTokens(
    JointContext {
      .fragment = fragment,
      .remap = remap,
      .content_root = nest_root,
    },
    specs);
  fragment->SetDefaultPrim(default_prim);

  LOG_F(INFO,
    "{}: stripped '{}', default prim '{}'{}, {} path(s) and {} joint(s) "
    "remapped",
    source, strip_prefix.GetString(), default_prim.GetString(),
    nest ? ", materials nested" : "", remapped, joints);
  return RewriteOutcome {
    .status = RewriteStatus::kRewritten,
    .default_prim = default_prim.GetString(),
    .remapped_paths = remapped,
    .remapped_joints = joints,
  };
}

auto ScopeRewriter::KeepSkelRoot(const SdfLayerHandle& fragment,
  const SdfPath& deepest, std::string_view source,
  Diagnostics& diagnostics) const -> RewriteOutcome
{
  const TfToken wrapper_name(config_.wrapper_name);
  const auto root = SdfPath::AbsoluteRootPath().AppendChild(wrapper_name);
  PathRemap remap;
  std::string relative_strip;

  // Collapse /root/root/... into the SkelRoot itself.
  if (deepest != root) {
    SdfBatchNamespaceEdit edit;
    for (const auto& child : Children(fragment->GetPrimAtPath(deepest))) {
      edit.Add(child->GetPath(), root.AppendChild(child->GetNameToken()));
    }
    edit.Add(SdfNamespaceEdit::Remove(root.AppendChild(wrapper_name)));
    if (auto failed = ApplyEdit(fragment, edit)) {
      return Mismatch(source, std::move(*failed), diagnostics);
    }
    remap.Add(deepest, root);
  }

  // A skeleton next to a single Scene wrapper: the wrapper's children move
  // up so skinned meshes sit directly under the SkelRoot.
  const auto children = Children(fragment->GetPrimAtPath(root));
  const auto is_skeleton = [](const SdfPrimSpecHandle& prim) {
    return prim->GetName() == kSkeletonScope
      || prim->GetTypeName() == kSkeleton;
  };
  std::vector<SdfPrimSpecHandle> candidates;
  for (const auto& child : children) {
    if (is_skeleton(child) || child->GetNameToken() == wrapper_name
      || !IsConcrete(child)
      || std::ranges::find(config_.material_scope_names, child->GetName())
        != config_.material_scope_names.end()) {
      continue;
    }
    candidates.push_back(child);
  }
  if (std::ranges::any_of(children, is_skeleton) && candidates.size() == 1
    && IsSceneWrapperName(candidates.front()->GetName())
    && !candidates.front()->GetNameChildren().empty()) {
    const auto scene = candidates.front()->GetPath();
    SdfBatchNamespaceEdit edit;
    for (const auto& child : Children(candidates.front())) {
      edit.Add(child->GetPath(), root.AppendChild(child->GetNameToken()));
    }
    edit.Add(SdfNamespaceEdit::Remove(scene));
    if (auto failed = ApplyEdit(fragment, edit)) {
      // The SkelRoot is still valid with the wrapper in place.
      LOG_F(WARNING, "{}: '{}' kept: {}", source, scene.GetString(), *failed);
      diagnostics.push_back(MakeDiagnostic(DiagnosticSeverity::kWarning,
        AssemblyError::kWrapperShapeMismatch, "scope.wrapper_shape_mismatch",
        fmt::format("cannot flatten '{}': {}", scene.GetString(), *failed),
        std::string(source)));
    } else {
      remap.Add(scene, root);
      relative_strip = scene.GetName() + "/";
    }
  }

  size_t remapped = 0;
  size_t joints = 0;
  if (!remap.Empty()) {
    const auto specs = SpecPaths(fragment);
    remapped = RemapPathLists(fragment, specs, remap);
    joints = RemapJointTokens(
      JointContext {
        .fragment = fragment,
        .remap = remap,
        .relative_strip = relative_strip,
      },
      specs);
  }
  const bool default_changed = fragment->GetDefaultPrim() != wrapper_name;
  if (default_changed) {
    fragment->SetDefaultPrim(wrapper_name);
  }

  if (remap.Empty() && !default_changed) {
    DLOG_F(1, "{}: {} '{}' already flat", source, kSkelRoot,
      config_.wrapper_name);
    diagnostics.push_back(MakeDiagnostic(DiagnosticSeverity::kInfo, {},
      "scope.already_flat",
      fmt::format("'{}' is a {} and is kept; nothing to flatten",
        config_.wrapper_name, kSkelRoot),
      std::string(source)));
    return RewriteOutcome {
      .status = RewriteStatus::kAlreadyFlat,
      .default_prim = config_.wrapper_name,
    };
  }

  LOG_F(INFO, "{}: kept {} '{}', {} path(s) and {} joint(s) remapped", source,
    kSkelRoot, config_.wrapper_name, remapped, joints);
  return RewriteOutcome {
    .status = RewriteStatus::kRewritten,
    .default_prim = config_.wrapper_name,
    .remapped_paths = remapped,
    .remapped_joints = joints,
  };
}

auto ScopeRewriter::RewriteFile(const std::filesystem::path& path,
  Diagnostics& diagnostics) const
  -> std::expected<RewriteOutcome, std::error_code>
{
  const auto fragment = OpenFragmentLayer(path, diagnostics);
  if (!fragment) {
    return RewriteOutcome { .status = RewriteStatus::kSkipped };
  }
  auto outcome = Rewrite(fragment, path.filename().string(), diagnostics);
  if (!outcome.Changed()) {
    return outcome;
  }
  const auto written = WriteFileAtomically(
    path, [&fragment](const std::filesystem::path& temp)
      -> std::expected<void, std::error_code> {
      if (!fragment->Export(temp.string())) {
        return std::unexpected(std::make_error_code(std::errc::io_error));
      }
      return {};
    });
  if (!written) {
    auto message = fmt::format(
      "cannot write '{}': {}", path.string(), written.error().message());
    LOG_F(ERROR, "{}", message);
    diagnostics.push_back(MakeDiagnostic(DiagnosticSeverity::kError,
      AssemblyError::kCommitFailed, "scope.write_failed", std::move(message),
      path.string()));
    return std::unexpected(make_error_code(AssemblyError::kCommitFailed));
  }
  return outcome;
}

} // namespace mosaic::assembly
