//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>

#include <fmt/format.h>
#include <pxr/usd/sdf/attributeSpec.h>
#include <pxr/usd/sdf/listOp.h>
#include <pxr/usd/sdf/payload.h>
#include <pxr/usd/sdf/reference.h>
#include <pxr/usd/sdf/types.h>
#include <pxr/usd/sdf/variantSetSpec.h>
#include <pxr/usd/sdf/variantSpec.h>
#include <pxr/usd/usdGeom/tokens.h>

#include <Mosaic/Assembly/StageEmitter.h>
#include <Mosaic/Base/Logging.h>

using PXR_NS::SdfAttributeSpec;
using PXR_NS::SdfLayer;
using PXR_NS::SdfLayerRefPtr;
using PXR_NS::SdfPayload;
using PXR_NS::SdfPrimSpec;
using PXR_NS::SdfPrimSpecHandle;
using PXR_NS::SdfReference;
using PXR_NS::SdfSpecifierDef;
using PXR_NS::SdfTokenListOp;
using PXR_NS::SdfValueTypeNames;
using PXR_NS::SdfVariability;
using PXR_NS::SdfVariabilityUniform;
using PXR_NS::SdfVariabilityVarying;
using PXR_NS::SdfVariantSetSpec;
using PXR_NS::SdfVariantSpec;
using PXR_NS::TfToken;
using PXR_NS::UsdGeomTokens;
using PXR_NS::VtValue;

namespace mosaic::assembly {

namespace {

  auto TypeNameOf(const HierarchyNode& node) -> std::string
  {
    return node.resolved_properties.geom_type == GeomType::kScope ? "Scope"
                                                                  : "Xform";
  }

  //! Prim type of `id`. A variant group is typed like its default member.
  auto PrimTypeOf(const HierarchyTree& tree, const NodeId id,
    Diagnostics& diagnostics) -> std::string
  {
    const auto& node = tree.Node(id);
    if (!node.variant_set || node.variant_set->members.empty()) {
      return TypeNameOf(node);
    }
    const auto& vset = *node.variant_set;
    const auto it = std::ranges::find(
      vset.members, vset.default_selection, &VariantMember::selector);
    const auto& chosen = it != vset.members.end() ? *it : vset.members.front();
    auto type_name = TypeNameOf(tree.Node(chosen.node));
    for (const auto& member : vset.members) {
      if (const auto other = TypeNameOf(tree.Node(member.node));
        other != type_name) {
        auto message = fmt::format(
          "variant '{}' of '{}' resolves to {} but the group is a {} like "
          "'{}'",
          member.selector, tree.PrimPath(id), other, type_name,
          chosen.selector);
        LOG_F(WARNING, "{}", message);
        diagnostics.push_back(MakeDiagnostic(DiagnosticSeverity::kWarning, {},
          "stage.variant_type_ignored", std::move(message), {},
          tree.PrimPath(member.node)));
      }
    }
    return type_name;
  }

  auto AuthorToken(const SdfPrimSpecHandle& prim, const TfToken& name,
    std::string_view value, const SdfVariability variability) -> void
  {
    const auto attribute = SdfAttributeSpec::New(
      prim, name.GetString(), SdfValueTypeNames->Token, variability);
    attribute->SetDefaultValue(VtValue(TfToken(std::string(value))));
  }

} // namespace

auto StageEmitter::AssetPathFor(const std::filesystem::path& fragment) const
  -> std::string
{
  if (!options_.relative_asset_paths) {
    return std::filesystem::absolute(fragment).lexically_normal()
      .generic_string();
  }
  const auto base = std::filesystem::absolute(document_path_)
                      .parent_path()
                      .lexically_normal();
  const auto target = std::filesystem::absolute(fragment).lexically_normal();
  const auto relative = target.lexically_relative(base);
  if (relative.empty()) {
    return target.generic_string();
  }
  auto text = relative.generic_string();
  if (!text.starts_with("../")) {
    text.insert(0, "./");
  }
  return text;
}

auto StageEmitter::AuthorNode(const SdfPrimSpecHandle& prim,
  const HierarchyTree& tree, const NodeId id,
  std::span<const FragmentRecord> records, Diagnostics& diagnostics) const
  -> void
{
  const auto& node = tree.Node(id);
  const auto& props = node.resolved_properties;
  const FragmentRecord* record
    = node.source_fragment ? &records[*node.source_fragment] : nullptr;

  if (props.draw_mode != DrawMode::kDefault) {
    SdfTokenListOp schemas;
    schemas.SetPrependedItems({ TfToken("GeomModelAPI") });
    prim->SetInfo(TfToken("apiSchemas"), VtValue(schemas));
  }
  if (props.asset_version) {
    prim->SetAssetInfo("version", VtValue(*props.asset_version));
  }
  if (record != nullptr && record->moved_to_origin) {
    prim->SetCustomData("movedToOrigin", VtValue(true));
  }
  if (props.instanceable) {
    if (node.children.empty()) {
      prim->SetInstanceable(true);
    } else {
      auto message = fmt::format(
        "'{}' is instanceable but has children; instanceable dropped",
        tree.PrimPath(id));
      LOG_F(WARNING, "{}", message);
      diagnostics.push_back(MakeDiagnostic(DiagnosticSeverity::kWarning, {},
        "stage.instanceable_with_children", std::move(message),
        record ? record->file_path.string() : std::string {},
        tree.PrimPath(id)));
    }
  }
  if (props.kind != Kind::kNone) {
    prim->SetKind(TfToken(std::string(to_string(props.kind))));
  }
  if (!props.active) {
    prim->SetActive(false);
  }
  if (record != nullptr) {
    const auto asset = AssetPathFor(record->file_path);
    if (props.payload) {
      prim->GetPayloadList().Prepend(SdfPayload(asset));
    } else {
      prim->GetReferenceList().Prepend(SdfReference(asset));
    }
  }

  if (props.purpose != Purpose::kDefault) {
    AuthorToken(prim, UsdGeomTokens->purpose, to_string(props.purpose),
      SdfVariabilityUniform);
  }
  if (props.hidden) {
    AuthorToken(prim, UsdGeomTokens->visibility,
      UsdGeomTokens->invisible.GetString(), SdfVariabilityVarying);
  }
  if (props.draw_mode != DrawMode::kDefault) {
    AuthorToken(prim, UsdGeomTokens->modelDrawMode, to_string(props.draw_mode),
      SdfVariabilityUniform);
  }

  for (const auto child : node.children) {
    const auto child_prim = SdfPrimSpec::New(prim, tree.Node(child).name,
      SdfSpecifierDef, PrimTypeOf(tree, child, diagnostics));
    EmitNode(child_prim, tree, child, records, diagnostics);
  }
}

auto StageEmitter::EmitNode(const SdfPrimSpecHandle& prim,
  const HierarchyTree& tree, const NodeId id,
  std::span<const FragmentRecord> records, Diagnostics& diagnostics) const
  -> void
{
  CHECK_F(static_cast<bool>(prim), "no prim spec for '{}'", tree.PrimPath(id));
  AuthorNode(prim, tree, id, records, diagnostics);

  const auto& node = tree.Node(id);
  if (!node.variant_set) {
    return;
  }
  const auto& vset = *node.variant_set;
  const auto variant_set = SdfVariantSetSpec::New(prim, vset.name);
  for (const auto& member : vset.members) {
    const auto variant = SdfVariantSpec::New(variant_set, member.selector);
    AuthorNode(variant->GetPrimSpec(), tree, member.node, records, diagnostics);
  }
  prim->GetVariantSetNameList().Prepend(vset.name);
  prim->SetVariantSelection(vset.name, vset.default_selection);
  DLOG_F(1, "{}: {} variant(s), default '{}'", tree.PrimPath(id),
    vset.members.size(), vset.default_selection);
}

auto StageEmitter::Emit(const HierarchyTree& tree,
  std::span<const FragmentRecord> records, Diagnostics& diagnostics) const
  -> SdfLayerRefPtr
{
  LOG_SCOPE_F(INFO, "Emit stage '{}'", document_path_.filename().string());

  auto document = SdfLayer::CreateAnonymous(".usda");
  const auto& root = tree.Node(tree.Root());
  document->SetDefaultPrim(TfToken(root.name));
  if (options_.frames_per_second) {
    document->SetFramesPerSecond(*options_.frames_per_second);
    document->SetTimeCodesPerSecond(*options_.frames_per_second);
  }
  if (options_.start_time_code) {
    document->SetStartTimeCode(*options_.start_time_code);
  }
  if (options_.end_time_code) {
    document->SetEndTimeCode(*options_.end_time_code);
  }
  const auto pseudo_root = document->GetPseudoRoot();
  pseudo_root->SetInfo(UsdGeomTokens->metersPerUnit,
    VtValue(options_.meters_per_unit));
  pseudo_root->SetInfo(UsdGeomTokens->upAxis,
    VtValue(TfToken(options_.up_axis)));

  const auto prim = SdfPrimSpec::New(
    document, root.name, SdfSpecifierDef, TypeNameOf(root));
  EmitNode(prim, tree, tree.Root(), records, diagnostics);
  return document;
}

auto StageEmitter::EmitText(const HierarchyTree& tree,
  std::span<const FragmentRecord> records, Diagnostics& diagnostics) const
  -> std::string
{
  std::string text;
  if (!Emit(tree, records, diagnostics)->ExportToString(&text)) {
    LOG_F(ERROR, "cannot serialize stage '{}'",
      document_path_.filename().string());
  }
  return text;
}

} // namespace mosaic::assembly
