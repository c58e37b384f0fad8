//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <string>
#include <system_error>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <pxr/base/tf/errorMark.h>
#include <pxr/base/vt/dictionary.h>
#include <pxr/usd/sdf/attributeSpec.h>
#include <pxr/usd/sdf/primSpec.h>
#include <pxr/usd/usdGeom/tokens.h>

#include <Mosaic/Assembly/FragmentReader.h>
#include <Mosaic/Base/Logging.h>

using PXR_NS::SdfLayer;
using PXR_NS::SdfLayerHandle;
using PXR_NS::SdfLayerRefPtr;
using PXR_NS::SdfPrimSpecHandle;
using PXR_NS::SdfSpecifierClass;
using PXR_NS::TfErrorMark;
using PXR_NS::TfToken;
using PXR_NS::UsdGeomTokens;
using PXR_NS::VtDictionary;
using PXR_NS::VtValue;

namespace mosaic::assembly {

namespace {

  auto TextOf(const VtValue& value) -> std::optional<std::string>
  {
    if (value.IsHolding<TfToken>()) {
      return value.UncheckedGet<TfToken>().GetString();
    }
    if (value.IsHolding<std::string>()) {
      return value.UncheckedGet<std::string>();
    }
    return std::nullopt;
  }

  auto EntryText(const VtDictionary& dictionary, const std::string& key)
    -> std::optional<std::string>
  {
    const auto it = dictionary.find(key);
    return it == dictionary.end() ? std::nullopt : TextOf(it->second);
  }

  auto EntryBool(const VtDictionary& dictionary, const std::string& key)
    -> std::optional<bool>
  {
    const auto it = dictionary.find(key);
    if (it == dictionary.end() || !it->second.IsHolding<bool>()) {
      return std::nullopt;
    }
    return it->second.UncheckedGet<bool>();
  }

  auto AttributeText(const SdfPrimSpecHandle& prim, const TfToken& name)
    -> std::optional<std::string>
  {
    const auto attribute = prim->GetLayer()->GetAttributeAtPath(
      prim->GetPath().AppendProperty(name));
    if (!attribute || !attribute->HasDefaultValue()) {
      return std::nullopt;
    }
    return TextOf(attribute->GetDefaultValue());
  }

} // namespace

auto OpenFragmentLayer(const std::filesystem::path& path,
  Diagnostics& diagnostics) -> SdfLayerRefPtr
{
  std::string reason;
  SdfLayerRefPtr fragment;
  if (std::error_code ec; !std::filesystem::is_regular_file(path, ec)) {
    reason = "no such file";
  } else {
    TfErrorMark mark;
    fragment = SdfLayer::OpenAsAnonymous(path.string());
    if (!mark.IsClean()) {
      std::vector<std::string> errors;
      for (auto it = mark.GetBegin(); it != mark.GetEnd(); ++it) {
        errors.push_back(it->GetCommentary());
      }
      mark.Clear();
      reason = fmt::format("{}", fmt::join(errors, "; "));
    }
    if (fragment) {
      if (!reason.empty()) {
        LOG_F(WARNING, "'{}' opened with errors: {}", path.filename().string(),
          reason);
      }
      return fragment;
    }
    if (reason.empty()) {
      reason = "not a USD layer";
    }
  }

  auto message
    = fmt::format("cannot read '{}': {}", path.filename().string(), reason);
  LOG_F(WARNING, "{}", message);
  diagnostics.push_back(MakeDiagnostic(DiagnosticSeverity::kWarning,
    AssemblyError::kUnreadableFragment, "fragment.unreadable",
    std::move(message), path.string()));
  return {};
}

auto FragmentRootPrim(const SdfLayerHandle& fragment) -> SdfPrimSpecHandle
{
  const auto roots = fragment->GetRootPrims();
  const auto default_prim = fragment->GetDefaultPrim();
  for (const auto& prim : roots) {
    if (!default_prim.IsEmpty() && prim->GetNameToken() == default_prim) {
      return prim;
    }
  }
  for (const auto& prim : roots) {
    if (prim->GetSpecifier() != SdfSpecifierClass) {
      return prim;
    }
  }
  return {};
}

auto ReadAuthoredProperties(const SdfLayerHandle& fragment)
  -> std::optional<PropertyOverrides>
{
  const auto prim = FragmentRootPrim(fragment);
  if (!prim) {
    return std::nullopt;
  }

  PropertyOverrides found;
  if (prim->HasKind()) {
    found.kind = ParseKind(prim->GetKind().GetString());
  }
  if (prim->HasInstanceable()) {
    found.instanceable = prim->GetInstanceable();
  }
  if (prim->HasActive()) {
    found.active = prim->GetActive();
  }
  if (auto v = EntryText(prim->GetAssetInfo(), "version")) {
    found.asset_version = std::move(v);
  }
  const auto custom_data = prim->GetCustomData();
  if (const auto v = EntryText(custom_data, "geomType")) {
    found.geom_type = ParseGeomType(*v);
  }
  if (const auto v = EntryBool(custom_data, "usePayload")) {
    found.payload = *v;
  }
  if (const auto v = AttributeText(prim, UsdGeomTokens->purpose)) {
    found.purpose = ParsePurpose(*v);
  }
  if (const auto v = AttributeText(prim, UsdGeomTokens->visibility)) {
    found.hidden = *v == UsdGeomTokens->invisible.GetString();
  }
  if (const auto v = AttributeText(prim, UsdGeomTokens->modelDrawMode)) {
    found.draw_mode = ParseDrawMode(*v);
  }

  if (found.Empty()) {
    return std::nullopt;
  }
  DLOG_F(2, "authored properties on '{}'", prim->GetName());
  return found;
}

} // namespace mosaic::assembly
