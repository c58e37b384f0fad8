//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <fmt/format.h>

#include <Mosaic/Assembly/SuffixResolver.h>
#include <Mosaic/Base/Logging.h>
#include <Mosaic/Base/StringUtils.h>

namespace mosaic::assembly {

namespace {

  constexpr std::string_view kVariantTag = "VARIANT";

  auto PurposeTag(std::string_view token) -> std::optional<Purpose>
  {
    if (token == "RENDER") {
      return Purpose::kRender;
    }
    if (token == "PROXY") {
      return Purpose::kProxy;
    }
    if (token == "GUIDE") {
      return Purpose::kGuide;
    }
    return std::nullopt;
  }

  auto MakeSuffixWarning(std::string_view object_name, std::string code,
    std::string message) -> AssemblyDiagnostic
  {
    return MakeDiagnostic(DiagnosticSeverity::kWarning,
      AssemblyError::kMalformedSuffix, std::move(code), std::move(message), {},
      std::string(object_name));
  }

  auto Literal(std::string_view object_name) -> SuffixTags
  {
    return SuffixTags { .base_name = std::string(object_name) };
  }

} // namespace

auto ResolveSuffixes(std::string_view object_name) -> SuffixResolution
{
  SuffixResolution result;
  const auto tokens = string_utils::Split(object_name, '_');
  if (tokens.size() < 2) {
    result.tags = Literal(object_name);
    return result;
  }

  SuffixTags tags;
  std::optional<std::string_view> conflict;
  size_t kept = tokens.size(); // tokens [0, kept) form the base name
  for (size_t i = tokens.size() - 1; i >= 1; --i) {
    const auto token = tokens[i];
    if (const auto purpose = PurposeTag(token)) {
      if (tags.purpose_override) {
        conflict = token;
        break;
      }
      tags.purpose_override = purpose;
    } else if (token == "PAYLOAD") {
      if (tags.payload_override) {
        conflict = token;
        break;
      }
      tags.payload_override = true;
    } else if (token.starts_with(kVariantTag)) {
      const auto digits = token.substr(kVariantTag.size());
      if (!string_utils::IsAllDigits(digits)) {
        result.diagnostics.push_back(MakeSuffixWarning(object_name,
          "suffix.malformed_variant",
          fmt::format("variant tag '{}' has no numeric selector; kept as part "
                      "of the name",
            token)));
        break;
      }
      if (tags.variant_member) {
        conflict = token;
        break;
      }
      tags.variant_member = std::string(digits);
    } else {
      break;
    }
    kept = i;
  }

  if (conflict) {
    result.diagnostics.push_back(MakeSuffixWarning(object_name,
      "suffix.conflicting_tags",
      fmt::format("tag '{}' conflicts with another tag in the suffix chain; "
                  "name kept literally",
        *conflict)));
    result.tags = Literal(object_name);
    return result;
  }

  std::string base;
  for (size_t i = 0; i < kept; ++i) {
    if (i > 0) {
      base.push_back('_');
    }
    base.append(tokens[i]);
  }
  if (base.empty()) {
    result.diagnostics.push_back(MakeSuffixWarning(object_name,
      "suffix.empty_base", "suffix chain leaves no base name; kept literally"));
    result.tags = Literal(object_name);
    return result;
  }

  tags.base_name = std::move(base);
  if (tags.variant_member) {
    tags.variant_group = tags.base_name;
  }
  if (tags.HasTags()) {
    DLOG_F(2, "suffix '{}' -> base='{}' variant={} purpose={} payload={}",
      object_name, tags.base_name, tags.variant_member.value_or("-"),
      tags.purpose_override ? to_string(*tags.purpose_override) : "-",
      tags.payload_override.has_value());
  }
  result.tags = std::move(tags);
  return result;
}

} // namespace mosaic::assembly
