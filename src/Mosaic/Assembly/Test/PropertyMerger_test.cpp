//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Mosaic/Assembly/PropertyMerger.h>
#include <Mosaic/Assembly/PropertySet.h>
#include <Mosaic/Testing/GTest.h>

using mosaic::assembly::DrawMode;
using mosaic::assembly::GeomType;
using mosaic::assembly::Kind;
using mosaic::assembly::MergeProperties;
using mosaic::assembly::ParseDrawMode;
using mosaic::assembly::ParseGeomType;
using mosaic::assembly::ParseKind;
using mosaic::assembly::ParsePurpose;
using mosaic::assembly::PropertyOverrides;
using mosaic::assembly::PropertySet;
using mosaic::assembly::Purpose;
using mosaic::assembly::ResolveSuffixes;
using mosaic::assembly::SuffixTags;

namespace {

//=== Token conversions ===---------------------------------------------------//

NOLINT_TEST(PropertySetTest, Parse_IsCaseInsensitive)
{
  EXPECT_EQ(ParseGeomType("Scope"), GeomType::kScope);
  EXPECT_EQ(ParseGeomType("xform"), GeomType::kXform);
  EXPECT_EQ(ParseKind("Component"), Kind::kComponent);
  EXPECT_EQ(ParsePurpose("PROXY"), Purpose::kProxy);
  EXPECT_EQ(ParseDrawMode("cards"), DrawMode::kCards);
}

NOLINT_TEST(PropertySetTest, Parse_UnknownToken_ReturnsNullopt)
{
  EXPECT_FALSE(ParseGeomType("Mesh").has_value());
  EXPECT_FALSE(ParseKind("prop").has_value());
  EXPECT_FALSE(ParsePurpose("").has_value());
}

NOLINT_TEST(PropertySetTest, OverridesFrom_SetsEveryField)
{
  PropertySet properties;
  properties.kind = Kind::kComponent;
  properties.asset_version = "3";

  const auto overrides = PropertyOverrides::From(properties);
  PropertySet applied;
  applied.hidden = true;
  ApplyOverrides(applied, overrides);

  EXPECT_FALSE(overrides.Empty());
  EXPECT_EQ(applied, properties);
}

//=== Merge layers ===--------------------------------------------------------//

NOLINT_TEST(PropertyMergerTest, NoHolderNoSuffix_YieldsDefaults)
{
  const auto merged = MergeProperties(std::nullopt, SuffixTags {});

  EXPECT_EQ(merged, PropertySet {});
  EXPECT_EQ(merged.geom_type, GeomType::kAuto);
  EXPECT_TRUE(merged.active);
  EXPECT_FALSE(merged.payload);
}

//! Scenario: fields the holder leaves unset keep their defaults.
NOLINT_TEST(PropertyMergerTest, HolderOverridesOnlyTheFieldsItSets)
{
  PropertyOverrides holder;
  holder.kind = Kind::kComponent;
  holder.instanceable = true;
  holder.asset_version = "12";

  const auto merged = MergeProperties(holder, SuffixTags {});

  EXPECT_EQ(merged.kind, Kind::kComponent);
  EXPECT_TRUE(merged.instanceable);
  EXPECT_EQ(merged.asset_version, "12");
  EXPECT_EQ(merged.purpose, Purpose::kDefault);
  EXPECT_TRUE(merged.active);
  EXPECT_FALSE(merged.hidden);
}

NOLINT_TEST(PropertyMergerTest, SuffixPurpose_WinsOverHolder)
{
  PropertyOverrides holder;
  holder.purpose = Purpose::kGuide;
  holder.kind = Kind::kModel;

  const auto merged
    = MergeProperties(holder, ResolveSuffixes("Chair_PROXY").tags);

  EXPECT_EQ(merged.purpose, Purpose::kProxy);
  EXPECT_EQ(merged.kind, Kind::kModel);
}

NOLINT_TEST(PropertyMergerTest, SuffixPayload_WinsOverHolder)
{
  PropertyOverrides holder;
  holder.payload = false;

  const auto merged
    = MergeProperties(holder, ResolveSuffixes("Rock_PAYLOAD").tags);

  EXPECT_TRUE(merged.payload);
}

//! Scenario: a variant tag carries no property of its own.
NOLINT_TEST(PropertyMergerTest, VariantTagAlone_LeavesHolderValues)
{
  PropertyOverrides holder;
  holder.purpose = Purpose::kRender;
  holder.draw_mode = DrawMode::kBounds;

  const auto merged
    = MergeProperties(holder, ResolveSuffixes("Lamp_VARIANT2").tags);

  EXPECT_EQ(merged.purpose, Purpose::kRender);
  EXPECT_EQ(merged.draw_mode, DrawMode::kBounds);
}

} // namespace
