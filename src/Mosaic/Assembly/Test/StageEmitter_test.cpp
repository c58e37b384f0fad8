//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <filesystem>
#include <string>
#include <vector>

#include <pxr/usd/sdf/attributeSpec.h>
#include <pxr/usd/sdf/listOp.h>
#include <pxr/usd/sdf/schema.h>
#include <pxr/usd/sdf/types.h>
#include <pxr/usd/usdGeom/tokens.h>

#include <Mosaic/Assembly/HierarchyReconstructor.h>
#include <Mosaic/Assembly/StageEmitter.h>
#include <Mosaic/Testing/GTest.h>

using mosaic::assembly::AssemblyOptions;
using mosaic::assembly::ContainerClass;
using mosaic::assembly::DiagnosticSeverity;
using mosaic::assembly::Diagnostics;
using mosaic::assembly::DrawMode;
using mosaic::assembly::FragmentRecord;
using mosaic::assembly::GeomType;
using mosaic::assembly::HierarchyReconstructor;
using mosaic::assembly::Kind;
using mosaic::assembly::PropertyOverrides;
using mosaic::assembly::StageEmitter;
using PXR_NS::SdfFieldKeys;
using PXR_NS::SdfLayerRefPtr;
using PXR_NS::SdfPath;
using PXR_NS::SdfPrimSpecHandle;
using PXR_NS::SdfTokenListOp;
using PXR_NS::SdfVariabilityUniform;
using PXR_NS::SdfVariabilityVarying;
using PXR_NS::SdfVariantSelectionMap;
using PXR_NS::TfToken;
using PXR_NS::UsdGeomTokens;
using testing::ElementsAre;
using testing::HasSubstr;
using testing::IsEmpty;

namespace {

class StageEmitterTest : public testing::Test {
protected:
  void SetUp() override
  {
    root_ = std::filesystem::temp_directory_path() / "mosaic_emit";
  }

  auto Record(std::string object, std::vector<std::string> parents = {})
    -> FragmentRecord
  {
    FragmentRecord record;
    record.file_path = root_ / (object + ".usda");
    record.object_name = std::move(object);
    record.parent_path = std::move(parents);
    return record;
  }

  auto Emit(const std::vector<FragmentRecord>& records,
    const AssemblyOptions& options = {}) -> SdfLayerRefPtr
  {
    const HierarchyReconstructor reconstructor(HierarchyReconstructor::Config {
      .root_name = options.ResolvedDefaultPrimName(),
      .variant_set_name = options.variant_set_name,
    });
    auto tree = reconstructor.Reconstruct(records, diagnostics_);
    EXPECT_TRUE(tree.has_value());
    if (!tree) {
      return {};
    }
    const StageEmitter emitter(options, root_ / "Scene_stage.usda");
    return emitter.Emit(*tree, records, diagnostics_);
  }

  static auto Prim(const SdfLayerRefPtr& stage, const std::string& path)
    -> SdfPrimSpecHandle
  {
    return stage->GetPrimAtPath(SdfPath(path));
  }

  //! Asset paths of the prepended references of `prim`.
  static auto ReferencesOf(const SdfPrimSpecHandle& prim)
    -> std::vector<std::string>
  {
    std::vector<std::string> assets;
    for (const auto& reference :
      prim->GetReferenceList().GetPrependedItems()) {
      assets.push_back(reference.GetAssetPath());
    }
    return assets;
  }

  //! Default token of the attribute at `path`, or "<unset>".
  static auto TokenAt(const SdfLayerRefPtr& stage, const std::string& path)
    -> std::string
  {
    const auto attribute = stage->GetAttributeAtPath(SdfPath(path));
    if (!attribute || !attribute->GetDefaultValue().IsHolding<TfToken>()) {
      return "<unset>";
    }
    return attribute->GetDefaultValue().UncheckedGet<TfToken>().GetString();
  }

  static auto SelectionOf(const SdfPrimSpecHandle& prim) -> std::string
  {
    const auto selections = prim->GetInfo(SdfFieldKeys->VariantSelection)
                              .GetWithDefault<SdfVariantSelectionMap>();
    const auto it = selections.find("modelVariant");
    return it != selections.end() ? it->second : std::string { "<unset>" };
  }

  std::filesystem::path root_;
  Diagnostics diagnostics_;
};

//=== Layer metadata ===------------------------------------------------------//

NOLINT_TEST_F(StageEmitterTest, LayerMetadata_Defaults)
{
  const auto stage = Emit({});

  ASSERT_TRUE(stage);
  EXPECT_EQ(stage->GetDefaultPrim().GetString(), "World");
  const auto pseudo_root = stage->GetPseudoRoot();
  EXPECT_DOUBLE_EQ(
    pseudo_root->GetInfo(UsdGeomTokens->metersPerUnit).Get<double>(), 0.01);
  EXPECT_EQ(pseudo_root->GetInfo(UsdGeomTokens->upAxis).Get<TfToken>(),
    TfToken("Z"));
  EXPECT_FALSE(stage->HasFramesPerSecond());
  EXPECT_FALSE(stage->HasStartTimeCode());
}

NOLINT_TEST_F(StageEmitterTest, LayerMetadata_TimingFromOptions)
{
  AssemblyOptions options;
  options.frames_per_second = 24.0;
  options.start_time_code = 1.0;
  options.end_time_code = 120.0;
  options.up_axis = "Y";
  options.meters_per_unit = 1.0;

  const auto stage = Emit({}, options);

  ASSERT_TRUE(stage);
  EXPECT_DOUBLE_EQ(stage->GetFramesPerSecond(), 24.0);
  EXPECT_DOUBLE_EQ(stage->GetTimeCodesPerSecond(), 24.0);
  EXPECT_DOUBLE_EQ(stage->GetStartTimeCode(), 1.0);
  EXPECT_DOUBLE_EQ(stage->GetEndTimeCode(), 120.0);
  const auto pseudo_root = stage->GetPseudoRoot();
  EXPECT_EQ(pseudo_root->GetInfo(UsdGeomTokens->upAxis).Get<TfToken>(),
    TfToken("Y"));
  EXPECT_DOUBLE_EQ(
    pseudo_root->GetInfo(UsdGeomTokens->metersPerUnit).Get<double>(), 1.0);
}

//=== Prims ===---------------------------------------------------------------//

//! Scenario: one top-level assembly prim referencing every fragment.
NOLINT_TEST_F(StageEmitterTest, RootPrim_IsAssemblyWithReferences)
{
  // Arrange
  const std::vector records { Record("Table"), Record("Seat", { "Table" }) };

  // Act
  const auto stage = Emit(records);

  // Assert
  ASSERT_TRUE(stage);
  ASSERT_EQ(stage->GetRootPrims().size(), 1U);
  const auto world = Prim(stage, "/World");
  ASSERT_TRUE(world);
  EXPECT_EQ(world->GetTypeName().GetString(), "Xform");
  EXPECT_EQ(world->GetKind().GetString(), "assembly");
  EXPECT_FALSE(world->HasReferences());

  const auto table = Prim(stage, "/World/Table");
  ASSERT_TRUE(table);
  EXPECT_THAT(ReferencesOf(table), ElementsAre("./Table.usda"));
  EXPECT_FALSE(table->HasKind());
  EXPECT_TRUE(table->GetProperties().empty());

  EXPECT_TRUE(Prim(stage, "/World/Table/Seat"));
  EXPECT_THAT(diagnostics_, IsEmpty());
}

NOLINT_TEST_F(StageEmitterTest, DefaultPrimName_FromOptions)
{
  AssemblyOptions options;
  options.default_prim_name = "Living Room";

  const auto stage = Emit({ Record("Sofa") }, options);

  ASSERT_TRUE(stage);
  EXPECT_EQ(stage->GetDefaultPrim().GetString(), "Living_Room");
  EXPECT_TRUE(Prim(stage, "/Living_Room/Sofa"));
}

NOLINT_TEST_F(StageEmitterTest, PayloadSuffix_AuthorsPayloadArc)
{
  const auto stage = Emit({ Record("Rock_PAYLOAD") });

  const auto rock = Prim(stage, "/World/Rock");
  ASSERT_TRUE(rock);
  EXPECT_FALSE(rock->HasReferences());
  const auto payloads = rock->GetPayloadList().GetPrependedItems();
  ASSERT_EQ(payloads.size(), 1U);
  EXPECT_EQ(payloads[0].GetAssetPath(), "./Rock_PAYLOAD.usda");
}

//! Scenario: every resolved property maps to its authored field.
NOLINT_TEST_F(StageEmitterTest, ResolvedProperties_AreAuthored)
{
  // Arrange
  auto lamp = Record("Lamp_PROXY");
  lamp.moved_to_origin = true;
  lamp.property_overrides = PropertyOverrides {
    .kind = Kind::kComponent,
    .instanceable = true,
    .hidden = true,
    .active = false,
    .asset_version = "7",
    .draw_mode = DrawMode::kBounds,
  };

  // Act
  const auto stage = Emit({ lamp });

  // Assert
  const auto prim = Prim(stage, "/World/Lamp");
  ASSERT_TRUE(prim);
  EXPECT_EQ(prim->GetKind().GetString(), "component");
  EXPECT_TRUE(prim->GetInstanceable());
  EXPECT_FALSE(prim->GetActive());
  EXPECT_EQ(prim->GetAssetInfo()["version"].Get<std::string>(), "7");
  EXPECT_TRUE(prim->GetCustomData()["movedToOrigin"].Get<bool>());
  const auto schemas = prim->GetInfo(TfToken("apiSchemas"));
  ASSERT_TRUE(schemas.IsHolding<SdfTokenListOp>());
  EXPECT_THAT(schemas.UncheckedGet<SdfTokenListOp>().GetPrependedItems(),
    ElementsAre(TfToken("GeomModelAPI")));

  EXPECT_EQ(TokenAt(stage, "/World/Lamp.purpose"), "proxy");
  EXPECT_EQ(TokenAt(stage, "/World/Lamp.visibility"), "invisible");
  EXPECT_EQ(TokenAt(stage, "/World/Lamp.model:drawMode"), "bounds");
  EXPECT_EQ(
    stage->GetAttributeAtPath(SdfPath("/World/Lamp.purpose"))->GetVariability(),
    SdfVariabilityUniform);
  EXPECT_EQ(stage->GetAttributeAtPath(SdfPath("/World/Lamp.visibility"))
              ->GetVariability(),
    SdfVariabilityVarying);
}

NOLINT_TEST_F(StageEmitterTest, InstanceableWithChildren_IsDropped)
{
  auto shelf = Record("Shelf");
  shelf.property_overrides = PropertyOverrides { .instanceable = true };

  const auto stage = Emit({ shelf, Record("Book", { "Shelf" }) });

  const auto prim = Prim(stage, "/World/Shelf");
  ASSERT_TRUE(prim);
  EXPECT_FALSE(prim->HasInstanceable());
  ASSERT_EQ(diagnostics_.size(), 1U);
  EXPECT_EQ(diagnostics_[0].code, "stage.instanceable_with_children");
  EXPECT_EQ(diagnostics_[0].object_path, "/World/Shelf");
}

NOLINT_TEST_F(StageEmitterTest, LayerContainer_IsScopeWithoutArc)
{
  auto lamp = Record("Lamp", { "Lighting" });
  lamp.ancestor_containers = { { "Lighting", ContainerClass::kLayer } };

  const auto stage = Emit({ lamp });

  const auto lighting = Prim(stage, "/World/Lighting");
  ASSERT_TRUE(lighting);
  EXPECT_EQ(lighting->GetTypeName().GetString(), "Scope");
  EXPECT_FALSE(lighting->HasReferences());
  EXPECT_TRUE(Prim(stage, "/World/Lighting/Lamp"));
}

//=== Variants ===------------------------------------------------------------//

//! Scenario: a variant group holds one variant per member, default selected.
NOLINT_TEST_F(StageEmitterTest, VariantGroup_AuthorsVariantSet)
{
  // Arrange
  const std::vector records {
    Record("Chair_VARIANT2"),
    Record("Chair"),
    Record("Chair_RENDER_VARIANT1"),
  };

  // Act
  const auto stage = Emit(records);

  // Assert
  const auto chair = Prim(stage, "/World/Chair");
  ASSERT_TRUE(chair);
  EXPECT_FALSE(chair->HasReferences());
  EXPECT_THAT(chair->GetVariantSetNameList().GetPrependedItems(),
    ElementsAre("modelVariant"));
  EXPECT_EQ(SelectionOf(chair), "default");
  EXPECT_THAT(
    chair->GetVariantNames("modelVariant"), ElementsAre("default", "1", "2"));

  const auto render = Prim(stage, "/World/Chair{modelVariant=1}");
  ASSERT_TRUE(render);
  EXPECT_THAT(ReferencesOf(render), ElementsAre("./Chair_RENDER_VARIANT1.usda"));
  EXPECT_EQ(TokenAt(stage, "/World/Chair{modelVariant=1}.purpose"), "render");
  EXPECT_THAT(ReferencesOf(Prim(stage, "/World/Chair{modelVariant=default}")),
    ElementsAre("./Chair.usda"));
}

//! Scenario: a group is typed like its default member; a member that
//! resolves to another type is reported and does not change the group.
NOLINT_TEST_F(StageEmitterTest, VariantGroup_MixedTypes_FollowsDefaultMember)
{
  // Arrange
  auto scope_member = Record("Shelf_VARIANT2");
  scope_member.property_overrides
    = PropertyOverrides { .geom_type = GeomType::kScope };
  const std::vector records { Record("Shelf_VARIANT1"), scope_member };

  // Act
  const auto stage = Emit(records);

  // Assert
  const auto shelf = Prim(stage, "/World/Shelf");
  ASSERT_TRUE(shelf);
  EXPECT_EQ(shelf->GetTypeName().GetString(), "Xform");
  EXPECT_EQ(SelectionOf(shelf), "1");
  ASSERT_EQ(diagnostics_.size(), 1U);
  EXPECT_EQ(diagnostics_[0].severity, DiagnosticSeverity::kWarning);
  EXPECT_EQ(diagnostics_[0].code, "stage.variant_type_ignored");
  EXPECT_THAT(diagnostics_[0].message, HasSubstr("'2'"));
  EXPECT_THAT(diagnostics_[0].message, HasSubstr("Scope"));
}

NOLINT_TEST_F(StageEmitterTest, EmitText_SerializesDocument)
{
  const std::vector records { Record("Chair_VARIANT1") };
  const HierarchyReconstructor reconstructor(HierarchyReconstructor::Config {});
  const auto tree = reconstructor.Reconstruct(records, diagnostics_);
  ASSERT_TRUE(tree.has_value());
  const StageEmitter emitter(AssemblyOptions {}, root_ / "Scene_stage.usda");

  const auto text = emitter.EmitText(*tree, records, diagnostics_);

  EXPECT_THAT(text, testing::StartsWith("#usda 1.0"));
  EXPECT_THAT(text, HasSubstr("defaultPrim = \"World\""));
  EXPECT_THAT(text, HasSubstr("def Xform \"World\""));
  EXPECT_THAT(text, HasSubstr("variantSet \"modelVariant\" = {"));
  EXPECT_THAT(text, HasSubstr("@./Chair_VARIANT1.usda@"));
}

//=== Asset paths ===---------------------------------------------------------//

NOLINT_TEST_F(StageEmitterTest, AssetPath_RelativeToDocument)
{
  const StageEmitter emitter(AssemblyOptions {}, root_ / "Scene_stage.usda");

  EXPECT_EQ(emitter.AssetPathFor(root_ / "Chair.usda"), "./Chair.usda");
  EXPECT_EQ(emitter.AssetPathFor(root_ / "props" / "Lamp.usda"),
    "./props/Lamp.usda");
  EXPECT_EQ(emitter.AssetPathFor(root_.parent_path() / "shared" / "Rug.usda"),
    "../shared/Rug.usda");
}

NOLINT_TEST_F(StageEmitterTest, AssetPath_AbsoluteWhenRequested)
{
  AssemblyOptions options;
  options.relative_asset_paths = false;
  const StageEmitter emitter(options, root_ / "Scene_stage.usda");

  const auto path = emitter.AssetPathFor(root_ / "Chair.usda");

  EXPECT_EQ(path, (root_ / "Chair.usda").lexically_normal().generic_string());
}

} // namespace
