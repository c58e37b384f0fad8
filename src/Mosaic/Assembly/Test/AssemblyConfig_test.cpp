//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <sstream>

#include <Mosaic/Assembly/AssemblyConfig.h>
#include <Mosaic/Testing/GTest.h>
#include <Mosaic/Testing/TemporaryDirectory.h>

using mosaic::assembly::AssemblyOptions;
using mosaic::assembly::LoadAssemblyOptions;
using mosaic::assembly::ParseAssemblyOptions;
using mosaic::testing::TemporaryDirectory;
using testing::ElementsAre;
using testing::HasSubstr;

namespace {

const std::filesystem::path kBaseDir = "/projects/shot010";

//=== Parsing ===-------------------------------------------------------------//

NOLINT_TEST(AssemblyConfigTest, EmptyObject_KeepsDefaults)
{
  std::ostringstream errors;

  const auto options = ParseAssemblyOptions("{}", kBaseDir, errors);

  ASSERT_TRUE(options.has_value()) << errors.str();
  EXPECT_EQ(options->default_prim_name, "World");
  EXPECT_EQ(options->up_axis, "Z");
  EXPECT_DOUBLE_EQ(options->meters_per_unit, 0.01);
  EXPECT_FALSE(options->frames_per_second.has_value());
  EXPECT_EQ(options->variant_set_name, "modelVariant");
  EXPECT_TRUE(options->strip_wrapper);
  EXPECT_THAT(
    options->material_scope_names, ElementsAre("mtl", "Looks", "Materials"));
  EXPECT_FALSE(options->output_path.has_value());
}

//! Scenario: every key maps onto its option.
NOLINT_TEST(AssemblyConfigTest, AllKeys_AreApplied)
{
  // Arrange
  constexpr auto config = R"({
    "version": 1,
    "defaultPrim": "Set",
    "upAxis": "Y",
    "metersPerUnit": 1.0,
    "fps": 25,
    "startFrame": 1001,
    "endFrame": 1100,
    "variantSetName": "look",
    "relativeAssetPaths": false,
    "stripWrapper": false,
    "nestMaterialScopes": false,
    "wrapperName": "top",
    "materialScopeNames": ["mat"],
    "rewriteThreads": 4,
    "output": "out/Set_stage.usda",
    "report": "/tmp/report.json",
    "attributeStore": "attributes.json"
  })";
  std::ostringstream errors;

  // Act
  const auto options = ParseAssemblyOptions(config, kBaseDir, errors);

  // Assert
  ASSERT_TRUE(options.has_value()) << errors.str();
  EXPECT_EQ(options->default_prim_name, "Set");
  EXPECT_EQ(options->up_axis, "Y");
  EXPECT_DOUBLE_EQ(options->meters_per_unit, 1.0);
  EXPECT_EQ(options->frames_per_second, 25.0);
  EXPECT_EQ(options->start_time_code, 1001.0);
  EXPECT_EQ(options->end_time_code, 1100.0);
  EXPECT_EQ(options->variant_set_name, "look");
  EXPECT_FALSE(options->relative_asset_paths);
  EXPECT_FALSE(options->strip_wrapper);
  EXPECT_FALSE(options->nest_material_scopes);
  EXPECT_EQ(options->wrapper_name, "top");
  EXPECT_THAT(options->material_scope_names, ElementsAre("mat"));
  EXPECT_EQ(options->rewrite_threads, 4U);
  ASSERT_TRUE(options->output_path.has_value());
  EXPECT_EQ(options->output_path->generic_string(),
    "/projects/shot010/out/Set_stage.usda");
  EXPECT_EQ(options->report_path->generic_string(), "/tmp/report.json");
  EXPECT_EQ(options->attribute_store_path->generic_string(),
    "/projects/shot010/attributes.json");
}

NOLINT_TEST(AssemblyConfigTest, InvalidJson_IsReported)
{
  std::ostringstream errors;

  const auto options = ParseAssemblyOptions("{ \"fps\": ", kBaseDir, errors);

  EXPECT_FALSE(options.has_value());
  EXPECT_THAT(errors.str(), HasSubstr("invalid assembly config JSON"));
}

class AssemblyConfigSchemaTest : public testing::TestWithParam<const char*> { };

NOLINT_TEST_P(AssemblyConfigSchemaTest, RejectedWithValidationError)
{
  std::ostringstream errors;

  const auto options = ParseAssemblyOptions(GetParam(), kBaseDir, errors);

  EXPECT_FALSE(options.has_value());
  EXPECT_THAT(errors.str(), HasSubstr("validation failed"));
}

INSTANTIATE_TEST_SUITE_P(Configs, AssemblyConfigSchemaTest,
  testing::Values(R"({ "upAxis": "X" })", R"({ "metersPerUnit": 0 })",
    R"({ "fps": -24 })", R"({ "unknown": true })",
    R"({ "rewriteThreads": 1000 })", R"({ "version": 2 })",
    R"({ "materialScopeNames": [""] })"));

//! Scenario: values the schema accepts can still be inconsistent.
NOLINT_TEST(AssemblyConfigTest, EndBeforeStart_FailsValidation)
{
  std::ostringstream errors;

  const auto options = ParseAssemblyOptions(
    R"({ "startFrame": 100, "endFrame": 1 })", kBaseDir, errors);

  EXPECT_FALSE(options.has_value());
  EXPECT_THAT(errors.str(), HasSubstr("endFrame"));
}

NOLINT_TEST(AssemblyConfigTest, InvalidVariantSetName_FailsValidation)
{
  std::ostringstream errors;

  const auto options = ParseAssemblyOptions(
    R"({ "variantSetName": "model variant" })", kBaseDir, errors);

  EXPECT_FALSE(options.has_value());
  EXPECT_THAT(errors.str(), HasSubstr("variantSetName"));
}

//=== Options ===-------------------------------------------------------------//

NOLINT_TEST(AssemblyOptionsTest, ResolvedDefaultPrimName)
{
  AssemblyOptions options;
  EXPECT_EQ(options.ResolvedDefaultPrimName(), "World");

  options.default_prim_name = "  ";
  EXPECT_EQ(options.ResolvedDefaultPrimName(), "World");

  options.default_prim_name = "2nd Floor";
  EXPECT_EQ(options.ResolvedDefaultPrimName(), "_2nd_Floor");
}

//=== Files ===---------------------------------------------------------------//

NOLINT_TEST(AssemblyConfigFileTest, RelativePaths_ResolveAgainstConfigFile)
{
  const TemporaryDirectory dir;
  const auto path = dir.WriteFile(
    "config/assemble.json", R"({ "output": "../Scene_stage.usda" })");
  std::ostringstream errors;

  const auto options = LoadAssemblyOptions(path, errors);

  ASSERT_TRUE(options.has_value()) << errors.str();
  ASSERT_TRUE(options->output_path.has_value());
  EXPECT_EQ(options->output_path->generic_string(),
    (dir.Path() / "Scene_stage.usda").lexically_normal().generic_string());
}

NOLINT_TEST(AssemblyConfigFileTest, MissingFile_IsReported)
{
  const TemporaryDirectory dir;
  std::ostringstream errors;

  const auto options = LoadAssemblyOptions(dir.Path() / "none.json", errors);

  EXPECT_FALSE(options.has_value());
  EXPECT_THAT(errors.str(), HasSubstr("failed to open assembly config"));
}

} // namespace
