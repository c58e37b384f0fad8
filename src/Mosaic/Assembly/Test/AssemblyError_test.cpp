//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <system_error>

#include <Mosaic/Assembly/AssemblyDiagnostics.h>
#include <Mosaic/Assembly/AssemblyError.h>
#include <Mosaic/Testing/GTest.h>

using mosaic::assembly::AssemblyError;
using mosaic::assembly::DiagnosticSeverity;
using mosaic::assembly::Diagnostics;
using mosaic::assembly::GetAssemblyErrorCategory;
using mosaic::assembly::HasErrors;
using mosaic::assembly::IsFatal;
using mosaic::assembly::MakeDiagnostic;

namespace {

NOLINT_TEST(AssemblyErrorTest, ErrorCode_UsesAssemblyCategory)
{
  const std::error_code ec = AssemblyError::kIncompleteHierarchy;

  EXPECT_EQ(&ec.category(), &GetAssemblyErrorCategory());
  EXPECT_STREQ(ec.category().name(), "Assembly Error");
  EXPECT_THAT(ec.message(), testing::HasSubstr("ancestor"));
  EXPECT_EQ(ec, AssemblyError::kIncompleteHierarchy);
  EXPECT_NE(ec, AssemblyError::kAmbiguousSibling);
}

NOLINT_TEST(AssemblyErrorTest, FatalAndRecoverableKinds)
{
  EXPECT_TRUE(IsFatal(AssemblyError::kIncompleteHierarchy));
  EXPECT_TRUE(IsFatal(AssemblyError::kAmbiguousSibling));
  EXPECT_TRUE(IsFatal(AssemblyError::kInvalidMetadata));
  EXPECT_TRUE(IsFatal(AssemblyError::kInvalidOptions));
  EXPECT_TRUE(IsFatal(AssemblyError::kCommitFailed));
  EXPECT_FALSE(IsFatal(AssemblyError::kMalformedSuffix));
  EXPECT_FALSE(IsFatal(AssemblyError::kWrapperShapeMismatch));
  EXPECT_FALSE(IsFatal(AssemblyError::kUnreadableFragment));
}

NOLINT_TEST(AssemblyErrorTest, UnknownValue_HasGenericMessage)
{
  EXPECT_EQ(GetAssemblyErrorCategory().message(999), "Unknown assembly error");
}

NOLINT_TEST(AssemblyDiagnosticsTest, HasErrors_OnlyForErrorSeverity)
{
  Diagnostics diagnostics;
  diagnostics.push_back(MakeDiagnostic(DiagnosticSeverity::kWarning,
    AssemblyError::kMalformedSuffix, "suffix.malformed_variant", "warn"));
  diagnostics.push_back(MakeDiagnostic(
    DiagnosticSeverity::kInfo, {}, "scope.already_flat", "info"));
  EXPECT_FALSE(HasErrors(diagnostics));

  diagnostics.push_back(MakeDiagnostic(DiagnosticSeverity::kError,
    AssemblyError::kCommitFailed, "commit.failed", "boom"));
  EXPECT_TRUE(HasErrors(diagnostics));
}

} // namespace
