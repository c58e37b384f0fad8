//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <system_error>

#include <Mosaic/Assembly/api_export.h>

namespace mosaic::assembly {

//! Assembly error codes exposed as std::error_code.
/*!
 Fatal codes abort the batch and nothing is committed. Recoverable codes are
 only ever reported through diagnostics.
*/
enum class AssemblyError : int {
  // Fatal
  kIncompleteHierarchy = 1,
  kAmbiguousSibling,
  kInvalidMetadata,
  kInvalidOptions,
  kCommitFailed,
  // Recoverable
  kMalformedSuffix,
  kWrapperShapeMismatch,
  kUnreadableFragment,
};

//! True for codes that abort a batch.
[[nodiscard]] constexpr auto IsFatal(const AssemblyError e) noexcept -> bool
{
  return e == AssemblyError::kIncompleteHierarchy
    || e == AssemblyError::kAmbiguousSibling
    || e == AssemblyError::kInvalidMetadata
    || e == AssemblyError::kInvalidOptions
    || e == AssemblyError::kCommitFailed;
}

class AssemblyErrorCategory : public std::error_category {
public:
  const char* name() const noexcept override { return "Assembly Error"; }

  std::string message(int ev) const override
  {
    switch (static_cast<AssemblyError>(ev)) {
    case AssemblyError::kIncompleteHierarchy:
      return "Fragment parent path names an ancestor that was neither "
             "exported nor declared as a container";
    case AssemblyError::kAmbiguousSibling:
      return "Sibling fragments resolve to the same prim without variant "
             "tags to tell them apart";
    case AssemblyError::kInvalidMetadata:
      return "Hierarchy metadata is missing, malformed or inconsistent";
    case AssemblyError::kInvalidOptions:
      return "Assembly options are invalid";
    case AssemblyError::kCommitFailed:
      return "Failed to write assembly outputs";
    case AssemblyError::kMalformedSuffix:
      return "Object name carries a malformed suffix tag, kept literally";
    case AssemblyError::kWrapperShapeMismatch:
      return "Fragment does not have the expected wrapper layout, left "
             "unchanged";
    case AssemblyError::kUnreadableFragment:
      return "Fragment file could not be read as usda text, left unchanged";
    default:
      return "Unknown assembly error";
    }
  }
};

// Defined in the .cpp so that there is a single category instance and
// error_code comparisons are reliable.
MSC_ASM_NDAPI const AssemblyErrorCategory& GetAssemblyErrorCategory() noexcept;

inline std::error_code make_error_code(AssemblyError e) noexcept
{
  return { static_cast<int>(e), GetAssemblyErrorCategory() };
}

} // namespace mosaic::assembly

template <>
struct std::is_error_code_enum<mosaic::assembly::AssemblyError> : true_type {
};
