//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <Mosaic/Base/api_export.h>

namespace mosaic::string_utils {

//! Remove leading and trailing ASCII whitespace.
MSC_BASE_NDAPI auto Trim(std::string_view text) -> std::string_view;

//! Split on every occurrence of `separator`. Empty fields are kept.
MSC_BASE_NDAPI auto Split(std::string_view text, char separator)
  -> std::vector<std::string_view>;

//! True if every character is an ASCII decimal digit and text is not empty.
MSC_BASE_NDAPI auto IsAllDigits(std::string_view text) noexcept -> bool;

//! Lowercase copy, ASCII only.
MSC_BASE_NDAPI auto ToLower(std::string_view text) -> std::string;

//! Quote a string for a text scene document, escaping quotes and backslashes.
MSC_BASE_NDAPI auto Quote(std::string_view text) -> std::string;

} // namespace mosaic::string_utils
