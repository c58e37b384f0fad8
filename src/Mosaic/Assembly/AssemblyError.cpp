//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Mosaic/Assembly/AssemblyError.h>

namespace mosaic::assembly {

const AssemblyErrorCategory& GetAssemblyErrorCategory() noexcept
{
  static const AssemblyErrorCategory instance;
  return instance;
}

} // namespace mosaic::assembly
