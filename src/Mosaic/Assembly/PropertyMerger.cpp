//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Mosaic/Assembly/PropertyMerger.h>
#include <Mosaic/Base/Logging.h>

namespace mosaic::assembly {

auto MergeProperties(const std::optional<PropertyOverrides>& overrides,
  const SuffixTags& tags) -> PropertySet
{
  PropertySet merged;
  if (overrides) {
    ApplyOverrides(merged, *overrides);
  }

  if (tags.purpose_override) {
    if (overrides && overrides->purpose
      && *overrides->purpose != *tags.purpose_override) {
      DLOG_F(1, "'{}': suffix purpose '{}' overrides attribute purpose '{}'",
        tags.base_name, to_string(*tags.purpose_override),
        to_string(*overrides->purpose));
    }
    merged.purpose = *tags.purpose_override;
  }
  if (tags.payload_override) {
    if (overrides && overrides->payload
      && *overrides->payload != *tags.payload_override) {
      DLOG_F(1, "'{}': suffix payload={} overrides attribute payload={}",
        tags.base_name, *tags.payload_override, *overrides->payload);
    }
    merged.payload = *tags.payload_override;
  }
  return merged;
}

} // namespace mosaic::assembly
