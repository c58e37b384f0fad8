//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <Mosaic/Assembly/AssemblyDiagnostics.h>
#include <Mosaic/Assembly/FragmentRecord.h>
#include <Mosaic/Assembly/PropertySet.h>
#include <Mosaic/Assembly/api_export.h>

namespace mosaic::assembly {

using NodeId = uint32_t;
inline constexpr NodeId kInvalidNodeId = std::numeric_limits<NodeId>::max();

//! What a node stands for in the assembled document.
enum class NodeRole : uint8_t {
  //! The single top-level prim of the document.
  kRoot = 0,
  //! Backed by an exported fragment.
  kFragment,
  //! Synthetic placeholder for a declared container ancestor.
  kContainer,
  //! A prim whose alternatives live in its variant set.
  kVariantGroup,
};

MSC_ASM_NDAPI auto to_string(NodeRole role) -> std::string_view;

struct VariantMember final {
  std::string selector;
  NodeId node = kInvalidNodeId;
};

struct VariantSet final {
  std::string name;
  //! `default` first, then ascending numeric selector.
  std::vector<VariantMember> members;
  std::string default_selection;
};

//! One prim of the reconstructed tree.
/*!
 Variant members are full nodes (with properties and children) that are
 referenced from their group's variant set instead of from `children`.
*/
struct HierarchyNode final {
  std::string name;
  NodeRole role = NodeRole::kFragment;
  PropertySet resolved_properties;

  //! Index of the producing FragmentRecord; empty for synthetic nodes.
  std::optional<size_t> source_fragment;

  std::optional<ContainerClass> container_class;

  //! Selector of this node inside its parent's variant set, if a member.
  std::optional<std::string> variant_selector;

  NodeId parent = kInvalidNodeId;
  std::vector<NodeId> children;
  std::optional<VariantSet> variant_set;
};

//! Arena of hierarchy nodes; node 0 is the root.
class HierarchyTree {
public:
  HierarchyTree() = default;

  [[nodiscard]] auto Root() const noexcept -> NodeId { return 0; }
  [[nodiscard]] auto Size() const noexcept -> size_t { return nodes_.size(); }

  MSC_ASM_NDAPI auto Node(NodeId id) const -> const HierarchyNode&;

  //! Node produced by the fragment at `fragment_index` of the input batch.
  MSC_ASM_NDAPI auto NodeForFragment(size_t fragment_index) const
    -> std::optional<NodeId>;

  //! Number of fragments that were mapped to nodes.
  [[nodiscard]] auto FragmentCount() const noexcept -> size_t
  {
    return fragment_nodes_.size();
  }

  //! Child of `parent` named `name` (not searching variant members).
  MSC_ASM_NDAPI auto FindChild(NodeId parent, std::string_view name) const
    -> std::optional<NodeId>;

  //! Member of a variant group by selector.
  MSC_ASM_NDAPI auto FindVariantMember(NodeId group,
    std::string_view selector) const -> std::optional<NodeId>;

  //! Prim path of a node, with variant selections, e.g.
  //! `/World/Chair{modelVariant=1}/Seat`.
  MSC_ASM_NDAPI auto PrimPath(NodeId id) const -> std::string;

private:
  friend class HierarchyReconstructor;

  std::vector<HierarchyNode> nodes_;
  std::vector<NodeId> fragment_nodes_;
};

//! Rebuilds the scene hierarchy from flat fragment records.
/*!
 Each record's `parent_path` is walked from the outermost ancestor. Every
 ancestor prefix must be the full path of another record or a container
 declared by some record; anything else fails the batch with
 kIncompleteHierarchy.

 Siblings are matched by prim name (suffixes stripped, made valid). Names
 that differ only by a variant tag collapse into one kVariantGroup node whose
 members are the alternatives; an untagged sibling becomes the `default`
 member. Two siblings with the same prim name and no variant tag, a repeated
 selector, or two records with the same path fail with kAmbiguousSibling.

 The result does not depend on input order except for the first-seen order
 of ordinary siblings.
*/
class HierarchyReconstructor {
public:
  struct Config final {
    //! Name of the root node (the document's default prim).
    std::string root_name = "World";
    //! Name of the variant set created on variant groups.
    std::string variant_set_name = "modelVariant";
  };

  explicit HierarchyReconstructor(Config config)
    : config_(std::move(config))
  {
  }

  //! Build the tree. Suffix warnings and fatal errors are appended to
  //! `diagnostics`; on a fatal error the matching AssemblyError is returned.
  MSC_ASM_NDAPI auto Reconstruct(std::span<const FragmentRecord> records,
    Diagnostics& diagnostics) const
    -> std::expected<HierarchyTree, std::error_code>;

private:
  Config config_;
};

} // namespace mosaic::assembly
