//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <map>
#include <set>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <Mosaic/Assembly/HierarchyReconstructor.h>
#include <Mosaic/Assembly/PrimNames.h>
#include <Mosaic/Assembly/PropertyMerger.h>
#include <Mosaic/Assembly/SuffixResolver.h>
#include <Mosaic/Base/Logging.h>

namespace mosaic::assembly {

namespace {

  using RawPath = std::vector<std::string>;

  constexpr std::string_view kDefaultSelector = "default";

  auto JoinRawPath(const RawPath& path) -> std::string
  {
    return fmt::format("{}", fmt::join(path, "/"));
  }

  auto Prefix(const FragmentRecord& record, size_t length) -> RawPath
  {
    return RawPath(record.parent_path.begin(),
      record.parent_path.begin() + static_cast<std::ptrdiff_t>(length));
  }

  auto FullPath(const FragmentRecord& record) -> RawPath
  {
    auto path = record.parent_path;
    path.push_back(record.object_name);
    return path;
  }

  //! Orders selectors: `default` first, then by numeric value, then label.
  auto SelectorLess(std::string_view a, std::string_view b) -> bool
  {
    if (a == kDefaultSelector || b == kDefaultSelector) {
      return a == kDefaultSelector && b != kDefaultSelector;
    }
    const auto strip = [](std::string_view s) {
      const auto first = s.find_first_not_of('0');
      return first == std::string_view::npos ? std::string_view {}
                                             : s.substr(first);
    };
    const auto sa = strip(a);
    const auto sb = strip(b);
    if (sa.size() != sb.size()) {
      return sa.size() < sb.size();
    }
    if (sa != sb) {
      return sa < sb;
    }
    return a < b;
  }

  class TreeBuilder {
  public:
    TreeBuilder(const HierarchyReconstructor::Config& config,
      std::span<const FragmentRecord> records,
      std::vector<HierarchyNode>& nodes, Diagnostics& diagnostics)
      : config_(config)
      , records_(records)
      , nodes_(nodes)
      , diagnostics_(diagnostics)
    {
    }

    auto Build(std::vector<NodeId>& fragment_nodes)
      -> std::expected<void, std::error_code>
    {
      nodes_.push_back(HierarchyNode {
        .name = MakeValidPrimName(config_.root_name),
        .role = NodeRole::kRoot,
      });

      if (auto ok = IndexRecords(); !ok) {
        return ok;
      }

      fragment_nodes.assign(records_.size(), kInvalidNodeId);
      for (size_t i = 0; i < records_.size(); ++i) {
        auto node = PlaceRecord(i);
        if (!node) {
          return std::unexpected(node.error());
        }
        fragment_nodes[i] = *node;
      }

      Finalize();
      return {};
    }

  private:
    auto Fail(AssemblyError error, std::string code, std::string message,
      const FragmentRecord& record) -> std::unexpected<std::error_code>
    {
      LOG_F(ERROR, "{}", message);
      diagnostics_.push_back(MakeDiagnostic(DiagnosticSeverity::kError, error,
        std::move(code), std::move(message), record.file_path.string(),
        JoinRawPath(FullPath(record))));
      return std::unexpected(make_error_code(error));
    }

    auto IndexRecords() -> std::expected<void, std::error_code>
    {
      for (size_t i = 0; i < records_.size(); ++i) {
        const auto& record = records_[i];
        auto [it, inserted] = fragment_paths_.emplace(FullPath(record), i);
        if (!inserted) {
          return Fail(AssemblyError::kAmbiguousSibling,
            "hierarchy.duplicate_path",
            fmt::format("'{}' is exported by both '{}' and '{}'",
              JoinRawPath(it->first),
              records_[it->second].file_path.filename().string(),
              record.file_path.filename().string()),
            record);
        }
        for (size_t j = 0; j < record.parent_path.size(); ++j) {
          const auto found
            = record.ancestor_containers.find(record.parent_path[j]);
          if (found != record.ancestor_containers.end()) {
            containers_.emplace(Prefix(record, j + 1), found->second);
          }
        }
      }
      return {};
    }

    auto PlaceRecord(size_t index) -> std::expected<NodeId, std::error_code>
    {
      const auto& record = records_[index];
      NodeId parent = 0;
      for (size_t j = 0; j < record.parent_path.size(); ++j) {
        auto prefix = Prefix(record, j + 1);
        if (const auto it = by_raw_path_.find(prefix);
          it != by_raw_path_.end()) {
          parent = it->second;
          continue;
        }
        const bool is_fragment = fragment_paths_.contains(prefix);
        const auto container = containers_.find(prefix);
        if (!is_fragment && container == containers_.end()) {
          return Fail(AssemblyError::kIncompleteHierarchy,
            "hierarchy.incomplete",
            fmt::format("ancestor '{}' of '{}' was not exported and is not a "
                        "declared container",
              JoinRawPath(prefix), record.object_name),
            record);
        }
        auto node = Attach(parent, record.parent_path[j], record);
        if (!node) {
          return node;
        }
        if (!is_fragment) {
          auto& n = nodes_[*node];
          n.role = NodeRole::kContainer;
          n.container_class = container->second;
        }
        by_raw_path_.emplace(std::move(prefix), *node);
        parent = *node;
      }

      auto full = FullPath(record);
      if (const auto it = by_raw_path_.find(full); it != by_raw_path_.end()) {
        // A descendant placed earlier already created this node.
        nodes_[it->second].source_fragment = index;
        return it->second;
      }
      auto node = Attach(parent, record.object_name, record);
      if (!node) {
        return node;
      }
      nodes_[*node].source_fragment = index;
      by_raw_path_.emplace(std::move(full), *node);
      return node;
    }

    auto NewNode(HierarchyNode node) -> NodeId
    {
      nodes_.push_back(std::move(node));
      return static_cast<NodeId>(nodes_.size() - 1);
    }

    auto FindSibling(NodeId parent, std::string_view name) const
      -> std::optional<size_t>
    {
      const auto& children = nodes_[parent].children;
      for (size_t i = 0; i < children.size(); ++i) {
        if (nodes_[children[i]].name == name) {
          return i;
        }
      }
      return std::nullopt;
    }

    auto AddMember(NodeId group, std::string selector,
      const FragmentRecord& record) -> std::expected<NodeId, std::error_code>
    {
      auto& vset = *nodes_[group].variant_set;
      const bool taken = std::ranges::any_of(vset.members,
        [&](const VariantMember& m) { return m.selector == selector; });
      if (taken) {
        return Fail(AssemblyError::kAmbiguousSibling,
          "hierarchy.duplicate_variant",
          fmt::format("variant '{}' of '{}' is defined more than once",
            selector, nodes_[group].name),
          record);
      }
      const auto member = NewNode(HierarchyNode {
        .name = nodes_[group].name,
        .role = NodeRole::kFragment,
        .variant_selector = selector,
        .parent = group,
      });
      nodes_[group].variant_set->members.push_back(
        { .selector = std::move(selector), .node = member });
      return member;
    }

    auto NewGroup(NodeId parent, const std::string& name) -> NodeId
    {
      return NewNode(HierarchyNode {
        .name = name,
        .role = NodeRole::kVariantGroup,
        .parent = parent,
        .variant_set = VariantSet { .name = config_.variant_set_name },
      });
    }

    //! Create the node for `raw_name` under `parent`, collapsing variants.
    auto Attach(NodeId parent, std::string_view raw_name,
      const FragmentRecord& record) -> std::expected<NodeId, std::error_code>
    {
      auto [tags, warnings] = ResolveSuffixes(raw_name);
      for (auto& w : warnings) {
        LOG_F(WARNING, "{}: {}", raw_name, w.message);
        w.source_path = record.file_path.string();
        diagnostics_.push_back(std::move(w));
      }
      const auto name = MakeValidPrimName(tags.base_name);

      const auto sibling = FindSibling(parent, name);
      if (!sibling) {
        if (!tags.HasVariant()) {
          const auto node = NewNode(HierarchyNode {
            .name = name,
            .parent = parent,
          });
          nodes_[parent].children.push_back(node);
          return node;
        }
        const auto group = NewGroup(parent, name);
        nodes_[parent].children.push_back(group);
        return AddMember(group, *tags.variant_member, record);
      }

      const auto sibling_id = nodes_[parent].children[*sibling];
      if (nodes_[sibling_id].role == NodeRole::kVariantGroup) {
        return AddMember(sibling_id,
          tags.variant_member.value_or(std::string(kDefaultSelector)), record);
      }

      if (!tags.HasVariant()) {
        return Fail(AssemblyError::kAmbiguousSibling,
          "hierarchy.ambiguous_sibling",
          fmt::format("'{}' resolves to prim '{}' which already exists under "
                      "'{}' and neither carries a variant tag",
            raw_name, name, nodes_[parent].name),
          record);
      }

      // Convert the plain sibling into the default member of a new group.
      DLOG_F(1, "'{}' becomes a variant group ({})", name, raw_name);
      const auto group = NewGroup(parent, name);
      nodes_[parent].children[*sibling] = group;
      auto& former = nodes_[sibling_id];
      former.parent = group;
      former.variant_selector = std::string(kDefaultSelector);
      nodes_[group].variant_set->members.push_back(
        { .selector = std::string(kDefaultSelector), .node = sibling_id });
      return AddMember(group, *tags.variant_member, record);
    }

    auto Finalize() -> void
    {
      for (auto& node : nodes_) {
        switch (node.role) {
        case NodeRole::kRoot:
          node.resolved_properties.kind = Kind::kAssembly;
          break;
        case NodeRole::kFragment: {
          const auto& record = records_[*node.source_fragment];
          node.resolved_properties = MergeProperties(
            record.property_overrides, ResolveSuffixes(record.object_name).tags);
          break;
        }
        case NodeRole::kContainer:
        case NodeRole::kVariantGroup:
          break;
        }
        if (node.resolved_properties.geom_type == GeomType::kAuto) {
          node.resolved_properties.geom_type
            = node.container_class == ContainerClass::kLayer ? GeomType::kScope
                                                             : GeomType::kXform;
        }
        if (node.variant_set) {
          auto& vset = *node.variant_set;
          std::ranges::sort(vset.members,
            [](const VariantMember& a, const VariantMember& b) {
              return SelectorLess(a.selector, b.selector);
            });
          vset.default_selection = vset.members.front().selector;
        }
      }
    }

    const HierarchyReconstructor::Config& config_;
    std::span<const FragmentRecord> records_;
    std::vector<HierarchyNode>& nodes_;
    Diagnostics& diagnostics_;

    std::map<RawPath, size_t> fragment_paths_;
    std::map<RawPath, ContainerClass> containers_;
    std::map<RawPath, NodeId> by_raw_path_;
  };

} // namespace

auto to_string(const NodeRole role) -> std::string_view
{
  switch (role) {
  case NodeRole::kRoot:
    return "Root";
  case NodeRole::kFragment:
    return "Fragment";
  case NodeRole::kContainer:
    return "Container";
  case NodeRole::kVariantGroup:
    return "VariantGroup";
  }
  return "__NotSupported__";
}

auto HierarchyTree::Node(const NodeId id) const -> const HierarchyNode&
{
  CHECK_F(id < nodes_.size(), "invalid hierarchy node id {}", id);
  return nodes_[id];
}

auto HierarchyTree::NodeForFragment(const size_t fragment_index) const
  -> std::optional<NodeId>
{
  if (fragment_index >= fragment_nodes_.size()) {
    return std::nullopt;
  }
  return fragment_nodes_[fragment_index];
}

auto HierarchyTree::FindChild(const NodeId parent, std::string_view name) const
  -> std::optional<NodeId>
{
  for (const auto child : Node(parent).children) {
    if (nodes_[child].name == name) {
      return child;
    }
  }
  return std::nullopt;
}

auto HierarchyTree::FindVariantMember(
  const NodeId group, std::string_view selector) const -> std::optional<NodeId>
{
  const auto& vset = Node(group).variant_set;
  if (!vset) {
    return std::nullopt;
  }
  for (const auto& member : vset->members) {
    if (member.selector == selector) {
      return member.node;
    }
  }
  return std::nullopt;
}

auto HierarchyTree::PrimPath(const NodeId id) const -> std::string
{
  std::string path;
  for (auto current = id; current != kInvalidNodeId;) {
    const auto& node = Node(current);
    if (node.variant_selector) {
      const auto& group = Node(node.parent);
      path.insert(0,
        fmt::format("{{{}={}}}", group.variant_set->name,
          *node.variant_selector));
    } else {
      path.insert(0, "/" + node.name);
    }
    current = node.parent;
  }
  return path;
}

auto HierarchyReconstructor::Reconstruct(
  std::span<const FragmentRecord> records, Diagnostics& diagnostics) const
  -> std::expected<HierarchyTree, std::error_code>
{
  LOG_SCOPE_F(INFO, "Reconstruct hierarchy ({} fragments)", records.size());

  HierarchyTree tree;
  TreeBuilder builder(config_, records, tree.nodes_, diagnostics);
  if (auto ok = builder.Build(tree.fragment_nodes_); !ok) {
    return std::unexpected(ok.error());
  }
  DLOG_F(INFO, "{} nodes", tree.Size());
  return tree;
}

} // namespace mosaic::assembly
