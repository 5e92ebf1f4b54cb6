#include "containers.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <magic_enum/magic_enum.hpp>

namespace treewm {

ContainerTree::ContainerTree() {
  root_ = create(RootContainer{});
}

int ContainerTree::create(ContainerData data) {
  Node n;
  n.data = std::move(data);
  nodes_.push_back(std::move(n));
  return static_cast<int>(nodes_.size() - 1);
}

void ContainerTree::destroy(int id) {
  Node& n = node(id);
  if (n.parent.has_value() || !n.children.empty()) {
    throw InvariantViolation("cannot destroy attached or non-empty container " +
                             std::to_string(id));
  }
  n.is_dead = true;
  n.child_focus_order.clear();
}

// ============================================================================
// Kinds and Data
// ============================================================================

bool ContainerTree::is_valid(int id) const {
  return id >= 0 && static_cast<size_t>(id) < nodes_.size() &&
         !nodes_[static_cast<size_t>(id)].is_dead;
}

ContainerKind ContainerTree::kind(int id) const {
  return std::visit(overloaded{
                        [](const RootContainer&) { return ContainerKind::Root; },
                        [](const Monitor&) { return ContainerKind::Monitor; },
                        [](const Workspace&) { return ContainerKind::Workspace; },
                        [](const SplitContainer&) { return ContainerKind::SplitContainer; },
                        [](const TilingWindow&) { return ContainerKind::TilingWindow; },
                        [](const FloatingWindow&) { return ContainerKind::FloatingWindow; },
                    },
                    node(id).data);
}

bool ContainerTree::is_window(int id) const {
  return std::visit([](const auto& c) { return is_window_v<std::decay_t<decltype(c)>>; },
                    node(id).data);
}

bool ContainerTree::is_resizable(int id) const {
  return std::visit([](const auto& c) { return is_resizable_v<std::decay_t<decltype(c)>>; },
                    node(id).data);
}

std::optional<Layout> ContainerTree::layout(int id) const {
  const ContainerData& d = node(id).data;
  if (const auto* workspace = std::get_if<Workspace>(&d)) {
    return workspace->layout;
  }
  if (const auto* split = std::get_if<SplitContainer>(&d)) {
    return split->layout;
  }
  return std::nullopt;
}

std::optional<double> ContainerTree::size_percentage(int id) const {
  return std::visit(
      [](const auto& c) -> std::optional<double> {
        if constexpr (is_resizable_v<std::decay_t<decltype(c)>>) {
          return c.size_percentage;
        } else {
          return std::nullopt;
        }
      },
      node(id).data);
}

std::optional<WindowHandle> ContainerTree::handle(int id) const {
  return std::visit(
      [](const auto& c) -> std::optional<WindowHandle> {
        if constexpr (is_window_v<std::decay_t<decltype(c)>>) {
          return c.handle;
        } else {
          return std::nullopt;
        }
      },
      node(id).data);
}

std::optional<Rect> ContainerTree::floating_placement(int id) const {
  return std::visit(
      [](const auto& c) -> std::optional<Rect> {
        if constexpr (is_window_v<std::decay_t<decltype(c)>>) {
          return c.floating_placement;
        } else {
          return std::nullopt;
        }
      },
      node(id).data);
}

// ============================================================================
// Navigation
// ============================================================================

int ContainerTree::index(int id) const {
  auto parent_opt = node(id).parent;
  if (!parent_opt.has_value()) {
    return -1;
  }
  const auto& siblings = node(*parent_opt).children;
  auto it = std::find(siblings.begin(), siblings.end(), id);
  return it == siblings.end() ? -1 : static_cast<int>(it - siblings.begin());
}

std::vector<int> ContainerTree::ancestors(int id) const {
  std::vector<int> result;
  auto current = node(id).parent;
  while (current.has_value()) {
    result.push_back(*current);
    current = node(*current).parent;
  }
  return result;
}

std::vector<int> ContainerTree::self_and_ancestors(int id) const {
  std::vector<int> result{id};
  auto rest = ancestors(id);
  result.insert(result.end(), rest.begin(), rest.end());
  return result;
}

std::vector<int> ContainerTree::descendants(int id) const {
  std::vector<int> result;
  std::vector<int> stack(node(id).children.rbegin(), node(id).children.rend());
  while (!stack.empty()) {
    int current = stack.back();
    stack.pop_back();
    result.push_back(current);
    const auto& kids = node(current).children;
    stack.insert(stack.end(), kids.rbegin(), kids.rend());
  }
  return result;
}

std::vector<int> ContainerTree::siblings(int id) const {
  std::vector<int> result;
  auto parent_opt = node(id).parent;
  if (!parent_opt.has_value()) {
    return result;
  }
  for (int child : node(*parent_opt).children) {
    if (child != id) {
      result.push_back(child);
    }
  }
  return result;
}

std::vector<int> ContainerTree::resizable_children(int id) const {
  std::vector<int> result;
  for (int child : node(id).children) {
    if (is_resizable(child)) {
      result.push_back(child);
    }
  }
  return result;
}

std::vector<int> ContainerTree::resizable_siblings(int id) const {
  std::vector<int> result;
  for (int sibling : siblings(id)) {
    if (is_resizable(sibling)) {
      result.push_back(sibling);
    }
  }
  return result;
}

std::vector<int> ContainerTree::self_and_resizable_siblings(int id) const {
  auto parent_opt = node(id).parent;
  if (!parent_opt.has_value()) {
    return {id};
  }
  std::vector<int> result;
  for (int child : node(*parent_opt).children) {
    if (child == id || is_resizable(child)) {
      result.push_back(child);
    }
  }
  return result;
}

std::optional<int> ContainerTree::previous_resizable_sibling(int id) const {
  auto group = self_and_resizable_siblings(id);
  auto it = std::find(group.begin(), group.end(), id);
  if (it == group.begin()) {
    return std::nullopt;
  }
  return *(it - 1);
}

std::optional<int> ContainerTree::next_resizable_sibling(int id) const {
  auto group = self_and_resizable_siblings(id);
  auto it = std::find(group.begin(), group.end(), id);
  if (it == group.end() || it + 1 == group.end()) {
    return std::nullopt;
  }
  return *(it + 1);
}

bool ContainerTree::is_descendant_of(int id, int ancestor) const {
  auto chain = ancestors(id);
  return std::find(chain.begin(), chain.end(), ancestor) != chain.end();
}

size_t ContainerTree::size() const {
  return static_cast<size_t>(
      std::count_if(nodes_.begin(), nodes_.end(), [](const Node& n) { return !n.is_dead; }));
}

// ============================================================================
// Raw Mutation
// ============================================================================

void ContainerTree::insert_child(int parent_id, int child_id, std::optional<int> index) {
  if (parent_id == child_id || is_descendant_of(parent_id, child_id)) {
    throw InvariantViolation("inserting container " + std::to_string(child_id) +
                             " would create a cycle");
  }
  Node& child = node(child_id);
  if (child.parent.has_value()) {
    throw InvariantViolation("container " + std::to_string(child_id) + " is already attached");
  }

  Node& parent = node(parent_id);
  auto position = parent.children.end();
  if (index.has_value() && *index >= 0 && static_cast<size_t>(*index) < parent.children.size()) {
    position = parent.children.begin() + *index;
  }
  parent.children.insert(position, child_id);
  parent.child_focus_order.push_back(child_id);
  child.parent = parent_id;
}

void ContainerTree::remove_child(int child_id) {
  Node& child = node(child_id);
  if (!child.parent.has_value()) {
    return;
  }
  Node& parent = node(*child.parent);
  std::erase(parent.children, child_id);
  std::erase(parent.child_focus_order, child_id);
  child.parent = std::nullopt;
}

void ContainerTree::replace_child(int old_child, int new_child) {
  Node& old_node = node(old_child);
  if (!old_node.parent.has_value()) {
    throw InvariantViolation("cannot replace detached container " + std::to_string(old_child));
  }
  if (node(new_child).parent.has_value()) {
    remove_child(new_child);
  }

  int parent_id = *old_node.parent;
  Node& parent = node(parent_id);
  std::replace(parent.children.begin(), parent.children.end(), old_child, new_child);
  std::replace(parent.child_focus_order.begin(), parent.child_focus_order.end(), old_child,
               new_child);
  old_node.parent = std::nullopt;
  node(new_child).parent = parent_id;
}

void ContainerTree::set_size_percentage(int id, double size_percentage) {
  std::visit(
      [&](auto& c) {
        if constexpr (is_resizable_v<std::decay_t<decltype(c)>>) {
          c.size_percentage = size_percentage;
        } else {
          throw InvariantViolation("container " + std::to_string(id) + " is not resizable");
        }
      },
      node(id).data);
}

void ContainerTree::set_layout(int id, Layout layout) {
  ContainerData& d = node(id).data;
  if (auto* workspace = std::get_if<Workspace>(&d)) {
    workspace->layout = layout;
  } else if (auto* split = std::get_if<SplitContainer>(&d)) {
    split->layout = layout;
  } else {
    throw InvariantViolation("container " + std::to_string(id) + " has no layout");
  }
}

void ContainerTree::set_floating_placement(int id, const Rect& placement) {
  std::visit(
      [&](auto& c) {
        if constexpr (is_window_v<std::decay_t<decltype(c)>>) {
          c.floating_placement = placement;
        } else {
          throw InvariantViolation("container " + std::to_string(id) + " is not a window");
        }
      },
      node(id).data);
}

void ContainerTree::set_pending_dpi_adjustment(int id, bool pending) {
  std::visit(
      [&](auto& c) {
        if constexpr (is_window_v<std::decay_t<decltype(c)>>) {
          c.has_pending_dpi_adjustment = pending;
        } else {
          throw InvariantViolation("container " + std::to_string(id) + " is not a window");
        }
      },
      node(id).data);
}

void ContainerTree::focus_path(int id) {
  int current = id;
  auto parent_opt = node(current).parent;
  while (parent_opt.has_value()) {
    auto& order = node(*parent_opt).child_focus_order;
    std::erase(order, current);
    order.insert(order.begin(), current);
    current = *parent_opt;
    parent_opt = node(current).parent;
  }
}

void ContainerTree::set_focus_position(int child_id, size_t position) {
  auto parent_opt = node(child_id).parent;
  if (!parent_opt.has_value()) {
    return;
  }
  auto& order = node(*parent_opt).child_focus_order;
  std::erase(order, child_id);
  position = std::min(position, order.size());
  order.insert(order.begin() + static_cast<std::ptrdiff_t>(position), child_id);
}

void ContainerTree::set_displayed_workspace(int monitor_id, int workspace_id) {
  if (node(workspace_id).parent != monitor_id) {
    throw InvariantViolation("workspace " + std::to_string(workspace_id) +
                             " does not belong to monitor " + std::to_string(monitor_id));
  }
  get<Monitor>(monitor_id).displayed_workspace = workspace_id;
}

// ============================================================================
// Utilities
// ============================================================================

bool ContainerTree::validate() const {
  bool ok = true;

  if (node(root_).parent.has_value()) {
    spdlog::error("[validate] root {} has a parent", root_);
    ok = false;
  }

  for (size_t i = 0; i < nodes_.size(); ++i) {
    const Node& n = nodes_[i];
    int id = static_cast<int>(i);
    if (n.is_dead) {
      continue;
    }

    if (id != root_) {
      if (!n.parent.has_value()) {
        spdlog::error("[validate] container {} is detached", id);
        ok = false;
        continue;
      }
      if (!is_valid(*n.parent)) {
        spdlog::error("[validate] container {} points to dead parent {}", id, *n.parent);
        ok = false;
        continue;
      }
      const Node& parent = nodes_[static_cast<size_t>(*n.parent)];
      if (std::count(parent.children.begin(), parent.children.end(), id) != 1) {
        spdlog::error("[validate] container {} claims parent {} but is not a child of it", id,
                      *n.parent);
        ok = false;
      }
      if (std::count(parent.child_focus_order.begin(), parent.child_focus_order.end(), id) != 1) {
        spdlog::error("[validate] container {} missing from focus order of {}", id, *n.parent);
        ok = false;
      }

      // Walking up must reach the root within the number of nodes
      size_t steps = 0;
      auto current = n.parent;
      while (current.has_value() && *current != root_ && steps <= nodes_.size()) {
        current = nodes_[static_cast<size_t>(*current)].parent;
        ++steps;
      }
      if (!current.has_value() || *current != root_) {
        spdlog::error("[validate] container {} is not connected to the root", id);
        ok = false;
        continue;
      }
    }

    for (int child : n.children) {
      if (!is_valid(child) || nodes_[static_cast<size_t>(child)].parent != id) {
        spdlog::error("[validate] child {} of container {} does not point back", child, id);
        ok = false;
      }
    }
    if (n.children.size() != n.child_focus_order.size()) {
      spdlog::error("[validate] container {} has {} children but {} focus entries", id,
                    n.children.size(), n.child_focus_order.size());
      ok = false;
    }

    auto resizable = resizable_children(id);
    if (!resizable.empty()) {
      double sum = 0.0;
      for (int child : resizable) {
        sum += *size_percentage(child);
      }
      if (std::abs(sum - 1.0) > kSizeTolerance) {
        spdlog::error("[validate] resizable children of {} sum to {:.4f}", id, sum);
        ok = false;
      }
    }

    ContainerKind k = kind(id);
    std::optional<ContainerKind> parent_kind;
    if (n.parent.has_value()) {
      parent_kind = kind(*n.parent);
    }
    switch (k) {
    case ContainerKind::Root:
      break;
    case ContainerKind::Monitor: {
      if (parent_kind != ContainerKind::Root) {
        spdlog::error("[validate] monitor {} is not a child of the root", id);
        ok = false;
      }
      const auto& monitor = std::get<Monitor>(n.data);
      if (monitor.displayed_workspace.has_value() &&
          (!is_valid(*monitor.displayed_workspace) ||
           nodes_[static_cast<size_t>(*monitor.displayed_workspace)].parent != id)) {
        spdlog::error("[validate] monitor {} displays foreign workspace {}", id,
                      *monitor.displayed_workspace);
        ok = false;
      }
      break;
    }
    case ContainerKind::Workspace:
      if (parent_kind != ContainerKind::Monitor) {
        spdlog::error("[validate] workspace {} is not a child of a monitor", id);
        ok = false;
      }
      break;
    case ContainerKind::SplitContainer:
      if (n.children.empty()) {
        spdlog::error("[validate] split container {} is empty", id);
        ok = false;
      }
      [[fallthrough]];
    case ContainerKind::TilingWindow:
    case ContainerKind::FloatingWindow:
      if (k == ContainerKind::FloatingWindow && parent_kind != ContainerKind::Workspace) {
        spdlog::error("[validate] floating window {} is not a child of a workspace", id);
        ok = false;
      }
      if (!ancestor_of_type<Monitor>(id).has_value()) {
        spdlog::error("[validate] {} {} has no monitor ancestor", magic_enum::enum_name(k), id);
        ok = false;
      }
      if (is_window(id) && !n.children.empty()) {
        spdlog::error("[validate] window {} has children", id);
        ok = false;
      }
      break;
    }
  }

  if (!ok) {
    spdlog::warn("[validate] container tree has anomalies");
  }
  return ok;
}

void ContainerTree::debug_print() const {
  spdlog::debug("===== Container Tree =====");
  std::vector<std::pair<int, int>> stack{{root_, 0}};
  while (!stack.empty()) {
    auto [id, depth] = stack.back();
    stack.pop_back();

    std::string indent(static_cast<size_t>(depth) * 2, ' ');
    std::string details = std::visit(
        overloaded{
            [](const RootContainer&) { return std::string("root"); },
            [](const Monitor& m) {
              return fmt::format("monitor '{}' ({}, {}, {}x{}) scale={}", m.name, m.bounds.x,
                                 m.bounds.y, m.bounds.width, m.bounds.height, m.scale_factor);
            },
            [](const Workspace& w) {
              return fmt::format("workspace '{}' layout={}", w.name,
                                 magic_enum::enum_name(w.layout));
            },
            [](const SplitContainer& s) {
              return fmt::format("split layout={} size={:.3f}", magic_enum::enum_name(s.layout),
                                 s.size_percentage);
            },
            [](const TilingWindow& w) {
              return fmt::format("tiling handle={} size={:.3f}", w.handle, w.size_percentage);
            },
            [](const FloatingWindow& w) {
              return fmt::format("floating handle={} at ({}, {}, {}x{})", w.handle,
                                 w.floating_placement.x, w.floating_placement.y,
                                 w.floating_placement.width, w.floating_placement.height);
            },
        },
        node(id).data);
    spdlog::debug("{}[{}] {}", indent, id, details);

    const auto& kids = node(id).children;
    for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
      stack.emplace_back(*it, depth + 1);
    }
  }
  spdlog::debug("===== End Container Tree =====");
}

// ============================================================================
// Internal
// ============================================================================

ContainerTree::Node& ContainerTree::node(int id) {
  if (!is_valid(id)) {
    throw InvariantViolation("invalid container id " + std::to_string(id));
  }
  return nodes_[static_cast<size_t>(id)];
}

const ContainerTree::Node& ContainerTree::node(int id) const {
  if (!is_valid(id)) {
    throw InvariantViolation("invalid container id " + std::to_string(id));
  }
  return nodes_[static_cast<size_t>(id)];
}

} // namespace treewm
