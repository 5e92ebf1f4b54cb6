#include "structural_handlers.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <magic_enum/magic_enum.hpp>

#include "commands.h"

namespace treewm {

namespace {

struct Context {
  Bus& bus;
  ContainerTree& tree;
  ContainerService& container_service;
};

// ============================================================================
// Internal Helpers
// ============================================================================

std::optional<int> workspace_of(const ContainerTree& tree, int container) {
  if (tree.is<Workspace>(container)) {
    return container;
  }
  return tree.ancestor_of_type<Workspace>(container);
}

// Whole workspaces are repositioned, since a structural change shifts every sibling
void queue_redraw(Context& ctx, int container) {
  if (auto workspace = workspace_of(ctx.tree, container)) {
    ctx.container_service.containers_to_redraw.insert(*workspace);
  }
}

// Gives a freshly inserted Resizable child 1/(n+1) and scales its siblings into the rest
void size_new_child(ContainerTree& tree, int child) {
  if (!tree.is_resizable(child)) {
    return;
  }

  auto siblings = tree.resizable_siblings(child);
  if (siblings.empty()) {
    tree.set_size_percentage(child, 1.0);
    return;
  }

  double default_size = 1.0 / static_cast<double>(siblings.size() + 1);
  double available = 1.0 - default_size;

  double total = 0.0;
  for (int sibling : siblings) {
    total += *tree.size_percentage(sibling);
  }

  for (int sibling : siblings) {
    double share = total > 0.0 ? *tree.size_percentage(sibling) / total * available
                               : available / static_cast<double>(siblings.size());
    tree.set_size_percentage(sibling, share);
  }
  tree.set_size_percentage(child, default_size);
}

// Spreads the share of a removed child evenly over the remaining Resizable children
void release_share(ContainerTree& tree, int parent, double share) {
  auto remaining = tree.resizable_children(parent);
  if (remaining.empty()) {
    return;
  }
  double increment = share / static_cast<double>(remaining.size());
  for (int child : remaining) {
    tree.set_size_percentage(child, *tree.size_percentage(child) + increment);
  }
}

// Removes an emptied split container, or replaces a split container holding a single
// Resizable child by that child
void collapse_if_needed(Context& ctx, int container) {
  if (!ctx.tree.is<SplitContainer>(container) || !ctx.tree.parent(container).has_value()) {
    return;
  }

  const auto& children = ctx.tree.children(container);
  if (children.empty()) {
    spdlog::debug("Removing empty split container {}", container);
    ctx.bus.invoke(DetachContainerCommand{.child = container, .adjust_size = true});
    ctx.tree.destroy(container);
    return;
  }

  if (children.size() == 1 && ctx.tree.is_resizable(children.front())) {
    int only_child = children.front();
    double size = *ctx.tree.size_percentage(container);
    spdlog::debug("Flattening split container {} into child {}", container, only_child);
    ctx.tree.replace_child(container, only_child);
    ctx.tree.set_size_percentage(only_child, size);
    ctx.tree.destroy(container);
  }
}

void check_parent_kind(const ContainerTree& tree, int child, int parent) {
  ContainerKind child_kind = tree.kind(child);
  ContainerKind parent_kind = tree.kind(parent);

  bool allowed = false;
  switch (child_kind) {
  case ContainerKind::Root:
    allowed = false;
    break;
  case ContainerKind::Monitor:
    allowed = parent_kind == ContainerKind::Root;
    break;
  case ContainerKind::Workspace:
    allowed = parent_kind == ContainerKind::Monitor;
    break;
  case ContainerKind::SplitContainer:
  case ContainerKind::TilingWindow:
    allowed = parent_kind == ContainerKind::Workspace ||
              parent_kind == ContainerKind::SplitContainer;
    break;
  // Floating windows take no share, so a split cannot hold them
  case ContainerKind::FloatingWindow:
    allowed = parent_kind == ContainerKind::Workspace;
    break;
  }

  if (!allowed) {
    throw InvariantViolation(fmt::format("{} {} cannot be a child of {} {}",
                                         magic_enum::enum_name(child_kind), child,
                                         magic_enum::enum_name(parent_kind), parent));
  }
}

// ============================================================================
// Handlers
// ============================================================================

CommandResponse attach_container(Context& ctx, const AttachContainerCommand& cmd) {
  check_parent_kind(ctx.tree, cmd.child, cmd.parent);

  ctx.tree.insert_child(cmd.parent, cmd.child, cmd.index);
  if (cmd.adjust_size) {
    size_new_child(ctx.tree, cmd.child);
  }
  queue_redraw(ctx, cmd.parent);
  return CommandResponse::ok();
}

CommandResponse detach_container(Context& ctx, const DetachContainerCommand& cmd) {
  auto parent_opt = ctx.tree.parent(cmd.child);
  if (!parent_opt.has_value()) {
    throw InvariantViolation("container " + std::to_string(cmd.child) + " is not attached");
  }
  int parent = *parent_opt;

  bool resizable = ctx.tree.is_resizable(cmd.child);
  double share = ctx.tree.size_percentage(cmd.child).value_or(0.0);

  queue_redraw(ctx, parent);
  ctx.tree.remove_child(cmd.child);
  if (cmd.adjust_size && resizable) {
    release_share(ctx.tree, parent, share);
  }
  collapse_if_needed(ctx, parent);
  return CommandResponse::ok();
}

CommandResponse move_container_within_tree(Context& ctx,
                                           const MoveContainerWithinTreeCommand& cmd) {
  auto old_parent_opt = ctx.tree.parent(cmd.container);
  if (!old_parent_opt.has_value()) {
    throw InvariantViolation("container " + std::to_string(cmd.container) + " is not attached");
  }
  int old_parent = *old_parent_opt;

  const auto& old_focus_order = ctx.tree.child_focus_order(old_parent);
  size_t focus_position = static_cast<size_t>(
      std::find(old_focus_order.begin(), old_focus_order.end(), cmd.container) -
      old_focus_order.begin());

  // Same parent: plain reorder, sizes untouched
  if (old_parent == cmd.target_parent) {
    int current_index = ctx.tree.index(cmd.container);
    int target_index =
        cmd.index.value_or(static_cast<int>(ctx.tree.children(cmd.target_parent).size()));
    if (current_index < target_index) {
      --target_index;
    }

    ctx.tree.remove_child(cmd.container);
    ctx.tree.insert_child(cmd.target_parent, cmd.container, target_index);
    ctx.tree.set_focus_position(cmd.container, focus_position);
    queue_redraw(ctx, cmd.target_parent);
    return CommandResponse::ok();
  }

  check_parent_kind(ctx.tree, cmd.container, cmd.target_parent);

  bool resizable = ctx.tree.is_resizable(cmd.container);
  double share = ctx.tree.size_percentage(cmd.container).value_or(0.0);
  bool had_focus = focus_position == 0;

  queue_redraw(ctx, old_parent);

  // Insert before cleaning up the old parent so that `cmd.index` stays meaningful
  ctx.tree.remove_child(cmd.container);
  ctx.tree.insert_child(cmd.target_parent, cmd.container, cmd.index);
  if (cmd.adjust_size) {
    size_new_child(ctx.tree, cmd.container);
    if (resizable) {
      release_share(ctx.tree, old_parent, share);
    }
  }

  if (had_focus) {
    ctx.tree.focus_path(cmd.container);
  }

  queue_redraw(ctx, cmd.target_parent);
  collapse_if_needed(ctx, old_parent);
  return CommandResponse::ok();
}

CommandResponse change_container_layout(Context& ctx, const ChangeContainerLayoutCommand& cmd) {
  ctx.tree.set_layout(cmd.container, cmd.layout);
  queue_redraw(ctx, cmd.container);
  return CommandResponse::ok();
}

CommandResponse resize_container(Context& ctx, const ResizeContainerCommand& cmd) {
  ctx.tree.set_size_percentage(cmd.container, cmd.size_percentage);
  queue_redraw(ctx, cmd.container);
  return CommandResponse::ok();
}

CommandResponse create_split_container(Context& ctx, const CreateSplitContainerCommand& cmd) {
  int split_container = ctx.tree.create(
      SplitContainer{.layout = cmd.layout, .size_percentage = cmd.size_percentage});
  return CommandResponse::created(split_container);
}

CommandResponse set_floating_placement(Context& ctx, const SetFloatingPlacementCommand& cmd) {
  ctx.tree.set_floating_placement(cmd.window, cmd.placement);
  return CommandResponse::ok();
}

CommandResponse set_pending_dpi_adjustment(Context& ctx,
                                           const SetPendingDpiAdjustmentCommand& cmd) {
  ctx.tree.set_pending_dpi_adjustment(cmd.window, cmd.pending);
  return CommandResponse::ok();
}

CommandResponse add_window(Context& ctx, const AddWindowCommand& cmd) {
  if (ctx.container_service.find_window_by_handle(cmd.handle).has_value()) {
    return CommandResponse::fail("window " + std::to_string(cmd.handle) + " is already managed");
  }

  int window = cmd.floating
                   ? ctx.tree.create(FloatingWindow{.handle = cmd.handle,
                                                    .floating_placement = cmd.placement})
                   : ctx.tree.create(TilingWindow{.handle = cmd.handle,
                                                  .floating_placement = cmd.placement});
  spdlog::debug("Adding {} window {} as container {}", cmd.floating ? "floating" : "tiling",
                cmd.handle, window);

  int parent = cmd.parent;
  if (cmd.floating && ctx.tree.is<SplitContainer>(parent)) {
    auto workspace = workspace_of(ctx.tree, parent);
    if (!workspace.has_value()) {
      throw InvariantViolation("split container " + std::to_string(parent) +
                               " has no workspace");
    }
    parent = *workspace;
  }

  ctx.bus.invoke(AttachContainerCommand{.child = window, .parent = parent});
  ctx.bus.invoke(SetFocusedDescendantCommand{.container = window});
  return CommandResponse::created(window);
}

CommandResponse remove_window(Context& ctx, const RemoveWindowCommand& cmd) {
  if (!ctx.tree.is_window(cmd.window)) {
    throw InvariantViolation("container " + std::to_string(cmd.window) + " is not a window");
  }

  spdlog::debug("Removing window container {}", cmd.window);
  if (ctx.tree.parent(cmd.window).has_value()) {
    ctx.bus.invoke(DetachContainerCommand{.child = cmd.window});
  }
  ctx.container_service.containers_to_redraw.erase(cmd.window);
  ctx.tree.destroy(cmd.window);
  return CommandResponse::ok();
}

CommandResponse display_workspace(Context& ctx, const DisplayWorkspaceCommand& cmd) {
  auto monitor = ctx.tree.parent(cmd.workspace);
  if (!monitor.has_value()) {
    throw InvariantViolation("workspace " + std::to_string(cmd.workspace) + " is not attached");
  }
  ctx.tree.set_displayed_workspace(*monitor, cmd.workspace);
  queue_redraw(ctx, cmd.workspace);
  return CommandResponse::ok();
}

CommandResponse set_focused_descendant(Context& ctx, const SetFocusedDescendantCommand& cmd) {
  ctx.tree.focus_path(cmd.container);
  return CommandResponse::ok();
}

} // anonymous namespace

void register_structural_handlers(Bus& bus, ContainerTree& tree,
                                  ContainerService& container_service) {
  Context ctx{bus, tree, container_service};

  bus.register_command_handler<AttachContainerCommand>(
      [ctx](const AttachContainerCommand& cmd) mutable { return attach_container(ctx, cmd); });
  bus.register_command_handler<DetachContainerCommand>(
      [ctx](const DetachContainerCommand& cmd) mutable { return detach_container(ctx, cmd); });
  bus.register_command_handler<MoveContainerWithinTreeCommand>(
      [ctx](const MoveContainerWithinTreeCommand& cmd) mutable {
        return move_container_within_tree(ctx, cmd);
      });
  bus.register_command_handler<ChangeContainerLayoutCommand>(
      [ctx](const ChangeContainerLayoutCommand& cmd) mutable {
        return change_container_layout(ctx, cmd);
      });
  bus.register_command_handler<ResizeContainerCommand>(
      [ctx](const ResizeContainerCommand& cmd) mutable { return resize_container(ctx, cmd); });
  bus.register_command_handler<CreateSplitContainerCommand>(
      [ctx](const CreateSplitContainerCommand& cmd) mutable {
        return create_split_container(ctx, cmd);
      });
  bus.register_command_handler<SetFloatingPlacementCommand>(
      [ctx](const SetFloatingPlacementCommand& cmd) mutable {
        return set_floating_placement(ctx, cmd);
      });
  bus.register_command_handler<SetPendingDpiAdjustmentCommand>(
      [ctx](const SetPendingDpiAdjustmentCommand& cmd) mutable {
        return set_pending_dpi_adjustment(ctx, cmd);
      });
  bus.register_command_handler<AddWindowCommand>(
      [ctx](const AddWindowCommand& cmd) mutable { return add_window(ctx, cmd); });
  bus.register_command_handler<RemoveWindowCommand>(
      [ctx](const RemoveWindowCommand& cmd) mutable { return remove_window(ctx, cmd); });
  bus.register_command_handler<DisplayWorkspaceCommand>(
      [ctx](const DisplayWorkspaceCommand& cmd) mutable { return display_workspace(ctx, cmd); });
  bus.register_command_handler<SetFocusedDescendantCommand>(
      [ctx](const SetFocusedDescendantCommand& cmd) mutable {
        return set_focused_descendant(ctx, cmd);
      });
}

} // namespace treewm
