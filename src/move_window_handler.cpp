#include "move_window_handler.h"

#include <spdlog/spdlog.h>

#include <magic_enum/magic_enum.hpp>

#include "units.h"

namespace treewm {

void MoveWindowHandler::throw_not_a_window(int container) const {
  throw InvariantViolation(fmt::format("cannot move container {} of kind {}", container,
                                       magic_enum::enum_name(tree_.kind(container))));
}

CommandResponse MoveWindowHandler::handle(const MoveWindowCommand& command) {
  spdlog::debug("MoveWindow: container {} {}", command.window,
                magic_enum::enum_name(command.direction));

  return std::visit(
      overloaded{
          [&](const FloatingWindow&) {
            return move_floating_window(command.window, command.direction);
          },
          [&](const TilingWindow&) {
            return move_tiling_window(command.window, command.direction);
          },
          [&](const RootContainer&) -> CommandResponse { throw_not_a_window(command.window); },
          [&](const Monitor&) -> CommandResponse { throw_not_a_window(command.window); },
          [&](const Workspace&) -> CommandResponse { throw_not_a_window(command.window); },
          [&](const SplitContainer&) -> CommandResponse { throw_not_a_window(command.window); },
      },
      tree_.data(command.window));
}

// ============================================================================
// Tiling Windows
// ============================================================================

CommandResponse MoveWindowHandler::move_tiling_window(int window, Direction direction) {
  Layout layout_for_dir = layout_for_direction(direction);
  int parent = *tree_.parent(window);
  bool parent_matches_layout = tree_.layout(parent) == layout_for_dir;
  bool has_resizable_siblings = !tree_.resizable_siblings(window).empty();

  // Attempt to move the window to the workspace in the given direction
  if (tree_.is<Workspace>(parent) && (!has_resizable_siblings || parent_matches_layout) &&
      !has_sibling_in_direction(window, direction)) {
    if (move_to_workspace_in_direction(window, direction)) {
      return CommandResponse::ok();
    }
  }

  // Find an ancestor that the window can be moved to
  std::optional<int> ancestor_with_layout;
  for (int ancestor : tree_.ancestors(window)) {
    if (tree_.layout(ancestor) == layout_for_dir) {
      ancestor_with_layout = ancestor;
      break;
    }
    if (tree_.is<Workspace>(ancestor)) {
      break;
    }
  }

  // No suitable ancestor: change the layout of the workspace
  if (!ancestor_with_layout.has_value()) {
    ancestor_with_layout = change_workspace_layout(window, layout_for_dir);
    parent_matches_layout = *tree_.parent(window) == *ancestor_with_layout;
  }

  if (parent_matches_layout && has_sibling_in_direction(window, direction)) {
    swap_sibling_containers(window, direction);
    return CommandResponse::ok();
  }

  // Move the window into the ancestor, which could simply be its direct parent
  move_into_ancestor(window, direction, *ancestor_with_layout);
  return CommandResponse::ok();
}

bool MoveWindowHandler::has_sibling_in_direction(int window, Direction direction) const {
  auto group = tree_.self_and_resizable_siblings(window);
  return is_lower_direction(direction) ? group.front() != window : group.back() != window;
}

void MoveWindowHandler::swap_sibling_containers(int window, Direction direction) {
  auto sibling = is_lower_direction(direction) ? tree_.previous_resizable_sibling(window)
                                               : tree_.next_resizable_sibling(window);
  if (!sibling.has_value()) {
    return;
  }

  if (!tree_.is<SplitContainer>(*sibling)) {
    int insert_index =
        is_lower_direction(direction) ? tree_.index(*sibling) : tree_.index(*sibling) + 1;
    spdlog::debug("Swapping window {} with sibling {}", window, *sibling);

    bus_.invoke(MoveContainerWithinTreeCommand{.container = window,
                                               .target_parent = *tree_.parent(window),
                                               .index = insert_index,
                                               .adjust_size = false});
    bus_.invoke(RedrawContainersCommand{});
    return;
  }

  move_into_split_container(window, direction, *sibling);
}

bool MoveWindowHandler::move_to_workspace_in_direction(int window, Direction direction) {
  auto monitor = monitor_service_.get_monitor_for_container(window);
  if (!monitor.has_value()) {
    throw InvariantViolation("window " + std::to_string(window) + " has no monitor");
  }

  auto workspace_in_direction = monitor_service_.get_workspace_in_direction(direction, *monitor);
  if (!workspace_in_direction.has_value()) {
    spdlog::debug("No workspace {} of monitor {}", magic_enum::enum_name(direction), *monitor);
    return false;
  }

  // Since the window is crossing monitors, adjustments might be needed because of DPI
  if (monitor_service_.has_dpi_difference(window, *workspace_in_direction)) {
    bus_.invoke(SetPendingDpiAdjustmentCommand{.window = window});
  }

  // Keep the floating placement on the monitor the window lives on
  Rect workspace_rect = container_service_.get_workspace_rect(*workspace_in_direction);
  Rect placement = translate_to_center(*tree_.floating_placement(window), workspace_rect);
  bus_.invoke(SetFloatingPlacementCommand{.window = window, .placement = placement});

  std::optional<int> index;
  if (is_lower_direction(direction)) {
    index = 0;
  }
  spdlog::debug("Moving window {} to workspace {}", window, *workspace_in_direction);
  bus_.invoke(MoveContainerWithinTreeCommand{
      .container = window, .target_parent = *workspace_in_direction, .index = index});
  bus_.invoke(RedrawContainersCommand{});

  // Refresh state of which workspace has focus
  bus_.emit(FocusChangedEvent{.container = window});
  return true;
}

int MoveWindowHandler::change_workspace_layout(int window, Layout layout) {
  auto workspace_opt = tree_.ancestor_of_type<Workspace>(window);
  if (!workspace_opt.has_value()) {
    throw InvariantViolation("window " + std::to_string(window) + " has no workspace");
  }
  int workspace = *workspace_opt;

  // The container that will share the workspace with the new split container
  int reference = window;
  while (*tree_.parent(reference) != workspace) {
    reference = *tree_.parent(reference);
  }

  auto siblings = tree_.resizable_siblings(reference);
  if (siblings.empty()) {
    spdlog::debug("Nothing to wrap around container {}", reference);
    return workspace;
  }

  spdlog::debug("Changing layout of workspace {} to {}", workspace,
                magic_enum::enum_name(layout));
  bus_.invoke(ChangeContainerLayoutCommand{.container = workspace, .layout = layout});

  // Wrap the siblings in a new split container
  auto created =
      bus_.invoke(CreateSplitContainerCommand{.layout = inverse(layout), .size_percentage = 0.5});
  int split_container = created.created_container.value();

  double increment = *tree_.size_percentage(reference) / static_cast<double>(siblings.size());
  for (auto it = siblings.rbegin(); it != siblings.rend(); ++it) {
    int sibling = *it;
    double size = *tree_.size_percentage(sibling);
    bus_.invoke(DetachContainerCommand{.child = sibling, .adjust_size = false});
    bus_.invoke(AttachContainerCommand{
        .child = sibling, .parent = split_container, .adjust_size = false});
    bus_.invoke(
        ResizeContainerCommand{.container = sibling, .size_percentage = size + increment});
  }

  bus_.invoke(ResizeContainerCommand{.container = reference, .size_percentage = 0.5});
  bus_.invoke(AttachContainerCommand{
      .child = split_container, .parent = workspace, .adjust_size = false});
  return workspace;
}

void MoveWindowHandler::move_into_ancestor(int window, Direction direction,
                                           int ancestor_with_layout) {
  // Traverse up from the window to the container whose parent is the ancestor, then insert
  // before or after that container depending on the direction
  int insertion_reference = window;
  while (*tree_.parent(insertion_reference) != ancestor_with_layout) {
    insertion_reference = *tree_.parent(insertion_reference);
  }

  auto reference_sibling = is_lower_direction(direction)
                               ? tree_.previous_resizable_sibling(insertion_reference)
                               : tree_.next_resizable_sibling(insertion_reference);

  if (!reference_sibling.has_value() || !tree_.is<SplitContainer>(*reference_sibling)) {
    int insert_index = is_lower_direction(direction) ? tree_.index(insertion_reference)
                                                     : tree_.index(insertion_reference) + 1;
    spdlog::debug("Moving window {} into ancestor {} at {}", window, ancestor_with_layout,
                  insert_index);

    bus_.invoke(MoveContainerWithinTreeCommand{
        .container = window, .target_parent = ancestor_with_layout, .index = insert_index});
    bus_.invoke(RedrawContainersCommand{});
    return;
  }

  move_into_split_container(window, direction, *reference_sibling);
}

void MoveWindowHandler::move_into_split_container(int window, Direction direction,
                                                  int split_container) {
  int target_descendant =
      container_service_.get_descendant_in_direction(split_container, inverse(direction));
  int target_parent = *tree_.parent(target_descendant);

  bool should_insert_after =
      tree_.layout(target_parent) != layout_for_direction(direction) ||
      is_lower_direction(direction);
  int insertion_index =
      should_insert_after ? tree_.index(target_descendant) + 1 : tree_.index(target_descendant);

  spdlog::debug("Moving window {} into split container {} (parent {}, index {})", window,
                split_container, target_parent, insertion_index);

  bus_.invoke(MoveContainerWithinTreeCommand{
      .container = window, .target_parent = target_parent, .index = insertion_index});
  bus_.invoke(RedrawContainersCommand{});
}

// ============================================================================
// Floating Windows
// ============================================================================

CommandResponse MoveWindowHandler::move_floating_window(int window, Direction direction) {
  auto monitor_opt = monitor_service_.get_monitor_for_container(window);
  if (!monitor_opt.has_value()) {
    throw InvariantViolation("window " + std::to_string(window) + " has no monitor");
  }
  int monitor = *monitor_opt;
  const Rect& bounds = tree_.get<Monitor>(monitor).bounds;

  auto move_amount =
      parse_unit_amount(options_provider_.options.general.floating_window_move_amount);
  int amount = resolve_to_pixels(move_amount, bounds.width);

  Rect placement = *tree_.floating_placement(window);
  switch (direction) {
  case Direction::Left:
    placement.x -= amount;
    break;
  case Direction::Right:
    placement.x += amount;
    break;
  case Direction::Up:
    placement.y -= amount;
    break;
  case Direction::Down:
    placement.y += amount;
    break;
  }

  // Keep the grabbable space at the top visible
  if (placement.y < bounds.top() &&
      !monitor_service_.get_monitor_in_direction(Direction::Up, monitor).has_value()) {
    placement.y = bounds.top();
  }

  // The direction check covers windows whose center was already dropped outside the monitor
  Point center = get_center(placement);
  bool crosses_monitor = (center.x >= bounds.right() && direction == Direction::Right) ||
                         (center.x < bounds.left() && direction == Direction::Left) ||
                         (center.y < bounds.top() && direction == Direction::Up) ||
                         (center.y >= bounds.bottom() && direction == Direction::Down);

  if (crosses_monitor) {
    auto workspace_in_direction = monitor_service_.get_workspace_in_direction(direction, monitor);
    if (!workspace_in_direction.has_value()) {
      spdlog::debug("Floating window {} stays: no workspace {} of monitor {}", window,
                    magic_enum::enum_name(direction), monitor);
      return CommandResponse::ok();
    }

    bus_.invoke(MoveContainerWithinTreeCommand{.container = window,
                                               .target_parent = *workspace_in_direction,
                                               .adjust_size = false});
    bus_.emit(FocusChangedEvent{.container = window});

    // The first reposition on the new monitor does not apply its scaling; redraw twice
    bus_.invoke(SetPendingDpiAdjustmentCommand{.window = window});
  }

  bus_.invoke(SetFloatingPlacementCommand{.window = window, .placement = placement});
  container_service_.containers_to_redraw.insert(window);
  bus_.invoke(RedrawContainersCommand{});
  return CommandResponse::ok();
}

void register_move_window_handler(Bus& bus, MoveWindowHandler& handler) {
  bus.register_command_handler<MoveWindowCommand>(
      [&handler](const MoveWindowCommand& cmd) { return handler.handle(cmd); });
}

} // namespace treewm
