#include "container_service.h"

namespace treewm {

int ContainerService::get_descendant_in_direction(int container, Direction direction) const {
  int current = container;
  while (true) {
    auto candidates = tree_.resizable_children(current);
    if (candidates.empty()) {
      return current;
    }
    current = is_lower_direction(direction) ? candidates.front() : candidates.back();
  }
}

std::vector<int> ContainerService::get_windows() const {
  std::vector<int> windows;
  for (int id : tree_.descendants(tree_.root())) {
    if (tree_.is_window(id)) {
      windows.push_back(id);
    }
  }
  return windows;
}

std::optional<int> ContainerService::find_window_by_handle(WindowHandle handle) const {
  for (int window : get_windows()) {
    if (tree_.handle(window) == handle) {
      return window;
    }
  }
  return std::nullopt;
}

std::optional<int> ContainerService::get_focused_window() const {
  int current = tree_.root();
  while (!tree_.is_window(current)) {
    // Windows on hidden workspaces never hold focus
    if (tree_.is<Monitor>(current)) {
      auto displayed = tree_.get<Monitor>(current).displayed_workspace;
      if (!displayed.has_value()) {
        return std::nullopt;
      }
      current = *displayed;
      continue;
    }
    const auto& order = tree_.child_focus_order(current);
    if (order.empty()) {
      return std::nullopt;
    }
    current = order.front();
  }
  return current;
}

Rect ContainerService::get_workspace_rect(int workspace) const {
  auto parent_opt = tree_.parent(workspace);
  if (!parent_opt.has_value()) {
    throw InvariantViolation("workspace " + std::to_string(workspace) + " has no monitor");
  }
  return tree_.get<Monitor>(*parent_opt).bounds;
}

} // namespace treewm
