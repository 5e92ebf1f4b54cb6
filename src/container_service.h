#pragma once

#include <optional>
#include <set>
#include <vector>

#include "containers.h"
#include "geometry.h"

namespace treewm {

// Read-side queries over the container tree, plus the queue of containers awaiting a redraw
class ContainerService {
public:
  explicit ContainerService(const ContainerTree& tree) : tree_(tree) {
  }

  // Innermost edge node of the subtree rooted at `container`: descends into the first Resizable
  // child for Up/Left and the last one for Down/Right until a leaf is reached
  [[nodiscard]] int get_descendant_in_direction(int container, Direction direction) const;

  // All tiling and floating windows, depth-first
  [[nodiscard]] std::vector<int> get_windows() const;

  [[nodiscard]] std::optional<int> find_window_by_handle(WindowHandle handle) const;

  // Follows the focus order from the root down to a window, entering each monitor through its
  // displayed workspace
  [[nodiscard]] std::optional<int> get_focused_window() const;

  // Rectangle a workspace tiles into (the bounds of its monitor)
  [[nodiscard]] Rect get_workspace_rect(int workspace) const;

  // Containers that need repositioning on the next RedrawContainersCommand
  std::set<int> containers_to_redraw;

private:
  const ContainerTree& tree_;
};

} // namespace treewm
