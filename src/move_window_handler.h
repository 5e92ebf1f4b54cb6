#pragma once

#include "bus.h"
#include "commands.h"
#include "container_service.h"
#include "containers.h"
#include "monitor_service.h"
#include "options.h"

namespace treewm {

// Moves a window one step in a direction. Tiling windows swap with a sibling, descend into
// an adjacent split container, move up into an ancestor with a matching layout, or cross to
// the monitor next door; the workspace is restructured when no ancestor matches. Floating
// windows shift by the configured move amount and change workspace when their center leaves
// the monitor.
class MoveWindowHandler {
public:
  MoveWindowHandler(Bus& bus, const ContainerTree& tree, ContainerService& container_service,
                    const MonitorService& monitor_service,
                    const GlobalOptionsProvider& options_provider)
      : bus_(bus), tree_(tree), container_service_(container_service),
        monitor_service_(monitor_service), options_provider_(options_provider) {
  }

  CommandResponse handle(const MoveWindowCommand& command);

private:
  Bus& bus_;
  const ContainerTree& tree_;
  ContainerService& container_service_;
  const MonitorService& monitor_service_;
  const GlobalOptionsProvider& options_provider_;

  [[noreturn]] void throw_not_a_window(int container) const;

  CommandResponse move_tiling_window(int window, Direction direction);
  CommandResponse move_floating_window(int window, Direction direction);

  // Whether a Resizable sibling lies between the window and the edge of its parent
  [[nodiscard]] bool has_sibling_in_direction(int window, Direction direction) const;

  void swap_sibling_containers(int window, Direction direction);

  // Returns true when the window landed on another monitor
  bool move_to_workspace_in_direction(int window, Direction direction);

  // Switches the workspace to `layout` and wraps the window's siblings in a split container
  // of the inverse layout. Returns the workspace.
  int change_workspace_layout(int window, Layout layout);

  void move_into_ancestor(int window, Direction direction, int ancestor_with_layout);

  // Moves the window next to the edge leaf of `split_container` that faces it
  void move_into_split_container(int window, Direction direction, int split_container);
};

void register_move_window_handler(Bus& bus, MoveWindowHandler& handler);

} // namespace treewm
