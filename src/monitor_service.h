#pragma once

#include <optional>
#include <vector>

#include "containers.h"
#include "geometry.h"

namespace treewm {

class MonitorService {
public:
  explicit MonitorService(const ContainerTree& tree) : tree_(tree) {
  }

  // Monitors sorted left to right, then top to bottom
  [[nodiscard]] std::vector<int> get_monitors() const;

  // Nearest monitor strictly on the `direction` side of `origin` that overlaps it on the
  // perpendicular axis. Returns nullopt when `origin` is the outermost monitor that way.
  [[nodiscard]] std::optional<int> get_monitor_in_direction(Direction direction,
                                                            int origin) const;

  // Monitor the container lives on (the container itself when it is a monitor)
  [[nodiscard]] std::optional<int> get_monitor_for_container(int container) const;

  // Displayed workspace of the monitor next to `origin`, if any
  [[nodiscard]] std::optional<int> get_workspace_in_direction(Direction direction,
                                                              int origin) const;

  // True when the container's monitor and the target workspace's monitor scale differently
  [[nodiscard]] bool has_dpi_difference(int container, int target_workspace) const;

private:
  const ContainerTree& tree_;
};

} // namespace treewm
