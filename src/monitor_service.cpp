#include "monitor_service.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <magic_enum/magic_enum.hpp>

namespace treewm {

namespace {

bool overlaps(int a_start, int a_end, int b_start, int b_end) {
  return a_start < b_end && b_start < a_end;
}

} // namespace

std::vector<int> MonitorService::get_monitors() const {
  std::vector<int> monitors = tree_.monitors();
  std::stable_sort(monitors.begin(), monitors.end(), [&](int a, int b) {
    const Rect& ra = tree_.get<Monitor>(a).bounds;
    const Rect& rb = tree_.get<Monitor>(b).bounds;
    if (ra.x != rb.x) {
      return ra.x < rb.x;
    }
    return ra.y < rb.y;
  });
  return monitors;
}

std::optional<int> MonitorService::get_monitor_in_direction(Direction direction,
                                                            int origin) const {
  const Rect& from = tree_.get<Monitor>(origin).bounds;

  std::optional<int> best;
  int best_gap = std::numeric_limits<int>::max();
  int best_offset = std::numeric_limits<int>::max();

  for (int candidate : get_monitors()) {
    if (candidate == origin) {
      continue;
    }
    const Rect& to = tree_.get<Monitor>(candidate).bounds;

    int gap = 0;
    bool aligned = false;
    switch (direction) {
    case Direction::Left:
      gap = from.left() - to.right();
      aligned = overlaps(from.top(), from.bottom(), to.top(), to.bottom());
      break;
    case Direction::Right:
      gap = to.left() - from.right();
      aligned = overlaps(from.top(), from.bottom(), to.top(), to.bottom());
      break;
    case Direction::Up:
      gap = from.top() - to.bottom();
      aligned = overlaps(from.left(), from.right(), to.left(), to.right());
      break;
    case Direction::Down:
      gap = to.top() - from.bottom();
      aligned = overlaps(from.left(), from.right(), to.left(), to.right());
      break;
    }

    if (gap < 0 || !aligned) {
      continue;
    }

    // Prefer the closest monitor, then the one whose start lines up best with the origin
    int offset = layout_for_direction(direction) == Layout::Horizontal
                     ? std::abs(to.top() - from.top())
                     : std::abs(to.left() - from.left());
    if (gap < best_gap || (gap == best_gap && offset < best_offset)) {
      best = candidate;
      best_gap = gap;
      best_offset = offset;
    }
  }

  if (!best.has_value()) {
    spdlog::debug("No monitor {} of monitor {}", magic_enum::enum_name(direction), origin);
  }
  return best;
}

std::optional<int> MonitorService::get_monitor_for_container(int container) const {
  if (tree_.is<Monitor>(container)) {
    return container;
  }
  return tree_.ancestor_of_type<Monitor>(container);
}

std::optional<int> MonitorService::get_workspace_in_direction(Direction direction,
                                                              int origin) const {
  auto monitor = get_monitor_in_direction(direction, origin);
  if (!monitor.has_value()) {
    return std::nullopt;
  }
  return tree_.get<Monitor>(*monitor).displayed_workspace;
}

bool MonitorService::has_dpi_difference(int container, int target_workspace) const {
  auto source_monitor = get_monitor_for_container(container);
  auto target_monitor = get_monitor_for_container(target_workspace);
  if (!source_monitor.has_value() || !target_monitor.has_value()) {
    return false;
  }
  return tree_.get<Monitor>(*source_monitor).scale_factor !=
         tree_.get<Monitor>(*target_monitor).scale_factor;
}

} // namespace treewm
