#include "redraw.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <set>

#include "commands.h"

namespace treewm {

Rect compute_container_rect(const ContainerTree& tree, const ContainerService& container_service,
                            int container, const GapOptions& gaps) {
  if (tree.is<Workspace>(container)) {
    Rect bounds = container_service.get_workspace_rect(container);
    return Rect{bounds.x + gaps.outer, bounds.y + gaps.outer,
                std::max(0, bounds.width - 2 * gaps.outer),
                std::max(0, bounds.height - 2 * gaps.outer)};
  }

  auto parent_opt = tree.parent(container);
  if (!parent_opt.has_value() || !tree.is_resizable(container)) {
    throw InvariantViolation("container " + std::to_string(container) + " is not tiled");
  }

  Rect parent_rect = compute_container_rect(tree, container_service, *parent_opt, gaps);
  Layout layout = tree.layout(*parent_opt).value_or(Layout::Horizontal);

  double offset = 0.0;
  for (int sibling : tree.resizable_children(*parent_opt)) {
    if (sibling == container) {
      break;
    }
    offset += *tree.size_percentage(sibling);
  }
  double end = offset + *tree.size_percentage(container);

  if (layout == Layout::Horizontal) {
    int start_x = parent_rect.x + static_cast<int>(std::lround(parent_rect.width * offset));
    int end_x = parent_rect.x + static_cast<int>(std::lround(parent_rect.width * end));
    return Rect{start_x, parent_rect.y, end_x - start_x, parent_rect.height};
  }
  int start_y = parent_rect.y + static_cast<int>(std::lround(parent_rect.height * offset));
  int end_y = parent_rect.y + static_cast<int>(std::lround(parent_rect.height * end));
  return Rect{parent_rect.x, start_y, parent_rect.width, end_y - start_y};
}

Rect compute_window_rect(const ContainerTree& tree, const ContainerService& container_service,
                         int window, const GapOptions& gaps) {
  if (tree.is<FloatingWindow>(window)) {
    return tree.get<FloatingWindow>(window).floating_placement;
  }

  Rect rect = compute_container_rect(tree, container_service, window, gaps);
  int half_gap = gaps.inner / 2;
  return Rect{rect.x + half_gap, rect.y + half_gap, std::max(0, rect.width - 2 * half_gap),
              std::max(0, rect.height - 2 * half_gap)};
}

namespace {

bool is_on_displayed_workspace(const ContainerTree& tree, int window) {
  auto workspace = tree.ancestor_of_type<Workspace>(window);
  auto monitor = tree.ancestor_of_type<Monitor>(window);
  return workspace.has_value() && monitor.has_value() &&
         tree.get<Monitor>(*monitor).displayed_workspace == workspace;
}

CommandResponse redraw_containers(ContainerTree& tree, ContainerService& container_service,
                                  const GlobalOptionsProvider& options_provider,
                                  NativeWindowBackend& backend) {
  std::set<int> windows;
  for (int container : container_service.containers_to_redraw) {
    if (!tree.is_valid(container)) {
      continue;
    }
    if (tree.is_window(container)) {
      windows.insert(container);
      continue;
    }
    for (int descendant : tree.descendants(container)) {
      if (tree.is_window(descendant)) {
        windows.insert(descendant);
      }
    }
  }
  container_service.containers_to_redraw.clear();

  const GapOptions& gaps = options_provider.options.gaps;
  for (int window : windows) {
    if (!is_on_displayed_workspace(tree, window)) {
      spdlog::trace("Skipping redraw of window {} on hidden workspace", window);
      continue;
    }

    Rect rect = compute_window_rect(tree, container_service, window, gaps);
    WindowHandle handle = *tree.handle(window);
    spdlog::trace("Redraw window {} -> ({}, {}, {}x{})", handle, rect.x, rect.y, rect.width,
                  rect.height);
    backend.set_window_rect(handle, rect);

    // Reposition once more so that the scaling of the new monitor is applied
    bool pending_dpi = std::visit(
        [](const auto& c) {
          if constexpr (is_window_v<std::decay_t<decltype(c)>>) {
            return c.has_pending_dpi_adjustment;
          } else {
            return false;
          }
        },
        tree.data(window));
    if (pending_dpi) {
      backend.set_window_rect(handle, rect);
      tree.set_pending_dpi_adjustment(window, false);
    }
  }
  return CommandResponse::ok();
}

} // anonymous namespace

void register_native_handlers(Bus& bus, ContainerTree& tree, ContainerService& container_service,
                              const GlobalOptionsProvider& options_provider,
                              NativeWindowBackend& backend, WindowRuleRunner& rule_runner) {
  bus.register_command_handler<RedrawContainersCommand>(
      [&tree, &container_service, &options_provider, &backend](const RedrawContainersCommand&) {
        return redraw_containers(tree, container_service, options_provider, backend);
      });

  bus.register_command_handler<SyncNativeFocusCommand>(
      [&tree, &container_service, &backend](const SyncNativeFocusCommand&) {
        std::optional<WindowHandle> handle;
        if (auto focused = container_service.get_focused_window()) {
          handle = tree.handle(*focused);
        }
        backend.focus_window(handle);
        return CommandResponse::ok();
      });

  bus.register_command_handler<RunWindowRulesCommand>(
      [&rule_runner](const RunWindowRulesCommand& cmd) {
        rule_runner.run_rules(cmd.window, cmd.rule_types);
        return CommandResponse::ok();
      });
}

} // namespace treewm
