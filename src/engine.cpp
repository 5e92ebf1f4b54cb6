#include "engine.h"

#include <spdlog/spdlog.h>

#include "redraw.h"
#include "structural_handlers.h"
#include "version.h"
#include "window_event_handlers.h"

namespace treewm {

Engine::Engine(NativeWindowBackend& backend, WindowRuleRunner& rule_runner,
               std::optional<std::filesystem::path> config_path)
    : options_provider(std::move(config_path)), container_service(tree), monitor_service(tree),
      move_window_handler(bus, tree, container_service, monitor_service, options_provider) {
  apply_log_level(options_provider.options.logging.level);
  spdlog::debug("treewm v{}", kVersion);

  register_structural_handlers(bus, tree, container_service);
  register_move_window_handler(bus, move_window_handler);
  register_native_handlers(bus, tree, container_service, options_provider, backend, rule_runner);
  register_window_event_handlers(bus, container_service);
}

int Engine::add_monitor(std::string name, const Rect& bounds, float scale_factor) {
  int monitor = tree.create(
      Monitor{.name = std::move(name), .bounds = bounds, .scale_factor = scale_factor});
  bus.invoke(AttachContainerCommand{.child = monitor, .parent = tree.root()});
  return monitor;
}

int Engine::add_workspace(int monitor, std::string name, Layout layout) {
  int workspace = tree.create(Workspace{.name = std::move(name), .layout = layout});
  bus.invoke(AttachContainerCommand{.child = workspace, .parent = monitor});
  if (!tree.get<Monitor>(monitor).displayed_workspace.has_value()) {
    bus.invoke(DisplayWorkspaceCommand{.workspace = workspace});
  }
  return workspace;
}

std::optional<int> Engine::add_window(WindowHandle handle, int parent, bool floating,
                                      const Rect& placement) {
  auto response = bus.invoke(AddWindowCommand{
      .handle = handle, .parent = parent, .floating = floating, .placement = placement});
  return response.created_container;
}

CommandResponse Engine::move_window(int window, Direction direction) {
  return bus.invoke(MoveWindowCommand{.window = window, .direction = direction});
}

bool Engine::refresh_options() {
  if (!options_provider.refresh()) {
    return false;
  }
  apply_log_level(options_provider.options.logging.level);
  return true;
}

} // namespace treewm
