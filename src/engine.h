#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "bus.h"
#include "collaborators.h"
#include "commands.h"
#include "container_service.h"
#include "containers.h"
#include "monitor_service.h"
#include "move_window_handler.h"
#include "options.h"

namespace treewm {

// Owns the container tree and every component that reads or mutates it. Handlers hold
// references into the engine, so it is neither copyable nor movable.
// All members are public for easy access
struct Engine {
  GlobalOptionsProvider options_provider;
  ContainerTree tree;
  Bus bus;
  ContainerService container_service;
  MonitorService monitor_service;
  MoveWindowHandler move_window_handler;

  Engine(NativeWindowBackend& backend, WindowRuleRunner& rule_runner,
         std::optional<std::filesystem::path> config_path = std::nullopt);

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  // Registers a display. Monitors are attached to the root in registration order.
  int add_monitor(std::string name, const Rect& bounds, float scale_factor = 1.0f);

  // The first workspace of a monitor becomes its displayed workspace
  int add_workspace(int monitor, std::string name, Layout layout = Layout::Horizontal);

  // Returns nullopt if the handle is already managed
  [[nodiscard]] std::optional<int> add_window(WindowHandle handle, int parent,
                                              bool floating = false, const Rect& placement = {});

  CommandResponse move_window(int window, Direction direction);

  // Reloads the config file if it changed and applies its log level
  bool refresh_options();
};

} // namespace treewm
