#pragma once

#include <optional>
#include <vector>

#include "commands.h"
#include "containers.h"
#include "geometry.h"

namespace treewm {

// OS side of window management, implemented by the host
class NativeWindowBackend {
public:
  virtual ~NativeWindowBackend() = default;

  virtual void set_window_rect(WindowHandle handle, const Rect& rect) = 0;

  // nullopt when no window holds focus (e.g. an empty workspace is displayed)
  virtual void focus_window(std::optional<WindowHandle> handle) = 0;
};

// Matches user-defined window rules, implemented by the host
class WindowRuleRunner {
public:
  virtual ~WindowRuleRunner() = default;

  virtual void run_rules(int window, const std::vector<WindowRuleType>& rule_types) = 0;
};

} // namespace treewm
