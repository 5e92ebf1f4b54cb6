#pragma once

#include "bus.h"
#include "collaborators.h"
#include "container_service.h"
#include "containers.h"
#include "options.h"

namespace treewm {

// Screen rectangle of a workspace, split container or tiling window, derived from the monitor
// bounds and the size percentages along each layout axis. The workspace is inset by the outer
// gap.
[[nodiscard]] Rect compute_container_rect(const ContainerTree& tree,
                                          const ContainerService& container_service,
                                          int container, const GapOptions& gaps);

// Final rectangle of a window: tiling windows are inset by half the inner gap on every side,
// floating windows use their floating placement
[[nodiscard]] Rect compute_window_rect(const ContainerTree& tree,
                                       const ContainerService& container_service, int window,
                                       const GapOptions& gaps);

// Registers RedrawContainersCommand, SyncNativeFocusCommand and RunWindowRulesCommand, which
// forward to the host's collaborators
void register_native_handlers(Bus& bus, ContainerTree& tree,
                              ContainerService& container_service,
                              const GlobalOptionsProvider& options_provider,
                              NativeWindowBackend& backend, WindowRuleRunner& rule_runner);

} // namespace treewm
