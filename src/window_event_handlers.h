#pragma once

#include "bus.h"
#include "container_service.h"

namespace treewm {

// Subscribes to the OS notifications: WindowTitleChangedEvent re-runs title rules,
// WindowDestroyedEvent removes the window. Handles that are not tracked are ignored.
void register_window_event_handlers(Bus& bus, const ContainerService& container_service);

} // namespace treewm
