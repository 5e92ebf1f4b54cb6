#pragma once

#include "bus.h"
#include "container_service.h"
#include "containers.h"

namespace treewm {

// Registers the handlers of every command that changes the shape of the tree: attach, detach,
// move-within-tree, change-layout, resize, window add/remove, workspace display and focus.
// These handlers are the only code that calls ContainerTree's raw mutation functions.
void register_structural_handlers(Bus& bus, ContainerTree& tree,
                                  ContainerService& container_service);

} // namespace treewm
