#include "window_event_handlers.h"

#include <spdlog/spdlog.h>

#include "commands.h"

namespace treewm {

void register_window_event_handlers(Bus& bus, const ContainerService& container_service) {
  bus.subscribe<WindowTitleChangedEvent>(
      [&bus, &container_service](const WindowTitleChangedEvent& event) {
        auto window = container_service.find_window_by_handle(event.handle);
        if (!window.has_value()) {
          spdlog::debug("Title changed for untracked window {}", event.handle);
          return;
        }

        bus.invoke(RunWindowRulesCommand{
            .window = *window,
            .rule_types = {WindowRuleType::FirstTitleChanged, WindowRuleType::TitleChanged}});
        bus.invoke(RedrawContainersCommand{});
        bus.invoke(SyncNativeFocusCommand{});
      });

  bus.subscribe<WindowDestroyedEvent>(
      [&bus, &container_service](const WindowDestroyedEvent& event) {
        auto window = container_service.find_window_by_handle(event.handle);
        if (!window.has_value()) {
          spdlog::debug("Destroyed window {} was not tracked", event.handle);
          return;
        }

        bus.invoke(RemoveWindowCommand{.window = *window});
        bus.invoke(RedrawContainersCommand{});
        bus.invoke(SyncNativeFocusCommand{});
      });
}

} // namespace treewm
