#pragma once

#include <spdlog/spdlog.h>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "errors.h"

namespace treewm {

struct CommandResponse {
  bool success = true;
  std::string error;                      // Set if success == false
  std::optional<int> created_container;   // Set by commands that create a container

  static CommandResponse ok() {
    return CommandResponse{};
  }

  static CommandResponse created(int container) {
    return CommandResponse{true, "", container};
  }

  static CommandResponse fail(std::string error) {
    return CommandResponse{false, std::move(error), std::nullopt};
  }
};

// Synchronous command/event dispatch. Commands have exactly one handler and return a
// response; events fan out to every subscriber in subscription order. Nested invokes run to
// completion before the outer handler resumes.
//
// Commands and events are plain structs exposing `static constexpr std::string_view kName`.
class Bus {
public:
  Bus() = default;

  // Handlers capture references to the bus
  Bus(const Bus&) = delete;
  Bus& operator=(const Bus&) = delete;

  template <typename TCommand>
  void register_command_handler(std::function<CommandResponse(const TCommand&)> handler) {
    auto [it, inserted] = command_handlers_.try_emplace(
        std::type_index(typeid(TCommand)),
        [handler = std::move(handler)](const void* command) {
          return handler(*static_cast<const TCommand*>(command));
        });
    if (!inserted) {
      throw InvariantViolation("duplicate handler for command " + std::string(TCommand::kName));
    }
  }

  template <typename TEvent>
  void subscribe(std::function<void(const TEvent&)> handler) {
    event_handlers_[std::type_index(typeid(TEvent))].push_back(
        [handler = std::move(handler)](const void* event) {
          handler(*static_cast<const TEvent*>(event));
        });
  }

  // Throws InvariantViolation if no handler is registered for TCommand
  template <typename TCommand>
  CommandResponse invoke(const TCommand& command) {
    auto it = command_handlers_.find(std::type_index(typeid(TCommand)));
    if (it == command_handlers_.end()) {
      throw InvariantViolation("no handler registered for command " +
                               std::string(TCommand::kName));
    }

    spdlog::trace("[bus] {}invoke {}", indent(), TCommand::kName);
    DepthGuard guard(depth_);
    CommandResponse response = it->second(&command);
    if (!response.success) {
      spdlog::warn("[bus] {} failed: {}", TCommand::kName, response.error);
    }
    return response;
  }

  // Subscriber failures are logged and do not stop delivery, except InvariantViolation which
  // propagates
  template <typename TEvent>
  void emit(const TEvent& event) {
    auto it = event_handlers_.find(std::type_index(typeid(TEvent)));
    if (it == event_handlers_.end()) {
      spdlog::trace("[bus] {}emit {} (no subscribers)", indent(), TEvent::kName);
      return;
    }

    spdlog::trace("[bus] {}emit {} to {} subscriber(s)", indent(), TEvent::kName,
                  it->second.size());
    DepthGuard guard(depth_);

    // Copy so that subscribing from within a handler does not invalidate iteration
    auto subscribers = it->second;
    for (size_t i = 0; i < subscribers.size(); ++i) {
      try {
        subscribers[i](&event);
      } catch (const InvariantViolation&) {
        throw;
      } catch (const std::exception& e) {
        spdlog::error("[bus] subscriber {} of {} failed: {}", i, TEvent::kName, e.what());
      }
    }
  }

  // Current nesting of invoke/emit calls
  [[nodiscard]] int depth() const {
    return depth_;
  }

  template <typename TCommand>
  [[nodiscard]] bool has_handler() const {
    return command_handlers_.contains(std::type_index(typeid(TCommand)));
  }

private:
  struct DepthGuard {
    int& depth;
    explicit DepthGuard(int& d) : depth(d) {
      ++depth;
    }
    ~DepthGuard() {
      --depth;
    }
  };

  [[nodiscard]] std::string indent() const {
    return std::string(static_cast<size_t>(depth_) * 2, ' ');
  }

  using ErasedCommandHandler = std::function<CommandResponse(const void*)>;
  using ErasedEventHandler = std::function<void(const void*)>;

  std::unordered_map<std::type_index, ErasedCommandHandler> command_handlers_;
  std::unordered_map<std::type_index, std::vector<ErasedEventHandler>> event_handlers_;
  int depth_ = 0;
};

} // namespace treewm
