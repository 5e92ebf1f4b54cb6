#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "containers.h"
#include "geometry.h"

namespace treewm {

// ============================================================================
// Structural Commands
// ============================================================================

// Inserts a detached container into `parent` (appended when index is empty).
// With adjust_size a Resizable child takes 1/(n+1) and its siblings shrink proportionally.
struct AttachContainerCommand {
  static constexpr std::string_view kName = "AttachContainer";
  int child;
  int parent;
  std::optional<int> index;
  bool adjust_size = true;
};

// Unlinks a container from its parent. The container stays alive and detached.
// An emptied split container is destroyed, a split left with a single child is flattened.
struct DetachContainerCommand {
  static constexpr std::string_view kName = "DetachContainer";
  int child;
  bool adjust_size = true;
};

// Re-parents (or reorders, when the parent does not change) a container.
// `index` refers to the target's children before the container is removed.
struct MoveContainerWithinTreeCommand {
  static constexpr std::string_view kName = "MoveContainerWithinTree";
  int container;
  int target_parent;
  std::optional<int> index;
  bool adjust_size = true;
};

struct ChangeContainerLayoutCommand {
  static constexpr std::string_view kName = "ChangeContainerLayout";
  int container;
  Layout layout;
};

// Sets the share of a Resizable container without touching its siblings
struct ResizeContainerCommand {
  static constexpr std::string_view kName = "ResizeContainer";
  int container;
  double size_percentage;
};

// Creates a detached split container; the response carries its id
struct CreateSplitContainerCommand {
  static constexpr std::string_view kName = "CreateSplitContainer";
  Layout layout;
  double size_percentage = 1.0;
};

// Registers a native window as a new leaf of `parent`. A floating window
// given a split container as parent lands in that split's workspace
struct AddWindowCommand {
  static constexpr std::string_view kName = "AddWindow";
  WindowHandle handle;
  int parent;
  bool floating = false;
  Rect placement;
};

struct RemoveWindowCommand {
  static constexpr std::string_view kName = "RemoveWindow";
  int window;
};

// Makes a workspace the displayed one of its monitor
struct DisplayWorkspaceCommand {
  static constexpr std::string_view kName = "DisplayWorkspace";
  int workspace;
};

// Moves `container` to the front of every focus order up to the root
struct SetFocusedDescendantCommand {
  static constexpr std::string_view kName = "SetFocusedDescendant";
  int container;
};

// ============================================================================
// Window Commands
// ============================================================================

struct SetFloatingPlacementCommand {
  static constexpr std::string_view kName = "SetFloatingPlacement";
  int window;
  Rect placement;
};

// Requests a second reposition on the next redraw to settle DPI scaling
struct SetPendingDpiAdjustmentCommand {
  static constexpr std::string_view kName = "SetPendingDpiAdjustment";
  int window;
  bool pending = true;
};

struct MoveWindowCommand {
  static constexpr std::string_view kName = "MoveWindow";
  int window;
  Direction direction;
};

enum class WindowRuleType { Manage, FirstTitleChanged, TitleChanged };

// Handled by the host's rule matcher
struct RunWindowRulesCommand {
  static constexpr std::string_view kName = "RunWindowRules";
  int window;
  std::vector<WindowRuleType> rule_types;
};

// Repositions every container queued in ContainerService::containers_to_redraw
struct RedrawContainersCommand {
  static constexpr std::string_view kName = "RedrawContainers";
};

struct SyncNativeFocusCommand {
  static constexpr std::string_view kName = "SyncNativeFocus";
};

// ============================================================================
// Events
// ============================================================================

struct FocusChangedEvent {
  static constexpr std::string_view kName = "FocusChanged";
  int container;
};

// Inbound notifications from the OS event collaborator

struct WindowTitleChangedEvent {
  static constexpr std::string_view kName = "WindowTitleChanged";
  WindowHandle handle;
};

struct WindowDestroyedEvent {
  static constexpr std::string_view kName = "WindowDestroyed";
  WindowHandle handle;
};

} // namespace treewm
