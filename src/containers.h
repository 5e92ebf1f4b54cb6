#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "errors.h"
#include "geometry.h"

namespace treewm {

// Native window handle as delivered by the OS event collaborator
using WindowHandle = std::uintptr_t;

// ============================================================================
// Container Variants
// ============================================================================

// Single root of the tree, parent of all monitors
struct RootContainer {};

struct Monitor {
  std::string name;
  Rect bounds;
  float scale_factor = 1.0f;
  std::optional<int> displayed_workspace;
};

struct Workspace {
  std::string name;
  Layout layout = Layout::Horizontal;
};

struct SplitContainer {
  Layout layout = Layout::Horizontal;
  double size_percentage = 1.0;
};

struct TilingWindow {
  WindowHandle handle = 0;
  double size_percentage = 1.0;
  // Kept up to date while tiling so that toggling to floating starts from a sane position
  Rect floating_placement;
  bool has_pending_dpi_adjustment = false;
};

struct FloatingWindow {
  WindowHandle handle = 0;
  Rect floating_placement;
  bool has_pending_dpi_adjustment = false;
};

using ContainerData =
    std::variant<RootContainer, Monitor, Workspace, SplitContainer, TilingWindow, FloatingWindow>;

enum class ContainerKind { Root, Monitor, Workspace, SplitContainer, TilingWindow, FloatingWindow };

// Resizable: variants that carry a size_percentage shared with their siblings
template <typename T>
struct is_resizable : std::false_type {};
template <>
struct is_resizable<SplitContainer> : std::true_type {};
template <>
struct is_resizable<TilingWindow> : std::true_type {};

template <typename T>
inline constexpr bool is_resizable_v = is_resizable<T>::value;

template <typename T>
struct is_window : std::false_type {};
template <>
struct is_window<TilingWindow> : std::true_type {};
template <>
struct is_window<FloatingWindow> : std::true_type {};

template <typename T>
inline constexpr bool is_window_v = is_window<T>::value;

// Helper for std::visit with lambdas
template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

// Allowed drift of a size_percentage sum away from 1.0
constexpr double kSizeTolerance = 1e-3;

// ============================================================================
// ContainerTree
// ============================================================================

// Arena of containers addressed by ids that stay valid until the container is destroyed.
// Parent links are plain ids, children are owned by id. Raw mutation functions are reserved
// for the structural command handlers; everything else only reads.
class ContainerTree {
public:
  struct Node {
    ContainerData data;
    std::optional<int> parent;
    std::vector<int> children;
    // Most recently focused first
    std::vector<int> child_focus_order;
    bool is_dead = false;
  };

  ContainerTree();

  [[nodiscard]] int root() const {
    return root_;
  }

  // Creates a detached container
  int create(ContainerData data);

  // Destroys a detached container without children
  void destroy(int id);

  // Kinds and data

  [[nodiscard]] bool is_valid(int id) const;

  [[nodiscard]] ContainerKind kind(int id) const;

  template <typename T>
  [[nodiscard]] bool is(int id) const {
    return std::holds_alternative<T>(node(id).data);
  }

  template <typename T>
  [[nodiscard]] T& get(int id) {
    T* value = std::get_if<T>(&node(id).data);
    if (value == nullptr) {
      throw InvariantViolation("container " + std::to_string(id) + " has unexpected kind");
    }
    return *value;
  }

  template <typename T>
  [[nodiscard]] const T& get(int id) const {
    const T* value = std::get_if<T>(&node(id).data);
    if (value == nullptr) {
      throw InvariantViolation("container " + std::to_string(id) + " has unexpected kind");
    }
    return *value;
  }

  [[nodiscard]] const ContainerData& data(int id) const {
    return node(id).data;
  }

  [[nodiscard]] bool is_window(int id) const;

  [[nodiscard]] bool is_resizable(int id) const;

  // Layout of a workspace or split container
  [[nodiscard]] std::optional<Layout> layout(int id) const;

  [[nodiscard]] std::optional<double> size_percentage(int id) const;

  [[nodiscard]] std::optional<WindowHandle> handle(int id) const;

  // Floating placement of either window variant
  [[nodiscard]] std::optional<Rect> floating_placement(int id) const;

  // Navigation

  [[nodiscard]] std::optional<int> parent(int id) const {
    return node(id).parent;
  }

  [[nodiscard]] const std::vector<int>& children(int id) const {
    return node(id).children;
  }

  [[nodiscard]] const std::vector<int>& child_focus_order(int id) const {
    return node(id).child_focus_order;
  }

  // Position within the parent's children, -1 when detached
  [[nodiscard]] int index(int id) const;

  // Parent chain, nearest first
  [[nodiscard]] std::vector<int> ancestors(int id) const;

  [[nodiscard]] std::vector<int> self_and_ancestors(int id) const;

  // Depth-first, pre-order, excluding `id`
  [[nodiscard]] std::vector<int> descendants(int id) const;

  [[nodiscard]] std::vector<int> siblings(int id) const;

  [[nodiscard]] std::vector<int> resizable_children(int id) const;

  [[nodiscard]] std::vector<int> resizable_siblings(int id) const;

  // `id` together with its Resizable siblings, in spatial order
  [[nodiscard]] std::vector<int> self_and_resizable_siblings(int id) const;

  [[nodiscard]] std::optional<int> previous_resizable_sibling(int id) const;

  [[nodiscard]] std::optional<int> next_resizable_sibling(int id) const;

  template <typename T>
  [[nodiscard]] std::optional<int> ancestor_of_type(int id) const {
    for (int ancestor : ancestors(id)) {
      if (is<T>(ancestor)) {
        return ancestor;
      }
    }
    return std::nullopt;
  }

  [[nodiscard]] bool is_descendant_of(int id, int ancestor) const;

  [[nodiscard]] const std::vector<int>& monitors() const {
    return children(root_);
  }

  // Number of live containers, root included
  [[nodiscard]] size_t size() const;

  // Raw mutation (structural command handlers only)

  // Inserts at `index` (append when empty or out of range); the child goes to the back of the
  // parent's focus order
  void insert_child(int parent_id, int child_id, std::optional<int> index = std::nullopt);

  // Unlinks `child_id` from its parent
  void remove_child(int child_id);

  // Puts `new_child` at the position of `old_child` in both children and focus order
  void replace_child(int old_child, int new_child);

  void set_size_percentage(int id, double size_percentage);

  void set_layout(int id, Layout layout);

  void set_floating_placement(int id, const Rect& placement);

  void set_pending_dpi_adjustment(int id, bool pending);

  // Moves every container on the path from `id` to the root to the front of its parent's focus
  // order
  void focus_path(int id);

  // Puts `child_id` at `position` within its parent's focus order
  void set_focus_position(int child_id, size_t position);

  void set_displayed_workspace(int monitor_id, int workspace_id);

  // Utilities

  // Checks structural invariants and logs every anomaly
  [[nodiscard]] bool validate() const;

  // Prints the tree at debug level
  void debug_print() const;

private:
  std::vector<Node> nodes_;
  int root_ = 0;

  Node& node(int id);
  [[nodiscard]] const Node& node(int id) const;
};

} // namespace treewm
