#ifndef DOCTEST_CONFIG_DISABLE

#include <doctest/doctest.h>

#include <cstdlib>
#include <random>

#include "redraw.h"
#include "test_support.h"

using namespace treewm;
using namespace treewm::testing;

namespace {

// Snapshot of the subtree below a container: ids, kinds and shares in pre-order
struct Snapshot {
  std::vector<int> ids;
  std::vector<std::optional<int>> parents;
  std::vector<double> sizes;
};

Snapshot take_snapshot(const ContainerTree& tree, int container) {
  Snapshot snapshot;
  for (int id : tree.descendants(container)) {
    snapshot.ids.push_back(id);
    snapshot.parents.push_back(tree.parent(id));
    snapshot.sizes.push_back(tree.size_percentage(id).value_or(-1.0));
  }
  return snapshot;
}

void check_same_structure(const Snapshot& before, const Snapshot& after) {
  REQUIRE(before.ids == after.ids);
  CHECK(before.parents == after.parents);
  for (size_t i = 0; i < before.sizes.size(); ++i) {
    CHECK(after.sizes[i] == doctest::Approx(before.sizes[i]));
  }
}

int attach_split(TestEngine& env, int parent, Layout layout) {
  auto& bus = env.engine.bus;
  int split = *bus.invoke(CreateSplitContainerCommand{.layout = layout}).created_container;
  bus.invoke(AttachContainerCommand{.child = split, .parent = parent});
  return split;
}

} // anonymous namespace

// ============================================================================
// Tiling Windows - Siblings
// ============================================================================

TEST_SUITE("MoveWindow - tiling siblings") {
  TEST_CASE("swap with the sibling to the right") {
    SingleMonitorSetup s;
    int a = s.env.add_tiling(1, s.workspace);
    int b = s.env.add_tiling(2, s.workspace);

    auto response = s.env.engine.move_window(a, Direction::Right);
    CHECK(response.success);
    CHECK(s.env.children_of(s.workspace) == std::vector<int>{b, a});
    CHECK(s.env.size_of(a) == doctest::Approx(0.5));
    CHECK(s.env.size_of(b) == doctest::Approx(0.5));
    CHECK(s.env.engine.tree.validate());
  }

  TEST_CASE("swap with the sibling to the left") {
    SingleMonitorSetup s;
    int a = s.env.add_tiling(1, s.workspace);
    int b = s.env.add_tiling(2, s.workspace);
    int c = s.env.add_tiling(3, s.workspace);

    s.env.engine.move_window(c, Direction::Left);
    CHECK(s.env.children_of(s.workspace) == std::vector<int>{a, c, b});
    s.env.engine.move_window(c, Direction::Left);
    CHECK(s.env.children_of(s.workspace) == std::vector<int>{c, a, b});
    CHECK(s.env.engine.tree.validate());
  }

  TEST_CASE("floating siblings are skipped") {
    SingleMonitorSetup s;
    int a = s.env.add_tiling(1, s.workspace);
    int f = s.env.add_floating(2, s.workspace, Rect{0, 0, 100, 100});
    int b = s.env.add_tiling(3, s.workspace);

    s.env.engine.move_window(a, Direction::Right);
    CHECK(s.env.children_of(s.workspace) == std::vector<int>{f, b, a});
    CHECK(s.env.engine.tree.validate());
  }

  TEST_CASE("swap redraws the workspace") {
    SingleMonitorSetup s;
    int a = s.env.add_tiling(1, s.workspace);
    s.env.add_tiling(2, s.workspace);
    s.env.backend.placements.clear();

    s.env.engine.move_window(a, Direction::Right);
    REQUIRE(s.env.backend.placements.size() == 2);
    CHECK(s.env.engine.container_service.containers_to_redraw.empty());

    // a is now on the right half
    bool found = false;
    for (const auto& [handle, rect] : s.env.backend.placements) {
      if (handle == 1) {
        found = true;
        CHECK(rect == Rect{960, 0, 960, 1080});
      }
    }
    CHECK(found);
  }
}

// ============================================================================
// Tiling Windows - Restructuring
// ============================================================================

TEST_SUITE("MoveWindow - restructuring") {
  TEST_CASE("moving across the workspace layout wraps the siblings") {
    SingleMonitorSetup s;
    int a = s.env.add_tiling(1, s.workspace);
    int b = s.env.add_tiling(2, s.workspace);
    int c = s.env.add_tiling(3, s.workspace);
    auto& tree = s.env.engine.tree;

    s.env.engine.move_window(a, Direction::Up);

    CHECK(tree.layout(s.workspace) == Layout::Vertical);
    const auto& children = s.env.children_of(s.workspace);
    REQUIRE(children.size() == 2);
    CHECK(children[0] == a);
    int split = children[1];
    REQUIRE(tree.is<SplitContainer>(split));
    CHECK(tree.layout(split) == Layout::Horizontal);
    CHECK(s.env.children_of(split) == std::vector<int>{c, b});

    CHECK(s.env.size_of(a) == doctest::Approx(0.5));
    CHECK(s.env.size_of(split) == doctest::Approx(0.5));
    CHECK(s.env.size_of(b) == doctest::Approx(0.5));
    CHECK(s.env.size_of(c) == doctest::Approx(0.5));
    CHECK(tree.validate());
  }

  TEST_CASE("restructure keeps relative sizes of the wrapped siblings") {
    SingleMonitorSetup s;
    int a = s.env.add_tiling(1, s.workspace);
    int b = s.env.add_tiling(2, s.workspace);
    int c = s.env.add_tiling(3, s.workspace);
    auto& bus = s.env.engine.bus;
    bus.invoke(ResizeContainerCommand{.container = a, .size_percentage = 0.2});
    bus.invoke(ResizeContainerCommand{.container = b, .size_percentage = 0.5});
    bus.invoke(ResizeContainerCommand{.container = c, .size_percentage = 0.3});

    s.env.engine.move_window(a, Direction::Up);

    CHECK(s.env.size_of(b) == doctest::Approx(0.6));
    CHECK(s.env.size_of(c) == doctest::Approx(0.4));
    CHECK(s.env.engine.tree.validate());
  }

  TEST_CASE("moving down after a restructure enters the new split") {
    SingleMonitorSetup s;
    int a = s.env.add_tiling(1, s.workspace);
    int b = s.env.add_tiling(2, s.workspace);
    int c = s.env.add_tiling(3, s.workspace);
    auto& tree = s.env.engine.tree;

    s.env.engine.move_window(a, Direction::Down);

    // The siblings were wrapped, then a moved into the wrapping split next to its top leaf
    CHECK(tree.layout(s.workspace) == Layout::Vertical);
    const auto& children = s.env.children_of(s.workspace);
    REQUIRE(children.size() == 1);
    int split = children[0];
    CHECK(s.env.children_of(split) == std::vector<int>{c, a, b});
    CHECK(s.env.size_of(split) == doctest::Approx(1.0));
    CHECK(tree.validate());
  }

  TEST_CASE("single window across the layout is left alone") {
    SingleMonitorSetup s;
    s.env.add_tiling(1, s.workspace);
    auto& tree = s.env.engine.tree;
    auto before = take_snapshot(tree, s.workspace);

    auto response = s.env.engine.move_window(before.ids.front(), Direction::Up);
    CHECK(response.success);
    check_same_structure(before, take_snapshot(tree, s.workspace));
    CHECK(tree.layout(s.workspace) == Layout::Horizontal);
    CHECK(tree.validate());
  }
}

// ============================================================================
// Tiling Windows - Split Containers and Ancestors
// ============================================================================

TEST_SUITE("MoveWindow - split containers") {
  TEST_CASE("moving towards a split inserts next to its facing leaf") {
    SingleMonitorSetup s;
    int a = s.env.add_tiling(1, s.workspace);
    int split = attach_split(s.env, s.workspace, Layout::Vertical);
    int b = s.env.add_tiling(2, split);
    int c = s.env.add_tiling(3, split);

    s.env.engine.move_window(a, Direction::Right);

    CHECK(s.env.children_of(s.workspace) == std::vector<int>{split});
    CHECK(s.env.children_of(split) == std::vector<int>{b, a, c});
    CHECK(s.env.size_of(a) == doctest::Approx(1.0 / 3.0));
    CHECK(s.env.size_of(split) == doctest::Approx(1.0));
    CHECK(s.env.engine.tree.validate());
  }

  TEST_CASE("moving left into a split uses its last leaf") {
    SingleMonitorSetup s;
    int split = attach_split(s.env, s.workspace, Layout::Vertical);
    int b = s.env.add_tiling(2, split);
    int c = s.env.add_tiling(3, split);
    int a = s.env.add_tiling(1, s.workspace);

    s.env.engine.move_window(a, Direction::Left);

    CHECK(s.env.children_of(split) == std::vector<int>{b, c, a});
    CHECK(s.env.engine.tree.validate());
  }

  TEST_CASE("entering a nested split with the move layout inserts before the leaf") {
    SingleMonitorSetup s;
    int a = s.env.add_tiling(1, s.workspace);
    int outer = attach_split(s.env, s.workspace, Layout::Vertical);
    int inner = attach_split(s.env, outer, Layout::Horizontal);
    int b = s.env.add_tiling(2, inner);
    int c = s.env.add_tiling(3, inner);
    int d = s.env.add_tiling(4, outer);

    s.env.engine.move_window(a, Direction::Right);

    CHECK(s.env.children_of(inner) == std::vector<int>{a, b, c});
    CHECK(s.env.children_of(outer) == std::vector<int>{inner, d});
    CHECK(s.env.size_of(outer) == doctest::Approx(1.0));
    CHECK(s.env.engine.tree.validate());
  }

  TEST_CASE("leaving a split to the left lands in the ancestor") {
    SingleMonitorSetup s;
    int x = s.env.add_tiling(1, s.workspace);
    int split = attach_split(s.env, s.workspace, Layout::Vertical);
    int a = s.env.add_tiling(2, split);
    int b = s.env.add_tiling(3, split);
    auto& tree = s.env.engine.tree;

    s.env.engine.move_window(a, Direction::Left);

    CHECK(!tree.is_valid(split));
    CHECK(s.env.children_of(s.workspace) == std::vector<int>{x, a, b});
    CHECK(s.env.size_of(x) == doctest::Approx(1.0 / 3.0));
    CHECK(s.env.size_of(a) == doctest::Approx(1.0 / 3.0));
    CHECK(s.env.size_of(b) == doctest::Approx(1.0 / 3.0));
    CHECK(tree.validate());
  }

  TEST_CASE("leaving a split to the right lands after it") {
    SingleMonitorSetup s;
    int split = attach_split(s.env, s.workspace, Layout::Vertical);
    int a = s.env.add_tiling(1, split);
    int b = s.env.add_tiling(2, split);
    int x = s.env.add_tiling(3, s.workspace);

    s.env.engine.move_window(a, Direction::Right);

    CHECK(s.env.children_of(s.workspace) == std::vector<int>{b, a, x});
    CHECK(s.env.engine.tree.validate());
  }

  TEST_CASE("moving within a split along its layout swaps") {
    SingleMonitorSetup s;
    s.env.add_tiling(1, s.workspace);
    int split = attach_split(s.env, s.workspace, Layout::Vertical);
    int b = s.env.add_tiling(2, split);
    int c = s.env.add_tiling(3, split);

    s.env.engine.move_window(b, Direction::Down);
    CHECK(s.env.children_of(split) == std::vector<int>{c, b});
    CHECK(s.env.engine.tree.validate());
  }

  TEST_CASE("edge of a split along its layout is a no-op") {
    SingleMonitorSetup s;
    s.env.add_tiling(1, s.workspace);
    int split = attach_split(s.env, s.workspace, Layout::Vertical);
    int b = s.env.add_tiling(2, split);
    s.env.add_tiling(3, split);
    auto& tree = s.env.engine.tree;
    auto before = take_snapshot(tree, s.workspace);

    s.env.engine.move_window(b, Direction::Up);
    check_same_structure(before, take_snapshot(tree, s.workspace));
  }
}

// ============================================================================
// Tiling Windows - Monitors
// ============================================================================

TEST_SUITE("MoveWindow - across monitors") {
  TEST_CASE("lone window moves to the monitor on the right") {
    DualMonitorSetup d;
    int a = d.env.add_tiling(1, d.w1);
    std::vector<int> focus_events;
    d.env.engine.bus.subscribe<FocusChangedEvent>(
        [&](const FocusChangedEvent& e) { focus_events.push_back(e.container); });

    auto response = d.env.engine.move_window(a, Direction::Right);

    CHECK(response.success);
    CHECK(d.env.children_of(d.w1).empty());
    CHECK(d.env.children_of(d.w2) == std::vector<int>{a});
    CHECK(d.env.size_of(a) == doctest::Approx(1.0));
    CHECK(focus_events == std::vector<int>{a});
    CHECK(d.env.engine.container_service.get_focused_window() == a);
    REQUIRE(!d.env.backend.placements.empty());
    CHECK(d.env.backend.placements.back().second == Rect{1920, 0, 1920, 1080});
    CHECK(d.env.engine.tree.validate());
  }

  TEST_CASE("moving left inserts at the start of the target workspace") {
    DualMonitorSetup d;
    int a = d.env.add_tiling(1, d.w1);
    int x = d.env.add_tiling(2, d.w2);

    d.env.engine.move_window(x, Direction::Left);
    CHECK(d.env.children_of(d.w1) == std::vector<int>{x, a});
    CHECK(d.env.size_of(a) == doctest::Approx(0.5));
    CHECK(d.env.engine.tree.validate());
  }

  TEST_CASE("moving right appends to the target workspace") {
    DualMonitorSetup d;
    int a = d.env.add_tiling(1, d.w1);
    int x = d.env.add_tiling(2, d.w2);

    d.env.engine.move_window(a, Direction::Right);
    CHECK(d.env.children_of(d.w2) == std::vector<int>{x, a});
    CHECK(d.env.engine.tree.validate());
  }

  TEST_CASE("window with a sibling in the direction swaps instead of leaving") {
    DualMonitorSetup d;
    int a = d.env.add_tiling(1, d.w1);
    int b = d.env.add_tiling(2, d.w1);

    d.env.engine.move_window(a, Direction::Right);
    CHECK(d.env.children_of(d.w1) == std::vector<int>{b, a});
    CHECK(d.env.children_of(d.w2).empty());
  }

  TEST_CASE("edge window leaves once it reaches the edge") {
    DualMonitorSetup d;
    int a = d.env.add_tiling(1, d.w1);
    int b = d.env.add_tiling(2, d.w1);

    d.env.engine.move_window(b, Direction::Right);
    CHECK(d.env.children_of(d.w1) == std::vector<int>{a});
    CHECK(d.env.children_of(d.w2) == std::vector<int>{b});
    CHECK(d.env.size_of(a) == doctest::Approx(1.0));
    CHECK(d.env.engine.tree.validate());
  }

  TEST_CASE("crossing to a monitor with another scale redraws twice") {
    DualMonitorSetup d(1.0f, 2.0f);
    int a = d.env.add_tiling(1, d.w1);
    d.env.backend.placements.clear();

    d.env.engine.move_window(a, Direction::Right);

    REQUIRE(d.env.backend.placements.size() == 2);
    CHECK(d.env.backend.placements[0] == d.env.backend.placements[1]);
    CHECK(!d.env.engine.tree.get<TilingWindow>(a).has_pending_dpi_adjustment);
  }

  TEST_CASE("floating placement follows the window to the new monitor") {
    DualMonitorSetup d;
    int a = *d.env.engine.add_window(1, d.w1, false, Rect{100, 100, 800, 600});

    d.env.engine.move_window(a, Direction::Right);
    CHECK(d.env.engine.tree.floating_placement(a) == Rect{2480, 240, 800, 600});
  }

  TEST_CASE("outermost lone window is a no-op") {
    DualMonitorSetup d;
    int a = d.env.add_tiling(1, d.w1);
    auto& tree = d.env.engine.tree;
    auto before = take_snapshot(tree, tree.root());
    std::vector<int> focus_events;
    d.env.engine.bus.subscribe<FocusChangedEvent>(
        [&](const FocusChangedEvent& e) { focus_events.push_back(e.container); });

    auto response = d.env.engine.move_window(a, Direction::Left);

    CHECK(response.success);
    check_same_structure(before, take_snapshot(tree, tree.root()));
    CHECK(focus_events.empty());
    CHECK(tree.validate());
  }
}

// ============================================================================
// Floating Windows
// ============================================================================

TEST_SUITE("MoveWindow - floating") {
  TEST_CASE("moves by the configured percentage of the monitor width") {
    SingleMonitorSetup s;
    int f = s.env.add_floating(1, s.workspace, Rect{100, 100, 400, 300});

    s.env.engine.move_window(f, Direction::Right);
    CHECK(s.env.engine.tree.floating_placement(f) == Rect{196, 100, 400, 300});

    s.env.engine.move_window(f, Direction::Down);
    CHECK(s.env.engine.tree.floating_placement(f) == Rect{196, 196, 400, 300});
  }

  TEST_CASE("pixel move amount") {
    SingleMonitorSetup s;
    s.env.engine.options_provider.options.general.floating_window_move_amount = "20px";
    int f = s.env.add_floating(1, s.workspace, Rect{100, 100, 400, 300});

    s.env.engine.move_window(f, Direction::Left);
    CHECK(s.env.engine.tree.floating_placement(f) == Rect{80, 100, 400, 300});
  }

  TEST_CASE("bare number move amount is pixels") {
    SingleMonitorSetup s;
    s.env.engine.options_provider.options.general.floating_window_move_amount = "25";
    int f = s.env.add_floating(1, s.workspace, Rect{100, 100, 400, 300});

    s.env.engine.move_window(f, Direction::Right);
    CHECK(s.env.engine.tree.floating_placement(f) == Rect{125, 100, 400, 300});
  }

  TEST_CASE("top edge is clamped without a monitor above") {
    SingleMonitorSetup s;
    int f = s.env.add_floating(1, s.workspace, Rect{100, 20, 400, 300});

    s.env.engine.move_window(f, Direction::Up);
    CHECK(s.env.engine.tree.floating_placement(f) == Rect{100, 0, 400, 300});
    CHECK(s.env.engine.tree.parent(f) == s.workspace);
  }

  TEST_CASE("top edge is not clamped with a monitor above") {
    TestEngine env;
    env.engine.add_monitor("top", Rect{0, -1080, 1920, 1080});
    int bottom = env.engine.add_monitor("bottom", Rect{0, 0, 1920, 1080});
    int workspace = env.engine.add_workspace(bottom, "1");
    int f = env.add_floating(1, workspace, Rect{100, 20, 400, 300});

    env.engine.move_window(f, Direction::Up);
    CHECK(env.engine.tree.floating_placement(f) == Rect{100, -76, 400, 300});
    CHECK(env.engine.tree.parent(f) == workspace);
  }

  TEST_CASE("placement is redrawn") {
    SingleMonitorSetup s;
    int f = s.env.add_floating(7, s.workspace, Rect{100, 100, 400, 300});
    s.env.backend.placements.clear();

    s.env.engine.move_window(f, Direction::Right);
    REQUIRE(s.env.backend.placements.size() == 1);
    CHECK(s.env.backend.placements[0].first == WindowHandle{7});
    CHECK(s.env.backend.placements[0].second == Rect{196, 100, 400, 300});
  }

  TEST_CASE("center crossing the monitor edge changes workspace") {
    DualMonitorSetup d;
    int f = d.env.add_floating(1, d.w1, Rect{1700, 100, 400, 300});
    std::vector<int> focus_events;
    d.env.engine.bus.subscribe<FocusChangedEvent>(
        [&](const FocusChangedEvent& e) { focus_events.push_back(e.container); });
    d.env.backend.placements.clear();

    d.env.engine.move_window(f, Direction::Right);

    CHECK(d.env.engine.tree.parent(f) == d.w2);
    CHECK(d.env.engine.tree.floating_placement(f) == Rect{1796, 100, 400, 300});
    CHECK(focus_events == std::vector<int>{f});
    // Pending DPI adjustment: positioned twice, then cleared
    CHECK(d.env.backend.placements.size() == 2);
    CHECK(!d.env.engine.tree.get<FloatingWindow>(f).has_pending_dpi_adjustment);
    CHECK(d.env.engine.tree.validate());
  }

  TEST_CASE("center crossing without a neighbour leaves the window untouched") {
    SingleMonitorSetup s;
    int f = s.env.add_floating(1, s.workspace, Rect{1700, 100, 400, 300});

    auto response = s.env.engine.move_window(f, Direction::Right);
    CHECK(response.success);
    CHECK(s.env.engine.tree.floating_placement(f) == Rect{1700, 100, 400, 300});
    CHECK(s.env.engine.tree.parent(f) == s.workspace);
  }

  TEST_CASE("center still inside keeps the workspace") {
    DualMonitorSetup d;
    int f = d.env.add_floating(1, d.w1, Rect{1500, 100, 400, 300});

    d.env.engine.move_window(f, Direction::Right);
    CHECK(d.env.engine.tree.parent(f) == d.w1);
    CHECK(d.env.engine.tree.floating_placement(f) == Rect{1596, 100, 400, 300});
  }
}

// ============================================================================
// Errors and Invariants
// ============================================================================

TEST_SUITE("MoveWindow - invariants") {
  TEST_CASE("moving a non-window is an invariant violation") {
    SingleMonitorSetup s;
    CHECK_THROWS_AS(s.env.engine.move_window(s.workspace, Direction::Left), InvariantViolation);
    CHECK_THROWS_AS(s.env.engine.move_window(s.monitor, Direction::Left), InvariantViolation);
  }

  TEST_CASE("floating window next to a split leaves no empty band") {
    SingleMonitorSetup s;
    int a = s.env.add_tiling(1, s.workspace);
    int b = s.env.add_tiling(2, s.workspace);
    auto& engine = s.env.engine;
    auto& tree = engine.tree;

    engine.move_window(b, Direction::Down);
    std::optional<int> split;
    for (int child : s.env.children_of(s.workspace)) {
      if (tree.is<SplitContainer>(child)) {
        split = child;
      }
    }
    REQUIRE(split.has_value());

    int f = s.env.add_floating(3, *split, Rect{100, 100, 300, 200});
    engine.move_window(b, Direction::Up);
    engine.move_window(a, Direction::Down);
    engine.move_window(a, Direction::Down);

    CHECK(tree.parent(f) == s.workspace);
    REQUIRE(tree.validate());

    // The resizable children split the whole workspace along its layout
    GapOptions no_gaps{.inner = 0, .outer = 0};
    Rect workspace_rect =
        compute_container_rect(tree, engine.container_service, s.workspace, no_gaps);
    bool vertical = tree.layout(s.workspace) == Layout::Vertical;
    auto resizable = tree.resizable_children(s.workspace);
    double shares = 0.0;
    int extent = 0;
    for (int child : resizable) {
      CHECK(tree.resizable_children(child).size() == tree.children(child).size());
      shares += s.env.size_of(child);
      Rect rect = compute_container_rect(tree, engine.container_service, child, no_gaps);
      extent += vertical ? rect.height : rect.width;
    }
    CHECK(shares == doctest::Approx(1.0));
    int expected = vertical ? workspace_rect.height : workspace_rect.width;
    CHECK(std::abs(extent - expected) <= static_cast<int>(resizable.size()));
  }

  TEST_CASE("random move sequences keep the tree valid") {
    DualMonitorSetup d;
    for (WindowHandle handle = 1; handle <= 4; ++handle) {
      d.env.add_tiling(handle, d.w1);
    }
    for (WindowHandle handle = 5; handle <= 7; ++handle) {
      d.env.add_tiling(handle, d.w2);
    }
    d.env.add_floating(8, d.w1, Rect{300, 300, 400, 300});

    auto& tree = d.env.engine.tree;
    auto& service = d.env.engine.container_service;
    REQUIRE(tree.validate());

    std::mt19937 rng(1234);
    const Direction directions[] = {Direction::Up, Direction::Down, Direction::Left,
                                    Direction::Right};

    for (int step = 0; step < 300; ++step) {
      auto windows = service.get_windows();
      REQUIRE(windows.size() == 8);

      int window = windows[rng() % windows.size()];
      Direction direction = directions[rng() % 4];

      auto response = d.env.engine.move_window(window, direction);
      CHECK(response.success);
      REQUIRE(tree.validate());
    }
  }
}

#endif // DOCTEST_CONFIG_DISABLE
