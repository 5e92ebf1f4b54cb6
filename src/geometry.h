#pragma once

namespace treewm {

// Screen rectangle in physical pixels
struct Rect {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;

  [[nodiscard]] int left() const {
    return x;
  }
  [[nodiscard]] int top() const {
    return y;
  }
  [[nodiscard]] int right() const {
    return x + width;
  }
  [[nodiscard]] int bottom() const {
    return y + height;
  }

  bool operator==(const Rect&) const = default;
};

struct Point {
  int x = 0;
  int y = 0;

  bool operator==(const Point&) const = default;
};

// Movement and monitor lookup direction
enum class Direction { Up, Down, Left, Right };

// Axis along which a split container lays out its children
enum class Layout { Horizontal, Vertical };

// {Left, Right} -> Horizontal, {Up, Down} -> Vertical
[[nodiscard]] Layout layout_for_direction(Direction dir);

[[nodiscard]] Direction inverse(Direction dir);

[[nodiscard]] Layout inverse(Layout layout);

// Up and Left point towards the start of a container's children
[[nodiscard]] bool is_lower_direction(Direction dir);

[[nodiscard]] Point get_center(const Rect& rect);

// Keeps the size of `rect` and centers it within `target`
[[nodiscard]] Rect translate_to_center(const Rect& rect, const Rect& target);

} // namespace treewm
