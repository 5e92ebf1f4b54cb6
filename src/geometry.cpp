#include "geometry.h"

namespace treewm {

Layout layout_for_direction(Direction dir) {
  switch (dir) {
  case Direction::Left:
  case Direction::Right:
    return Layout::Horizontal;
  case Direction::Up:
  case Direction::Down:
    return Layout::Vertical;
  }
  return Layout::Horizontal;
}

Direction inverse(Direction dir) {
  switch (dir) {
  case Direction::Up:
    return Direction::Down;
  case Direction::Down:
    return Direction::Up;
  case Direction::Left:
    return Direction::Right;
  case Direction::Right:
    return Direction::Left;
  }
  return dir;
}

Layout inverse(Layout layout) {
  return layout == Layout::Horizontal ? Layout::Vertical : Layout::Horizontal;
}

bool is_lower_direction(Direction dir) {
  return dir == Direction::Up || dir == Direction::Left;
}

Point get_center(const Rect& rect) {
  return Point{rect.x + rect.width / 2, rect.y + rect.height / 2};
}

Rect translate_to_center(const Rect& rect, const Rect& target) {
  Point target_center = get_center(target);
  return Rect{target_center.x - rect.width / 2, target_center.y - rect.height / 2, rect.width,
              rect.height};
}

} // namespace treewm
