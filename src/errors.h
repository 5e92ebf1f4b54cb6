#pragma once

#include <stdexcept>

namespace treewm {

// Broken contract between components (missing handler, unreachable container kind).
// Never caught inside the core.
class InvariantViolation : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

} // namespace treewm
