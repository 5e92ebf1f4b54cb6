#pragma once

#include <string>
#include <string_view>

namespace treewm {

// A configured length such as "5%", "10ppt", "20px" or a bare "20"
struct UnitAmount {
  double amount = 0.0;
  std::string units; // Empty for a bare number
};

// Splits the leading number from its unit suffix. Whitespace around both is ignored.
// A value without any leading number yields amount 0.
[[nodiscard]] UnitAmount parse_unit_amount(std::string_view text);

// Converts to pixels: "%" and "ppt" are relative to `reference_extent`, "px" and bare numbers
// are pixels, and an unknown unit falls back to the raw number
[[nodiscard]] int resolve_to_pixels(const UnitAmount& value, int reference_extent);

} // namespace treewm
