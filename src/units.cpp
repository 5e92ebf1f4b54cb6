#include "units.h"

#include <spdlog/spdlog.h>

#include <cctype>
#include <charconv>
#include <cmath>

namespace treewm {

namespace {

std::string_view trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  return text;
}

} // anonymous namespace

UnitAmount parse_unit_amount(std::string_view text) {
  text = trim(text);

  size_t end = 0;
  if (end < text.size() && (text[end] == '-' || text[end] == '+')) {
    ++end;
  }
  while (end < text.size() &&
         (std::isdigit(static_cast<unsigned char>(text[end])) || text[end] == '.')) {
    ++end;
  }

  UnitAmount result;
  std::string number(text.substr(0, end));
  if (!number.empty() && number.front() == '+') {
    number.erase(0, 1);
  }

  auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), result.amount);
  if (ec != std::errc() || ptr != number.data() + number.size()) {
    spdlog::warn("No numeric amount in '{}', using 0", text);
    result.amount = 0.0;
  }

  result.units = std::string(trim(text.substr(end)));
  return result;
}

int resolve_to_pixels(const UnitAmount& value, int reference_extent) {
  double pixels = value.amount;
  if (value.units == "%" || value.units == "ppt") {
    pixels = value.amount * reference_extent / 100.0;
  } else if (!value.units.empty() && value.units != "px") {
    spdlog::warn("Unknown unit '{}', treating {} as pixels", value.units, value.amount);
  }
  return static_cast<int>(std::lround(pixels));
}

} // namespace treewm
