#include "options.h"

#include <spdlog/spdlog.h>

#include <fstream>
#include <magic_enum/magic_enum.hpp>
#include <toml++/toml.hpp>

#include "units.h"

namespace treewm {

GlobalOptions get_default_global_options() {
  return GlobalOptions{};
}

WriteResult write_options_toml(const GlobalOptions& options,
                               const std::filesystem::path& filepath) {
  try {
    toml::table root;

    toml::table general;
    general.insert("floating_window_move_amount", options.general.floating_window_move_amount);
    root.insert("general", general);

    toml::table gaps;
    gaps.insert("inner", options.gaps.inner);
    gaps.insert("outer", options.gaps.outer);
    root.insert("gaps", gaps);

    toml::table logging;
    logging.insert("level", std::string(magic_enum::enum_name(options.logging.level)));
    root.insert("logging", logging);

    // Write to file
    std::ofstream file(filepath);
    if (!file) {
      return WriteResult{false, "Failed to open file for writing: " + filepath.string()};
    }
    file << root;
    return WriteResult{true, ""};
  } catch (const std::exception& e) {
    return WriteResult{false, std::string("Error writing TOML: ") + e.what()};
  }
}

ReadResult read_options_toml(const std::filesystem::path& filepath) {
  try {
    auto tbl = toml::parse_file(filepath.string());
    GlobalOptions options;

    // Parse general section
    if (auto general = tbl["general"].as_table()) {
      auto move_amount = (*general)["floating_window_move_amount"];
      if (auto amount = move_amount.as_string()) {
        options.general.floating_window_move_amount = amount->get();
      } else if (auto number = move_amount.as_integer()) {
        options.general.floating_window_move_amount = std::to_string(number->get());
      } else if (auto fraction = move_amount.as_floating_point()) {
        options.general.floating_window_move_amount = fmt::format("{}", fraction->get());
      } else if (move_amount) {
        spdlog::error("Invalid floating_window_move_amount: must be a string or a number. "
                      "Using default.");
      }
    }

    // Validate move amount - must start with a number
    auto parsed = parse_unit_amount(options.general.floating_window_move_amount);
    if (parsed.amount <= 0.0) {
      spdlog::error("Invalid floating_window_move_amount '{}': must be positive. Using default.",
                    options.general.floating_window_move_amount);
      options.general.floating_window_move_amount = kDefaultFloatingWindowMoveAmount;
    }

    // Parse gaps section
    if (auto gaps = tbl["gaps"].as_table()) {
      if (auto inner = (*gaps)["inner"].as_integer()) {
        options.gaps.inner = static_cast<int>(inner->get());
      }
      if (auto outer = (*gaps)["outer"].as_integer()) {
        options.gaps.outer = static_cast<int>(outer->get());
      }
    }

    // Validate gap values - negative values not allowed
    if (options.gaps.inner < 0) {
      spdlog::error("Invalid gaps.inner value ({}): must be non-negative. Using default.",
                    options.gaps.inner);
      options.gaps.inner = kDefaultInnerGap;
    }

    if (options.gaps.outer < 0) {
      spdlog::error("Invalid gaps.outer value ({}): must be non-negative. Using default.",
                    options.gaps.outer);
      options.gaps.outer = kDefaultOuterGap;
    }

    // Parse logging section
    if (auto logging = tbl["logging"].as_table()) {
      if (auto level = (*logging)["level"].as_string()) {
        auto parsed_level =
            magic_enum::enum_cast<LogLevel>(level->get(), magic_enum::case_insensitive);
        if (parsed_level.has_value()) {
          options.logging.level = *parsed_level;
        } else {
          spdlog::error("Invalid logging.level '{}'. Using default.", level->get());
        }
      }
    }

    return ReadResult{true, "", options};
  } catch (const toml::parse_error& e) {
    return ReadResult{false, std::string("TOML parse error: ") + e.what(), {}};
  } catch (const std::exception& e) {
    return ReadResult{false, std::string("Error reading TOML: ") + e.what(), {}};
  }
}

void apply_log_level(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    spdlog::set_level(spdlog::level::trace);
    break;
  case LogLevel::Debug:
    spdlog::set_level(spdlog::level::debug);
    break;
  case LogLevel::Info:
    spdlog::set_level(spdlog::level::info);
    break;
  case LogLevel::Warn:
    spdlog::set_level(spdlog::level::warn);
    break;
  case LogLevel::Err:
    spdlog::set_level(spdlog::level::err);
    break;
  case LogLevel::Off:
    spdlog::set_level(spdlog::level::off);
    break;
  }
}

GlobalOptionsProvider::GlobalOptionsProvider(std::optional<std::filesystem::path> path)
    : configPath(std::move(path)), options(get_default_global_options()), lastModified{} {
  if (configPath.has_value() && std::filesystem::exists(*configPath)) {
    auto result = read_options_toml(*configPath);
    if (result.success) {
      options = result.options;
      lastModified = std::filesystem::last_write_time(*configPath);
    } else {
      spdlog::error("Failed to load config: {}", result.error);
    }
  }
}

bool GlobalOptionsProvider::refresh() {
  if (!configPath.has_value()) {
    return false; // No file to monitor
  }
  if (!std::filesystem::exists(*configPath)) {
    return false; // File doesn't exist (yet)
  }

  auto currentModified = std::filesystem::last_write_time(*configPath);
  if (currentModified == lastModified) {
    return false; // No change
  }

  auto result = read_options_toml(*configPath);
  if (result.success) {
    options = result.options;
    lastModified = currentModified;
    spdlog::info("Config reloaded from: {}", configPath->string());
    return true;
  }
  spdlog::error("Failed to reload config: {}", result.error);
  return false;
}

} // namespace treewm
