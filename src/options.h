#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace treewm {

enum class LogLevel { Trace, Debug, Info, Warn, Err, Off };

// Default floating window step per move command
constexpr const char* kDefaultFloatingWindowMoveAmount = "5%";

// Default gap values
constexpr int kDefaultInnerGap = 0;
constexpr int kDefaultOuterGap = 0;

struct GeneralOptions {
  // Amount with optional unit: "%" or "ppt" of monitor width, "px", or a bare pixel count
  std::string floating_window_move_amount = kDefaultFloatingWindowMoveAmount;
};

// Gap configuration for window spacing
struct GapOptions {
  int inner = kDefaultInnerGap; // Between adjacent tiling windows
  int outer = kDefaultOuterGap; // Between tiling windows and the monitor edge
};

struct LoggingOptions {
  LogLevel level = LogLevel::Info;
};

// Global options container
struct GlobalOptions {
  GeneralOptions general;
  GapOptions gaps;
  LoggingOptions logging;
};

// Get default global options
GlobalOptions get_default_global_options();

// Result type for TOML operations
struct WriteResult {
  bool success;
  std::string error; // Set if success == false
};

struct ReadResult {
  bool success;
  std::string error;     // Set if success == false
  GlobalOptions options; // Valid if success == true
};

// Write GlobalOptions to a TOML file
WriteResult write_options_toml(const GlobalOptions& options, const std::filesystem::path& filepath);

// Read GlobalOptions from a TOML file
ReadResult read_options_toml(const std::filesystem::path& filepath);

// Set the global spdlog level
void apply_log_level(LogLevel level);

// Provides GlobalOptions, optionally monitoring a config file for changes
class GlobalOptionsProvider {
public:
  std::optional<std::filesystem::path> configPath;
  GlobalOptions options;
  std::filesystem::file_time_type lastModified;

  explicit GlobalOptionsProvider(std::optional<std::filesystem::path> configPath = std::nullopt);

  // Check for file changes and reload if necessary. Returns true if options changed.
  bool refresh();
};

} // namespace treewm
