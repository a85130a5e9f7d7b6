#pragma once

#include <filesystem>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "ms/orchestrator/event_bus.h"

namespace ms::orchestrator {

enum class Mode { kInit, kMove };

bool ParseMode(std::string_view text, Mode& out);

inline constexpr int kDefaultInitDepth = -1;
inline constexpr std::string_view kDefaultLogLevel = "info";

// Effective run configuration. Paths are cleaned as they are read.
struct Options {
  std::string mode;  // command line only
  std::filesystem::path mirror_root;
  std::filesystem::path target_root;
  std::vector<std::filesystem::path> excludes;
  bool direct{false};
  bool verify{false};
  bool skip_failed{false};
  bool slow_mode{false};
  int init_depth{kDefaultInitDepth};
  bool dry_run{false};
  std::string log_level;
  bool json{false};
};

struct CommandLine {
  Options options;
  std::optional<std::filesystem::path> config_path;
  std::set<std::string> given;  // option names set explicitly
  bool help{false};
};

// Parses --name=value, --name value, -name forms. Boolean options take an
// optional =true|false. Throws ms::Error (domain Config) on malformed input.
CommandLine ParseCommandLine(const std::vector<std::string>& args);

// Reads a YAML configuration file; unknown keys and mistyped values are
// rejected. Throws kConfigMissing when the file cannot be opened and
// kConfigMalformed for everything else.
Options LoadYamlConfig(const std::filesystem::path& path);
Options ParseYamlConfig(std::string_view document);

// Copies every option from file that was not given on the command line.
void MergeOptions(Options& cli, const std::set<std::string>& given, const Options& file);

// Command line and optional file, merged.
Options ResolveOptions(const CommandLine& command_line);

// Normalizes and checks options in place; returns the selected mode.
Mode ValidateOptions(Options& options);

// Effective configuration as printed before a run.
std::string FormatOptions(const Options& options);

void PrintUsage(std::ostream& out, std::string_view program);

EventSeverity LogSeverity(const Options& options);

} // namespace ms::orchestrator
