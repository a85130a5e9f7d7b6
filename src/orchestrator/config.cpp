#include "ms/orchestrator/config.h"

#include "ms/common.h"
#include "ms/core/exclusion.h"
#include "ms/error.h"
#include "ms/errors.h"

#include <yaml-cpp/yaml.h>

#include <charconv>
#include <span>
#include <sstream>
#include <utility>

namespace ms::orchestrator {
namespace {

constexpr std::string_view kStringOptions[] = {"mode", "config", "mirror", "target", "exclude",
                                               "init-depth", "log-level"};
constexpr std::string_view kBoolOptions[] = {"direct", "verify", "skip-failed", "slow-mode",
                                             "dry-run", "json"};
constexpr std::string_view kYamlKeys[] = {"mirror", "target", "exclude", "direct",
                                          "verify", "skip-failed", "slow-mode", "init-depth",
                                          "dry-run", "log-level", "json"};

bool Contains(std::span<const std::string_view> names, std::string_view name) {
  for (auto candidate : names) {
    if (candidate == name) {
      return true;
    }
  }
  return false;
}

[[noreturn]] void ThrowConfigError(int code, std::string message) {
  throw Error{ErrorDomain::Config, code, std::move(message)};
}

[[noreturn]] void ThrowInvalidValue(std::string_view name, std::string_view value) {
  ThrowConfigError(errors::config::kArgumentValueInvalid,
                   std::string(errors::msg::kInvalidArgumentValue) + ": -" + std::string(name) +
                       "=\"" + std::string(value) + "\"");
}

bool ParseBool(std::string_view text, bool& out) {
  if (text == "1" || text == "t" || text == "T" || text == "true" || text == "TRUE" ||
      text == "True") {
    out = true;
    return true;
  }
  if (text == "0" || text == "f" || text == "F" || text == "false" || text == "FALSE" ||
      text == "False") {
    out = false;
    return true;
  }
  return false;
}

bool ParseInt(std::string_view text, int& out) {
  if (text.empty()) {
    return false;
  }
  const char* first = text.data();
  if (*first == '+') {
    ++first;
  }
  auto [ptr, ec] = std::from_chars(first, text.data() + text.size(), out);
  return ec == std::errc() && ptr == text.data() + text.size();
}

void ApplyStringOption(CommandLine& result, std::string_view name, std::string_view value) {
  auto& options = result.options;
  if (name == "mode") {
    options.mode = std::string(value);
  } else if (name == "config") {
    result.config_path = std::filesystem::path(std::string(TrimWhitespace(value)));
  } else if (name == "mirror") {
    options.mirror_root = std::filesystem::path(std::string(value));
  } else if (name == "target") {
    options.target_root = std::filesystem::path(std::string(value));
  } else if (name == "exclude") {
    options.excludes.push_back(core::CleanPath(value));
  } else if (name == "init-depth") {
    if (!ParseInt(TrimWhitespace(value), options.init_depth)) {
      ThrowInvalidValue(name, value);
    }
  } else if (name == "log-level") {
    options.log_level = std::string(value);
  }
}

void ApplyBoolOption(Options& options, std::string_view name, bool value) {
  if (name == "direct") {
    options.direct = value;
  } else if (name == "verify") {
    options.verify = value;
  } else if (name == "skip-failed") {
    options.skip_failed = value;
  } else if (name == "slow-mode") {
    options.slow_mode = value;
  } else if (name == "dry-run") {
    options.dry_run = value;
  } else if (name == "json") {
    options.json = value;
  }
}

template <typename T>
T ReadScalar(const YAML::Node& node, const std::string& key, T fallback) {
  if (node.IsNull()) {
    return fallback;
  }
  if (!node.IsScalar()) {
    ThrowConfigError(errors::config::kConfigMalformed,
                     std::string(errors::msg::kConfigMalformed) + ": \"" + key +
                         "\" must be a scalar value");
  }
  return node.as<T>();
}

Options OptionsFromYaml(const YAML::Node& root) {
  Options options;
  if (root.IsNull()) {
    return options;
  }
  if (!root.IsMap()) {
    ThrowConfigError(errors::config::kConfigMalformed,
                     std::string(errors::msg::kConfigMalformed) + ": top level must be a mapping");
  }

  for (const auto& item : root) {
    const auto key = item.first.as<std::string>();
    const auto& value = item.second;
    if (!Contains(kYamlKeys, key)) {
      ThrowConfigError(errors::config::kConfigMalformed,
                       std::string(errors::msg::kConfigMalformed) + ": field \"" + key +
                           "\" not found");
    }
    if (key == "mirror") {
      options.mirror_root = std::filesystem::path(ReadScalar<std::string>(value, key, ""));
    } else if (key == "target") {
      options.target_root = std::filesystem::path(ReadScalar<std::string>(value, key, ""));
    } else if (key == "exclude") {
      if (value.IsNull()) {
        continue;
      }
      if (!value.IsSequence()) {
        ThrowConfigError(errors::config::kConfigMalformed,
                         std::string(errors::msg::kConfigMalformed) +
                             ": \"exclude\" must be a sequence");
      }
      for (const auto& entry : value) {
        options.excludes.push_back(core::CleanPath(ReadScalar<std::string>(entry, key, "")));
      }
    } else if (key == "init-depth") {
      options.init_depth = ReadScalar<int>(value, key, kDefaultInitDepth);
    } else if (key == "log-level") {
      options.log_level = ReadScalar<std::string>(value, key, "");
    } else {
      ApplyBoolOption(options, key, ReadScalar<bool>(value, key, false));
    }
  }
  return options;
}

} // namespace

bool ParseMode(std::string_view text, Mode& out) {
  if (text == "init") {
    out = Mode::kInit;
    return true;
  }
  if (text == "move") {
    out = Mode::kMove;
    return true;
  }
  return false;
}

CommandLine ParseCommandLine(const std::vector<std::string>& args) {
  CommandLine result;
  for (std::size_t index = 0; index < args.size(); ++index) {
    std::string_view arg = args[index];
    if (arg.size() < 2 || arg.front() != '-') {
      ThrowConfigError(errors::config::kUnknownArgument,
                       std::string(errors::msg::kUnknownArgument) + ": \"" + std::string(arg) + "\"");
    }
    arg.remove_prefix(arg.rfind("--", 0) == 0 ? 2 : 1);

    std::string_view name = arg;
    std::optional<std::string_view> inline_value;
    if (const auto eq = arg.find('='); eq != std::string_view::npos) {
      name = arg.substr(0, eq);
      inline_value = arg.substr(eq + 1);
    }

    if (name == "h" || name == "help") {
      result.help = true;
      continue;
    }

    if (Contains(kBoolOptions, name)) {
      bool value = true;
      if (inline_value && !ParseBool(*inline_value, value)) {
        ThrowInvalidValue(name, *inline_value);
      }
      ApplyBoolOption(result.options, name, value);
      result.given.insert(std::string(name));
      continue;
    }

    if (!Contains(kStringOptions, name)) {
      ThrowConfigError(errors::config::kUnknownArgument,
                       std::string(errors::msg::kUnknownArgument) + ": \"" + std::string(args[index]) +
                           "\"");
    }
    std::string_view value;
    if (inline_value) {
      value = *inline_value;
    } else if (index + 1 < args.size()) {
      value = args[++index];
    } else {
      ThrowConfigError(errors::config::kArgumentValueInvalid,
                       std::string(errors::msg::kInvalidArgumentValue) + ": flag needs an argument: -" +
                           std::string(name));
    }
    ApplyStringOption(result, name, value);
    result.given.insert(std::string(name));
  }
  return result;
}

Options ParseYamlConfig(std::string_view document) {
  try {
    return OptionsFromYaml(YAML::Load(std::string(document)));
  } catch (const YAML::Exception& yaml_error) {
    ThrowConfigError(errors::config::kConfigMalformed,
                     std::string(errors::msg::kConfigMalformed) + ": " + yaml_error.what());
  }
}

Options LoadYamlConfig(const std::filesystem::path& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(PathToUtf8String(path));
  } catch (const YAML::BadFile&) {
    ThrowConfigError(errors::config::kConfigMissing,
                     std::string(errors::msg::kConfigMissing) + ": " + QuotePath(path));
  } catch (const YAML::Exception& yaml_error) {
    ThrowConfigError(errors::config::kConfigMalformed,
                     std::string(errors::msg::kConfigMalformed) + ": " + yaml_error.what());
  }
  try {
    return OptionsFromYaml(root);
  } catch (const YAML::Exception& yaml_error) {
    ThrowConfigError(errors::config::kConfigMalformed,
                     std::string(errors::msg::kConfigMalformed) + ": " + yaml_error.what());
  }
}

void MergeOptions(Options& cli, const std::set<std::string>& given, const Options& file) {
  auto take = [&given](std::string_view name) { return given.count(std::string(name)) == 0; };
  if (take("mirror")) {
    cli.mirror_root = file.mirror_root;
  }
  if (take("target")) {
    cli.target_root = file.target_root;
  }
  if (take("exclude")) {
    cli.excludes = file.excludes;
  }
  if (take("direct")) {
    cli.direct = file.direct;
  }
  if (take("verify")) {
    cli.verify = file.verify;
  }
  if (take("skip-failed")) {
    cli.skip_failed = file.skip_failed;
  }
  if (take("slow-mode")) {
    cli.slow_mode = file.slow_mode;
  }
  if (take("init-depth")) {
    cli.init_depth = file.init_depth;
  }
  if (take("dry-run")) {
    cli.dry_run = file.dry_run;
  }
  if (take("log-level")) {
    cli.log_level = file.log_level;
  }
  if (take("json")) {
    cli.json = file.json;
  }
}

Options ResolveOptions(const CommandLine& command_line) {
  Options options = command_line.options;
  if (command_line.config_path && !command_line.config_path->empty()) {
    MergeOptions(options, command_line.given, LoadYamlConfig(*command_line.config_path));
  }
  return options;
}

Mode ValidateOptions(Options& options) {
  Mode mode = Mode::kMove;
  if (!ParseMode(options.mode, mode)) {
    ThrowConfigError(errors::config::kModeInvalid, std::string(errors::msg::kModeMismatch));
  }

  if (options.mirror_root.empty() || options.target_root.empty()) {
    ThrowConfigError(errors::config::kRootsMissing, std::string(errors::msg::kMissingMirrorTarget));
  }

  options.mirror_root = core::CleanPath(options.mirror_root.generic_string());
  options.target_root = core::CleanPath(options.target_root.generic_string());

  if (options.mirror_root == options.target_root) {
    ThrowConfigError(errors::config::kRootsSame, std::string(errors::msg::kMirrorTargetSame));
  }

  if (!options.mirror_root.is_absolute() || !options.target_root.is_absolute()) {
    ThrowConfigError(errors::config::kRootsNotAbsolute,
                     std::string(errors::msg::kMirrorTargetNotAbsolute));
  }

  for (const auto& excluded : options.excludes) {
    if (!excluded.is_absolute()) {
      ThrowConfigError(errors::config::kExcludeNotAbsolute,
                       std::string(errors::msg::kExcludePathNotAbsolute) + ": " +
                           QuotePath(excluded));
    }
  }

  if (options.log_level.empty()) {
    options.log_level = std::string(kDefaultLogLevel);
  } else {
    EventSeverity severity;
    if (!ParseSeverity(TrimWhitespace(options.log_level), severity)) {
      ThrowConfigError(errors::config::kLogLevelInvalid,
                       std::string(errors::msg::kInvalidLogLevel) + ": \"" + options.log_level + "\"");
    }
  }
  return mode;
}

EventSeverity LogSeverity(const Options& options) {
  EventSeverity severity = EventSeverity::kInfo;
  if (!ParseSeverity(TrimWhitespace(options.log_level), severity)) {
    severity = EventSeverity::kInfo;
  }
  return severity;
}

std::string FormatOptions(const Options& options) {
  YAML::Emitter emitter;
  emitter << YAML::BeginMap;
  emitter << YAML::Key << "mirror" << YAML::Value << PathToUtf8String(options.mirror_root);
  emitter << YAML::Key << "target" << YAML::Value << PathToUtf8String(options.target_root);
  emitter << YAML::Key << "exclude" << YAML::Value << YAML::BeginSeq;
  for (const auto& excluded : options.excludes) {
    emitter << PathToUtf8String(excluded);
  }
  emitter << YAML::EndSeq;
  emitter << YAML::Key << "direct" << YAML::Value << options.direct;
  emitter << YAML::Key << "verify" << YAML::Value << options.verify;
  emitter << YAML::Key << "skip-failed" << YAML::Value << options.skip_failed;
  emitter << YAML::Key << "slow-mode" << YAML::Value << options.slow_mode;
  emitter << YAML::Key << "init-depth" << YAML::Value << options.init_depth;
  emitter << YAML::Key << "dry-run" << YAML::Value << options.dry_run;
  emitter << YAML::Key << "log-level" << YAML::Value << options.log_level;
  emitter << YAML::Key << "json" << YAML::Value << options.json;
  emitter << YAML::EndMap;

  std::ostringstream out;
  out << "configuration for '--mode=" << options.mode << "':\n";
  std::istringstream lines(emitter.c_str());
  std::string line;
  while (std::getline(lines, line)) {
    if (!line.empty()) {
      out << '\t' << line << '\n';
    }
  }
  out << '\n';
  return out.str();
}

void PrintUsage(std::ostream& out, std::string_view program) {
  out << "usage: \"" << program << "\" --mode=init|move --mirror=ABSPATH --target=ABSPATH\n";
  out << "\t[--exclude=ABSPATH] [--exclude=ABSPATH] [--direct] [--verify] [--skip-failed]\n";
  out << "\t[--slow-mode] [--init-depth=N] [--dry-run] [--log-level=debug|info|warn|error] [--json]\n\n";
  out << "  --mode string         operation mode: 'init' or 'move'; always needed\n";
  out << "  --config string       path to a yaml configuration file; used with the specified mode\n";
  out << "  --mirror string       absolute path to the mirror structure to create; files will be moved *from* here\n";
  out << "  --target string       absolute path to the real structure to mirror; files will be moved *to* here\n";
  out << "  --exclude value       absolute path to exclude; can be repeated multiple times\n";
  out << "  --direct              use atomic rename when possible; fallback to copy and remove if it fails or crosses filesystems\n";
  out << "  --verify              verify again the hash of a target file after moving it; requires an extra full read of the file\n";
  out << "  --skip-failed         do not exit on non-fatal failures; skip failed element and proceed instead\n";
  out << "  --slow-mode           adds a 1s pause after every 50 directories created in --mode=init; avoids thrashing filesystem\n";
  out << "  --init-depth int      maximum depth mirrored in --mode=init; 0 mirrors only the root's contents, negative is unlimited (default -1)\n";
  out << "  --dry-run             preview only; no changes are written to disk\n";
  out << "  --log-level string    decides the verbosity of emitted logs; debug, info, warn, error (default \"info\")\n";
  out << "  --json                output all emitted logs in the JSON format; results can be read from stderr\n";
}

} // namespace ms::orchestrator
