#include "config.hpp"
#include <filesystem>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <utility>

namespace neutral_ipc {

namespace fs = std::filesystem;

// Read an unsigned integer setting and check it against [min, max]
static uint64_t parse_unsigned(const YAML::Node &node, const std::string &key,
                               uint64_t min, uint64_t max,
                               const std::string &origin) {
  int64_t value = 0;
  try {
    value = node.as<int64_t>();
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("[CONFIG] " + origin + ": '" + key +
                             "' must be an integer (" + e.what() + ")");
  }

  if (value < 0 || static_cast<uint64_t>(value) < min ||
      static_cast<uint64_t>(value) > max) {
    throw std::runtime_error("[CONFIG] " + origin + ": '" + key +
                             "' must be in range [" + std::to_string(min) +
                             ", " + std::to_string(max) + "]");
  }
  return static_cast<uint64_t>(value);
}

// Validates every key into a copy of `config`; `config` is only replaced once
// the whole node has been accepted.
static void apply_settings(IpcConfig &config, const YAML::Node &settings,
                           const std::string &origin) {
  if (!settings || settings.IsNull()) {
    return;
  }
  if (!settings.IsMap()) {
    throw std::runtime_error("[CONFIG] " + origin + ": expected a map");
  }

  IpcConfig next = config;

  if (settings["host"]) {
    try {
      next.host = settings["host"].as<std::string>();
    } catch (const YAML::Exception &e) {
      throw std::runtime_error("[CONFIG] " + origin +
                               ": 'host' must be a string (" + e.what() + ")");
    }
    if (next.host.empty()) {
      throw std::runtime_error("[CONFIG] " + origin + ": 'host' is empty");
    }
  }

  if (settings["port"]) {
    next.port = static_cast<uint16_t>(parse_unsigned(
        settings["port"], "port", 1, std::numeric_limits<uint16_t>::max(),
        origin));
  }

  if (settings["timeout"]) {
    next.timeout = std::chrono::seconds(parse_unsigned(
        settings["timeout"], "timeout", 1,
        std::numeric_limits<uint16_t>::max(), origin));
  }

  if (settings["buffer_size"]) {
    next.buffer_size = static_cast<size_t>(
        parse_unsigned(settings["buffer_size"], "buffer_size", 1,
                       std::numeric_limits<uint32_t>::max(), origin));
  }

  config = std::move(next);
}

void apply_config_file(IpcConfig &config) {
  const std::string &path = config.config_file;

  std::error_code ec;
  if (path.empty() || !fs::exists(path, ec)) {
    return;
  }

  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Failed to load config file '" + path +
                             "': " + e.what());
  }

  apply_settings(config, yaml, path);
  std::cerr << "[IpcConfig] loaded " << path << " (server " << config.host
            << ":" << config.port << ")\n";
}

IpcConfig load_config() { return load_config(kDefaultConfigFile); }

IpcConfig load_config(const std::string &path) {
  IpcConfig config;
  config.config_file = path;
  apply_config_file(config);
  return config;
}

void update_settings(IpcConfig &config, const YAML::Node &settings) {
  IpcConfig next = config;
  apply_settings(next, settings, "settings");

  if (settings.IsMap() && settings["config_file"]) {
    try {
      next.config_file = settings["config_file"].as<std::string>();
    } catch (const YAML::Exception &e) {
      throw std::runtime_error(
          "[CONFIG] settings: 'config_file' must be a string (" +
          std::string(e.what()) + ")");
    }
    apply_config_file(next);
  }

  config = std::move(next);
}

void set_config_file(IpcConfig &config, const std::string &path) {
  IpcConfig next = config;
  next.config_file = path;
  apply_config_file(next);
  config = std::move(next);
}

} // namespace neutral_ipc
