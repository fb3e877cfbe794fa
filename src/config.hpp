#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <yaml-cpp/yaml.h>

namespace neutral_ipc {

constexpr const char *kDefaultConfigFile = "/etc/neutral-ipc-cfg.json";

// Connection settings for the template server. Passed by value into every
// exchange; nothing reads configuration implicitly.
struct IpcConfig {
  std::string host = "127.0.0.1";
  uint16_t port = 4273;
  std::chrono::seconds timeout{10}; // read and write
  size_t buffer_size = 8192;        // read chunk size
  std::string config_file = kDefaultConfigFile;
};

// Defaults overridden by kDefaultConfigFile, if it exists.
IpcConfig load_config();

// Defaults overridden by the file at path, if it exists.
IpcConfig load_config(const std::string &path);

// Re-reads config.config_file and applies host/port/timeout/buffer_size.
// A missing file leaves config unchanged.
// Throws std::runtime_error if the file cannot be parsed or holds an invalid
// value, in which case config is left unchanged.
void apply_config_file(IpcConfig &config);

// Applies the keys present in settings (host, port, timeout, buffer_size,
// config_file). If config_file is among them the file is re-read afterwards,
// so file values take precedence.
// Throws std::runtime_error on invalid values; config is left unchanged when
// anything is rejected.
void update_settings(IpcConfig &config, const YAML::Node &settings);

// Sets config_file and re-reads it. On error config keeps its previous
// values, config_file included.
void set_config_file(IpcConfig &config, const std::string &path);

} // namespace neutral_ipc
