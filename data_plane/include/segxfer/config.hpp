#pragma once

#include "segxfer/logging.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>

namespace segxfer {

class ConfigError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

constexpr const char *default_working_subdir = ".workdir";
constexpr std::size_t default_max_segment_size = 1024;

struct StoreOptions {
    std::filesystem::path storage_dir;
    // Defaults to <storage_dir>/.workdir.
    std::optional<std::filesystem::path> working_dir;
};

struct ClientOptions {
    std::size_t max_segment_size{default_max_segment_size};
    std::chrono::milliseconds response_timeout{30000};
};

struct ServiceOptions {
    std::string bind_address{"0.0.0.0"};
    std::uint16_t port{0};
    std::string service_id;
};

struct AppConfig {
    StoreOptions store;
    ClientOptions client;
    ServiceOptions service;
    LogLevel log_level{LogLevel::info};
};

// INI layout:
//   [store]   storage_dir, working_dir
//   [client]  max_segment_size, response_timeout_ms
//   [service] bind, port, service_id
//   [log]     level
// '#' and ';' start comments. Unknown keys are ignored, malformed values
// raise ConfigError.
AppConfig parse_config(std::istream &input);

AppConfig load_config(const std::filesystem::path &path);

} // namespace segxfer
