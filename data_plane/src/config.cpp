#include "segxfer/config.hpp"

#include "segxfer/wire.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>

namespace segxfer {

namespace {

std::string trim(const std::string &input) {
    const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    auto begin = std::find_if_not(input.begin(), input.end(), is_space);
    auto end = std::find_if_not(input.rbegin(), input.rend(), is_space).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::string strip_comment(const std::string &input) {
    for (std::size_t i = 0; i < input.size(); ++i) {
        const char ch = input[i];
        if ((ch == '#' || ch == ';') &&
            (i == 0 || std::isspace(static_cast<unsigned char>(input[i - 1])) != 0)) {
            return input.substr(0, i);
        }
    }
    return input;
}

[[noreturn]] void bad_value(std::size_t line_number, const std::string &key, const std::string &value) {
    std::ostringstream oss;
    oss << "line " << line_number << ": invalid value for '" << key << "': '" << value << "'";
    throw ConfigError(oss.str());
}

std::uint64_t to_uint(std::size_t line_number, const std::string &key, const std::string &value,
                      std::uint64_t max_value) {
    std::uint64_t parsed = 0;
    if (!parse_uint64(value, parsed) || parsed > max_value) {
        bad_value(line_number, key, value);
    }
    return parsed;
}

void apply(AppConfig &config, const std::string &section, const std::string &key,
           const std::string &value, std::size_t line_number) {
    if (section == "store") {
        if (key == "storage_dir") {
            config.store.storage_dir = value;
        } else if (key == "working_dir") {
            config.store.working_dir = std::filesystem::path(value);
        }
    } else if (section == "client") {
        if (key == "max_segment_size") {
            auto size = to_uint(line_number, key, value, std::numeric_limits<std::size_t>::max());
            if (size == 0) {
                bad_value(line_number, key, value);
            }
            config.client.max_segment_size = static_cast<std::size_t>(size);
        } else if (key == "response_timeout_ms") {
            auto ms = to_uint(line_number, key, value,
                              static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()));
            config.client.response_timeout = std::chrono::milliseconds(static_cast<std::int64_t>(ms));
        }
    } else if (section == "service") {
        if (key == "bind") {
            config.service.bind_address = value;
        } else if (key == "port") {
            config.service.port = static_cast<std::uint16_t>(to_uint(line_number, key, value, 65535));
        } else if (key == "service_id") {
            config.service.service_id = value;
        }
    } else if (section == "log") {
        if (key == "level" && !parse_log_level(value, config.log_level)) {
            bad_value(line_number, key, value);
        }
    }
}

} // namespace

AppConfig parse_config(std::istream &input) {
    AppConfig config;
    std::string section;
    std::string raw;
    std::size_t line_number = 0;
    while (std::getline(input, raw)) {
        ++line_number;
        const std::string line = trim(strip_comment(raw));
        if (line.empty()) {
            continue;
        }
        if (line.front() == '[') {
            if (line.back() != ']') {
                std::ostringstream oss;
                oss << "line " << line_number << ": unterminated section header";
                throw ConfigError(oss.str());
            }
            section = trim(line.substr(1, line.size() - 2));
            continue;
        }
        auto pos = line.find('=');
        if (pos == std::string::npos) {
            std::ostringstream oss;
            oss << "line " << line_number << ": expected key=value";
            throw ConfigError(oss.str());
        }
        apply(config, section, trim(line.substr(0, pos)), trim(line.substr(pos + 1)), line_number);
    }
    return config;
}

AppConfig load_config(const std::filesystem::path &path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("config file not found: " + path.string());
    }
    return parse_config(file);
}

} // namespace segxfer
