#include "handoff/core/config.hpp"
#include "handoff/core/logger.hpp"
#include "handoff/core/utils.hpp"
#include <array>
#include <fstream>
#include <utility>

namespace handoff::core {

namespace {

constexpr std::array<std::pair<const char*, const char*>, 18> DEFAULTS = {{
    {"transfer.chunk_size", "65536"},
    {"transfer.max_file_size", "2147483648"},
    {"transfer.max_session_size", "10737418240"},
    {"transfer.max_files_per_batch", "500"},
    {"transfer.send_buffer_limit", "1048576"},
    {"security.room_code_length", "8"},
    {"security.room_code_expiry_seconds", "3600"},
    {"security.pin_length", "4"},
    {"security.max_pin_attempts", "3"},
    {"security.max_connection_attempts", "3"},
    {"security.connection_attempt_window_seconds", "300"},
    {"security.rate_limit_block_seconds", "300"},
    {"security.approval_timeout_ms", "30000"},
    {"security.heartbeat_interval_ms", "5000"},
    {"transport.max_reconnect_attempts", "5"},
    {"transport.port", "47800"},
    {"log.level", "info"},
    {"log.file", "handoff.log"},
}};

std::string section_of(const std::string& key) {
    auto dot = key.find('.');
    return dot == std::string::npos ? std::string() : key.substr(0, dot);
}

}

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    std::string line;
    std::size_t line_number = 0;
    std::size_t loaded = 0;
    while (std::getline(file, line)) {
        ++line_number;
        line = utils::StringUtils::trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        
        auto eq = line.find('=');
        auto key = eq == std::string::npos ? std::string() : utils::StringUtils::trim(line.substr(0, eq));
        if (key.empty()) {
            LOG_WARN("{}:{}: ignoring line without a key=value pair", filename, line_number);
            continue;
        }
        
        values_[key] = utils::StringUtils::trim(line.substr(eq + 1));
        ++loaded;
    }
    
    LOG_DEBUG("Loaded {} settings from {}", loaded, filename);
    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    file << "# handoff configuration\n";
    
    // Keys are sorted, so each section is contiguous.
    std::optional<std::string> current_section;
    for (const auto& [key, value] : values_) {
        auto section = section_of(key);
        if (section != current_section) {
            file << "\n";
            if (!section.empty()) {
                file << "# " << section << "\n";
            }
            current_section = section;
        }
        file << key << "=" << value << "\n";
    }
    
    return file.good();
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) {
        return default_value;
    }
    
    auto lower = utils::StringUtils::to_lower(*value);
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
        return false;
    }
    return default_value;
}

int Config::get_int(const std::string& key, int default_value) const {
    return get_as<int>(key).value_or(default_value);
}

std::uint64_t Config::get_uint64(const std::string& key, std::uint64_t default_value) const {
    // istream would wrap a negative number around.
    auto value = get(key);
    if (!value || value->empty() || value->front() == '-') {
        return default_value;
    }
    return get_as<std::uint64_t>(key).value_or(default_value);
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    return get(key).value_or(default_value);
}

void Config::set_defaults() {
    for (const auto& [key, value] : DEFAULTS) {
        values_.emplace(key, value);
    }
}

}
