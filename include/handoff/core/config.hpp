#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <sstream>
#include <string>

namespace handoff::core {

// Flat `section.key=value` settings; `#` starts a comment line.
class Config {
public:
    Config() = default;
    
    // Process-wide settings used by the executable. Library code takes limit structs instead.
    static Config& instance();
    
    // False only when the file cannot be opened; malformed lines are logged and skipped.
    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;
    
    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    
    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value) {
            return std::nullopt;
        }
        
        std::istringstream stream(*value);
        T result{};
        stream >> result;
        if (stream.fail() || !stream.eof()) {
            return std::nullopt;
        }
        return result;
    }
    
    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    std::uint64_t get_uint64(const std::string& key, std::uint64_t default_value = 0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    
    // Fills in every key handoff reads, keeping values that are already set.
    void set_defaults();
    void clear() { values_.clear(); }
    bool empty() const { return values_.empty(); }
    std::size_t size() const { return values_.size(); }

private:
    std::map<std::string, std::string> values_;
};

}
