#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace handoff::core {

// Flags shared by every command plus the ones `host` and `send` understand.
class CommandLineParser {
public:
    explicit CommandLineParser(const std::string& program_name);
    
    void add_option(char short_name, const std::string& long_name, const std::string& description,
                    bool takes_value = false, const std::string& default_value = "");
    
    // False on an unknown flag or a missing value; see get_error().
    // Everything after a bare "--" is positional.
    bool parse(int argc, char* argv[]);
    
    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;
    bool get_bool_option(const std::string& name, bool default_value = false) const;
    // Throws std::invalid_argument for anything that is not 0..65535.
    std::uint16_t get_port_option(const std::string& name, std::uint16_t default_value) const;
    
    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }
    
    void print_help() const;
    void print_version() const;

private:
    struct Option {
        char short_name = 0;
        std::string long_name;
        std::string description;
        bool takes_value = false;
        std::string default_value;
    };
    
    const Option* find_long(const std::string& long_name) const;
    const Option* find_short(char short_name) const;
    bool store(const Option& option, std::optional<std::string> inline_value, int& index, int argc,
               char* argv[]);
    
    std::string program_name_;
    std::vector<Option> options_;
    std::map<std::string, std::string> values_;
    std::vector<std::string> positional_args_;
    std::string error_;
};

}
