#include "handoff/core/cli.hpp"
#include "handoff/core/utils.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace handoff::core {

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name) {
    
    add_option('h', "help", "Show this help message");
    add_option('v', "version", "Show version information");
    add_option('c', "config", "Configuration file path", true, "handoff.conf");
    add_option(0, "verbose", "Log debug output to the console");
    
    add_option('p', "port", "TCP port to listen on or connect to", true);
    add_option(0, "address", "Host address to connect to", true, "127.0.0.1");
    add_option(0, "code", "Room code shown by the host (XXXX-XXXX)", true);
    add_option(0, "pin", "Session PIN (host: require it, sender: answer with it)", true);
    add_option('o', "output", "Directory for received files", true, ".");
    add_option('y', "auto-approve", "Approve the first connection request without asking");
}

void CommandLineParser::add_option(char short_name, const std::string& long_name, const std::string& description,
                                   bool takes_value, const std::string& default_value) {
    options_.push_back(Option{short_name, long_name, description, takes_value, default_value});
}

const CommandLineParser::Option* CommandLineParser::find_long(const std::string& long_name) const {
    auto it = std::find_if(options_.begin(), options_.end(),
                           [&long_name](const Option& option) { return option.long_name == long_name; });
    return it == options_.end() ? nullptr : &*it;
}

const CommandLineParser::Option* CommandLineParser::find_short(char short_name) const {
    auto it = std::find_if(options_.begin(), options_.end(),
                           [short_name](const Option& option) { return option.short_name == short_name; });
    return it == options_.end() ? nullptr : &*it;
}

bool CommandLineParser::store(const Option& option, std::optional<std::string> inline_value, int& index, int argc,
                              char* argv[]) {
    if (!option.takes_value) {
        if (inline_value) {
            error_ = "Option --" + option.long_name + " does not take a value";
            return false;
        }
        values_[option.long_name] = "true";
        return true;
    }
    
    if (inline_value) {
        values_[option.long_name] = *inline_value;
        return true;
    }
    if (index + 1 >= argc) {
        error_ = "Option --" + option.long_name + " requires a value";
        return false;
    }
    values_[option.long_name] = argv[++index];
    return true;
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    values_.clear();
    positional_args_.clear();
    error_.clear();
    
    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        
        if (options_done || arg == "-" || !arg.starts_with("-")) {
            positional_args_.push_back(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }
        
        if (arg.starts_with("--")) {
            auto body = arg.substr(2);
            auto eq = body.find('=');
            std::optional<std::string> inline_value;
            if (eq != std::string::npos) {
                inline_value = body.substr(eq + 1);
                body.resize(eq);
            }
            
            const Option* option = find_long(body);
            if (!option) {
                error_ = "Unknown option: --" + body;
                return false;
            }
            if (!store(*option, inline_value, i, argc, argv)) {
                return false;
            }
            continue;
        }
        
        // Short flags may be grouped (-yv); a value-taking flag ends the group.
        for (std::size_t j = 1; j < arg.size(); ++j) {
            const Option* option = find_short(arg[j]);
            if (!option) {
                error_ = std::string("Unknown option: -") + arg[j];
                return false;
            }
            
            std::optional<std::string> inline_value;
            if (option->takes_value && j + 1 < arg.size()) {
                inline_value = arg.substr(j + 1);
            }
            if (!store(*option, inline_value, i, argc, argv)) {
                return false;
            }
            if (option->takes_value) {
                break;
            }
        }
    }
    
    return true;
}

bool CommandLineParser::has_option(const std::string& name) const {
    return values_.count(name) > 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    if (auto it = values_.find(name); it != values_.end()) {
        return it->second;
    }
    if (const Option* option = find_long(name); option && !option->default_value.empty()) {
        return option->default_value;
    }
    return default_value;
}

bool CommandLineParser::get_bool_option(const std::string& name, bool default_value) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        return default_value;
    }
    auto value = utils::StringUtils::to_lower(it->second);
    return value == "true" || value == "1" || value == "yes";
}

std::uint16_t CommandLineParser::get_port_option(const std::string& name, std::uint16_t default_value) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        return default_value;
    }
    
    const auto& text = it->second;
    bool digits = !text.empty() && text.size() <= 5 &&
                  std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; });
    if (!digits || std::stoul(text) > 65535) {
        throw std::invalid_argument("Option --" + name + " expects a port number, got '" + text + "'");
    }
    return static_cast<std::uint16_t>(std::stoul(text));
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    std::cout << "Options:\n";
    
    for (const auto& option : options_) {
        std::string flag = option.short_name ? std::string("-") + option.short_name + ", " : "    ";
        flag += "--" + option.long_name;
        if (option.takes_value) {
            flag += " <value>";
        }
        
        std::cout << "  " << std::left << std::setw(28) << flag << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " 0.1.0\n";
}

}
