#pragma once

#include "handoff/core/command_handler.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace handoff::core {

// Commands in registration order, which is also the order `--help` lists them.
class CommandRegistry {
public:
    CommandRegistry();
    
    // Replaces an existing handler of the same name.
    void register_command(const std::string& name, std::unique_ptr<CommandHandler> handler);
    CommandResult execute_command(const std::string& command, const std::vector<std::string>& args,
                                  const CommandLineParser& options);
    bool has_command(const std::string& command) const;
    void print_help() const;

private:
    CommandHandler* find(const std::string& command) const;
    
    std::vector<std::pair<std::string, std::unique_ptr<CommandHandler>>> handlers_;
};

}
