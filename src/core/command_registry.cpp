#include "handoff/core/command_registry.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>

namespace handoff::core {

CommandRegistry::CommandRegistry() {
    register_command("host", std::make_unique<HostCommandHandler>());
    register_command("send", std::make_unique<SendCommandHandler>());
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    auto it = std::find_if(handlers_.begin(), handlers_.end(),
                           [&name](const auto& entry) { return entry.first == name; });
    if (it != handlers_.end()) {
        it->second = std::move(handler);
        return;
    }
    handlers_.emplace_back(name, std::move(handler));
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args,
                                               const CommandLineParser& options) {
    auto* handler = find(command);
    if (!handler) {
        return CommandResult::error("Unknown command: " + command, 2);
    }
    return handler->execute(args, options);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return find(command) != nullptr;
}

CommandHandler* CommandRegistry::find(const std::string& command) const {
    for (const auto& [name, handler] : handlers_) {
        if (name == command) {
            return handler.get();
        }
    }
    return nullptr;
}

void CommandRegistry::print_help() const {
    std::cout << "\nCommands:\n";
    for (const auto& [name, handler] : handlers_) {
        std::cout << "  " << std::left << std::setw(8) << name << handler->get_description() << "\n"
                  << "  " << std::setw(8) << "" << handler->get_usage() << "\n";
    }
}

}
