#pragma once

#include "handoff/core/cli.hpp"
#include <string>
#include <vector>

namespace handoff::core {

struct CommandResult {
    bool success = true;
    std::string message;
    int exit_code = 0;
    
    static CommandResult ok(const std::string& msg = "") {
        return {true, msg, 0};
    }
    
    static CommandResult error(const std::string& msg, int code = 1) {
        return {false, msg, code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    
    // args[0] is the command name itself.
    virtual CommandResult execute(const std::vector<std::string>& args, const CommandLineParser& options) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

// Issues a room, waits for one device and saves what it sends.
class HostCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args, const CommandLineParser& options) override;
    std::string get_description() const override { return "Open a room and receive files from one device"; }
    std::string get_usage() const override {
        return "handoff host [--port N] [--pin NNNN] [--output DIR] [--auto-approve]";
    }
};

// Joins a room and sends files as a single batch.
class SendCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args, const CommandLineParser& options) override;
    std::string get_description() const override { return "Send files to a host's room"; }
    std::string get_usage() const override {
        return "handoff send --address HOST --port N --code XXXX-XXXX [--pin NNNN] FILE...";
    }
};

}
