#include "handoff/core/cli.hpp"
#include "handoff/core/command_registry.hpp"
#include "handoff/core/config.hpp"
#include "handoff/core/logger.hpp"
#include "handoff/crypto/random.hpp"
#include <filesystem>
#include <iostream>
#include <string>

namespace {

using handoff::core::CommandLineParser;
using handoff::core::CommandRegistry;
using handoff::core::Config;
using handoff::core::Logger;

void print_usage(const CommandLineParser& parser, const CommandRegistry& registry) {
    parser.print_help();
    registry.print_help();
}

// Defaults first, then the file when it exists. A missing default file is not an error.
bool load_configuration(const CommandLineParser& parser, Config& config) {
    config.set_defaults();
    
    auto path = parser.get_option("config", "handoff.conf");
    if (!std::filesystem::exists(path)) {
        if (parser.has_option("config")) {
            std::cerr << "Error: configuration file " << path << " does not exist\n";
            return false;
        }
        return true;
    }
    if (!config.load_from_file(path)) {
        std::cerr << "Error: failed to read configuration from " << path << "\n";
        return false;
    }
    return true;
}

}

int main(int argc, char* argv[]) {
    CommandLineParser parser("handoff");
    CommandRegistry registry;
    
    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        print_usage(parser, registry);
        return 2;
    }
    if (parser.has_option("help")) {
        print_usage(parser, registry);
        return 0;
    }
    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }
    
    const auto& args = parser.get_positional_args();
    if (args.empty()) {
        print_usage(parser, registry);
        return 2;
    }
    if (!registry.has_command(args.front())) {
        std::cerr << "Unknown command: " << args.front() << "\n";
        registry.print_help();
        return 2;
    }
    
    auto& config = Config::instance();
    if (!load_configuration(parser, config)) {
        return 1;
    }
    
    auto level = parser.has_option("verbose")
        ? handoff::core::LogLevel::Debug
        : Logger::parse_level(config.get_string("log.level", "info"));
    Logger::initialize(config.get_string("log.file", "handoff.log"), level);
    
    if (!handoff::crypto::SecureRandom::initialize()) {
        std::cerr << "Error: libsodium is unavailable\n";
        Logger::shutdown();
        return 1;
    }
    
    auto result = registry.execute_command(args.front(), args, parser);
    
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
    } else if (!result.message.empty()) {
        std::cout << result.message << "\n";
    }
    
    Logger::shutdown();
    return result.exit_code;
}
