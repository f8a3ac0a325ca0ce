#include "handoff/core/command_handler.hpp"
#include "handoff/core/clock.hpp"
#include "handoff/core/config.hpp"
#include "handoff/core/limits.hpp"
#include "handoff/core/line_prompt.hpp"
#include "handoff/core/logger.hpp"
#include "handoff/core/utils.hpp"
#include "handoff/network/connection_state_machine.hpp"
#include "handoff/network/tcp_transport.hpp"
#include "handoff/security/audit_log.hpp"
#include "handoff/security/rate_limiter.hpp"
#include "handoff/security/room_registry.hpp"
#include "handoff/transfer/transfer_engine.hpp"
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <filesystem>
#include <functional>
#include <iomanip>
#include <iostream>
#include <optional>
#include <unistd.h>

namespace handoff::core {

namespace {

std::uint16_t resolve_port(const CommandLineParser& options) {
    auto configured = Config::instance().get_int("transport.port", DEFAULT_PORT);
    if (configured < 0 || configured > 65535) {
        throw std::invalid_argument("transport.port out of range: " + std::to_string(configured));
    }
    return options.get_port_option("port", static_cast<std::uint16_t>(configured));
}

void print_progress(const transfer::BatchProgress& batch) {
    std::cout << "\r  " << batch.completed_files << "/" << batch.total_files << " files  "
              << std::fixed << std::setprecision(1) << batch.overall_percentage << "%  "
              << utils::StringUtils::format_speed(batch.average_speed) << "  ETA "
              << utils::StringUtils::format_time_remaining(batch.estimated_time_remaining)
              << "    " << std::flush;
}

void print_summary(const transfer::ProgressTracker& progress) {
    const auto& batch = progress.batch();
    std::cout << "\nBatch " << transfer::batch_status_name(batch.status) << ": "
              << batch.completed_files << "/" << batch.total_files << " files, "
              << utils::StringUtils::format_bytes(batch.bytes_transferred) << "\n";
    
    for (const auto& file : progress.files()) {
        std::cout << "  " << (file.status == transfer::FileStatus::COMPLETED ? "✓ " : "✗ ")
                  << file.file_name << " (" << utils::StringUtils::format_bytes(file.total_bytes) << ")";
        if (!file.error.empty()) {
            std::cout << ": " << file.error;
        }
        std::cout << "\n";
    }
}

}

CommandResult HostCommandHandler::execute(const std::vector<std::string>& args, const CommandLineParser& options) {
    try {
        auto& config = Config::instance();
        auto security_limits = SecurityLimits::from_config(config);
        auto transfer_limits = TransferLimits::from_config(config);
        
        std::filesystem::path output_dir = options.get_option("output", ".");
        if (!utils::FileUtils::create_directories(output_dir)) {
            return CommandResult::error("Cannot create output directory: " + output_dir.string());
        }
        
        boost::asio::io_context io_context;
        SteadyClock clock;
        
        network::TcpTransport::Options transport_options;
        transport_options.host = "0.0.0.0";
        transport_options.port = resolve_port(options);
        transport_options.limits = TransportLimits::from_config(config);
        network::TcpTransport transport(io_context, transport_options);
        
        security::RoomRegistry rooms(clock, security_limits);
        security::RateLimiter rate_limiter(clock, security_limits);
        security::AuditLog audit_log;
        
        auto connection = network::ConnectionStateMachine::create(
            {io_context, transport, rooms, rate_limiter}, network::Role::HOST, security_limits);
        connection->set_audit_sink(audit_log.sink());
        connection->set_device_info(utils::SystemUtils::device_description());
        
        if (options.has_option("pin")) {
            auto result = connection->set_pin(options.get_option("pin"));
            if (!result) {
                return CommandResult::error(result.message);
            }
        }
        
        auto prompt = LinePrompt::create(io_context, STDIN_FILENO, std::cout);
        bool auto_approve = options.get_bool_option("auto-approve");
        connection->set_approval_provider(
            [auto_approve, prompt](const std::string& peer_id, const std::string& device_info,
                                   network::ApprovalResponder respond) {
                if (auto_approve) {
                    std::cout << "Approving " << device_info << "\n";
                    respond(true);
                    return;
                }
                prompt->ask("\nConnection request from " + device_info + " (" + peer_id + "). Accept? [y/N] ",
                    [respond](std::optional<std::string> answer) {
                        respond(answer && utils::StringUtils::to_lower(*answer).starts_with("y"));
                    });
            });
        
        auto engine = transfer::TransferEngine::create(io_context, clock, transfer_limits);
        engine->attach(connection);
        engine->set_audit_sink(audit_log.sink());
        
        std::size_t saved_files = 0;
        engine->set_delivery_sink([&output_dir, &saved_files](std::vector<std::uint8_t> bytes,
                                                              const transfer::FileMetadata& metadata) {
            auto target = utils::FileUtils::unique_path(output_dir, metadata.sanitized_name);
            if (!utils::FileUtils::write_file(target, bytes)) {
                LOG_ERROR("Failed to save {}", target.string());
                std::cerr << "Failed to save " << target.string() << "\n";
                return;
            }
            ++saved_files;
            std::cout << "Saved " << target.string() << "\n";
        });
        engine->set_progress_listener([](transfer::Direction, const transfer::BatchProgress& batch,
                                         const transfer::TransferProgress&) {
            print_progress(batch);
        });
        engine->set_finished_handler([&engine](transfer::Direction direction, const transfer::BatchProgress&) {
            if (direction == transfer::Direction::INCOMING) {
                print_summary(engine->incoming());
            }
        });
        
        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        std::string failure;
        
        connection->add_state_listener([&](const network::ConnectionInfo& info) {
            switch (info.state) {
                case network::ConnectionState::CONNECTED:
                    std::cout << "Paired with " << info.remote_peer_id << ". Waiting for files...\n";
                    break;
                case network::ConnectionState::DISCONNECTED:
                    std::cout << "Peer disconnected\n";
                    transport.stop();
                    signals.cancel();
                    break;
                case network::ConnectionState::ERROR:
                    failure = info.error;
                    transport.stop();
                    signals.cancel();
                    break;
                case network::ConnectionState::IDLE:
                    if (!info.error.empty()) {
                        std::cout << info.error << "\n";
                    }
                    if (info.room_code.empty()) {
                        failure = info.error.empty() ? "Room closed" : info.error;
                        transport.stop();
                        signals.cancel();
                    }
                    break;
                default:
                    break;
            }
        });
        
        signals.async_wait([&](const boost::system::error_code& ec, int signal) {
            if (ec) {
                return;
            }
            LOG_INFO("Received signal {}, shutting down", signal);
            connection->disconnect();
            transport.stop();
        });
        
        auto result = connection->connect();
        if (!result) {
            return CommandResult::error("Failed to open a room: " + result.message);
        }
        
        std::cout << "Room code: " << connection->formatted_room_code() << "\n";
        std::cout << "Listening on port " << transport.local_port() << "\n";
        if (connection->info().is_pin_required) {
            std::cout << "A PIN is required to pair\n";
        }
        std::cout << "Press Ctrl+C to stop\n";
        
        io_context.run();
        
        if (!failure.empty()) {
            return CommandResult::error(failure);
        }
        return CommandResult::ok("Received " + std::to_string(saved_files) + " files");
        
    } catch (const std::exception& e) {
        LOG_ERROR("host command failed: {}", e.what());
        return CommandResult::error(e.what());
    }
}

CommandResult SendCommandHandler::execute(const std::vector<std::string>& args, const CommandLineParser& options) {
    if (args.size() < 2 || !options.has_option("code")) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    try {
        auto& config = Config::instance();
        auto security_limits = SecurityLimits::from_config(config);
        auto transfer_limits = TransferLimits::from_config(config);
        
        std::vector<std::shared_ptr<transfer::FileSource>> files;
        for (std::size_t i = 1; i < args.size(); ++i) {
            files.push_back(std::make_shared<transfer::DiskFileSource>(args[i]));
        }
        
        boost::asio::io_context io_context;
        SteadyClock clock;
        
        network::TcpTransport::Options transport_options;
        transport_options.host = options.get_option("address", "127.0.0.1");
        transport_options.port = resolve_port(options);
        transport_options.limits = TransportLimits::from_config(config);
        network::TcpTransport transport(io_context, transport_options);
        
        security::RoomRegistry rooms(clock, security_limits);
        security::RateLimiter rate_limiter(clock, security_limits);
        security::AuditLog audit_log;
        
        auto connection = network::ConnectionStateMachine::create(
            {io_context, transport, rooms, rate_limiter}, network::Role::CLIENT, security_limits);
        connection->set_audit_sink(audit_log.sink());
        connection->set_device_info(utils::SystemUtils::device_description());
        
        std::optional<std::string> preset_pin;
        if (options.has_option("pin")) {
            preset_pin = options.get_option("pin");
        }
        auto prompt = LinePrompt::create(io_context, STDIN_FILENO, std::cout);
        connection->set_pin_entry_provider(
            [&preset_pin, prompt](std::uint32_t attempt, network::PinResponder respond) {
                if (attempt == 1 && preset_pin) {
                    respond(*preset_pin);
                    return;
                }
                prompt->ask("PIN (attempt " + std::to_string(attempt) + "): ", respond);
            });
        
        auto engine = transfer::TransferEngine::create(io_context, clock, transfer_limits);
        engine->attach(connection);
        engine->set_audit_sink(audit_log.sink());
        engine->set_progress_listener([](transfer::Direction direction, const transfer::BatchProgress& batch,
                                         const transfer::TransferProgress&) {
            if (direction == transfer::Direction::OUTGOING) {
                print_progress(batch);
            }
        });
        
        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        std::string failure;
        bool batch_started = false;
        bool batch_failed = false;
        
        engine->set_finished_handler([&](transfer::Direction direction, const transfer::BatchProgress& batch) {
            if (direction != transfer::Direction::OUTGOING) {
                return;
            }
            print_summary(engine->outgoing());
            batch_failed = batch.status != transfer::BatchStatus::COMPLETED;
            connection->disconnect();
            signals.cancel();
        });
        
        connection->add_state_listener([&](const network::ConnectionInfo& info) {
            switch (info.state) {
                case network::ConnectionState::AWAITING_APPROVAL:
                    std::cout << "Waiting for the host to approve...\n";
                    break;
                case network::ConnectionState::CONNECTED: {
                    if (batch_started) {
                        break;
                    }
                    batch_started = true;
                    std::cout << "Connected. Sending " << files.size() << " files\n";
                    auto outcome = engine->send_files(files);
                    for (const auto& rejected : outcome.validation.rejected_files) {
                        std::cout << "Skipping " << rejected.source->name() << ": "
                                  << rejected.result.errors.front() << "\n";
                    }
                    if (!outcome.started) {
                        failure = outcome.error;
                        connection->disconnect();
                        signals.cancel();
                    }
                    break;
                }
                case network::ConnectionState::ERROR:
                    failure = info.error;
                    signals.cancel();
                    break;
                case network::ConnectionState::IDLE:
                    if (!info.error.empty()) {
                        failure = info.error;
                        signals.cancel();
                    }
                    break;
                default:
                    break;
            }
        });
        
        signals.async_wait([&](const boost::system::error_code& ec, int signal) {
            if (ec) {
                return;
            }
            LOG_INFO("Received signal {}, cancelling", signal);
            engine->cancel();
            connection->disconnect();
        });
        
        auto result = connection->connect(options.get_option("code"));
        if (!result) {
            return CommandResult::error(result.message);
        }
        
        std::cout << "Connecting to " << transport_options.host << ":" << transport_options.port << "...\n";
        io_context.run();
        
        if (!failure.empty()) {
            return CommandResult::error(failure);
        }
        if (batch_failed) {
            return CommandResult::error("Some files were not delivered");
        }
        return CommandResult::ok("Batch delivered");
        
    } catch (const std::exception& e) {
        LOG_ERROR("send command failed: {}", e.what());
        return CommandResult::error(e.what());
    }
}

}
