#include "handoff/network/tcp_transport.hpp"
#include "handoff/security/room_registry.hpp"
#include "handoff/core/logger.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <algorithm>

namespace handoff::network {

TcpChannel::TcpChannel(boost::asio::io_context& io_context, tcp::socket socket, std::uint32_t max_frame_size)
    : io_context_(io_context)
    , socket_(std::move(socket))
    , max_frame_size_(max_frame_size)
    , open_(true)
    , reading_(false)
    , closing_(false)
    , read_header_buffer_{}
    , queued_bytes_(0)
    , write_in_progress_(false) {
    
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
        remote_endpoint_ = "unknown";
        LOG_WARN("Failed to get remote endpoint: {}", ec.message());
    } else {
        remote_endpoint_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }
}

TcpChannel::~TcpChannel() {
    LOG_DEBUG("Channel to {} destroyed", remote_endpoint_);
}

void TcpChannel::open() {
    if (reading_ || !open_) {
        return;
    }
    reading_ = true;
    receive_loop();
}

bool TcpChannel::send(std::vector<std::uint8_t> frame) {
    if (!open_) {
        return false;
    }
    if (frame.size() > max_frame_size_) {
        LOG_ERROR("Frame of {} bytes exceeds limit for {}", frame.size(), remote_endpoint_);
        return false;
    }
    
    auto size = static_cast<std::uint32_t>(frame.size());
    std::vector<std::uint8_t> message;
    message.reserve(frame.size() + 4);
    message.push_back((size >> 24) & 0xFF);
    message.push_back((size >> 16) & 0xFF);
    message.push_back((size >> 8) & 0xFF);
    message.push_back(size & 0xFF);
    message.insert(message.end(), frame.begin(), frame.end());
    
    queued_bytes_ += message.size();
    write_queue_.push(std::move(message));
    if (!write_in_progress_) {
        do_write();
    }
    return true;
}

void TcpChannel::close() {
    if (!open_) {
        return;
    }
    
    open_ = false;
    closing_ = true;
    LOG_DEBUG("Closing channel to {}", remote_endpoint_);
    
    if (!write_in_progress_) {
        shutdown_socket();
    }
}

void TcpChannel::read_frame(FrameCallback callback) {
    read_header(std::move(callback));
}

void TcpChannel::read_header(FrameCallback callback) {
    auto self = shared_from_this();
    boost::asio::async_read(socket_,
        boost::asio::buffer(read_header_buffer_),
        [this, self, callback = std::move(callback)](boost::system::error_code ec, std::size_t) mutable {
            if (ec) {
                callback(ec, {});
                return;
            }
            
            std::uint32_t size = (static_cast<std::uint32_t>(read_header_buffer_[0]) << 24) |
                                 (static_cast<std::uint32_t>(read_header_buffer_[1]) << 16) |
                                 (static_cast<std::uint32_t>(read_header_buffer_[2]) << 8) |
                                 static_cast<std::uint32_t>(read_header_buffer_[3]);
            
            if (size > max_frame_size_) {
                LOG_ERROR("Frame too large ({} bytes) from {}", size, remote_endpoint_);
                callback(boost::asio::error::message_size, {});
                return;
            }
            
            if (size == 0) {
                callback({}, {});
                return;
            }
            
            read_payload(size, std::move(callback));
        });
}

void TcpChannel::read_payload(std::uint32_t payload_size, FrameCallback callback) {
    read_payload_buffer_.resize(payload_size);
    
    auto self = shared_from_this();
    boost::asio::async_read(socket_,
        boost::asio::buffer(read_payload_buffer_),
        [this, self, callback = std::move(callback)](boost::system::error_code ec, std::size_t) mutable {
            if (ec) {
                callback(ec, {});
                return;
            }
            callback({}, std::move(read_payload_buffer_));
        });
}

void TcpChannel::receive_loop() {
    if (!open_) {
        return;
    }
    
    auto self = shared_from_this();
    read_header([this, self](const boost::system::error_code& ec, std::vector<std::uint8_t> frame) {
        if (ec) {
            handle_error(ec);
            return;
        }
        if (!open_) {
            return;
        }
        
        notify_message(std::move(frame));
        receive_loop();
    });
}

void TcpChannel::do_write() {
    if (write_queue_.empty() || write_in_progress_) {
        return;
    }
    
    write_in_progress_ = true;
    
    auto self = shared_from_this();
    boost::asio::async_write(socket_,
        boost::asio::buffer(write_queue_.front()),
        [this, self](boost::system::error_code ec, std::size_t) {
            write_in_progress_ = false;
            
            if (ec) {
                handle_error(ec);
                return;
            }
            
            queued_bytes_ -= write_queue_.front().size();
            write_queue_.pop();
            if (!write_queue_.empty()) {
                do_write();
            } else if (closing_) {
                shutdown_socket();
            }
        });
}

void TcpChannel::handle_error(const boost::system::error_code& error) {
    if (!open_) {
        if (closing_) {
            shutdown_socket();
        }
        return;
    }
    
    open_ = false;
    shutdown_socket();
    
    if (error == boost::asio::error::eof) {
        LOG_INFO("Channel to {} closed by peer", remote_endpoint_);
        notify_close();
    } else {
        LOG_ERROR("Channel error with {}: {}", remote_endpoint_, error.message());
        notify_error(error.message());
    }
}

void TcpChannel::shutdown_socket() {
    closing_ = false;
    std::queue<std::vector<std::uint8_t>>().swap(write_queue_);
    queued_bytes_ = 0;
    
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

TcpTransport::TcpTransport(boost::asio::io_context& io_context, Options options)
    : io_context_(io_context)
    , options_(std::move(options))
    , acceptor_(io_context) {}

TcpTransport::~TcpTransport() {
    stop();
}

void TcpTransport::start_server() {
    if (acceptor_.is_open()) {
        return;
    }
    
    tcp::endpoint endpoint(tcp::v4(), options_.port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    
    LOG_INFO("TCP transport listening on port {}", local_port());
    do_accept();
}

void TcpTransport::stop() {
    listeners_.clear();
    
    if (acceptor_.is_open()) {
        boost::system::error_code ec;
        acceptor_.close(ec);
    }
}

std::uint16_t TcpTransport::local_port() const {
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void TcpTransport::listen(const std::string& room_code, IncomingHandler handler) {
    start_server();
    listeners_[security::normalize_room_code(room_code)] = std::move(handler);
}

void TcpTransport::stop_listening(const std::string& room_code) {
    listeners_.erase(security::normalize_room_code(room_code));
}

void TcpTransport::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open()) {
                return;
            }
            
            if (ec) {
                LOG_ERROR("Accept error: {}", ec.message());
            } else {
                handle_accepted(std::make_shared<TcpChannel>(
                    io_context_, std::move(socket), options_.limits.max_frame_size));
            }
            
            do_accept();
        });
}

void TcpTransport::handle_accepted(std::shared_ptr<TcpChannel> channel) {
    LOG_DEBUG("Accepted connection from {}", channel->remote_description());
    
    channel->read_frame([this, channel](const boost::system::error_code& ec, std::vector<std::uint8_t> frame) {
        if (ec) {
            LOG_WARN("Connection from {} dropped before naming a room: {}",
                     channel->remote_description(), ec.message());
            channel->close();
            return;
        }
        
        auto room = security::normalize_room_code(std::string(frame.begin(), frame.end()));
        auto it = listeners_.find(room);
        if (it == listeners_.end()) {
            LOG_WARN("Connection from {} asked for unknown room", channel->remote_description());
            channel->close();
            return;
        }
        
        auto handler = it->second;
        handler(channel);
    });
}

void TcpTransport::connect(const std::string& room_code, ConnectHandler handler) {
    auto attempt = std::make_shared<ConnectAttempt>();
    attempt->room_code = security::normalize_room_code(room_code);
    attempt->handler = std::move(handler);
    attempt->retry_timer = std::make_unique<boost::asio::steady_timer>(io_context_);
    
    attempt_connect(attempt);
}

void TcpTransport::attempt_connect(std::shared_ptr<ConnectAttempt> attempt) {
    attempt->attempt++;
    LOG_INFO("Connecting to {}:{} (attempt {}/{})", options_.host, options_.port,
             attempt->attempt, options_.limits.max_reconnect_attempts);
    
    tcp::resolver resolver(io_context_);
    boost::system::error_code ec;
    auto endpoints = resolver.resolve(options_.host, std::to_string(options_.port), ec);
    if (ec) {
        attempt->last_error = ec.message();
        schedule_retry(attempt);
        return;
    }
    
    attempt->socket = std::make_unique<tcp::socket>(io_context_);
    boost::asio::async_connect(*attempt->socket, endpoints,
        [this, attempt](boost::system::error_code ec, const tcp::endpoint&) {
            if (ec) {
                attempt->last_error = ec.message();
                schedule_retry(attempt);
                return;
            }
            
            auto channel = std::make_shared<TcpChannel>(
                io_context_, std::move(*attempt->socket), options_.limits.max_frame_size);
            const auto& room = attempt->room_code;
            channel->send(std::vector<std::uint8_t>(room.begin(), room.end()));
            
            LOG_INFO("Connected to {}", channel->remote_description());
            attempt->handler(channel, "");
        });
}

void TcpTransport::schedule_retry(std::shared_ptr<ConnectAttempt> attempt) {
    if (attempt->attempt >= options_.limits.max_reconnect_attempts) {
        auto error = "Unable to reach host after " + std::to_string(attempt->attempt) +
                     " attempts: " + attempt->last_error;
        LOG_ERROR("{}", error);
        attempt->handler(nullptr, error);
        return;
    }
    
    auto delay = backoff_delay(attempt->attempt);
    LOG_WARN("Connection attempt {} failed ({}), retrying in {} ms",
             attempt->attempt, attempt->last_error, delay.count());
    
    attempt->retry_timer->expires_after(delay);
    attempt->retry_timer->async_wait([this, attempt](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        attempt_connect(attempt);
    });
}

std::chrono::milliseconds TcpTransport::backoff_delay(std::uint32_t attempt) const {
    auto delay = options_.limits.initial_backoff;
    for (std::uint32_t i = 1; i < attempt && delay < options_.limits.max_backoff; ++i) {
        delay *= 2;
    }
    return std::min(delay, options_.limits.max_backoff);
}

}
