#pragma once

#include "handoff/network/channel.hpp"
#include "handoff/core/limits.hpp"
#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <array>
#include <map>
#include <queue>

namespace handoff::network {

using boost::asio::ip::tcp;

// Frames are a 4-byte big-endian length followed by the payload.
class TcpChannel : public Channel, public std::enable_shared_from_this<TcpChannel> {
public:
    using FrameCallback = std::function<void(const boost::system::error_code&, std::vector<std::uint8_t>)>;
    
    TcpChannel(boost::asio::io_context& io_context, tcp::socket socket, std::uint32_t max_frame_size);
    ~TcpChannel();
    
    void open() override;
    bool send(std::vector<std::uint8_t> frame) override;
    void close() override;
    bool is_open() const override { return open_; }
    std::string remote_description() const override { return remote_endpoint_; }
    std::size_t buffered_bytes() const override { return queued_bytes_; }
    
    // Reads exactly one frame without starting the receive loop.
    void read_frame(FrameCallback callback);

private:
    void read_header(FrameCallback callback);
    void read_payload(std::uint32_t payload_size, FrameCallback callback);
    void receive_loop();
    void do_write();
    void handle_error(const boost::system::error_code& error);
    void shutdown_socket();
    
    boost::asio::io_context& io_context_;
    tcp::socket socket_;
    std::string remote_endpoint_;
    std::uint32_t max_frame_size_;
    bool open_;
    bool reading_;
    bool closing_;
    
    std::array<std::uint8_t, 4> read_header_buffer_;
    std::vector<std::uint8_t> read_payload_buffer_;
    
    std::queue<std::vector<std::uint8_t>> write_queue_;
    std::size_t queued_bytes_;
    bool write_in_progress_;
};

class TcpTransport : public Transport {
public:
    struct Options {
        std::string host = "127.0.0.1";
        std::uint16_t port = core::DEFAULT_PORT;
        core::TransportLimits limits;
    };
    
    TcpTransport(boost::asio::io_context& io_context, Options options);
    ~TcpTransport();
    
    // Binds the listening socket; port 0 picks an ephemeral port. Throws on bind failure.
    void start_server();
    void stop();
    std::uint16_t local_port() const;
    
    // Starts the server on first use.
    void listen(const std::string& room_code, IncomingHandler handler) override;
    void stop_listening(const std::string& room_code) override;
    void connect(const std::string& room_code, ConnectHandler handler) override;

private:
    struct ConnectAttempt {
        std::string room_code;
        ConnectHandler handler;
        std::uint32_t attempt = 0;
        std::string last_error;
        std::unique_ptr<tcp::socket> socket;
        std::unique_ptr<boost::asio::steady_timer> retry_timer;
    };
    
    void do_accept();
    void handle_accepted(std::shared_ptr<TcpChannel> channel);
    void attempt_connect(std::shared_ptr<ConnectAttempt> attempt);
    void schedule_retry(std::shared_ptr<ConnectAttempt> attempt);
    std::chrono::milliseconds backoff_delay(std::uint32_t attempt) const;
    
    boost::asio::io_context& io_context_;
    Options options_;
    tcp::acceptor acceptor_;
    std::map<std::string, IncomingHandler> listeners_;
};

}
