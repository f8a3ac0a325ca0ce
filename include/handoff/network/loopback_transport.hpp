#pragma once

#include "handoff/network/channel.hpp"
#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <deque>
#include <map>

namespace handoff::network {

// In-process channel; delivery is posted to the io_context in send order.
class LoopbackChannel : public Channel, public std::enable_shared_from_this<LoopbackChannel> {
public:
    // May rewrite the frame in place; returning false makes send() fail.
    using OutboundFilter = std::function<bool(std::vector<std::uint8_t>&)>;
    
    LoopbackChannel(boost::asio::io_context& io_context, std::string name);
    
    static void link(const std::shared_ptr<LoopbackChannel>& a, const std::shared_ptr<LoopbackChannel>& b);
    
    void open() override;
    bool send(std::vector<std::uint8_t> frame) override;
    void close() override;
    bool is_open() const override { return open_; }
    std::string remote_description() const override { return "loopback:" + name_; }
    // Frames posted to the peer or held by it and not yet handed to its handler.
    std::size_t buffered_bytes() const override;
    
    void set_outbound_filter(OutboundFilter filter) { filter_ = std::move(filter); }
    
    // A paused channel holds inbound frames the way a stalled reader would.
    void set_paused(bool paused);
    
    // Simulates an abrupt link failure; both ends report `error`.
    void sever(const std::string& error = "Connection lost");
    
    std::size_t frames_sent() const { return frames_sent_; }

private:
    void deliver(std::vector<std::uint8_t> frame);
    void drain();
    void release(std::size_t size);
    void reset_inbound();
    void remote_closed();
    void remote_failed(const std::string& error);
    
    boost::asio::io_context& io_context_;
    std::string name_;
    std::weak_ptr<LoopbackChannel> peer_;
    OutboundFilter filter_;
    bool open_;
    bool started_;
    bool paused_;
    std::deque<std::vector<std::uint8_t>> held_;
    std::size_t inbound_bytes_;
    std::size_t frames_sent_;
};

class LoopbackTransport : public Transport {
public:
    using PairObserver = std::function<void(std::shared_ptr<LoopbackChannel> host,
                                            std::shared_ptr<LoopbackChannel> client)>;
    
    explicit LoopbackTransport(boost::asio::io_context& io_context);
    
    void listen(const std::string& room_code, IncomingHandler handler) override;
    void stop_listening(const std::string& room_code) override;
    void connect(const std::string& room_code, ConnectHandler handler) override;
    
    // Sees every channel pair before either side gets it.
    void set_pair_observer(PairObserver observer) { observer_ = std::move(observer); }
    
    bool is_listening(const std::string& room_code) const;

private:
    boost::asio::io_context& io_context_;
    std::map<std::string, IncomingHandler> listeners_;
    PairObserver observer_;
    std::size_t next_pair_id_;
};

}
