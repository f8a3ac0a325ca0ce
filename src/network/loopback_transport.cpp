#include "handoff/network/loopback_transport.hpp"
#include "handoff/security/room_registry.hpp"
#include "handoff/core/logger.hpp"
#include <algorithm>

namespace handoff::network {

LoopbackChannel::LoopbackChannel(boost::asio::io_context& io_context, std::string name)
    : io_context_(io_context)
    , name_(std::move(name))
    , open_(true)
    , started_(false)
    , paused_(false)
    , inbound_bytes_(0)
    , frames_sent_(0) {}

void LoopbackChannel::link(const std::shared_ptr<LoopbackChannel>& a, const std::shared_ptr<LoopbackChannel>& b) {
    a->peer_ = b;
    b->peer_ = a;
}

void LoopbackChannel::open() {
    if (started_) {
        return;
    }
    started_ = true;
    drain();
}

std::size_t LoopbackChannel::buffered_bytes() const {
    auto peer = peer_.lock();
    return peer ? peer->inbound_bytes_ : 0;
}

void LoopbackChannel::set_paused(bool paused) {
    paused_ = paused;
    if (!paused_ && started_) {
        drain();
    }
}

void LoopbackChannel::drain() {
    while (open_ && !paused_ && !held_.empty()) {
        auto frame = std::move(held_.front());
        held_.pop_front();
        release(frame.size());
        notify_message(std::move(frame));
    }
}

void LoopbackChannel::release(std::size_t size) {
    inbound_bytes_ -= std::min(inbound_bytes_, size);
}

void LoopbackChannel::reset_inbound() {
    held_.clear();
    inbound_bytes_ = 0;
}

bool LoopbackChannel::send(std::vector<std::uint8_t> frame) {
    if (!open_) {
        return false;
    }
    
    if (filter_ && !filter_(frame)) {
        LOG_DEBUG("Loopback {} rejected outbound frame", name_);
        return false;
    }
    
    auto peer = peer_.lock();
    if (!peer) {
        return false;
    }
    
    ++frames_sent_;
    peer->inbound_bytes_ += frame.size();
    boost::asio::post(io_context_, [peer, frame = std::move(frame)]() mutable {
        peer->deliver(std::move(frame));
    });
    return true;
}

void LoopbackChannel::close() {
    if (!open_) {
        return;
    }
    open_ = false;
    reset_inbound();
    
    if (auto peer = peer_.lock()) {
        boost::asio::post(io_context_, [peer] { peer->remote_closed(); });
    }
}

void LoopbackChannel::sever(const std::string& error) {
    if (!open_) {
        return;
    }
    open_ = false;
    reset_inbound();
    
    auto self = shared_from_this();
    auto peer = peer_.lock();
    boost::asio::post(io_context_, [self, peer, error] {
        self->notify_error(error);
        if (peer) {
            peer->remote_failed(error);
        }
    });
}

void LoopbackChannel::deliver(std::vector<std::uint8_t> frame) {
    if (!open_) {
        release(frame.size());
        return;
    }
    
    if (!started_ || paused_) {
        held_.push_back(std::move(frame));
        return;
    }
    
    release(frame.size());
    notify_message(std::move(frame));
}

void LoopbackChannel::remote_closed() {
    if (!open_) {
        return;
    }
    open_ = false;
    reset_inbound();
    notify_close();
}

void LoopbackChannel::remote_failed(const std::string& error) {
    if (!open_) {
        return;
    }
    open_ = false;
    reset_inbound();
    notify_error(error);
}

LoopbackTransport::LoopbackTransport(boost::asio::io_context& io_context)
    : io_context_(io_context)
    , next_pair_id_(1) {}

void LoopbackTransport::listen(const std::string& room_code, IncomingHandler handler) {
    listeners_[security::normalize_room_code(room_code)] = std::move(handler);
}

void LoopbackTransport::stop_listening(const std::string& room_code) {
    listeners_.erase(security::normalize_room_code(room_code));
}

bool LoopbackTransport::is_listening(const std::string& room_code) const {
    return listeners_.count(security::normalize_room_code(room_code)) > 0;
}

void LoopbackTransport::connect(const std::string& room_code, ConnectHandler handler) {
    auto room = security::normalize_room_code(room_code);
    auto it = listeners_.find(room);
    
    if (it == listeners_.end()) {
        LOG_WARN("Loopback connect: no host listening on room {}", room);
        boost::asio::post(io_context_, [handler = std::move(handler)] {
            handler(nullptr, "No host is listening on this room code");
        });
        return;
    }
    
    auto pair_id = std::to_string(next_pair_id_++);
    auto host = std::make_shared<LoopbackChannel>(io_context_, "host-" + pair_id);
    auto client = std::make_shared<LoopbackChannel>(io_context_, "client-" + pair_id);
    LoopbackChannel::link(host, client);
    
    if (observer_) {
        observer_(host, client);
    }
    
    auto incoming = it->second;
    boost::asio::post(io_context_, [incoming, host, client, handler = std::move(handler)] {
        incoming(host);
        handler(client, "");
    });
}

}
