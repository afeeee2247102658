#pragma once

#include "BaseTransport.hpp"

#include <atomic>
#include <deque>
#include <memory>
#include <string>

#include <boost/asio.hpp>

class Dispatcher;

// the two listeners of one known peer. inbound bytes for this peer are queued
// per channel, each queue is drained by its own loop on its own strand.
// stop() retires both loops without waiting for more traffic.
class PeerSession: public std::enable_shared_from_this<PeerSession> {
public:
    PeerSession(boost::asio::any_io_executor exec, const boost::asio::ip::address& peer, Dispatcher& dispatcher):
        _peer(peer),
        _dispatcher(dispatcher),
        _stream(exec, Channel::Stream),
        _datagram(exec, Channel::Datagram)
        {}

    const boost::asio::ip::address& peer() const { return _peer; }

    void start();
    void stop();
    void deliver(Channel channel, std::string bytes);

    bool is_stopped() const { return _stopped.load(std::memory_order_acquire); }

private:
    struct Inbox {
        boost::asio::strand<boost::asio::any_io_executor> strand;
        boost::asio::steady_timer signal;
        std::deque<std::string> pending;
        Channel channel;

        Inbox(boost::asio::any_io_executor exec, Channel ch): strand(boost::asio::make_strand(exec)), signal(strand), channel(ch) {}
    };

    [[nodiscard]] boost::asio::awaitable<void> listen(Inbox& inbox);

    Inbox& inbox_for(Channel channel) { return channel == Channel::Stream ? _stream : _datagram; }

    boost::asio::ip::address _peer;
    Dispatcher& _dispatcher;

    Inbox _stream;
    Inbox _datagram;

    static constexpr size_t MAX_PENDING = 4096;

    std::atomic<bool> _stopped = false;
};
