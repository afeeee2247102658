#pragma once

#include "Message.hpp"
#include "NodeConfig.hpp"
#include "Peer.hpp"

#include <atomic>
#include <functional>
#include <vector>

#include <boost/asio.hpp>

class PeerTable;
class BaseTransport;

// membership: Unknown -> Greeted -> Known -> (silence) -> Unknown
class Discovery {
public:
    using clock = std::chrono::steady_clock;
    using PeerCallback = std::function<void(const boost::asio::ip::address&)>;

    Discovery(boost::asio::any_io_executor exec, const NodeConfig& config, PeerTable& peers, BaseTransport& transport, std::vector<boost::asio::ip::address> self);

    // learned fires on every hello / hello ack, pruned once per removed peer
    void set_callbacks(PeerCallback learned, PeerCallback pruned);

    void start();
    void stop();

    [[nodiscard]] boost::asio::awaitable<void> beacon();
    [[nodiscard]] boost::asio::awaitable<void> handle_hello(const boost::asio::ip::address& from, const Hello& hello, clock::time_point now = clock::now());
    void handle_hello_ack(const boost::asio::ip::address& from, const HelloAck& ack, clock::time_point now = clock::now());

    // direct hello over the stream channel, false when it could not be delivered
    [[nodiscard]] boost::asio::awaitable<bool> probe(const boost::asio::ip::address& to);

    std::vector<Peer> prune(clock::time_point now = clock::now());

    bool is_self(const boost::asio::ip::address& addr) const;
    const std::string& name() const { return _config.name; }

private:
    boost::asio::awaitable<void> beacon_loop();

    boost::asio::strand<boost::asio::any_io_executor> _strand;
    boost::asio::steady_timer _beacon_timer;

    NodeConfig _config;
    PeerTable& _peers;
    BaseTransport& _transport;
    std::vector<boost::asio::ip::address> _self;

    PeerCallback _learned, _pruned;

    std::atomic<bool> _stopped{false};
};
