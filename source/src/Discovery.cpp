#include "Discovery.hpp"
#include "PeerTable.hpp"
#include "BaseTransport.hpp"

#include <algorithm>
#include <print>

Discovery::Discovery(boost::asio::any_io_executor exec, const NodeConfig& config, PeerTable& peers, BaseTransport& transport, std::vector<boost::asio::ip::address> self):
    _strand(boost::asio::make_strand(exec)),
    _beacon_timer(_strand),
    _config(config),
    _peers(peers),
    _transport(transport),
    _self(std::move(self))
    {}

void Discovery::set_callbacks(PeerCallback learned, PeerCallback pruned) {
    _learned = std::move(learned);
    _pruned = std::move(pruned);
}

void Discovery::start() {
    boost::asio::co_spawn(_strand, beacon_loop(), boost::asio::detached);
}

void Discovery::stop() {
    if (_stopped.exchange(true, std::memory_order_acq_rel)) return;

    boost::asio::post(_strand, [this] { _beacon_timer.cancel(); });
}

bool Discovery::is_self(const boost::asio::ip::address& addr) const {
    return addr.is_loopback() || std::ranges::find(_self, addr) != _self.end();
}

boost::asio::awaitable<void> Discovery::beacon_loop() {
    boost::system::error_code ec;

    while (!_stopped.load(std::memory_order_acquire)) {
        co_await beacon();
        prune();

        _beacon_timer.expires_after(_config.broadcast_period);
        co_await _beacon_timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        ec.clear();
    }
}

boost::asio::awaitable<void> Discovery::beacon() {
    std::println("Broadcasting hello as {}", _config.name);

    auto ec = co_await _transport.broadcast(encode(Hello{ _config.name }));
    if (ec) std::println(stderr, "Broadcast failed: {}", ec.message());
}

boost::asio::awaitable<void> Discovery::handle_hello(const boost::asio::ip::address& from, const Hello& hello, clock::time_point now) {
    if (is_self(from)) co_return;

    if (_peers.upsert(from, hello.name, now)) std::println("{} ({}) said hello", hello.name, from.to_string());

    if (_learned) _learned(from);

    auto ec = co_await _transport.send_stream(from, encode(HelloAck{ _config.name }));
    if (ec) std::println(stderr, "Hello ack to {}: {}", from.to_string(), describe_transport_error(ec));
}

void Discovery::handle_hello_ack(const boost::asio::ip::address& from, const HelloAck& ack, clock::time_point now) {
    if (is_self(from)) return;

    if (_peers.upsert(from, ack.name, now)) std::println("{} ({}) answered hello", ack.name, from.to_string());

    if (_learned) _learned(from);
}

boost::asio::awaitable<bool> Discovery::probe(const boost::asio::ip::address& to) {
    auto ec = co_await _transport.send_stream(to, encode(Hello{ _config.name }));

    if (ec) {
        std::println(stderr, "Hello to {}: {}", to.to_string(), describe_transport_error(ec));
        co_return false;
    }

    co_return true;
}

std::vector<Peer> Discovery::prune(clock::time_point now) {
    auto removed = _peers.prune(_config.pruning_period, now);

    for (const auto& peer: removed) {
        std::println("Pruning {} ({}) after inactivity", peer.name(), peer.ip());
        if (_pruned) _pruned(peer.addr());
    }

    return removed;
}
