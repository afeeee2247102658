#pragma once

#include "Peer.hpp"

#include <mutex>
#include <optional>
#include <vector>
#include <unordered_map>

struct PeerSnapshot;

// process-wide, every access goes through _mutex
class PeerTable {
public:
    using clock = std::chrono::steady_clock;

    // true when the address was not known before
    bool upsert(const boost::asio::ip::address& addr, std::string_view name, clock::time_point now = clock::now());

    // refreshes last_seen of a known peer only
    bool touch(const boost::asio::ip::address& addr, clock::time_point now = clock::now());

    // removes every peer silent for longer than period, returns the removed ones
    std::vector<Peer> prune(std::chrono::steady_clock::duration period, clock::time_point now = clock::now());

    bool contains(const boost::asio::ip::address& addr) const;
    std::optional<Peer> find(const boost::asio::ip::address& addr) const;
    std::optional<boost::asio::ip::address> find_by_name(std::string_view name) const;
    std::optional<std::string> name_of(const boost::asio::ip::address& addr) const;

    size_t size() const;
    std::vector<PeerSnapshot> snapshot(clock::time_point now = clock::now()) const;

private:
    mutable std::mutex _mutex;
    std::unordered_map<boost::asio::ip::address, Peer, AddressHash> _peers;
};
