#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <boost/asio.hpp>

// one known remote node, keyed by address in the peer table
class Peer {
public:
    Peer(const boost::asio::ip::address& addr, std::string_view name, std::chrono::steady_clock::time_point last_seen): _ip(addr), _name(name), _last_seen(last_seen) {}

    const boost::asio::ip::address& addr() const { return _ip; }
    std::string ip() const { return _ip.to_string(); }
    const std::string& name() const { return _name; }
    std::chrono::steady_clock::time_point last_seen() const { return _last_seen; }

    void touch(std::chrono::steady_clock::time_point now) { _last_seen = now; }
    void rename(std::string_view name) { _name = name; }

    bool operator==(const Peer& other) const noexcept {
        return _ip == other._ip;
    }

private:
    boost::asio::ip::address _ip;
    std::string _name;
    std::chrono::steady_clock::time_point _last_seen;
};

struct AddressHash {
    size_t operator()(const boost::asio::ip::address& addr) const noexcept;

    static size_t hash_bytes(const uint8_t* data, size_t len) noexcept;
};
