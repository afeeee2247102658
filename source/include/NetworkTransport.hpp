#pragma once

#include "BaseTransport.hpp"

#include <atomic>

namespace net = boost::asio;
using udp = net::ip::udp;
using tcp = net::ip::tcp;

class NetworkTransport: public BaseTransport {
public:
    NetworkTransport(net::any_io_executor exec, uint16_t port): _exec(exec), _port(port) {}

    net::awaitable<boost::system::error_code> send_stream(const net::ip::address& to, std::string bytes) override;
    net::awaitable<boost::system::error_code> send_datagram(const net::ip::address& to, std::string bytes) override;
    net::awaitable<boost::system::error_code> broadcast(std::string bytes) override;

    void stop() override { _stopped.store(true, std::memory_order_release); }

private:
    net::awaitable<boost::system::error_code> send_to(const udp::endpoint& endpoint, const std::string& bytes, bool broadcast);

    net::any_io_executor _exec;
    uint16_t _port;
    std::atomic<bool> _stopped{false};

    static constexpr auto CONNECT_TIMEOUT = std::chrono::seconds(5);
};
