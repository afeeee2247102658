#pragma once

#include <string>

#include <boost/asio.hpp>

// the two channels every message travels on
enum class Channel: uint8_t {
    Stream = 0,     // connection-oriented, one message per connection
    Datagram        // connectionless
};

// outbound side of the node, one send attempt per call, no retries here
class BaseTransport {
public:
    virtual ~BaseTransport() = default;

    virtual boost::asio::awaitable<boost::system::error_code> send_stream(const boost::asio::ip::address& to, std::string bytes) = 0;
    virtual boost::asio::awaitable<boost::system::error_code> send_datagram(const boost::asio::ip::address& to, std::string bytes) = 0;
    virtual boost::asio::awaitable<boost::system::error_code> broadcast(std::string bytes) = 0;

    virtual void stop() { }
};

// PeerUnreachable / ConnectionRefused in log lines
std::string describe_transport_error(const boost::system::error_code& ec);
