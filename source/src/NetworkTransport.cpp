#include "NetworkTransport.hpp"

#include <boost/asio/experimental/awaitable_operators.hpp>

using namespace boost::asio::experimental::awaitable_operators;

std::string describe_transport_error(const boost::system::error_code& ec) {
    if (ec == net::error::connection_refused) return "ConnectionRefused: " + ec.message();
    return "PeerUnreachable: " + ec.message();
}

net::awaitable<boost::system::error_code> NetworkTransport::send_stream(const net::ip::address& to, std::string bytes) {
    boost::system::error_code ec;
    if (_stopped.load(std::memory_order_acquire)) co_return net::error::operation_aborted;

    tcp::socket socket(_exec);
    net::steady_timer deadline(_exec);
    deadline.expires_after(CONNECT_TIMEOUT);

    // a silent host would otherwise hold this coroutine for the kernel's syn timeout
    auto result = co_await (
        socket.async_connect(tcp::endpoint(to, _port), net::redirect_error(net::use_awaitable, ec)) ||
        deadline.async_wait(net::use_awaitable)
    );

    if (result.index() == 1) co_return net::error::timed_out;
    if (ec) co_return ec;

    co_await net::async_write(socket, net::buffer(bytes), net::redirect_error(net::use_awaitable, ec));
    if (ec) co_return ec;

    boost::system::error_code ignored;
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    socket.close(ignored);

    co_return boost::system::error_code{};
}

net::awaitable<boost::system::error_code> NetworkTransport::send_datagram(const net::ip::address& to, std::string bytes) {
    co_return co_await send_to(udp::endpoint(to, _port), bytes, false);
}

net::awaitable<boost::system::error_code> NetworkTransport::broadcast(std::string bytes) {
    co_return co_await send_to(udp::endpoint(net::ip::address_v4::broadcast(), _port), bytes, true);
}

net::awaitable<boost::system::error_code> NetworkTransport::send_to(const udp::endpoint& endpoint, const std::string& bytes, bool broadcast) {
    boost::system::error_code ec;
    if (_stopped.load(std::memory_order_acquire)) co_return net::error::operation_aborted;

    // fresh ephemeral socket per datagram, sockets are not shared across threads
    udp::socket socket(_exec);
    socket.open(endpoint.protocol(), ec);
    if (ec) co_return ec;

    if (broadcast) {
        socket.set_option(net::socket_base::broadcast(true), ec);
        if (ec) co_return ec;
    }

    co_await socket.async_send_to(net::buffer(bytes), endpoint, net::redirect_error(net::use_awaitable, ec));

    boost::system::error_code ignored;
    socket.close(ignored);

    co_return ec;
}
