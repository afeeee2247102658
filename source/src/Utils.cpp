#include "Utils.hpp"

#include <ifaddrs.h>
#include <netinet/in.h>
#include <net/if.h>

#include <boost/asio.hpp>

bool is_good_ipv4(const boost::asio::ip::address_v4& addr) {
    // Reject 127.0.0.0/8
    if (addr.is_loopback()) return false;

    // Reject 0.0.0.0, multicast and the limited broadcast
    if (addr.is_unspecified() || addr.is_multicast()) return false;
    if (addr == boost::asio::ip::address_v4::broadcast()) return false;

    return true;
}

std::optional<boost::asio::ip::address> parse_ipv4(std::string_view text) {
    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address_v4(std::string(text), ec);

    if (ec || !is_good_ipv4(addr)) return std::nullopt;
    return addr;
}

std::vector<boost::asio::ip::address> detect_local_addresses() {
    std::vector<boost::asio::ip::address> out;

    ifaddrs* interfaces = nullptr;

    if (getifaddrs(&interfaces) == 0) {
        for (auto* ifa = interfaces; ifa; ifa = ifa->ifa_next) {
            if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
            if (!(ifa->ifa_flags & IFF_UP)) continue;

            auto* sa = reinterpret_cast<sockaddr_in*>(ifa->ifa_addr);
            boost::asio::ip::address_v4 addr(ntohl(sa->sin_addr.s_addr));

            if (!is_good_ipv4(addr)) continue;

            out.emplace_back(addr);
        }

        freeifaddrs(interfaces);
    }

    if (!out.empty()) return out;

    // no usable interface list, fall back to whatever the host name resolves to
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver(ioc);
    boost::system::error_code ec;

    auto host = boost::asio::ip::host_name(ec);
    if (ec) return out;

    auto results = resolver.resolve(boost::asio::ip::tcp::v4(), host, "", ec);
    if (ec) return out;

    for (const auto& r: results) {
        auto addr = r.endpoint().address();
        if (addr.is_v4() && is_good_ipv4(addr.to_v4())) out.push_back(addr);
    }

    return out;
}
