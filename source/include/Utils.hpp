#pragma once

#include <string>
#include <vector>
#include <optional>
#include <string_view>

#include <boost/asio/ip/address.hpp>

std::vector<boost::asio::ip::address> detect_local_addresses();
std::optional<boost::asio::ip::address> parse_ipv4(std::string_view text);
bool is_good_ipv4(const boost::asio::ip::address_v4& addr);
