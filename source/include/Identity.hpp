#pragma once

#include <string>
#include <vector>

#include <boost/asio/ip/address.hpp>

// who this node is on the LAN
struct Identity {
    std::string name;

    boost::asio::ip::address address;

    // every local address, beacons from these are our own
    std::vector<boost::asio::ip::address> local_addresses;
};
