#pragma once

#include <string>
#include <cstdint>

struct PeerSnapshot {
    std::string ip{}, name{};

    uint64_t seconds_since_seen{};

    bool listening = false;
};
