#pragma once

#include <string>
#include <cstdint>
#include <filesystem>

enum class Direction: uint8_t {
    Outbound = 0,
    Inbound
};

struct TransferSnapshot {
    Direction direction;

    std::string peer{}, file{};

    uint64_t done{}, total{};   // chunks acknowledged / received

    bool total_known = true;

    uint64_t in_flight{}, credit{};
};

// reported once per finished transfer, success or not
struct TransferReport {
    Direction direction;

    std::string peer{}, file{};

    std::filesystem::path path{};

    uint32_t chunks{};

    bool success = false;
    std::string error{};
};

struct StartSendResult {
    std::string file{}, peer{};

    uint32_t chunks{};

    bool success = false;
    std::string error{};
};
