#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

// fixed at process start, nothing here is hot-reloaded
struct NodeConfig {
    std::string name;

    uint16_t port = 12345;

    std::chrono::seconds broadcast_period{60};
    std::chrono::seconds pruning_period{120};

    size_t batch_size = 1500;           // bytes per chunk
    uint32_t receive_window = 8;        // sender credit until the first ack arrives

    std::chrono::milliseconds packet_timeout{1000};
    std::chrono::milliseconds daemon_interval{100};
    std::chrono::seconds completed_linger{30};
    std::chrono::seconds receive_idle_timeout{120};     // incomplete receive with no chunk for this long is dropped

    std::filesystem::path download_dir = std::filesystem::current_path();

    unsigned worker_threads = 2;
    bool verbose = false;
};
