#pragma once

#include "FileManager.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <optional>

#include <boost/asio.hpp>

// inbound transfer of one file from one peer, chunks may arrive in any order,
// any number of times, and before the control chunk
class ReceiveContext {
public:
    enum class Insert {
        Stored,
        Duplicate,
        OutOfRange
    };

    using clock = std::chrono::steady_clock;

    ReceiveContext(boost::asio::ip::address peer, std::string file_id, uint32_t window, clock::time_point now = clock::now()):
        _peer(peer), _file_id(std::move(file_id)), _window(window), _last_activity(now) {}

    const boost::asio::ip::address& peer() const { return _peer; }
    const std::string& file_id() const { return _file_id; }

    // first count wins, returns false on a conflicting count
    bool set_total(uint32_t total);

    Insert insert(uint32_t seq, Chunk payload);

    // N - received once N is known, the configured window before that
    uint32_t credit() const;

    std::optional<uint32_t> total() const;
    size_t received() const;
    bool has(uint32_t seq) const;
    bool is_complete() const;

    // any chunk from the sender, duplicates included
    void touch(clock::time_point now);
    clock::time_point last_activity() const;

    // payloads ordered by sequence number, leaves the context empty
    std::vector<Chunk> take_chunks();

private:
    mutable std::mutex _mutex;

    boost::asio::ip::address _peer;
    std::string _file_id;
    uint32_t _window;

    std::optional<uint32_t> _total;
    std::map<uint32_t, Chunk> _chunks;

    clock::time_point _last_activity;
};
