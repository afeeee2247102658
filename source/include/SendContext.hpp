#pragma once

#include "FileManager.hpp"

#include <map>
#include <mutex>
#include <chrono>
#include <string>
#include <vector>
#include <optional>

#include <boost/asio.hpp>
#include <boost/dynamic_bitset.hpp>

// outbound transfer of one file to one peer.
// seq 0 is the control chunk, it is sent at creation outside the window and
// retried until acknowledged. data chunks are 1..N, admitted only after the
// control chunk is acknowledged and only while in_flight < credit. a shrinking
// credit never recalls chunks already in flight.
// the daemon tick and the ack handler run on different threads, every
// public member locks _mutex.
class SendContext {
public:
    using clock = std::chrono::steady_clock;

    SendContext(boost::asio::ip::address peer, std::string file_id, std::vector<Chunk> chunks, uint32_t initial_credit);

    const boost::asio::ip::address& peer() const { return _peer; }
    const std::string& file_id() const { return _file_id; }
    uint32_t chunk_count() const { return _count; }

    // payload of data chunk seq (1-based)
    const Chunk& chunk(uint32_t seq) const;

    // call once the control chunk went out
    void mark_control_sent(clock::time_point now);

    // sequences to (re)send now: expired ones first, each gets a fresh timestamp,
    // then new ones in order while in_flight < credit once the receiver acknowledged
    // the control chunk. 0 stands for the control chunk
    std::vector<uint32_t> collect_due(clock::time_point now, clock::duration timeout);

    // duplicate acks are no-ops apart from the credit update, returns true when seq was newly acknowledged
    bool on_ack(uint32_t seq, uint32_t advertised_credit);

    bool is_complete() const;

    size_t in_flight() const;
    size_t acknowledged() const;
    uint32_t credit() const;
    uint32_t next_seq() const;
    bool control_acknowledged() const;
    bool is_in_flight(uint32_t seq) const;
    bool is_acknowledged(uint32_t seq) const;

private:
    mutable std::mutex _mutex;

    boost::asio::ip::address _peer;
    std::string _file_id;
    std::vector<Chunk> _chunks;
    uint32_t _count;

    uint32_t _next_seq = 1;
    uint32_t _credit;

    std::map<uint32_t, clock::time_point> _in_flight;
    boost::dynamic_bitset<> _acked;     // bit i is seq i + 1
    size_t _acked_count{};

    std::optional<clock::time_point> _control_sent_at;
    bool _control_acked = false;
};
