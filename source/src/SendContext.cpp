#include "SendContext.hpp"

#include <stdexcept>

SendContext::SendContext(boost::asio::ip::address peer, std::string file_id, std::vector<Chunk> chunks, uint32_t initial_credit):
    _peer(peer),
    _file_id(std::move(file_id)),
    _chunks(std::move(chunks)),
    _count(static_cast<uint32_t>(_chunks.size())),
    _credit(initial_credit),
    _acked(_chunks.size())
    {}

const Chunk& SendContext::chunk(uint32_t seq) const {
    if (seq == 0 || seq > _count) throw std::out_of_range("No chunk " + std::to_string(seq) + " in " + _file_id);
    return _chunks[seq - 1];
}

void SendContext::mark_control_sent(clock::time_point now) {
    std::scoped_lock lock(_mutex);
    if (!_control_acked) _control_sent_at = now;
}

std::vector<uint32_t> SendContext::collect_due(clock::time_point now, clock::duration timeout) {
    std::scoped_lock lock(_mutex);
    std::vector<uint32_t> due;

    if (!_control_acked && _control_sent_at && now - *_control_sent_at >= timeout) {
        _control_sent_at = now;
        due.push_back(0);
    }

    // retransmissions keep their sequence number
    for (auto& [seq, sent_at]: _in_flight) {
        if (now - sent_at >= timeout) {
            sent_at = now;
            due.push_back(seq);
        }
    }

    // the receiver must know N first, a data chunk can never land in a stale receive
    if (!_control_acked) return due;

    while (_in_flight.size() < _credit && _next_seq <= _count) {
        auto seq = _next_seq++;
        if (_acked.test(seq - 1)) continue;

        _in_flight.emplace(seq, now);
        due.push_back(seq);
    }

    return due;
}

bool SendContext::on_ack(uint32_t seq, uint32_t advertised_credit) {
    std::scoped_lock lock(_mutex);

    _credit = advertised_credit;

    if (seq == 0) {
        if (_control_acked) return false;
        _control_acked = true;
        _control_sent_at.reset();
        return true;
    }

    if (seq > _count || _acked.test(seq - 1)) return false;

    _in_flight.erase(seq);
    _acked.set(seq - 1);
    ++_acked_count;

    return true;
}

bool SendContext::is_complete() const {
    std::scoped_lock lock(_mutex);
    return _control_acked && _acked_count == _count;
}

size_t SendContext::in_flight() const {
    std::scoped_lock lock(_mutex);
    return _in_flight.size();
}

size_t SendContext::acknowledged() const {
    std::scoped_lock lock(_mutex);
    return _acked_count;
}

uint32_t SendContext::credit() const {
    std::scoped_lock lock(_mutex);
    return _credit;
}

uint32_t SendContext::next_seq() const {
    std::scoped_lock lock(_mutex);
    return _next_seq;
}

bool SendContext::control_acknowledged() const {
    std::scoped_lock lock(_mutex);
    return _control_acked;
}

bool SendContext::is_in_flight(uint32_t seq) const {
    std::scoped_lock lock(_mutex);
    return _in_flight.contains(seq);
}

bool SendContext::is_acknowledged(uint32_t seq) const {
    std::scoped_lock lock(_mutex);
    if (seq == 0) return _control_acked;
    return seq <= _count && _acked.test(seq - 1);
}
