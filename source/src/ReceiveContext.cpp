#include "ReceiveContext.hpp"

#include <algorithm>

bool ReceiveContext::set_total(uint32_t total) {
    std::scoped_lock lock(_mutex);

    if (_total) return *_total == total;

    _total = total;

    // anything buffered past the end was never part of this file
    _chunks.erase(_chunks.upper_bound(total), _chunks.end());
    return true;
}

ReceiveContext::Insert ReceiveContext::insert(uint32_t seq, Chunk payload) {
    std::scoped_lock lock(_mutex);

    if (seq == 0 || (_total && seq > *_total)) return Insert::OutOfRange;

    auto [it, inserted] = _chunks.try_emplace(seq, std::move(payload));
    return inserted ? Insert::Stored : Insert::Duplicate;
}

uint32_t ReceiveContext::credit() const {
    std::scoped_lock lock(_mutex);

    if (!_total) return _window;
    return *_total - static_cast<uint32_t>(_chunks.size());
}

std::optional<uint32_t> ReceiveContext::total() const {
    std::scoped_lock lock(_mutex);
    return _total;
}

size_t ReceiveContext::received() const {
    std::scoped_lock lock(_mutex);
    return _chunks.size();
}

bool ReceiveContext::has(uint32_t seq) const {
    std::scoped_lock lock(_mutex);
    return _chunks.contains(seq);
}

bool ReceiveContext::is_complete() const {
    std::scoped_lock lock(_mutex);
    return _total.has_value() && _chunks.size() == *_total;
}

void ReceiveContext::touch(clock::time_point now) {
    std::scoped_lock lock(_mutex);
    _last_activity = std::max(_last_activity, now);
}

ReceiveContext::clock::time_point ReceiveContext::last_activity() const {
    std::scoped_lock lock(_mutex);
    return _last_activity;
}

std::vector<Chunk> ReceiveContext::take_chunks() {
    std::scoped_lock lock(_mutex);

    std::vector<Chunk> out;
    out.reserve(_chunks.size());

    for (auto& [seq, payload]: _chunks) out.push_back(std::move(payload));

    _chunks.clear();
    return out;
}
