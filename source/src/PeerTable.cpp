#include "PeerTable.hpp"
#include "PeerSnapshot.hpp"

size_t AddressHash::hash_bytes(const uint8_t* data, size_t len) noexcept {
    size_t h = 1469598103934665603ULL;

    for (size_t i{}; i < len; ++i) {
        h ^= data[i];
        h *= 1099511628211ULL;
    }

    return h;
}

size_t AddressHash::operator()(const boost::asio::ip::address& addr) const noexcept {
    if (addr.is_v4()) {
        auto bytes = addr.to_v4().to_bytes();
        return hash_bytes(bytes.data(), bytes.size());
    }

    auto bytes = addr.to_v6().to_bytes();
    return hash_bytes(bytes.data(), bytes.size()) ^ 0x9e3779b97f4a7c15ULL;
}

bool PeerTable::upsert(const boost::asio::ip::address& addr, std::string_view name, clock::time_point now) {
    std::scoped_lock lock(_mutex);

    auto it = _peers.find(addr);
    if (it == _peers.end()) {
        _peers.emplace(addr, Peer(addr, name, now));
        return true;
    }

    it->second.touch(now);
    it->second.rename(name);
    return false;
}

bool PeerTable::touch(const boost::asio::ip::address& addr, clock::time_point now) {
    std::scoped_lock lock(_mutex);

    auto it = _peers.find(addr);
    if (it == _peers.end()) return false;

    it->second.touch(now);
    return true;
}

std::vector<Peer> PeerTable::prune(std::chrono::steady_clock::duration period, clock::time_point now) {
    std::vector<Peer> removed;
    std::scoped_lock lock(_mutex);

    for (auto it = _peers.begin(); it != _peers.end();) {
        if (now - it->second.last_seen() > period) {
            removed.push_back(it->second);
            it = _peers.erase(it);
        }
        else ++it;
    }

    return removed;
}

bool PeerTable::contains(const boost::asio::ip::address& addr) const {
    std::scoped_lock lock(_mutex);
    return _peers.contains(addr);
}

std::optional<Peer> PeerTable::find(const boost::asio::ip::address& addr) const {
    std::scoped_lock lock(_mutex);

    auto it = _peers.find(addr);
    if (it == _peers.end()) return std::nullopt;
    return it->second;
}

// display names are not unique, first match wins
std::optional<boost::asio::ip::address> PeerTable::find_by_name(std::string_view name) const {
    std::scoped_lock lock(_mutex);

    for (const auto& [addr, peer]: _peers) {
        if (peer.name() == name) return addr;
    }

    return std::nullopt;
}

std::optional<std::string> PeerTable::name_of(const boost::asio::ip::address& addr) const {
    std::scoped_lock lock(_mutex);

    auto it = _peers.find(addr);
    if (it == _peers.end()) return std::nullopt;
    return it->second.name();
}

size_t PeerTable::size() const {
    std::scoped_lock lock(_mutex);
    return _peers.size();
}

std::vector<PeerSnapshot> PeerTable::snapshot(clock::time_point now) const {
    std::scoped_lock lock(_mutex);

    std::vector<PeerSnapshot> out;
    out.reserve(_peers.size());

    for (const auto& [addr, peer]: _peers) {
        PeerSnapshot ps;

        ps.ip = peer.ip();
        ps.name = peer.name();
        ps.seconds_since_seen = (uint64_t)std::chrono::duration_cast<std::chrono::seconds>(now - peer.last_seen()).count();

        out.push_back(std::move(ps));
    }

    return out;
}
