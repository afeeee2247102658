#include "PeerSession.hpp"
#include "Dispatcher.hpp"

#include <print>

void PeerSession::start() {
    auto self = shared_from_this();

    for (auto* inbox: { &_stream, &_datagram }) {
        boost::asio::co_spawn(inbox->strand,
            [self, inbox]() -> boost::asio::awaitable<void> {
                co_await self->listen(*inbox);
            },
            boost::asio::detached
        );
    }
}

void PeerSession::stop() {
    if (_stopped.exchange(true, std::memory_order_acq_rel)) return;

    auto self = shared_from_this();

    for (auto* inbox: { &_stream, &_datagram }) {
        boost::asio::post(inbox->strand, [self, inbox] { inbox->signal.cancel(); });
    }
}

// runs on the inbox strand, so the emptiness check and the wait cannot race a delivery
void PeerSession::deliver(Channel channel, std::string bytes) {
    auto& inbox = inbox_for(channel);

    boost::asio::post(inbox.strand, [self = shared_from_this(), &inbox, bytes = std::move(bytes)]() mutable {
        if (self->is_stopped()) return;

        if (inbox.pending.size() >= MAX_PENDING) {
            std::println(stderr, "Inbox for {} is full, message dropped", self->_peer.to_string());
            return;
        }

        inbox.pending.push_back(std::move(bytes));
        inbox.signal.cancel();
    });
}

boost::asio::awaitable<void> PeerSession::listen(Inbox& inbox) {
    boost::system::error_code ec;

    while (!is_stopped()) {
        if (inbox.pending.empty()) {
            inbox.signal.expires_at(std::chrono::steady_clock::time_point::max());
            co_await inbox.signal.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            ec.clear();
            continue;
        }

        auto bytes = std::move(inbox.pending.front());
        inbox.pending.pop_front();

        co_await _dispatcher.dispatch(_peer, inbox.channel, std::move(bytes));
    }

    inbox.pending.clear();
}
