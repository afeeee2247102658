#include "Dispatcher.hpp"
#include "Discovery.hpp"
#include "PeerTable.hpp"
#include "TransferEngine.hpp"
#include "Errors.hpp"

#include <print>

boost::asio::awaitable<void> Dispatcher::dispatch(boost::asio::ip::address from, Channel channel, std::string bytes) {
    std::optional<Message> msg;

    try {
        msg = decode(bytes);
    }
    catch (const MalformedMessage& e) {
        std::println(stderr, "{} from {}, dropped", e.what(), from.to_string());
        co_return;
    }

    if (_verbose) std::println("{} from {} over {}", to_string(type_of(*msg)), from.to_string(), channel == Channel::Stream ? "stream" : "datagram");

    try {
        if (auto* hello = std::get_if<Hello>(&*msg)) {
            co_await _discovery.handle_hello(from, *hello);
        }
        else if (auto* hello_ack = std::get_if<HelloAck>(&*msg)) {
            _discovery.handle_hello_ack(from, *hello_ack);
        }
        else if (auto* chat = std::get_if<Chat>(&*msg)) {
            _peers.touch(from);
            if (_on_chat) _on_chat(from, _peers.name_of(from), *chat);
        }
        else if (auto* chunk = std::get_if<FileChunk>(&*msg)) {
            _peers.touch(from);
            co_await _engine.on_chunk(from, std::move(*chunk));
        }
        else if (auto* ack = std::get_if<FileAck>(&*msg)) {
            _peers.touch(from);
            _engine.on_ack(from, *ack);
        }
    }
    catch (const std::exception& e) {
        std::println(stderr, "Handling {} from {}: {}", to_string(type_of(*msg)), from.to_string(), e.what());
    }
}
