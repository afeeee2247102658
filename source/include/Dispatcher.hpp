#pragma once

#include "Message.hpp"
#include "BaseTransport.hpp"

#include <functional>
#include <optional>

#include <boost/asio.hpp>

class PeerTable;
class Discovery;
class TransferEngine;

// decodes inbound bytes and routes them by message kind
class Dispatcher {
public:
    // name is nullopt when the sender is not in the peer table
    using ChatHandler = std::function<void(const boost::asio::ip::address& from, std::optional<std::string> name, const Chat& chat)>;

    Dispatcher(PeerTable& peers, Discovery& discovery, TransferEngine& engine, ChatHandler on_chat, bool verbose = false):
        _peers(peers), _discovery(discovery), _engine(engine), _on_chat(std::move(on_chat)), _verbose(verbose) {}

    // never throws, malformed input is logged and dropped
    [[nodiscard]] boost::asio::awaitable<void> dispatch(boost::asio::ip::address from, Channel channel, std::string bytes);

private:
    PeerTable& _peers;
    Discovery& _discovery;
    TransferEngine& _engine;
    ChatHandler _on_chat;
    bool _verbose;
};
