#include "Node.hpp"
#include "PeerSession.hpp"
#include "PeerSnapshot.hpp"
#include "TransferSnapshot.hpp"
#include "Utils.hpp"

#include <format>
#include <print>

#include <boost/asio/experimental/awaitable_operators.hpp>

using namespace boost::asio::experimental::awaitable_operators;

namespace {

NodeConfig with_defaults(NodeConfig config) {
    if (config.name.empty()) {
        boost::system::error_code ec;
        config.name = boost::asio::ip::host_name(ec);
        if (ec || config.name.empty()) config.name = "anonymous";
    }

    if (config.worker_threads == 0) config.worker_threads = 1;
    return config;
}

Identity make_identity(const NodeConfig& config) {
    Identity id;

    id.name = config.name;
    id.local_addresses = detect_local_addresses();
    id.address = id.local_addresses.empty() ? boost::asio::ip::address(boost::asio::ip::address_v4::loopback()) : id.local_addresses.front();

    return id;
}

}

Node::Node(NodeConfig config):
    _work(boost::asio::make_work_guard(_ioc)),
    _config(with_defaults(std::move(config))),
    _identity(make_identity(_config)),
    _transport(_ioc.get_executor(), _config.port),
    _fm(_config.download_dir, _ioc.get_executor()),
    _discovery(_ioc.get_executor(), _config, _peers, _transport, _identity.local_addresses),
    _engine(_ioc.get_executor(), _config, _transport, _fm, [this](const TransferReport& r) { record_report(r); }),
    _dispatcher(_peers, _discovery, _engine,
        [this](const auto& from, const auto& name, const auto& chat) { print_chat(from, name, chat); },
        _config.verbose),
    _accept_strand(boost::asio::make_strand(_ioc.get_executor())),
    _udp_strand(boost::asio::make_strand(_ioc.get_executor()))
    {
        _discovery.set_callbacks(
            [this](const auto& peer) { ensure_session(peer); },
            [this](const auto& peer) { retire_session(peer); }
        );
    }

Node::~Node() {
    stop();
    _ioc.stop();
    wait();
}

void Node::start() {
    std::println("Resolved whoami. IP:{}\tName:{}", _identity.address.to_string(), _identity.name);

    open_listeners();

    boost::asio::co_spawn(_accept_strand, accept_loop(), boost::asio::detached);
    boost::asio::co_spawn(_udp_strand, datagram_loop(), boost::asio::detached);

    _discovery.start();
    _engine.start();

    for (unsigned i{}; i < _config.worker_threads; ++i) _threads.emplace_back([this] { run_io(); });
}

void Node::open_listeners() {
    boost::system::error_code ec;

    _acceptor.emplace(_accept_strand);
    _acceptor->open(tcp::v4(), ec);
    if (!ec) _acceptor->set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (!ec) _acceptor->bind({ tcp::v4(), _config.port }, ec);
    if (!ec) _acceptor->listen(boost::asio::socket_base::max_listen_connections, ec);

    if (ec) throw std::runtime_error(std::format("Stream listener on port {} failed: {}", _config.port, ec.message()));

    _udp.emplace(_udp_strand);
    _udp->open(udp::v4(), ec);
    if (!ec) _udp->set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (!ec) _udp->set_option(boost::asio::socket_base::broadcast(true), ec);
    if (!ec) _udp->bind({ udp::v4(), _config.port }, ec);

    if (ec) throw std::runtime_error(std::format("Datagram listener on port {} failed: {}", _config.port, ec.message()));

    std::println("Listening on port {}", _config.port);
}

void Node::run_io() {
    while (true) {
        try {
            _ioc.run();
            break;
        }
        catch (const std::exception& e) {
            std::println(stderr, "Worker: {}", e.what());
        }
    }
}

void Node::stop() {
    if (_stopped.exchange(true, std::memory_order_acq_rel)) return;

    std::println("Terminating...");

    _discovery.stop();
    _engine.stop();
    _transport.stop();

    boost::asio::post(_accept_strand, [this] {
        boost::system::error_code ignored;
        if (_acceptor) _acceptor->close(ignored);
    });

    boost::asio::post(_udp_strand, [this] {
        boost::system::error_code ignored;
        if (_udp) _udp->close(ignored);
    });

    std::unordered_map<boost::asio::ip::address, std::shared_ptr<PeerSession>, AddressHash> sessions;
    {
        std::scoped_lock lock(_sessions_mutex);
        sessions.swap(_sessions);
    }

    for (auto& [addr, session]: sessions) {
        session->stop();
        std::println("{} listener closed.", addr.to_string());
    }

    // pending assemblies still land on disk
    _fm.stop();

    _work.reset();
}

void Node::wait() {
    for (auto& t: _threads) {
        if (t.joinable()) t.join();
    }
    _threads.clear();
}

boost::asio::awaitable<void> Node::accept_loop() {
    while (!is_stopped()) {
        if (!_acceptor || !_acceptor->is_open()) co_return;

        // accepted sockets live on the plain executor, reads are not serialized with accepts
        tcp::socket socket(_ioc);

        boost::system::error_code ec;
        co_await _acceptor->async_accept(socket, boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (ec) {
            if (is_stopped() || ec == boost::asio::error::operation_aborted) co_return;
            std::println(stderr, "Accept failed: {}", ec.message());
            continue;
        }

        boost::asio::co_spawn(_ioc, read_stream(std::move(socket)), boost::asio::detached);
    }
}

// one message per connection, the sender closes when done
boost::asio::awaitable<void> Node::read_stream(tcp::socket socket) {
    boost::system::error_code ec;

    auto remote = socket.remote_endpoint(ec);
    if (ec) co_return;

    std::string bytes;
    boost::asio::steady_timer deadline(_ioc);
    deadline.expires_after(STREAM_READ_TIMEOUT);

    auto result = co_await (
        boost::asio::async_read(socket, boost::asio::dynamic_buffer(bytes, MAX_MESSAGE), boost::asio::redirect_error(boost::asio::use_awaitable, ec)) ||
        deadline.async_wait(boost::asio::use_awaitable)
    );

    if (result.index() == 1) {
        std::println(stderr, "Connection from {} timed out", remote.address().to_string());
        co_return;
    }

    if (ec && ec != boost::asio::error::eof) {
        std::println(stderr, "Read from {} failed: {}", remote.address().to_string(), ec.message());
        co_return;
    }

    if (!bytes.empty()) route(remote.address(), Channel::Stream, std::move(bytes));
}

boost::asio::awaitable<void> Node::datagram_loop() {
    std::vector<char> buf(MAX_MESSAGE);

    while (!is_stopped()) {
        if (!_udp || !_udp->is_open()) co_return;

        udp::endpoint sender;
        boost::system::error_code ec;

        auto size = co_await _udp->async_receive_from(boost::asio::buffer(buf), sender, boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (ec) {
            if (is_stopped() || ec == boost::asio::error::operation_aborted) co_return;
            std::println(stderr, "Datagram receive failed: {}", ec.message());
            continue;
        }

        route(sender.address(), Channel::Datagram, std::string(buf.data(), size));

        _discovery.prune();
    }
}

void Node::route(const boost::asio::ip::address& from, Channel channel, std::string bytes) {
    std::shared_ptr<PeerSession> session;

    {
        std::scoped_lock lock(_sessions_mutex);
        auto it = _sessions.find(from);
        if (it != _sessions.end()) session = it->second;
    }

    if (session && !session->is_stopped()) {
        session->deliver(channel, std::move(bytes));
        return;
    }

    // first contact or a pruned peer, the node's own listener handles it
    boost::asio::co_spawn(_ioc, _dispatcher.dispatch(from, channel, std::move(bytes)), boost::asio::detached);
}

void Node::ensure_session(const boost::asio::ip::address& peer) {
    if (is_stopped()) return;

    std::scoped_lock lock(_sessions_mutex);

    auto& slot = _sessions[peer];
    if (slot && !slot->is_stopped()) return;

    slot = std::make_shared<PeerSession>(_ioc.get_executor(), peer, _dispatcher);
    slot->start();

    std::println("Listening for {}", peer.to_string());
}

void Node::retire_session(const boost::asio::ip::address& peer) {
    std::shared_ptr<PeerSession> session;

    {
        std::scoped_lock lock(_sessions_mutex);
        auto it = _sessions.find(peer);
        if (it == _sessions.end()) return;

        session = std::move(it->second);
        _sessions.erase(it);
    }

    session->stop();
    std::println("{} listener closed.", peer.to_string());
}

void Node::print_chat(const boost::asio::ip::address& from, const std::optional<std::string>& name, const Chat& chat) {
    auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    std::println("[{:%Y-%m-%d %H:%M:%S}] FROM: {}({}): {}", now, name.value_or("UNKNOWN_HOST"), from.to_string(), chat.text);
}

void Node::record_report(const TransferReport& report) {
    std::scoped_lock lock(_reports_mutex);

    _reports.push_back(report);
    if (_reports.size() > MAX_REPORTS) _reports.pop_front();
}

std::vector<PeerSnapshot> Node::peers() const {
    auto out = _peers.snapshot();

    std::scoped_lock lock(_sessions_mutex);

    for (auto& ps: out) {
        boost::system::error_code ec;
        auto addr = boost::asio::ip::make_address(ps.ip, ec);
        if (ec) continue;

        auto it = _sessions.find(addr);
        ps.listening = it != _sessions.end() && !it->second->is_stopped();
    }

    return out;
}

CommandResult Node::probe(std::string_view ip) {
    if (is_stopped()) return { false, "Node is stopped" };

    auto addr = parse_ipv4(ip);
    if (!addr) return { false, "Incorrect IP string: " + std::string(ip) };
    if (_discovery.is_self(*addr)) return { false, "That is this node" };

    auto delivered = boost::asio::co_spawn(_ioc, _discovery.probe(*addr), boost::asio::use_future).get();
    if (!delivered) return { false, "Could not reach " + addr->to_string() };

    return { true, "Said hello to " + addr->to_string() };
}

CommandResult Node::send_chat(std::string_view name, std::string_view text) {
    if (is_stopped()) return { false, "Node is stopped" };

    auto addr = _peers.find_by_name(name);
    if (!addr) return { false, std::format("Peer with name \"{}\" not found.", name) };

    auto ec = boost::asio::co_spawn(_ioc, _transport.send_stream(*addr, encode(Chat{ std::string(text) })), boost::asio::use_future).get();
    if (ec) return { false, "Error while sending the message. Reason: " + describe_transport_error(ec) };

    return { true, "Sent the message" };
}

StartSendResult Node::send_file(std::string_view name, const std::filesystem::path& path) {
    StartSendResult result;
    result.file = path.filename().string();

    if (is_stopped()) {
        result.error = "Node is stopped";
        return result;
    }

    auto addr = _peers.find_by_name(name);
    if (!addr) {
        result.error = std::format("Peer with name \"{}\" not found.", name);
        return result;
    }

    return boost::asio::co_spawn(_ioc, _engine.start_send(*addr, path), boost::asio::use_future).get();
}

std::vector<TransferSnapshot> Node::transfers() const {
    return _engine.snapshots();
}

std::vector<TransferReport> Node::finished_transfers() const {
    std::scoped_lock lock(_reports_mutex);
    return { _reports.begin(), _reports.end() };
}
