#pragma once

#include "NodeConfig.hpp"
#include "Identity.hpp"
#include "NetworkTransport.hpp"
#include "PeerTable.hpp"
#include "FileManager.hpp"
#include "Discovery.hpp"
#include "TransferEngine.hpp"
#include "Dispatcher.hpp"

#include <atomic>
#include <deque>
#include <mutex>
#include <thread>
#include <memory>
#include <optional>
#include <unordered_map>

#include <boost/asio.hpp>

class PeerSession;
struct PeerSnapshot;
struct TransferSnapshot;

namespace test { class NodeAccess; }

struct CommandResult {
    bool success = false;
    std::string message;
};

class Node {
public:
    explicit Node(NodeConfig config);
    ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    // binds the port, throws when it cannot be bound
    void start();
    void stop();
    void wait();

    bool is_stopped() const { return _stopped.load(std::memory_order_acquire); }

    // command surface, called from the shell thread
    std::vector<PeerSnapshot> peers() const;
    const Identity& whoami() const { return _identity; }
    CommandResult probe(std::string_view ip);
    CommandResult send_chat(std::string_view name, std::string_view text);
    StartSendResult send_file(std::string_view name, const std::filesystem::path& path);
    std::vector<TransferSnapshot> transfers() const;
    std::vector<TransferReport> finished_transfers() const;

private:
    friend class test::NodeAccess;

    void open_listeners();
    void run_io();

    boost::asio::awaitable<void> accept_loop();
    boost::asio::awaitable<void> read_stream(tcp::socket socket);
    boost::asio::awaitable<void> datagram_loop();

    void route(const boost::asio::ip::address& from, Channel channel, std::string bytes);
    void ensure_session(const boost::asio::ip::address& peer);
    void retire_session(const boost::asio::ip::address& peer);

    void print_chat(const boost::asio::ip::address& from, const std::optional<std::string>& name, const Chat& chat);
    void record_report(const TransferReport& report);

    // io first, everything below posts into it
    boost::asio::io_context _ioc;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> _work;

    NodeConfig _config;
    Identity _identity;

    NetworkTransport _transport;
    PeerTable _peers;
    FileManager _fm;
    Discovery _discovery;
    TransferEngine _engine;
    Dispatcher _dispatcher;

    mutable std::mutex _sessions_mutex;
    std::unordered_map<boost::asio::ip::address, std::shared_ptr<PeerSession>, AddressHash> _sessions;

    mutable std::mutex _reports_mutex;
    std::deque<TransferReport> _reports;

    boost::asio::strand<boost::asio::any_io_executor> _accept_strand;
    boost::asio::strand<boost::asio::any_io_executor> _udp_strand;
    std::optional<tcp::acceptor> _acceptor;
    std::optional<udp::socket> _udp;

    std::vector<std::thread> _threads;
    std::atomic<bool> _stopped{false};

    static constexpr size_t MAX_MESSAGE = 64 * 1024;
    static constexpr size_t MAX_REPORTS = 32;
    static constexpr auto STREAM_READ_TIMEOUT = std::chrono::seconds(10);
};
