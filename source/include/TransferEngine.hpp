#pragma once

#include "Message.hpp"
#include "NodeConfig.hpp"
#include "Peer.hpp"
#include "TransferSnapshot.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <functional>
#include <unordered_map>

#include <boost/asio.hpp>

class BaseTransport;
class FileManager;
class SendContext;
class ReceiveContext;

namespace test { class TransferEngineAccess; }

// owns every send and receive context of the process. the daemon drives
// emission and retransmission, listeners feed acks and chunks in.
class TransferEngine {
public:
    using clock = std::chrono::steady_clock;
    using ReportCallback = std::function<void(const TransferReport&)>;

    TransferEngine(boost::asio::any_io_executor exec, const NodeConfig& config, BaseTransport& transport, FileManager& fm, ReportCallback on_report);

    void start();
    void stop();

    // fails without creating a context when the file cannot be read
    [[nodiscard]] boost::asio::awaitable<StartSendResult> start_send(const boost::asio::ip::address& peer, const std::filesystem::path& path);

    // one daemon pass over every live send
    [[nodiscard]] boost::asio::awaitable<void> tick(clock::time_point now);

    void on_ack(const boost::asio::ip::address& from, const FileAck& ack);
    [[nodiscard]] boost::asio::awaitable<void> on_chunk(const boost::asio::ip::address& from, FileChunk chunk, clock::time_point now = clock::now());

    std::vector<TransferSnapshot> snapshots() const;
    size_t active_sends() const;
    size_t active_receives() const;

private:
    friend class test::TransferEngineAccess;

    struct TransferKey {
        boost::asio::ip::address peer;
        std::string file_id;

        bool operator==(const TransferKey&) const = default;
    };

    struct TransferKeyHash {
        size_t operator()(const TransferKey& key) const noexcept {
            size_t h = AddressHash{}(key.peer);
            h ^= std::hash<std::string>{}(key.file_id) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
            return h;
        }
    };

    boost::asio::awaitable<void> daemon_loop();
    boost::asio::awaitable<void> send_chunk(const SendContext& ctx, uint32_t seq);
    boost::asio::awaitable<void> send_ack(const boost::asio::ip::address& to, const FileAck& ack);

    void finish_send(const TransferKey& key, const std::shared_ptr<SendContext>& ctx);
    void finish_receive(const TransferKey& key, const std::shared_ptr<ReceiveContext>& ctx, clock::time_point now);
    void expire_completed(clock::time_point now);
    void expire_idle_receives(clock::time_point now);

    boost::asio::any_io_executor _exec;
    boost::asio::strand<boost::asio::any_io_executor> _daemon_strand;
    boost::asio::steady_timer _daemon_timer;

    NodeConfig _config;
    BaseTransport& _transport;
    FileManager& _fm;
    ReportCallback _on_report;

    std::atomic<bool> _stopped{false};

    mutable std::mutex _send_mutex;
    std::unordered_map<TransferKey, std::shared_ptr<SendContext>, TransferKeyHash> _sends;

    mutable std::mutex _receive_mutex;
    std::unordered_map<TransferKey, std::shared_ptr<ReceiveContext>, TransferKeyHash> _receives;
    std::unordered_map<TransferKey, clock::time_point, TransferKeyHash> _completed;    // finished receives, still re-acked
};
