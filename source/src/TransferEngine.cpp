#include "TransferEngine.hpp"
#include "BaseTransport.hpp"
#include "FileManager.hpp"
#include "SendContext.hpp"
#include "ReceiveContext.hpp"
#include "Errors.hpp"

#include <format>
#include <print>

TransferEngine::TransferEngine(boost::asio::any_io_executor exec, const NodeConfig& config, BaseTransport& transport, FileManager& fm, ReportCallback on_report):
    _exec(exec),
    _daemon_strand(boost::asio::make_strand(exec)),
    _daemon_timer(_daemon_strand),
    _config(config),
    _transport(transport),
    _fm(fm),
    _on_report(std::move(on_report))
    {}

void TransferEngine::start() {
    boost::asio::co_spawn(_daemon_strand, daemon_loop(), boost::asio::detached);
}

void TransferEngine::stop() {
    if (_stopped.exchange(true, std::memory_order_acq_rel)) return;

    boost::asio::post(_daemon_strand, [this] { _daemon_timer.cancel(); });
}

boost::asio::awaitable<void> TransferEngine::daemon_loop() {
    boost::system::error_code ec;

    while (!_stopped.load(std::memory_order_acquire)) {
        try {
            co_await tick(clock::now());
        }
        catch (const std::exception& e) {
            std::println(stderr, "Transfer daemon: {}", e.what());
        }

        _daemon_timer.expires_after(_config.daemon_interval);
        co_await _daemon_timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        ec.clear();
    }
}

boost::asio::awaitable<StartSendResult> TransferEngine::start_send(const boost::asio::ip::address& peer, const std::filesystem::path& path) {
    StartSendResult result;
    result.peer = peer.to_string();
    result.file = path.filename().string();

    if (result.file.empty()) {
        result.error = "Not a file path: " + path.string();
        co_return result;
    }

    std::vector<Chunk> chunks;

    try {
        chunks = FileManager::load_chunks(path, _config.batch_size);
    }
    catch (const FileNotFound& e) {
        result.error = e.what();
        co_return result;
    }
    catch (const FileUnreadable& e) {
        result.error = e.what();
        co_return result;
    }

    TransferKey key{ peer, result.file };
    auto ctx = std::make_shared<SendContext>(peer, result.file, std::move(chunks), _config.receive_window);

    {
        std::scoped_lock lock(_send_mutex);

        if (_sends.contains(key)) {
            result.error = "Transfer of " + result.file + " to " + result.peer + " already in progress";
            co_return result;
        }

        _sends.emplace(key, ctx);
    }

    result.chunks = ctx->chunk_count();
    result.success = true;

    std::println("Sending {} to {} ({} chunks)", result.file, result.peer, result.chunks);

    // the control chunk goes out right away, the daemon retries it until acked
    co_await send_chunk(*ctx, 0);
    ctx->mark_control_sent(clock::now());

    co_return result;
}

boost::asio::awaitable<void> TransferEngine::tick(clock::time_point now) {
    std::vector<std::pair<TransferKey, std::shared_ptr<SendContext>>> live;

    {
        std::scoped_lock lock(_send_mutex);
        live.reserve(_sends.size());
        for (const auto& entry: _sends) live.push_back(entry);
    }

    for (const auto& [key, ctx]: live) {
        if (ctx->is_complete()) {
            finish_send(key, ctx);
            continue;
        }

        for (auto seq: ctx->collect_due(now, _config.packet_timeout)) {
            if (_stopped.load(std::memory_order_acquire)) co_return;
            co_await send_chunk(*ctx, seq);
        }
    }

    expire_completed(now);
    expire_idle_receives(now);
}

boost::asio::awaitable<void> TransferEngine::send_chunk(const SendContext& ctx, uint32_t seq) {
    FileChunk chunk;
    chunk.file_id = ctx.file_id();
    chunk.seq = seq;

    if (chunk.is_control()) chunk.total = ctx.chunk_count();
    else chunk.payload = ctx.chunk(seq);

    if (_config.verbose) std::println("-> {} {}#{}", ctx.peer().to_string(), ctx.file_id(), seq);

    // a failed attempt stays in flight, the timeout path sends it again
    auto ec = co_await _transport.send_datagram(ctx.peer(), encode(chunk));
    if (ec) std::println(stderr, "Chunk {}#{} to {}: {}", ctx.file_id(), seq, ctx.peer().to_string(), describe_transport_error(ec));
}

boost::asio::awaitable<void> TransferEngine::send_ack(const boost::asio::ip::address& to, const FileAck& ack) {
    if (_config.verbose) std::println("<- ack {}#{} rwnd {} to {}", ack.file_id, ack.seq, ack.credit, to.to_string());

    // a lost ack is recovered by the sender's retransmission
    auto ec = co_await _transport.send_stream(to, encode(ack));
    if (ec) std::println(stderr, "Ack {}#{} to {}: {}", ack.file_id, ack.seq, to.to_string(), describe_transport_error(ec));
}

void TransferEngine::on_ack(const boost::asio::ip::address& from, const FileAck& ack) {
    std::shared_ptr<SendContext> ctx;

    {
        std::scoped_lock lock(_send_mutex);
        auto it = _sends.find(TransferKey{ from, ack.file_id });
        if (it != _sends.end()) ctx = it->second;
    }

    if (!ctx) {
        std::println("UnknownTransfer: ack {}#{} from {} dropped", ack.file_id, ack.seq, from.to_string());
        return;
    }

    ctx->on_ack(ack.seq, ack.credit);
}

boost::asio::awaitable<void> TransferEngine::on_chunk(const boost::asio::ip::address& from, FileChunk chunk, clock::time_point now) {
    TransferKey key{ from, chunk.file_id };
    std::shared_ptr<ReceiveContext> ctx;

    {
        std::scoped_lock lock(_receive_mutex);

        auto done = _completed.find(key);
        if (done != _completed.end() && chunk.is_control()) {
            // data only follows an acked control chunk, so a control chunk here starts a new send
            _completed.erase(done);
            done = _completed.end();
        }

        if (done == _completed.end()) {
            auto& slot = _receives[key];
            if (!slot) {
                slot = std::make_shared<ReceiveContext>(from, chunk.file_id, _config.receive_window, now);
                std::println("Receiving {} from {}", chunk.file_id, from.to_string());
            }
            ctx = slot;
        }
    }

    // late retransmission of a file already written, our last ack got lost
    if (!ctx) {
        co_await send_ack(from, FileAck{ chunk.file_id, chunk.seq, _config.receive_window });
        co_return;
    }

    ctx->touch(now);

    if (chunk.is_control()) {
        if (!ctx->set_total(chunk.total)) {
            std::println(stderr, "Conflicting chunk count {} for {} from {}, keeping {}", chunk.total, chunk.file_id, from.to_string(), ctx->total().value_or(0));
        }
    }
    else {
        if (_config.verbose) std::println("<- {} {}#{}", from.to_string(), chunk.file_id, chunk.seq);

        auto inserted = ctx->insert(chunk.seq, std::move(chunk.payload));
        if (inserted == ReceiveContext::Insert::OutOfRange) {
            std::println(stderr, "Chunk {}#{} from {} is past the end of the file, dropped", chunk.file_id, chunk.seq, from.to_string());
            co_return;
        }
    }

    // duplicates are acked again too
    FileAck ack{ chunk.file_id, chunk.seq, ctx->credit() };

    if (ctx->is_complete()) finish_receive(key, ctx, now);

    co_await send_ack(from, ack);
}

void TransferEngine::finish_send(const TransferKey& key, const std::shared_ptr<SendContext>& ctx) {
    {
        std::scoped_lock lock(_send_mutex);
        auto it = _sends.find(key);
        if (it == _sends.end() || it->second != ctx) return;
        _sends.erase(it);
    }

    std::println("Sent {} to {} ({} chunks)", ctx->file_id(), ctx->peer().to_string(), ctx->chunk_count());

    if (_on_report) _on_report(TransferReport{ Direction::Outbound, ctx->peer().to_string(), ctx->file_id(), {}, ctx->chunk_count(), true, {} });
}

void TransferEngine::finish_receive(const TransferKey& key, const std::shared_ptr<ReceiveContext>& ctx, clock::time_point now) {
    {
        std::scoped_lock lock(_receive_mutex);
        auto it = _receives.find(key);
        if (it == _receives.end() || it->second != ctx) return;
        _receives.erase(it);
        _completed[key] = now;
    }

    TransferReport report{ Direction::Inbound, ctx->peer().to_string(), ctx->file_id(), {}, ctx->total().value_or(0), false, {} };

    auto dest = _fm.destination_for(ctx->file_id());
    if (!dest) {
        report.error = "Refusing to write file named '" + ctx->file_id() + "'";
        std::println(stderr, "Receive of {} from {} failed: {}", report.file, report.peer, report.error);
        if (_on_report) _on_report(report);
        return;
    }

    report.path = *dest;

    // the context is gone either way, the sender cannot re-request a finished file
    _fm.enqueue_assembly(*dest, ctx->take_chunks(), [this, report = std::move(report)](std::optional<std::string> error) mutable {
        if (error) {
            report.error = std::move(*error);
            std::println(stderr, "Receive of {} from {} failed: {}", report.file, report.peer, report.error);
        }
        else {
            report.success = true;
            std::println("Received {} from {} -> {}", report.file, report.peer, report.path.string());
        }

        if (_on_report) _on_report(report);
    });
}

void TransferEngine::expire_completed(clock::time_point now) {
    std::scoped_lock lock(_receive_mutex);

    std::erase_if(_completed, [&](const auto& entry) {
        return now - entry.second > _config.completed_linger;
    });
}

void TransferEngine::expire_idle_receives(clock::time_point now) {
    std::vector<std::shared_ptr<ReceiveContext>> idle;

    {
        std::scoped_lock lock(_receive_mutex);

        for (auto it = _receives.begin(); it != _receives.end();) {
            if (now - it->second->last_activity() > _config.receive_idle_timeout) {
                idle.push_back(it->second);
                it = _receives.erase(it);
            }
            else ++it;
        }
    }

    for (const auto& ctx: idle) {
        TransferReport report{ Direction::Inbound, ctx->peer().to_string(), ctx->file_id(), {}, ctx->total().value_or(0), false, {} };
        report.error = std::format("abandoned after {} of silence, {} chunks received", _config.receive_idle_timeout, ctx->received());

        std::println(stderr, "Receive of {} from {} failed: {}", report.file, report.peer, report.error);
        if (_on_report) _on_report(report);
    }
}

std::vector<TransferSnapshot> TransferEngine::snapshots() const {
    std::vector<TransferSnapshot> out;

    {
        std::scoped_lock lock(_send_mutex);

        for (const auto& [key, ctx]: _sends) {
            TransferSnapshot ts{ Direction::Outbound };

            ts.peer = key.peer.to_string();
            ts.file = key.file_id;
            ts.done = ctx->acknowledged();
            ts.total = ctx->chunk_count();
            ts.in_flight = ctx->in_flight();
            ts.credit = ctx->credit();

            out.push_back(std::move(ts));
        }
    }

    {
        std::scoped_lock lock(_receive_mutex);

        for (const auto& [key, ctx]: _receives) {
            TransferSnapshot ts{ Direction::Inbound };

            auto total = ctx->total();

            ts.peer = key.peer.to_string();
            ts.file = key.file_id;
            ts.done = ctx->received();
            ts.total = total.value_or(0);
            ts.total_known = total.has_value();
            ts.credit = ctx->credit();

            out.push_back(std::move(ts));
        }
    }

    return out;
}

size_t TransferEngine::active_sends() const {
    std::scoped_lock lock(_send_mutex);
    return _sends.size();
}

size_t TransferEngine::active_receives() const {
    std::scoped_lock lock(_receive_mutex);
    return _receives.size();
}
