#include "LoopbackNetwork.hpp"
#include "TestAccess.hpp"

#include <cassert>
#include <fstream>
#include <future>
#include <iterator>
#include <random>

using namespace std::chrono_literals;

namespace {

std::string read_all(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return { std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>() };
}

std::filesystem::path write_file(const std::filesystem::path& path, const std::string& bytes) {
    std::ofstream out(path, std::ios::binary);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    return path;
}

std::string random_bytes(size_t n, unsigned seed) {
    std::mt19937 rng(seed);
    std::string out(n, '\0');
    for (auto& c: out) c = static_cast<char>(rng() & 0xff);
    return out;
}

StartSendResult start_send(test::LoopbackNetwork& net, test::LoopbackNode& from, const boost::asio::ip::address& to, const std::filesystem::path& path) {
    auto fut = boost::asio::co_spawn(net.ioc(), from.engine.start_send(to, path), boost::asio::use_future);

    bool ready = net.run_until([&] { return fut.wait_for(0s) == std::future_status::ready; });
    assert(ready);

    return fut.get();
}

bool received(const test::LoopbackNode& node, const std::string& file) {
    for (const auto& r: node.reports) {
        if (r.direction == Direction::Inbound && r.file == file) return true;
    }
    return false;
}

bool sent(const test::LoopbackNode& node, const std::string& file) {
    for (const auto& r: node.reports) {
        if (r.direction == Direction::Outbound && r.file == file && r.success) return true;
    }
    return false;
}

size_t successes(const test::LoopbackNode& node, Direction direction, const std::string& file) {
    size_t n = 0;
    for (const auto& r: node.reports) {
        if (r.direction == direction && r.file == file && r.success) ++n;
    }
    return n;
}

}

int main() {
    test::TempDir root("transfer");
    std::filesystem::create_directories(root.path / "a");
    std::filesystem::create_directories(root.path / "b");
    std::filesystem::create_directories(root.path / "src");

    boost::asio::io_context ioc;
    test::LoopbackNetwork net(ioc);

    // 4000 bytes at 1500 per chunk: control chunk plus 3 data chunks
    {
        test::LoopbackNode a(net, "10.0.0.1", test::fast_config("A", root.path / "a"));
        test::LoopbackNode b(net, "10.0.0.2", test::fast_config("B", root.path / "b"));
        a.engine.start();
        b.engine.start();

        auto content = random_bytes(4000, 1);
        auto path = write_file(root.path / "src" / "four.bin", content);

        auto result = start_send(net, a, b.addr, path);
        assert(result.success);
        assert(result.chunks == 3);
        assert(result.file == "four.bin");

        bool done = net.run_until([&] { return received(b, "four.bin") && sent(a, "four.bin"); });
        assert(done);

        assert(b.reports.front().success);
        assert(b.reports.front().chunks == 3);
        assert(read_all(root.path / "b" / "four.bin") == content);

        // the finished send leaves no context behind
        assert(a.engine.active_sends() == 0);
        assert(!test::TransferEngineAccess::send(a.engine, b.addr, "four.bin"));
        assert(b.engine.active_receives() == 0);
        assert(test::TransferEngineAccess::lingering(b.engine, a.addr, "four.bin"));

        // a late retransmission is acknowledged again without reopening the transfer
        FileChunk late;
        late.file_id = "four.bin";
        late.seq = 2;
        late.payload = Chunk(10, 'z');

        boost::asio::co_spawn(ioc, b.engine.on_chunk(a.addr, late), boost::asio::detached);
        net.settle(20ms);

        assert(b.engine.active_receives() == 0);
        assert(b.reports.size() == 1);
        assert(read_all(root.path / "b" / "four.bin") == content);

        test::TransferEngineAccess::expire_completed(b.engine, TransferEngine::clock::now() + 1h);
        assert(!test::TransferEngineAccess::lingering(b.engine, a.addr, "four.bin"));
    }

    // the same name sent again right after a finished transfer replaces the file
    {
        test::LoopbackNode a(net, "10.0.0.1", test::fast_config("A", root.path / "a"));
        test::LoopbackNode b(net, "10.0.0.2", test::fast_config("B", root.path / "b"));
        a.engine.start();
        b.engine.start();

        auto path = root.path / "src" / "x.bin";
        auto first = random_bytes(20 * 1500, 4);
        auto second = random_bytes(20 * 1500, 5);

        write_file(path, first);
        auto result = start_send(net, a, b.addr, path);
        assert(result.success);
        assert(result.chunks == 20);

        bool done = net.run_until([&] { return successes(b, Direction::Inbound, "x.bin") == 1 && sent(a, "x.bin"); });
        assert(done);
        assert(read_all(root.path / "b" / "x.bin") == first);
        assert(test::TransferEngineAccess::lingering(b.engine, a.addr, "x.bin"));

        write_file(path, second);
        result = start_send(net, a, b.addr, path);
        assert(result.success);

        done = net.run_until([&] {
            return successes(b, Direction::Inbound, "x.bin") == 2 && successes(a, Direction::Outbound, "x.bin") == 2;
        });
        assert(done);

        assert(read_all(root.path / "b" / "x.bin") == second);
        assert(a.engine.active_sends() == 0);
        assert(b.engine.active_receives() == 0);
    }

    // lossy network in both directions still delivers the exact bytes
    {
        test::LoopbackNode a(net, "10.0.0.1", test::fast_config("A", root.path / "a"));
        test::LoopbackNode b(net, "10.0.0.2", test::fast_config("B", root.path / "b"));
        a.engine.start();
        b.engine.start();

        net.drop_every(Channel::Datagram, 3);
        net.drop_every(Channel::Stream, 4);

        auto content = random_bytes(20 * 1500 + 321, 2);
        auto path = write_file(root.path / "src" / "lossy.bin", content);

        auto result = start_send(net, a, b.addr, path);
        assert(result.success);
        assert(result.chunks == 21);

        bool done = net.run_until([&] { return received(b, "lossy.bin") && sent(a, "lossy.bin"); }, 30s);
        assert(done);
        assert(net.dropped() > 0);

        assert(read_all(root.path / "b" / "lossy.bin") == content);
        assert(a.engine.active_sends() == 0);

        net.drop_every(Channel::Datagram, 0);
        net.drop_every(Channel::Stream, 0);
    }

    // empty file still makes the round trip
    {
        test::LoopbackNode a(net, "10.0.0.1", test::fast_config("A", root.path / "a"));
        test::LoopbackNode b(net, "10.0.0.2", test::fast_config("B", root.path / "b"));
        a.engine.start();
        b.engine.start();

        auto path = write_file(root.path / "src" / "nothing.txt", "");

        auto result = start_send(net, a, b.addr, path);
        assert(result.success);
        assert(result.chunks == 0);

        bool done = net.run_until([&] { return received(b, "nothing.txt") && sent(a, "nothing.txt"); });
        assert(done);

        assert(std::filesystem::exists(root.path / "b" / "nothing.txt"));
        assert(std::filesystem::file_size(root.path / "b" / "nothing.txt") == 0);
    }

    // failures to start never create a context
    {
        test::LoopbackNode a(net, "10.0.0.1", test::fast_config("A", root.path / "a"));
        a.engine.start();

        auto ghost = boost::asio::ip::make_address("10.0.0.9");

        auto missing = start_send(net, a, ghost, root.path / "src" / "missing.bin");
        assert(!missing.success);
        assert(!missing.error.empty());
        assert(a.engine.active_sends() == 0);

        // nobody answers at 10.0.0.9, so the first send stays live
        auto path = write_file(root.path / "src" / "stuck.bin", random_bytes(5000, 3));
        auto first = start_send(net, a, ghost, path);
        assert(first.success);

        auto second = start_send(net, a, ghost, path);
        assert(!second.success);
        assert(a.engine.active_sends() == 1);

        net.settle(100ms);

        auto snaps = a.engine.snapshots();
        assert(snaps.size() == 1);
        assert(snaps.front().direction == Direction::Outbound);
        assert(snaps.front().total == 4);
        assert(snaps.front().done == 0);
        // without an acked control chunk only seq 0 is ever retried
        assert(snaps.front().in_flight == 0);

        auto ctx = test::TransferEngineAccess::send(a.engine, ghost, "stuck.bin");
        assert(ctx && !ctx->control_acknowledged());
        assert(ctx->next_seq() == 1);

        // acks for transfers nobody started are dropped
        a.engine.on_ack(ghost, FileAck{ "other.bin", 1, 3 });
        assert(a.engine.active_sends() == 1);
    }

    // a chunk past the announced end is not acknowledged and not stored
    {
        test::LoopbackNode b(net, "10.0.0.2", test::fast_config("B", root.path / "b"));
        auto sender = boost::asio::ip::make_address("10.0.0.7");

        FileChunk control;
        control.file_id = "short.bin";
        control.total = 2;

        FileChunk beyond;
        beyond.file_id = "short.bin";
        beyond.seq = 3;
        beyond.payload = Chunk(4, 'q');

        boost::asio::co_spawn(ioc, b.engine.on_chunk(sender, control), boost::asio::detached);
        net.settle(10ms);
        boost::asio::co_spawn(ioc, b.engine.on_chunk(sender, beyond), boost::asio::detached);
        net.settle(10ms);

        auto ctx = test::TransferEngineAccess::receive(b.engine, sender, "short.bin");
        assert(ctx);
        assert(ctx->total() == 2u);
        assert(ctx->received() == 0);
        assert(ctx->credit() == 2);

        // a receive that hears nothing for the idle timeout is dropped and reported
        auto now = TransferEngine::clock::now();
        test::TransferEngineAccess::expire_idle_receives(b.engine, now + 60s);
        assert(b.engine.active_receives() == 1);

        test::TransferEngineAccess::expire_idle_receives(b.engine, now + 121s);
        assert(b.engine.active_receives() == 0);
        assert(b.reports.size() == 1);
        assert(b.reports.front().direction == Direction::Inbound);
        assert(!b.reports.front().success);
        assert(b.reports.front().file == "short.bin");
    }

    // an old incomplete receive does not survive a daemon pass
    {
        test::LoopbackNode b(net, "10.0.0.2", test::fast_config("B", root.path / "b"));
        auto sender = boost::asio::ip::make_address("10.0.0.8");

        FileChunk control;
        control.file_id = "stale.bin";
        control.total = 5;

        auto long_ago = TransferEngine::clock::now() - 10min;
        boost::asio::co_spawn(ioc, b.engine.on_chunk(sender, control, long_ago), boost::asio::detached);
        net.settle(10ms);
        assert(b.engine.active_receives() == 1);

        b.engine.start();
        bool gone = net.run_until([&] { return b.engine.active_receives() == 0; });
        assert(gone);
        assert(b.reports.size() == 1 && !b.reports.front().success);
    }

    return 0;
}
