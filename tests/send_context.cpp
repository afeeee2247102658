#include "SendContext.hpp"
#include "FileManager.hpp"

#include "LoopbackNetwork.hpp"

#include <algorithm>
#include <cassert>
#include <fstream>

using namespace std::chrono_literals;

namespace {

std::vector<Chunk> make_chunks(size_t n) {
    std::vector<Chunk> chunks;
    for (size_t i = 0; i < n; ++i) chunks.push_back(Chunk(10, static_cast<unsigned char>(i)));
    return chunks;
}

bool contains(const std::vector<uint32_t>& v, uint32_t seq) {
    return std::ranges::find(v, seq) != v.end();
}

}

int main() {
    using clock = SendContext::clock;

    const auto peer = boost::asio::ip::make_address("10.0.0.2");
    const auto timeout = std::chrono::milliseconds(1000);
    const auto t0 = clock::now();

    // a file of 3 * 1500 + 17 bytes is 4 chunks, the last one short
    {
        test::TempDir dir("send-context");
        auto path = dir.path / "payload.bin";

        {
            std::ofstream out(path, std::ios::binary);
            std::string bytes(3 * 1500 + 17, 'x');
            out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        }

        auto chunks = FileManager::load_chunks(path, 1500);
        assert(chunks.size() == 4);
        assert(chunks[0].size() == 1500);
        assert(chunks[3].size() == 17);

        SendContext ctx(peer, "payload.bin", std::move(chunks), 8);
        assert(ctx.chunk_count() == 4);
        assert(ctx.chunk(4).size() == 17);

        bool threw = false;
        try {
            (void)ctx.chunk(5);
        }
        catch (const std::out_of_range&) {
            threw = true;
        }
        assert(threw);
    }

    // no data chunk leaves before the control chunk is acknowledged
    {
        SendContext ctx(peer, "f", make_chunks(4), 8);
        ctx.mark_control_sent(t0);

        assert(ctx.collect_due(t0, timeout).empty());
        assert(ctx.in_flight() == 0);

        // only the control chunk is retried while it goes unanswered
        assert((ctx.collect_due(t0 + 1000ms, timeout) == std::vector<uint32_t>{ 0 }));
        assert(ctx.collect_due(t0 + 1500ms, timeout).empty());
        assert((ctx.collect_due(t0 + 2000ms, timeout) == std::vector<uint32_t>{ 0 }));
        assert(ctx.next_seq() == 1);

        assert(ctx.on_ack(0, 2));
        assert((ctx.collect_due(t0 + 2100ms, timeout) == std::vector<uint32_t>{ 1, 2 }));
    }

    // the window never has more than credit chunks outstanding
    {
        SendContext ctx(peer, "f", make_chunks(10), 3);
        ctx.mark_control_sent(t0);
        assert(ctx.on_ack(0, 3));

        auto due = ctx.collect_due(t0, timeout);
        assert((due == std::vector<uint32_t>{ 1, 2, 3 }));
        assert(ctx.in_flight() == 3);

        // nothing new until something is acknowledged
        assert(ctx.collect_due(t0 + 10ms, timeout).empty());

        assert(ctx.on_ack(2, 3));
        due = ctx.collect_due(t0 + 20ms, timeout);
        assert((due == std::vector<uint32_t>{ 4 }));
        assert(ctx.in_flight() == 3);

        // the bound is enforced at admission, a shrinking credit never
        // recalls chunks already in flight
        assert(ctx.on_ack(1, 1));
        assert(ctx.credit() == 1);
        assert(ctx.collect_due(t0 + 30ms, timeout).empty());
        assert(ctx.in_flight() == 2);

        // admission resumes once in flight drops below the credit
        assert(ctx.on_ack(3, 1));
        assert(ctx.collect_due(t0 + 40ms, timeout).empty());
        assert(ctx.on_ack(4, 1));
        assert((ctx.collect_due(t0 + 50ms, timeout) == std::vector<uint32_t>{ 5 }));
        assert(ctx.in_flight() == 1);
    }

    // duplicate acknowledgements change nothing but the credit
    {
        SendContext ctx(peer, "f", make_chunks(2), 8);
        ctx.mark_control_sent(t0);
        assert(ctx.on_ack(0, 8));
        assert((ctx.collect_due(t0, timeout) == std::vector<uint32_t>{ 1, 2 }));

        assert(ctx.on_ack(1, 1));
        assert(!ctx.on_ack(1, 1));
        assert(ctx.acknowledged() == 1);
        assert(!ctx.on_ack(9, 1));
        assert(ctx.acknowledged() == 1);
        assert(!ctx.on_ack(0, 1));

        assert(!ctx.is_complete());
        assert(ctx.on_ack(2, 0));
        assert(ctx.is_complete());
    }

    // expired chunks are resent with the same sequence number and a fresh clock
    {
        SendContext ctx(peer, "f", make_chunks(4), 2);
        ctx.mark_control_sent(t0);
        assert(ctx.on_ack(0, 2));

        assert((ctx.collect_due(t0, timeout) == std::vector<uint32_t>{ 1, 2 }));
        assert(ctx.on_ack(1, 2));

        auto due = ctx.collect_due(t0 + 999ms, timeout);
        assert((due == std::vector<uint32_t>{ 3 }));

        // seq 2 expires, seq 3 does not yet
        due = ctx.collect_due(t0 + 1000ms, timeout);
        assert((due == std::vector<uint32_t>{ 2 }));
        assert(ctx.is_in_flight(2));
        assert(!ctx.is_in_flight(1));

        assert(ctx.collect_due(t0 + 1500ms, timeout).empty());

        due = ctx.collect_due(t0 + 2000ms, timeout);
        assert(contains(due, 2) && contains(due, 3));
        assert(!contains(due, 0));
        assert(ctx.next_seq() == 4);
    }

    // an acknowledged control chunk is never resent
    {
        SendContext ctx(peer, "f", make_chunks(1), 8);
        ctx.mark_control_sent(t0);
        assert(ctx.on_ack(0, 1));
        assert(ctx.control_acknowledged());

        auto due = ctx.collect_due(t0 + 5s, timeout);
        assert((due == std::vector<uint32_t>{ 1 }));
    }

    // an empty file only waits for its control chunk
    {
        SendContext ctx(peer, "empty", {}, 8);
        ctx.mark_control_sent(t0);

        assert(ctx.chunk_count() == 0);
        assert(ctx.collect_due(t0, timeout).empty());
        assert(!ctx.is_complete());

        assert(ctx.on_ack(0, 0));
        assert(ctx.is_complete());
    }

    return 0;
}
