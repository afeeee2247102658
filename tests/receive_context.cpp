#include "ReceiveContext.hpp"

#include <cassert>

namespace {

Chunk bytes(char c, size_t n = 4) {
    return Chunk(n, static_cast<unsigned char>(c));
}

}

int main() {
    const auto peer = boost::asio::ip::make_address("10.0.0.1");

    // data may arrive before the chunk count, credit is the window until then
    {
        ReceiveContext ctx(peer, "f", 8);

        assert(ctx.insert(2, bytes('b')) == ReceiveContext::Insert::Stored);
        assert(ctx.insert(5, bytes('e')) == ReceiveContext::Insert::Stored);
        assert(!ctx.total());
        assert(ctx.credit() == 8);
        assert(!ctx.is_complete());

        // seq 5 is past the end once the count says 3
        assert(ctx.set_total(3));
        assert(ctx.received() == 1);
        assert(!ctx.has(5));
        assert(ctx.credit() == 2);

        assert(ctx.insert(4, bytes('d')) == ReceiveContext::Insert::OutOfRange);
        assert(ctx.insert(0, bytes('z')) == ReceiveContext::Insert::OutOfRange);

        assert(ctx.insert(3, bytes('c', 2)) == ReceiveContext::Insert::Stored);
        assert(ctx.insert(1, bytes('a')) == ReceiveContext::Insert::Stored);
        assert(ctx.is_complete());
        assert(ctx.credit() == 0);

        // assembled in sequence order whatever the arrival order was
        auto chunks = ctx.take_chunks();
        assert(chunks.size() == 3);
        assert(chunks[0] == bytes('a'));
        assert(chunks[1] == bytes('b'));
        assert(chunks[2] == bytes('c', 2));
    }

    // duplicates are detected and do not change the buffered payload
    {
        ReceiveContext ctx(peer, "f", 8);
        assert(ctx.set_total(2));

        assert(ctx.insert(1, bytes('a')) == ReceiveContext::Insert::Stored);
        assert(ctx.insert(1, bytes('x')) == ReceiveContext::Insert::Duplicate);
        assert(ctx.received() == 1);
        assert(ctx.credit() == 1);

        // a repeated control chunk is fine, a conflicting one is refused
        assert(ctx.set_total(2));
        assert(!ctx.set_total(7));
        assert(ctx.total() == 2u);

        assert(ctx.insert(2, bytes('b')) == ReceiveContext::Insert::Stored);
        auto chunks = ctx.take_chunks();
        assert(chunks[0] == bytes('a'));
    }

    // an empty file is complete as soon as its count is known
    {
        ReceiveContext ctx(peer, "empty", 8);
        assert(!ctx.is_complete());
        assert(ctx.set_total(0));
        assert(ctx.is_complete());
        assert(ctx.take_chunks().empty());
    }

    return 0;
}
