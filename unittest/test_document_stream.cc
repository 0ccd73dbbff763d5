//
// Document stream cursor: byte and bulk reads, mark/reset, skip, close
//

#include <doctest/doctest.h>
#include <array>
#include <limits>
#include <numeric>
#include <type_traits>
#include <vector>

#include <cfb/document.hh>
#include <cfb/document_stream.hh>
#include <cfb/exceptions.hh>
#include "test_utils.hh"

using namespace cfb;

namespace {
    constexpr std::size_t kSize = 1000;
    constexpr std::size_t kBlock = 64;

    // 16 blocks stored in reverse order
    std::vector<std::uint32_t> reversed_chain(std::uint32_t n) {
        std::vector<std::uint32_t> chain(n);
        std::iota(chain.rbegin(), chain.rend(), 0u);
        return chain;
    }

    struct fixture {
        std::vector<std::byte> content = make_content(kSize);
        std::vector<std::uint32_t> chain = reversed_chain(16);
        test_image image = scatter(content, kBlock, chain, 16);
        document doc{image.storage(), chain, kSize};
    };

    std::vector<std::byte> slice(const std::vector<std::byte>& v, std::size_t from, std::size_t n) {
        return {v.begin() + static_cast<std::ptrdiff_t>(from), v.begin() + static_cast<std::ptrdiff_t>(from + n)};
    }
}

TEST_CASE("document_stream - byte and bulk reads agree") {
    fixture f;

    document_stream bytewise(f.doc);
    std::vector<std::byte> by_byte;
    int c;
    while ((c = bytewise.read()) != document_stream::eof) {
        by_byte.push_back(static_cast<std::byte>(c));
    }
    CHECK(bytewise.offset() == kSize);
    CHECK(bytewise.available() == 0);

    document_stream bulk(f.doc);
    std::vector<std::byte> all(kSize);
    CHECK(bulk.read(all) == static_cast<std::int64_t>(kSize));

    CHECK(by_byte == all);
    CHECK(all == f.content);
}

TEST_CASE("document_stream - available tracks offset") {
    fixture f;
    document_stream s(f.doc);

    CHECK(s.size() == kSize);
    CHECK(s.available() == kSize);
    s.read();
    CHECK(s.available() == kSize - 1);

    std::vector<std::byte> buf(200);
    s.read(buf);
    CHECK(s.offset() == 201);
    CHECK(s.available() == kSize - 201);
}

TEST_CASE("document_stream - mark and reset") {
    fixture f;
    document_stream s(f.doc);

    SUBCASE("reset replays from the mark") {
        s.skip(100);
        s.mark();

        s.read_int();
        std::vector<std::byte> buf(150);
        s.read(buf);
        for (int i = 0; i < 20; i++) {
            s.read();
        }
        s.skip(30);
        CHECK(s.offset() == 304);

        s.reset();
        CHECK(s.offset() == 100);
        std::vector<std::byte> replay(300);
        s.read_fully(replay);
        CHECK(replay == slice(f.content, 100, 300));
    }

    SUBCASE("read limit is ignored") {
        s.mark(1);
        std::vector<std::byte> buf(500);
        s.read(buf);
        s.reset();
        CHECK(s.read() == std::to_integer<int>(f.content[0]));
    }

    SUBCASE("reset without mark rewinds to the start") {
        s.skip(640);
        s.reset();
        CHECK(s.offset() == 0);
        CHECK(s.read() == std::to_integer<int>(f.content[0]));
    }

    SUBCASE("reset after end of stream") {
        s.skip(10);
        s.mark();
        s.skip(5000);
        CHECK(s.read() == document_stream::eof);
        s.reset();
        CHECK(s.read() == std::to_integer<int>(f.content[10]));
    }
}

TEST_CASE("document_stream - skip") {
    fixture f;
    document_stream s(f.doc);

    SUBCASE("inside the document") {
        CHECK(s.skip(70) == 70);
        CHECK(s.offset() == 70);
        CHECK(s.read() == std::to_integer<int>(f.content[70]));
    }

    SUBCASE("past the end returns what was left") {
        s.skip(10);
        CHECK(s.skip(5000) == 990);
        CHECK(s.offset() == kSize);
        CHECK(s.available() == 0);
        CHECK(s.skip(1) == 0);
    }

    SUBCASE("huge count does not wrap") {
        s.skip(3);
        CHECK(s.skip(std::numeric_limits<std::int64_t>::max()) == 997);
        CHECK(s.offset() == kSize);
    }

    SUBCASE("negative count is a no-op") {
        s.skip(20);
        CHECK(s.skip(-5) == 0);
        CHECK(s.offset() == 20);
        CHECK(s.read() == std::to_integer<int>(f.content[20]));
    }

    SUBCASE("to an exact block boundary") {
        CHECK(s.skip(128) == 128);
        CHECK(s.read() == std::to_integer<int>(f.content[128]));
    }
}

TEST_CASE("document_stream - end of stream") {
    fixture f;
    document_stream s(f.doc);
    s.skip(kSize);

    for (int i = 0; i < 5; i++) {
        CHECK(s.read() == document_stream::eof);
    }

    std::array<std::byte, 8> buf{};
    CHECK(s.read(buf.data(), buf.size(), 0, 8) == document_stream::eof);
    CHECK(s.read(buf.data(), buf.size(), 0, 0) == 0);
    CHECK(s.offset() == kSize);
}

TEST_CASE("document_stream - bounded bulk reads") {
    fixture f;
    document_stream s(f.doc);

    SUBCASE("request larger than what is left is clamped") {
        s.skip(995);
        std::vector<std::byte> buf(10, std::byte{0xAA});
        CHECK(s.read(buf.data(), buf.size(), 2, 8) == 5);
        CHECK(buf[0] == std::byte{0xAA});
        CHECK(buf[1] == std::byte{0xAA});
        CHECK(slice(buf, 2, 5) == slice(f.content, 995, 5));
        CHECK(buf[7] == std::byte{0xAA});
        CHECK(s.read() == document_stream::eof);
    }

    SUBCASE("range may end at the buffer end") {
        std::array<std::byte, 4> buf{};
        CHECK(s.read(buf.data(), buf.size(), 4, 0) == 0);
        CHECK(s.read(buf.data(), buf.size(), 1, 3) == 3);
        CHECK(buf[1] == f.content[0]);
        CHECK(buf[3] == f.content[2]);
    }

    SUBCASE("invalid arguments") {
        std::array<std::byte, 4> buf{};
        CHECK_THROWS_AS(s.read(nullptr, 4, 0, 1), invalid_argument_error);
        CHECK_THROWS_AS(s.read(buf.data(), buf.size(), -1, 1), invalid_argument_error);
        CHECK_THROWS_AS(s.read(buf.data(), buf.size(), 0, -1), invalid_argument_error);
        CHECK_THROWS_AS(s.read(buf.data(), buf.size(), 3, 2), invalid_argument_error);
        CHECK_THROWS_AS(s.read(buf.data(), buf.size(), 5, 0), invalid_argument_error);
        CHECK_THROWS_AS(s.read_fully(buf.data(), buf.size(), 2, 3), invalid_argument_error);
        CHECK(s.offset() == 0);
    }
}

TEST_CASE("document_stream - read_fully") {
    fixture f;
    document_stream s(f.doc);

    SUBCASE("exact read across many blocks") {
        s.skip(33);
        std::vector<std::byte> buf(600);
        s.read_fully(buf);
        CHECK(buf == slice(f.content, 33, 600));
        CHECK(s.offset() == 633);
    }

    SUBCASE("more than available is an underrun") {
        s.skip(990);
        std::vector<std::byte> buf(20);
        CHECK_THROWS_AS(s.read_fully(buf), buffer_underrun_error);
        CHECK(s.offset() == 990);
        CHECK(s.read() == std::to_integer<int>(f.content[990]));
    }

    SUBCASE("whole remainder") {
        s.skip(990);
        std::vector<std::byte> buf(10);
        s.read_fully(buf);
        CHECK(s.available() == 0);
        CHECK(s.read() == document_stream::eof);
    }
}

TEST_CASE("document_stream - empty document") {
    document_stream s([](std::uint64_t) { return std::optional<block_view>(); }, 0);

    CHECK(s.available() == 0);
    CHECK(s.read() == document_stream::eof);

    std::array<std::byte, 1> buf{};
    CHECK(s.read(buf.data(), buf.size(), 0, 0) == 0);
    CHECK(s.read(buf.data(), buf.size(), 0, 1) == document_stream::eof);
    CHECK(s.skip(10) == 0);
    CHECK_THROWS_AS(s.read_ubyte(), unexpected_eof_error);
}

TEST_CASE("document_stream - closing") {
    fixture f;
    document_stream s(f.doc);
    s.read();

    s.close();
    CHECK_NOTHROW(s.close());
    CHECK(s.closed());

    std::array<std::byte, 4> buf{};
    CHECK_THROWS_AS(s.read(), closed_stream_error);
    CHECK_THROWS_AS(s.available(), closed_stream_error);
    CHECK_THROWS_AS(s.read(buf.data(), buf.size(), 0, 4), closed_stream_error);
    CHECK_THROWS_AS(s.read_fully(buf.data(), buf.size(), 0, 4), closed_stream_error);
    CHECK_THROWS_AS(s.skip(1), closed_stream_error);
    CHECK_THROWS_AS(s.mark(), closed_stream_error);
    CHECK_THROWS_AS(s.reset(), closed_stream_error);
    CHECK_THROWS_AS(s.read_int(), closed_stream_error);
    CHECK(s.offset() == 1);
}

TEST_CASE("document_stream - damaged chain") {
    fixture f;
    stream_options opts;
    opts.strict = false;
    // Only the first 10 blocks (640 bytes) are reachable
    std::vector<std::uint32_t> short_chain(f.chain.begin(), f.chain.begin() + 10);
    document doc(f.image.storage(), short_chain, kSize, opts);

    SUBCASE("byte reads up to the damage") {
        document_stream s(doc);
        s.skip(639);
        CHECK(s.read() == std::to_integer<int>(f.content[639]));
        CHECK(s.available() == kSize - 640);
        CHECK_THROWS_AS(s.read(), unexpected_eof_error);
    }

    SUBCASE("bulk read crossing the damage") {
        document_stream s(doc);
        s.skip(600);
        std::vector<std::byte> buf(100);
        CHECK_THROWS_AS(s.read(buf), unexpected_eof_error);

        s.reset();
        CHECK(s.read() == std::to_integer<int>(f.content[0]));
    }

    SUBCASE("read_fully crossing the damage") {
        document_stream s(doc);
        s.skip(600);
        std::vector<std::byte> buf(100);
        CHECK_THROWS_AS(s.read_fully(buf), unexpected_eof_error);
    }

    SUBCASE("skipping over the damage") {
        document_stream s(doc);
        CHECK(s.skip(700) == 700);
        CHECK_THROWS_AS(s.read(), unexpected_eof_error);
        CHECK(s.skip(1000) == 300);
        CHECK(s.read() == document_stream::eof);
    }
}

TEST_CASE("document_stream - independent cursors") {
    fixture f;
    document_stream a(f.doc);
    document_stream b(f.doc);

    a.skip(500);
    CHECK(b.read() == std::to_integer<int>(f.content[0]));
    CHECK(a.read() == std::to_integer<int>(f.content[500]));
    b.mark();
    a.close();
    CHECK(b.read() == std::to_integer<int>(f.content[1]));
    b.reset();
    CHECK(b.offset() == 1);
}

TEST_CASE("document_stream - move") {
    fixture f;
    document_stream a(f.doc);
    a.skip(10);
    a.mark();
    a.skip(5);

    document_stream b(std::move(a));
    CHECK(b.read() == std::to_integer<int>(f.content[15]));
    b.reset();
    CHECK(b.read() == std::to_integer<int>(f.content[10]));
}

// Streams resolve through the document, so it must be an lvalue that outlives them
static_assert(std::is_constructible_v<document_stream, const document&>);
static_assert(!std::is_constructible_v<document_stream, document&&>);
static_assert(!std::is_constructible_v<document_stream, document>);

TEST_CASE("document_stream - invalid construction") {
    CHECK_THROWS_AS(document_stream(block_resolver{}, 10), invalid_argument_error);
}
