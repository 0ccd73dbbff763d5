//
// Block storage addressing
//

#include <doctest/doctest.h>
#include <vector>

#include <cfb/block_storage.hh>
#include <cfb/exceptions.hh>
#include "test_utils.hh"

using namespace cfb;

TEST_CASE("block_storage - addressing") {
    auto bytes = make_content(100);

    SUBCASE("blocks after a header") {
        block_storage storage(bytes.data(), bytes.size(), 16, 16);
        CHECK(storage.block_size() == 16);
        CHECK(storage.block_count() == 6);  // 84 bytes after the header

        auto first = storage.block(0);
        REQUIRE(first);
        CHECK(first->available() == 16);
        CHECK(first->read_ubyte() == std::to_integer<int>(bytes[16]));

        auto last = storage.block(5);
        REQUIRE(last);
        CHECK(last->available() == 4);  // cut by the end of the image
        CHECK(last->read_ubyte() == std::to_integer<int>(bytes[96]));

        CHECK_FALSE(storage.block(6));
    }

    SUBCASE("no header") {
        block_storage storage(bytes.data(), bytes.size(), 25);
        CHECK(storage.block_count() == 4);
        auto third = storage.block(2);
        REQUIRE(third);
        CHECK(third->read_ubyte() == std::to_integer<int>(bytes[50]));
    }

    SUBCASE("header larger than the image") {
        block_storage storage(bytes.data(), bytes.size(), 16, 512);
        CHECK(storage.block_count() == 0);
        CHECK_FALSE(storage.block(0));
    }

    SUBCASE("invalid arguments") {
        CHECK_THROWS_AS(block_storage(bytes.data(), bytes.size(), 0), invalid_argument_error);
        CHECK_THROWS_AS(block_storage(nullptr, 10, 4), invalid_argument_error);
        CHECK_NOTHROW(block_storage(nullptr, 0, 4));
    }
}
