#include <doctest/doctest.h>
#include <voxmix/sdk/buffer.hh>
#include <voxmix/sdk/types.hh>

using namespace voxmix;

TEST_SUITE("Buffer::Unit") {

    TEST_CASE("should_start_zeroed") {
        buffer<stereo_frame> block(8);
        REQUIRE(block.size() == 8);
        for (std::size_t i = 0; i < block.size(); ++i) {
            CHECK(block.data()[i].left == 0.0f);
            CHECK(block.data()[i].right == 0.0f);
        }
    }

    TEST_CASE("should_only_reallocate_when_growing") {
        buffer<stereo_frame> block(16);
        const stereo_frame* before = block.data();

        CHECK_FALSE(block.ensure(16));
        CHECK_FALSE(block.ensure(4));
        CHECK(block.data() == before);
        CHECK(block.size() == 16);

        CHECK(block.ensure(64));
        CHECK(block.size() == 64);
        CHECK(block.data()[63].left == 0.0f);
    }

    TEST_CASE("should_zero_a_prefix") {
        buffer<float> block(4);
        for (std::size_t i = 0; i < 4; ++i) {
            block.data()[i] = 1.0f;
        }
        block.zero(2);
        CHECK(block.data()[0] == 0.0f);
        CHECK(block.data()[1] == 0.0f);
        CHECK(block.data()[2] == 1.0f);

        // clamped to the size
        block.zero(100);
        CHECK(block.data()[3] == 0.0f);
    }
}
