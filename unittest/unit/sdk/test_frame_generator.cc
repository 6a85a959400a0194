/**
 * @file test_frame_generator.cc
 * @brief Unit tests for block generation: resampling, ramps, pan and end of stream
 */

#include <doctest/doctest.h>
#include <voxmix/sdk/frame_generator.hh>
#include <voxmix/sdk/sample_store.hh>
#include "../../test_helpers.hh"
#include <cmath>
#include <limits>
#include <vector>

using namespace voxmix;
using namespace voxmix::test;

namespace {
    frame_params unity(bool loop = false, sample_rate_t device_rate = 48000) {
        frame_params p;
        p.loop = loop;
        p.device_rate = device_rate;
        return p;
    }

    bool is_silent(const stereo_frame& f) {
        return f.left == 0.0f && f.right == 0.0f;
    }
}

TEST_SUITE("FrameGenerator::Unit") {

    TEST_CASE("should_always_produce_exactly_n_frames") {
        auto store = make_ramp_store(5);
        std::vector<stereo_frame> out(10, stereo_frame{9.0f, 9.0f});

        SUBCASE("end_of_stream_pads_with_silence") {
            const double cursor = generate_frames(*store, 3.0, unity(), out.data(), out.size());

            CHECK(out[0].left == doctest::Approx((*store)[3].left));
            CHECK(out[0].right == doctest::Approx((*store)[3].right));
            CHECK(out[1].left == doctest::Approx((*store)[4].left));
            CHECK(out[1].right == doctest::Approx((*store)[4].right));
            for (std::size_t i = 2; i < out.size(); ++i) {
                CHECK(is_silent(out[i]));
            }
            CHECK(cursor == doctest::Approx(13.0));
        }

        SUBCASE("cursor_past_end_gives_silence") {
            generate_frames(*store, 7.0, unity(), out.data(), out.size());
            for (const auto& f : out) {
                CHECK(is_silent(f));
            }
        }

        SUBCASE("negative_cursor_skips_unreadable_positions") {
            generate_frames(*store, -2.0, unity(), out.data(), 5);
            CHECK(out[0].left == doctest::Approx((*store)[0].left));
            CHECK(out[1].left == doctest::Approx((*store)[1].left));
            CHECK(out[2].left == doctest::Approx((*store)[2].left));
            CHECK(is_silent(out[3]));
            CHECK(is_silent(out[4]));
            // frames beyond n are untouched
            CHECK(out[5].left == 9.0f);
        }

        SUBCASE("last_frame_is_readable") {
            generate_frames(*store, 4.0, unity(), out.data(), 1);
            CHECK(out[0].left == doctest::Approx((*store)[4].left));
        }
    }

    TEST_CASE("should_wrap_positions_when_looping") {
        auto store = make_ramp_store(100);
        std::vector<stereo_frame> out(10);

        SUBCASE("consecutive_blocks_continue") {
            double cursor = generate_frames(*store, 0.0, unity(true), out.data(), out.size());
            for (std::size_t i = 0; i < 10; ++i) {
                CHECK(out[i].left == doctest::Approx((*store)[i].left));
            }
            CHECK(cursor == doctest::Approx(10.0));

            generate_frames(*store, cursor, unity(true), out.data(), out.size());
            for (std::size_t i = 0; i < 10; ++i) {
                CHECK(out[i].left == doctest::Approx((*store)[10 + i].left));
            }
        }

        SUBCASE("block_crossing_the_end") {
            const double cursor = generate_frames(*store, 95.0, unity(true), out.data(), out.size());
            for (std::size_t i = 0; i < 10; ++i) {
                CHECK(out[i].left == doctest::Approx((*store)[(95 + i) % 100].left));
            }
            // the returned cursor is not wrapped
            CHECK(cursor == doctest::Approx(105.0));
        }

        SUBCASE("interpolates_from_last_to_first_frame") {
            auto p = unity(true);
            p.pitch = {0.5f, 0.5f};
            generate_frames(*store, 99.0, p, out.data(), 2);
            const float expected = ((*store)[99].left + (*store)[0].left) * 0.5f;
            CHECK(out[1].left == doctest::Approx(expected));
        }

        SUBCASE("negative_cursor_wraps_from_the_end") {
            generate_frames(*store, -1.0, unity(true), out.data(), 2);
            CHECK(out[0].left == doctest::Approx((*store)[99].left));
            CHECK(out[1].left == doctest::Approx((*store)[0].left));
        }
    }

    TEST_CASE("should_resample_by_rate_ratio_and_pitch") {
        SUBCASE("half_rate_store_advances_half_a_frame") {
            auto store = make_ramp_store(10, 24000);
            std::vector<stereo_frame> out(4);
            const double cursor = generate_frames(*store, 0.0, unity(), out.data(), out.size());

            CHECK(out[0].left == doctest::Approx(0.0f));
            CHECK(out[1].left == doctest::Approx(0.0005f));
            CHECK(out[2].left == doctest::Approx(0.001f));
            CHECK(cursor == doctest::Approx(2.0));
        }

        SUBCASE("pitch_ramp_glides_across_the_block") {
            auto store = make_ramp_store(20);
            std::vector<stereo_frame> out(3);
            auto p = unity();
            p.pitch = {1.0f, 2.0f};
            const double cursor = generate_frames(*store, 0.0, p, out.data(), out.size());

            // steps are 1, 1.5, 2
            CHECK(out[0].left == doctest::Approx((*store)[0].left));
            CHECK(out[1].left == doctest::Approx((*store)[1].left));
            CHECK(out[2].left == doctest::Approx(0.0025f));
            CHECK(cursor == doctest::Approx(4.5));
        }

        SUBCASE("single_frame_block_uses_start_pitch") {
            auto store = make_ramp_store(20);
            stereo_frame out{};
            auto p = unity();
            p.pitch = {3.0f, 1.0f};
            CHECK(generate_frames(*store, 0.0, p, &out, 1) == doctest::Approx(3.0));
        }
    }

    TEST_CASE("should_apply_volume_ramp") {
        auto store = make_constant_store(64, 1.0f, 1.0f);
        std::vector<stereo_frame> out(32);

        SUBCASE("rising_envelope_is_non_decreasing") {
            auto p = unity();
            p.volume = {0.0f, 1.0f};
            generate_frames(*store, 0.0, p, out.data(), out.size());

            CHECK(out.front().left == doctest::Approx(0.0f));
            CHECK(out.back().left == doctest::Approx(1.0f));
            for (std::size_t i = 1; i < out.size(); ++i) {
                CHECK(out[i].left >= out[i - 1].left);
                CHECK(out[i].right >= out[i - 1].right);
            }
        }

        SUBCASE("negative_volume_clamps_to_zero") {
            auto p = unity();
            p.volume = {-2.0f, -0.5f};
            generate_frames(*store, 0.0, p, out.data(), out.size());
            for (const auto& f : out) {
                CHECK(is_silent(f));
            }
        }

        SUBCASE("ramp_spans_only_produced_frames") {
            // 4 readable frames, then silence; the ramp reaches its end on the last real frame
            auto short_store = make_constant_store(4, 1.0f, 1.0f);
            auto p = unity();
            p.volume = {1.0f, 0.0f};
            generate_frames(*short_store, 0.0, p, out.data(), 8);
            CHECK(out[0].left == doctest::Approx(1.0f));
            CHECK(out[3].left == doctest::Approx(0.0f));
            CHECK(out[1].left > out[2].left);
        }
    }

    TEST_CASE("should_pan_between_channels") {
        auto store = make_constant_store(16, 0.5f, 0.25f);
        std::vector<stereo_frame> out(8);
        auto p = unity();

        SUBCASE("center_is_a_no_op") {
            p.pan = 0.0f;
            generate_frames(*store, 0.0, p, out.data(), out.size());
            CHECK(out[0].left == 0.5f);
            CHECK(out[0].right == 0.25f);
        }

        SUBCASE("full_right_moves_left_into_right") {
            p.pan = 1.0f;
            generate_frames(*store, 0.0, p, out.data(), out.size());
            CHECK(out[0].left == doctest::Approx(0.0f));
            CHECK(out[0].right == doctest::Approx(0.75f));
        }

        SUBCASE("full_left_moves_right_into_left") {
            p.pan = -1.0f;
            generate_frames(*store, 0.0, p, out.data(), out.size());
            CHECK(out[0].left == doctest::Approx(0.75f));
            CHECK(out[0].right == doctest::Approx(0.0f));
        }

        SUBCASE("partial_pan") {
            p.pan = 0.5f;
            generate_frames(*store, 0.0, p, out.data(), out.size());
            CHECK(out[0].left == doctest::Approx(0.25f));
            CHECK(out[0].right == doctest::Approx(0.5f));
        }

        SUBCASE("out_of_range_pan_is_clamped") {
            p.pan = 4.0f;
            generate_frames(*store, 0.0, p, out.data(), out.size());
            CHECK(out[0].left == doctest::Approx(0.0f));
            CHECK(out[0].right == doctest::Approx(0.75f));
        }
    }

    TEST_CASE("should_render_silence_for_degenerate_input") {
        std::vector<stereo_frame> out(6, stereo_frame{1.0f, 1.0f});

        SUBCASE("empty_store") {
            sample_store empty({}, 48000);
            CHECK(generate_frames(empty, 2.0, unity(true), out.data(), out.size()) == 2.0);
            for (const auto& f : out) {
                CHECK(is_silent(f));
            }
        }

        SUBCASE("non_finite_cursor") {
            auto store = make_ramp_store(10);
            const double nan = std::numeric_limits<double>::quiet_NaN();
            CHECK(std::isnan(generate_frames(*store, nan, unity(), out.data(), out.size())));
            for (const auto& f : out) {
                CHECK(is_silent(f));
            }
        }

        SUBCASE("zero_frames_requested") {
            auto store = make_ramp_store(10);
            CHECK(generate_frames(*store, 3.0, unity(), out.data(), 0) == 3.0);
            CHECK(out[0].left == 1.0f);
        }
    }
}
