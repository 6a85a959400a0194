/**
 * @file test_voice.cc
 * @brief Unit tests for voice state, crossfades and cursor handling
 */

#include <doctest/doctest.h>
#include <voxmix/voice.hh>
#include <voxmix/sdk/sample_store.hh>
#include "../../test_helpers.hh"
#include <sstream>
#include <vector>

using namespace voxmix;
using namespace voxmix::test;

TEST_SUITE("Voice::Unit") {

    TEST_CASE("should_read_consecutive_positions_when_looping") {
        auto store = make_ramp_store(100, 48000);
        voice v("loop", store, 48000, 1.0f, 1.0f, 0.0f, true);
        std::vector<stereo_frame> out(10);

        v.get_frames(out.data(), out.size());
        for (std::size_t i = 0; i < 10; ++i) {
            CHECK(out[i].left == doctest::Approx(static_cast<float>(i) * 0.001f));
        }

        v.get_frames(out.data(), out.size());
        for (std::size_t i = 0; i < 10; ++i) {
            CHECK(out[i].left == doctest::Approx(static_cast<float>(10 + i) * 0.001f));
        }
        CHECK(v.cursor() == doctest::Approx(20.0));
    }

    TEST_CASE("should_keep_cursor_inside_store_when_looping") {
        auto store = make_ramp_store(100, 48000);
        voice v("loop", store, 48000, 1.0f, 1.7f, 0.0f, true);
        std::vector<stereo_frame> out(64);

        for (int block = 0; block < 50; ++block) {
            v.get_frames(out.data(), out.size());
            CHECK(v.cursor() >= 0.0);
            CHECK(v.cursor() < 100.0);
            CHECK_FALSE(v.finished());
        }
        CHECK(v.state() == voice_state::looping);
    }

    TEST_CASE("should_finish_after_running_off_the_store") {
        auto store = make_ramp_store(16, 48000);
        voice v("one-shot", store, 48000);
        std::vector<stereo_frame> out(10);

        CHECK(v.state() == voice_state::playing);
        v.get_frames(out.data(), out.size());
        CHECK_FALSE(v.finished());

        v.get_frames(out.data(), out.size());
        CHECK(v.finished());
        CHECK(v.state() == voice_state::finished);
        // frames 10..15 were played, the rest of the block is silence
        CHECK(out[5].left == doctest::Approx(0.015f));
        CHECK(out[6].left == 0.0f);
    }

    TEST_CASE("should_fade_out_when_stopped") {
        auto store = make_constant_store(4096, 1.0f, 1.0f);
        voice v("sfx", store, 48000, 1.0f, 1.0f, 0.0f, true);
        std::vector<stereo_frame> out(32);

        v.get_frames(out.data(), out.size());
        v.stop();
        CHECK(v.state() == voice_state::pending_removal);
        CHECK_FALSE(v.finished());
        CHECK(v.get_volume() == 0.0f);

        v.get_frames(out.data(), out.size());
        CHECK(out.front().left == doctest::Approx(1.0f));
        CHECK(out.back().left == doctest::Approx(0.0f));
        for (std::size_t i = 1; i < out.size(); ++i) {
            CHECK(out[i].left <= out[i - 1].left);
        }
        CHECK(v.finished());
        CHECK(v.state() == voice_state::finished);
    }

    TEST_CASE("should_crossfade_parameter_changes") {
        auto store = make_constant_store(4096, 1.0f, 1.0f);
        voice v("pad", store, 48000, 1.0f, 1.0f, 0.0f, true);
        std::vector<stereo_frame> out(16);

        v.get_frames(out.data(), out.size());
        v.set_volume(0.5f);

        v.get_frames(out.data(), out.size());
        CHECK(out.front().left == doctest::Approx(1.0f));
        CHECK(out.back().left == doctest::Approx(0.5f));

        v.get_frames(out.data(), out.size());
        CHECK(out.front().left == doctest::Approx(0.5f));
        CHECK(out.back().left == doctest::Approx(0.5f));
    }

    TEST_CASE("should_glide_pitch_changes") {
        auto store = make_ramp_store(1000, 48000);
        voice v("glide", store, 48000);
        std::vector<stereo_frame> out(5);

        v.set_pitch(2.0f);
        v.get_frames(out.data(), out.size());
        // steps 1, 1.25, 1.5, 1.75, 2
        CHECK(v.cursor() == doctest::Approx(7.5));

        v.get_frames(out.data(), out.size());
        CHECK(v.cursor() == doctest::Approx(17.5));
    }

    TEST_CASE("should_report_time_in_seconds_of_the_source") {
        auto store = make_ramp_store(48000, 24000);
        voice v("t", store, 48000);
        std::vector<stereo_frame> out(480);

        CHECK(v.get_time() == 0.0);
        v.get_frames(out.data(), out.size());
        CHECK(v.cursor() == doctest::Approx(240.0));
        CHECK(v.get_time() == doctest::Approx(0.01));
    }

    TEST_CASE("should_sanitize_parameters") {
        auto store = make_ramp_store(10);

        SUBCASE("pan_is_clamped") {
            voice v("p", store, 48000, 1.0f, 1.0f, 3.0f);
            CHECK(v.get_pan() == 1.0f);
            v.set_pan(-7.0f);
            CHECK(v.get_pan() == -1.0f);
            v.set_pan(0.25f);
            CHECK(v.get_pan() == 0.25f);
        }

        SUBCASE("null_store_is_rejected") {
            CHECK_THROWS(voice("x", nullptr, 48000));
        }

        SUBCASE("empty_store_is_finished_immediately") {
            auto empty = std::make_shared<const sample_store>(std::vector<stereo_frame>{}, 48000);
            voice v("e", empty, 48000, 1.0f, 1.0f, 0.0f, true);
            CHECK(v.finished());
            std::vector<stereo_frame> out(4, stereo_frame{1.0f, 1.0f});
            v.get_frames(out.data(), out.size());
            CHECK(out[0].left == 0.0f);
        }
    }

    TEST_CASE("should_expose_identity") {
        auto store = make_ramp_store(10);
        voice v("engine", store, 48000, 0.7f, 1.2f, 0.0f, true);

        CHECK(v.id() == "engine");
        CHECK(v.loops());
        CHECK(v.store() == store);
        CHECK(v.get_volume() == 0.7f);
        CHECK(v.get_pitch() == 1.2f);

        std::ostringstream os;
        os << v.state();
        CHECK(os.str() == "looping");
    }
}
