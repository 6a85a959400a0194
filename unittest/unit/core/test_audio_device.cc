/**
 * @file test_audio_device.cc
 * @brief Unit tests for audio_device against the mock and null backends
 */

#include <doctest/doctest.h>
#include <voxmix/audio_device.hh>
#include <voxmix/backends/null/null_backend.hh>
#include <voxmix/error.hh>
#include "../../mock_backends.hh"
#include <cstring>
#include <memory>
#include <sstream>
#include <utility>

using namespace voxmix;
using namespace voxmix::test;

namespace {
    callback_status silent_callback(void*, uint8_t*, int) {
        return callback_status::keep_going;
    }

    // completes on the third block
    callback_status finishing_callback(void* userdata, uint8_t* out, int len) {
        int& calls = *static_cast<int*>(userdata);
        std::memset(out, 0, static_cast<std::size_t>(len));
        return ++calls < 3 ? callback_status::keep_going : callback_status::complete;
    }
}

TEST_SUITE("AudioDevice::Unit") {

    TEST_CASE("should_require_an_initialized_backend") {
        CHECK_THROWS_AS(audio_device::open_default_device(nullptr), device_error);

        auto backend = std::make_shared<mock_backend>();
        CHECK_THROWS_AS(audio_device::open_default_device(backend), device_error);
        CHECK_THROWS_AS(audio_device::enumerate_devices(backend), device_error);
        CHECK(backend->open_device_calls == 0);
    }

    TEST_CASE("should_open_and_close_devices") {
        auto backend = std::make_shared<mock_backend>();
        backend->init();

        SUBCASE("default_device") {
            {
                auto dev = audio_device::open_default_device(backend);
                CHECK(dev.get_device_id() == "mock_default");
                CHECK(dev.get_device_name() == "Mock Default Device");
                CHECK(dev.get_spec().format == audio_f32sys);
                CHECK(dev.get_freq() == default_sample_rate);
                CHECK(backend->open_device_count() == 1);
            }
            CHECK(backend->open_device_count() == 0);
        }

        SUBCASE("by_id") {
            audio_spec spec;
            spec.freq = 22050;
            auto dev = audio_device::open_device(backend, "mock_secondary", spec);
            CHECK(dev.get_device_id() == "mock_secondary");
            CHECK(dev.get_freq() == 22050);
        }

        SUBCASE("unknown_id") {
            CHECK_THROWS_AS(audio_device::open_device(backend, "nope"), device_error);
        }

        SUBCASE("backend_failure_is_a_device_error") {
            backend->fail_open_device = true;
            CHECK_THROWS_AS(audio_device::open_default_device(backend), device_error);
        }

        SUBCASE("enumerate") {
            auto devices = audio_device::enumerate_devices(backend);
            REQUIRE(devices.size() == 2);
            CHECK(devices[0].is_default);
            std::ostringstream os;
            os << devices[1];
            CHECK(os.str().find("mock_secondary") != std::string::npos);
        }
    }

    TEST_CASE("should_run_a_single_stream") {
        auto backend = std::make_shared<mock_backend>();
        backend->init();
        auto dev = audio_device::open_default_device(backend);

        CHECK_FALSE(dev.has_stream());
        CHECK_THROWS(dev.start(nullptr, nullptr));

        dev.start(&silent_callback, nullptr);
        CHECK(dev.has_stream());
        auto stream = backend->last_stream();
        REQUIRE(stream);
        CHECK(stream->bound);
        CHECK_THROWS_AS(dev.start(&silent_callback, nullptr), device_error);

        CHECK(dev.pause());
        CHECK(dev.is_paused());
        CHECK(stream->paused);
        CHECK(dev.resume());
        CHECK_FALSE(dev.is_paused());
        CHECK_FALSE(stream->paused);
        CHECK_FALSE(dev.is_complete());

        dev.stop();
        CHECK_FALSE(dev.has_stream());
        CHECK_FALSE(stream->bound);
        dev.stop();
    }

    TEST_CASE("should_end_playback_when_the_callback_completes") {
        auto backend = std::make_shared<mock_backend>();
        backend->init();
        auto dev = audio_device::open_default_device(backend);
        CHECK_FALSE(dev.is_complete());

        int calls = 0;
        dev.start(&finishing_callback, &calls);
        CHECK(backend->pull(4).size() == 4);
        CHECK(backend->pull(4).size() == 4);
        CHECK_FALSE(dev.is_complete());

        // the third block reports complete and is the last one requested
        CHECK(backend->pull(4).size() == 4);
        CHECK(dev.is_complete());
        CHECK(backend->pull(4).empty());
        CHECK(calls == 3);
        CHECK(dev.has_stream());

        dev.stop();
        CHECK_FALSE(dev.is_complete());
    }

    TEST_CASE("should_move_device_ownership") {
        auto backend = std::make_shared<mock_backend>();
        backend->init();
        auto a = audio_device::open_default_device(backend);
        a.start(&silent_callback, nullptr);

        audio_device b = std::move(a);
        CHECK(b.has_stream());
        CHECK(backend->open_device_count() == 1);
        CHECK(backend->close_device_calls == 0);
    }

    TEST_CASE("should_accept_any_spec_on_the_null_backend") {
        std::shared_ptr<audio_backend> backend = create_null_backend();
        CHECK(backend->get_name() == "Null");
        CHECK_THROWS(backend->enumerate_devices(true));

        backend->init();
        auto devices = audio_device::enumerate_devices(backend);
        REQUIRE(devices.size() == 1);
        CHECK(devices[0].id == "null");

        auto dev = audio_device::open_device(backend, "null");
        dev.start(&silent_callback, nullptr);
        CHECK(dev.has_stream());
        CHECK_FALSE(dev.is_paused());
        CHECK(dev.pause());
        CHECK(dev.is_paused());

        backend->shutdown();
        CHECK_FALSE(backend->is_initialized());
    }
}
