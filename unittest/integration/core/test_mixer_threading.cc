/**
 * Mixer thread safety tests
 *
 * A render thread ticks the mixer the way a device callback would while
 * control threads start, adjust, query and stop voices.
 */

#include <doctest/doctest.h>
#include <voxmix/sound_player.hh>
#include <voxmix/mixer.hh>
#include <voxmix/sample_library.hh>
#include "../../mock_backends.hh"
#include "../../test_helpers.hh"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace voxmix::test {

TEST_SUITE("MixerThreading::Integration") {

    TEST_CASE("concurrent control calls while rendering") {
        memory_loader files;
        files.add_store("a", make_constant_store(2000, 0.4f, 0.4f));
        files.add_store("b", make_ramp_store(500));
        sample_library library(files.as_loader());
        mixer mix(library, 48000, 256);

        std::atomic<bool> running{true};
        std::atomic<bool> out_of_range{false};
        std::atomic<int> ticks{0};

        std::thread render([&] {
            while (running.load()) {
                const stereo_frame* block = mix.tick(256);
                for (std::size_t i = 0; i < 256; ++i) {
                    if (block[i].left > 1.0f || block[i].left < -1.0f ||
                        block[i].right > 1.0f || block[i].right < -1.0f) {
                        out_of_range = true;
                    }
                }
                ticks++;
            }
        });

        std::vector<std::thread> controllers;
        for (int t = 0; t < 4; ++t) {
            controllers.emplace_back([&mix, t] {
                play_options opts;
                opts.id = "ctl" + std::to_string(t);
                opts.loop = (t % 2) == 0;
                for (int i = 0; i < 200; ++i) {
                    auto v = mix.play((i % 2) ? "a" : "b", opts);
                    v->set_volume(0.5f + 0.001f * static_cast<float>(i));
                    v->set_pan(t % 2 ? 0.5f : -0.5f);
                    for (auto& other : mix.query(*opts.id)) {
                        other->set_pitch(1.1f);
                    }
                    if (i % 10 == 9) {
                        mix.stop(*opts.id);
                    }
                }
            });
        }

        for (auto& c : controllers) {
            c.join();
        }
        mix.stop_all();

        // let the render thread fade everything out
        const int seen = ticks.load();
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while ((ticks.load() < seen + 2 || mix.active_count() > 0) && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::yield();
        }
        running = false;
        render.join();

        CHECK_FALSE(out_of_range.load());
        CHECK(mix.active_count() == 0);
        CHECK(files.load_count("a") == 1);
        CHECK(files.load_count("b") == 1);
    }

    TEST_CASE("play does not wait for a render in progress") {
        // heavy blocks: many long looping voices, 64k frames per tick
        auto store = make_ramp_store(1 << 20, 48000, 1e-7f);
        sample_library library;
        mixer mix(library, 48000, 65536);

        play_options looping;
        looping.loop = true;
        looping.volume = 0.01f;
        for (int i = 0; i < 24; ++i) {
            mix.play(store, looping);
        }

        using clock = std::chrono::steady_clock;
        std::atomic<bool> running{true};
        std::atomic<int> ticks{0};
        std::atomic<long long> max_tick_us{0};

        std::thread render([&] {
            while (running.load()) {
                const auto start = clock::now();
                mix.tick(65536);
                const long long us = std::chrono::duration_cast<std::chrono::microseconds>(clock::now() - start).count();
                if (us > max_tick_us.load()) {
                    max_tick_us = us;
                }
                ticks++;
            }
        });

        while (ticks.load() < 2) {
            std::this_thread::yield();
        }

        // crosses several capacity doublings of the voice list and the snapshot
        long long max_play_us = 0;
        for (int i = 0; i < 100; ++i) {
            const auto start = clock::now();
            mix.play(store, looping);
            const long long us = std::chrono::duration_cast<std::chrono::microseconds>(clock::now() - start).count();
            max_play_us = std::max(max_play_us, us);
        }

        running = false;
        render.join();

        CHECK(mix.active_count() == 124);
        CHECK(max_tick_us.load() > 0);
        CHECK(max_play_us < max_tick_us.load() / 2);
    }

    TEST_CASE("player shutdown while the device pulls") {
        memory_loader files;
        files.add_store("tone", make_constant_store(48000, 0.2f, 0.2f));
        player_config cfg;
        cfg.loader = files.as_loader();

        auto backend = std::make_shared<mock_backend>();
        sound_player player(backend, cfg);
        REQUIRE(player.is_enabled());
        auto stream = backend->last_stream();
        REQUIRE(stream);

        play_options looping;
        looping.loop = true;
        player.play("tone", looping);

        std::atomic<bool> running{true};
        std::thread device([&] {
            std::vector<stereo_frame> out(128);
            while (running.load()) {
                // the stream state outlives the stream, so this stays safe after shutdown
                stream->callback(stream->userdata, reinterpret_cast<uint8_t*>(out.data()),
                                 static_cast<int>(out.size() * sizeof(stereo_frame)));
            }
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        player.shutdown();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        running = false;
        device.join();

        CHECK_FALSE(player.is_enabled());
        CHECK(backend->shutdown_calls == 1);
    }
}

} // namespace voxmix::test
