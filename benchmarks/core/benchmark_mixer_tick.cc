// Mixing throughput: resampling a single voice and summing many voices per block
#include <nanobench.h>
#include "../benchmark_helpers.hh"
#include <voxmix/mixer.hh>
#include <voxmix/sample_library.hh>
#include <voxmix/sdk/frame_generator.hh>
#include <atomic>
#include <cmath>
#include <string>
#include <thread>
#include <vector>

namespace voxmix::benchmark {

namespace {
    constexpr std::size_t BLOCK_FRAMES = 512;
    constexpr sample_rate_t DEVICE_RATE = 48000;
}

void register_frame_generator_benchmarks(ankerl::nanobench::Bench& bench) {
    auto store = make_sine_store();
    std::vector<stereo_frame> out(BLOCK_FRAMES);

    frame_params steady;
    steady.loop = true;
    steady.device_rate = DEVICE_RATE;

    double cursor = 0.0;
    bench.run("generate_frames steady 512", [&] {
        cursor = generate_frames(*store, cursor, steady, out.data(), out.size());
        cursor = std::fmod(cursor, static_cast<double>(store->length()));
        ankerl::nanobench::doNotOptimizeAway(out.data());
    });

    frame_params ramped = steady;
    ramped.volume = {1.0f, 0.5f};
    ramped.pitch = {1.0f, 1.5f};
    ramped.pan = 0.3f;

    cursor = 0.0;
    bench.run("generate_frames ramped 512", [&] {
        cursor = generate_frames(*store, cursor, ramped, out.data(), out.size());
        cursor = std::fmod(cursor, static_cast<double>(store->length()));
        ankerl::nanobench::doNotOptimizeAway(out.data());
    });
}

void register_mixer_tick_benchmarks(ankerl::nanobench::Bench& bench) {
    auto store = make_sine_store();

    for (int voices : {1, 8, 32, 64}) {
        sample_library library;
        mixer mix(library, DEVICE_RATE, BLOCK_FRAMES);

        play_options opts;
        opts.loop = true;
        for (int i = 0; i < voices; ++i) {
            opts.pan = (i % 2) ? 0.5f : -0.5f;
            opts.pitch = 1.0f + 0.01f * static_cast<float>(i);
            mix.play(store, opts);
        }

        bench.run("mixer tick " + std::to_string(voices) + " voices", [&] {
            ankerl::nanobench::doNotOptimizeAway(mix.tick(BLOCK_FRAMES));
        });
    }
}

// Tick while another thread keeps starting, querying and stopping voices
void register_control_contention_benchmarks(ankerl::nanobench::Bench& bench) {
    auto store = make_sine_store();
    sample_library library;
    mixer mix(library, DEVICE_RATE, BLOCK_FRAMES);

    std::atomic<bool> running{true};
    std::thread controller([&] {
        play_options opts;
        opts.id = "sfx";
        while (running.load(std::memory_order_relaxed)) {
            for (int i = 0; i < 8; ++i) {
                mix.play(store, opts);
            }
            for (auto& v : mix.query("sfx")) {
                v->set_volume(0.5f);
            }
            mix.stop("sfx");
            std::this_thread::yield();
        }
    });

    bench.run("mixer tick under control traffic", [&] {
        ankerl::nanobench::doNotOptimizeAway(mix.tick(BLOCK_FRAMES));
    });

    running = false;
    controller.join();
}

} // namespace voxmix::benchmark
