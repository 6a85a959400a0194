#define ANKERL_NANOBENCH_IMPLEMENT
#include <nanobench.h>
#include <iostream>

// Declare benchmark suites
namespace voxmix::benchmark {
    void register_mixer_tick_benchmarks(ankerl::nanobench::Bench& bench);
    void register_frame_generator_benchmarks(ankerl::nanobench::Bench& bench);
    void register_control_contention_benchmarks(ankerl::nanobench::Bench& bench);
}

int main() {
    std::cout << "Running voxmix benchmarks...\n\n";

    // Run benchmarks in a scope so they complete before exit
    {
        ankerl::nanobench::Bench bench;
        bench.title("voxmix Mixing Benchmarks");
        bench.relative(true);
        bench.performanceCounters(true);

        voxmix::benchmark::register_frame_generator_benchmarks(bench);
        voxmix::benchmark::register_mixer_tick_benchmarks(bench);
        voxmix::benchmark::register_control_contention_benchmarks(bench);
    }

    return 0;
}
