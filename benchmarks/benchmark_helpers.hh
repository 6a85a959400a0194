#ifndef VOXMIX_BENCHMARK_HELPERS_HH
#define VOXMIX_BENCHMARK_HELPERS_HH

#include <voxmix/sdk/sample_store.hh>
#include <voxmix/sdk/types.hh>
#include <cmath>
#include <memory>
#include <vector>

namespace voxmix::benchmark {

// One second of a 440 Hz sine, stereo
inline std::shared_ptr<const sample_store> make_sine_store(sample_rate_t rate = 44100) {
    std::vector<stereo_frame> frames(rate);
    const double step = 2.0 * 3.14159265358979323846 * 440.0 / rate;
    for (std::size_t i = 0; i < frames.size(); ++i) {
        const auto v = static_cast<float>(0.3 * std::sin(step * static_cast<double>(i)));
        frames[i] = {v, v};
    }
    return std::make_shared<const sample_store>(std::move(frames), rate);
}

} // namespace voxmix::benchmark

#endif // VOXMIX_BENCHMARK_HELPERS_HH
