#include <voxmix/sdk/frame_generator.hh>
#include <voxmix/sdk/sample_store.hh>
#include <voxmix/sdk/compiler.hh>
#include <algorithm>
#include <cmath>

namespace voxmix {
    namespace {
        double finite_or(double v, double fallback) noexcept {
            return std::isfinite(v) ? v : fallback;
        }

        void fill_silence(stereo_frame* out, std::size_t from, std::size_t n) noexcept {
            std::fill(out + from, out + n, stereo_frame{0.0f, 0.0f});
        }

        void apply_volume(stereo_frame* out, std::size_t produced, const ramp& volume) noexcept {
            const double v0 = std::max(0.0, finite_or(volume.start, 0.0));
            const double v1 = std::max(0.0, finite_or(volume.end, 0.0));
            if (v0 == 1.0 && v1 == 1.0) {
                return;
            }
            const double span = produced > 1 ? static_cast<double>(produced - 1) : 1.0;
            for (std::size_t i = 0; i < produced; ++i) {
                const auto gain = static_cast<float>(v0 + (v1 - v0) * static_cast<double>(i) / span);
                out[i].left *= gain;
                out[i].right *= gain;
            }
        }

        void apply_pan(stereo_frame* out, std::size_t produced, float pan) noexcept {
            if (!std::isfinite(pan) || pan == 0.0f) {
                return;
            }
            pan = std::clamp(pan, -1.0f, 1.0f);
            if (pan > 0.0f) {
                const float keep = 1.0f - pan;
                VOXMIX_PRAGMA_IVDEP
                for (std::size_t i = 0; i < produced; ++i) {
                    const float l = out[i].left;
                    out[i].right += l * pan;
                    out[i].left = l * keep;
                }
            } else {
                const float amount = -pan;
                const float keep = 1.0f - amount;
                VOXMIX_PRAGMA_IVDEP
                for (std::size_t i = 0; i < produced; ++i) {
                    const float r = out[i].right;
                    out[i].left += r * amount;
                    out[i].right = r * keep;
                }
            }
        }
    }

    double generate_frames(const sample_store& store,
                           double cursor,
                           const frame_params& params,
                           stereo_frame* out,
                           std::size_t n) noexcept {
        if (n == 0 || out == nullptr) {
            return cursor;
        }
        const std::size_t length = store.length();
        if (length == 0 || params.device_rate == 0 || !std::isfinite(cursor)) {
            fill_silence(out, 0, n);
            return cursor;
        }

        const double rate_ratio = static_cast<double>(store.rate()) / static_cast<double>(params.device_rate);
        const double p0 = finite_or(params.pitch.start, 0.0) * rate_ratio;
        const double p1 = finite_or(params.pitch.end, 0.0) * rate_ratio;
        const double step = n > 1 ? (p1 - p0) / static_cast<double>(n - 1) : 0.0;

        const double len = static_cast<double>(length);
        const double last = len - 1.0;
        const stereo_frame* src = store.frames();

        std::size_t produced = 0;
        double advanced = 0.0;
        for (std::size_t i = 0; i < n; ++i) {
            double pos = cursor + advanced;
            advanced += p0 + step * static_cast<double>(i);

            if (params.loop) {
                pos = std::fmod(pos, len);
                if (pos < 0.0) {
                    pos += len;
                }
                if (pos >= len) {
                    pos = 0.0;
                }
            } else if (!(pos >= 0.0 && pos <= last)) {
                continue;
            }

            const double base = std::floor(pos);
            const auto lo = std::min(static_cast<std::size_t>(base), length - 1);
            std::size_t hi = pos > base ? lo + 1 : lo;
            if (hi >= length) {
                // only reachable while looping: the frame after the last one is the first
                hi = params.loop ? 0 : length - 1;
            }
            const auto w = static_cast<float>(pos - base);
            const stereo_frame& a = src[lo];
            const stereo_frame& b = src[hi];
            out[produced++] = {a.left + (b.left - a.left) * w,
                               a.right + (b.right - a.right) * w};
        }

        apply_volume(out, produced, params.volume);
        apply_pan(out, produced, params.pan);
        fill_silence(out, produced, n);

        return cursor + advanced;
    }
}
