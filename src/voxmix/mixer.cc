#include <voxmix/mixer.hh>
#include <voxmix/sample_library.hh>
#include <voxmix/sdk/sample_store.hh>
#include <voxmix/sdk/compiler.hh>
#include <voxmix/error.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <iterator>

namespace voxmix {
    namespace {
        constexpr std::size_t INITIAL_VOICE_CAPACITY = 32;

        // out += clamp(x, -1 - out, 1 - out), so the running sum never leaves [-1, 1]
        inline float add_clipped(float out, float x) noexcept {
            if (!std::isfinite(x)) {
                return out;
            }
            return out + std::clamp(x, -1.0f - out, 1.0f - out);
        }

        void mix_clipped(stereo_frame* dst, const stereo_frame* src, std::size_t n) noexcept {
            VOXMIX_PRAGMA_IVDEP
            for (std::size_t i = 0; i < n; ++i) {
                dst[i].left = add_clipped(dst[i].left, src[i].left);
                dst[i].right = add_clipped(dst[i].right, src[i].right);
            }
        }
    }

    mixer::mixer(sample_library& library, sample_rate_t device_rate, std::size_t block_hint)
        : m_library(library),
          m_device_rate(device_rate),
          m_mix_buf(block_hint),
          m_voice_buf(block_hint) {
        if (m_device_rate == 0) {
            THROW_RUNTIME("mixer requires a positive device rate");
        }
        m_voices.reserve(INITIAL_VOICE_CAPACITY);
        m_retired.reserve(INITIAL_VOICE_CAPACITY);
        m_snapshot.reserve(INITIAL_VOICE_CAPACITY);
        m_snapshot_capacity = m_snapshot.capacity();
    }

    std::shared_ptr<voice> mixer::play(const std::string& source, const play_options& opts) {
        auto store = m_library.get(source);
        return add_voice(opts.id.value_or(source), std::move(store), opts);
    }

    std::shared_ptr<voice> mixer::play(std::shared_ptr<const sample_store> store, const play_options& opts) {
        if (!store) {
            THROW_RUNTIME("Cannot play a null sample store");
        }
        return add_voice(opts.id.value_or(std::string{}), std::move(store), opts);
    }

    // caller holds m_voices_mutex
    bool mixer::needs_room(std::size_t voices) const {
        // every active voice may be retired before the next control call drains the list
        return m_voices.capacity() < voices
               || m_retired.capacity() < voices
               || std::max(m_snapshot_capacity, m_snapshot_spare.capacity()) < voices;
    }

    std::shared_ptr<voice> mixer::add_voice(std::string id,
                                            std::shared_ptr<const sample_store> store,
                                            const play_options& opts) {
        auto v = std::make_shared<voice>(std::move(id), std::move(store), m_device_rate,
                                         opts.volume, opts.pitch, opts.pan, opts.loop);

        // declared before the lock so whatever they end up holding is freed after it is released
        voice_list retired;
        voice_list grown_voices;
        voice_list grown_retired;
        voice_list grown_snapshot;
        std::size_t want = 0;

        while (true) {
            retired.reserve(m_retired_hint.load(std::memory_order_acquire));
            if (want > 0) {
                grown_voices.reserve(want);
                grown_retired.reserve(want);
                grown_snapshot.reserve(want);
            }

            std::lock_guard<std::mutex> lock(m_voices_mutex);
            take_retired(retired);

            const std::size_t needed = m_voices.size() + 1;
            if (needs_room(needed)) {
                if (grown_voices.capacity() < needed) {
                    // reserve outside the lock and look again
                    want = needed * 2;
                    continue;
                }
                if (m_voices.capacity() < needed) {
                    grown_voices.assign(std::make_move_iterator(m_voices.begin()),
                                        std::make_move_iterator(m_voices.end()));
                    m_voices.swap(grown_voices);
                }
                if (m_retired.capacity() < needed) {
                    m_retired.swap(grown_retired);
                }
                if (std::max(m_snapshot_capacity, m_snapshot_spare.capacity()) < needed) {
                    m_snapshot_spare.swap(grown_snapshot);
                }
            }

            m_voices.push_back(v);
            m_active_hint.store(m_voices.size(), std::memory_order_relaxed);
            return v;
        }
    }

    // caller holds m_voices_mutex; m_retired keeps its capacity, @p into should be reserved beforehand
    void mixer::take_retired(voice_list& into) {
        if (m_retired.empty()) {
            return;
        }
        into.insert(into.end(),
                    std::make_move_iterator(m_retired.begin()),
                    std::make_move_iterator(m_retired.end()));
        m_retired.clear();
        m_retired_hint.store(0, std::memory_order_relaxed);
    }

    void mixer::stop(const std::string& id) {
        voice_list retired;
        retired.reserve(m_retired_hint.load(std::memory_order_acquire));
        std::lock_guard<std::mutex> lock(m_voices_mutex);
        take_retired(retired);
        for (const auto& v : m_voices) {
            if (v->id() == id) {
                v->stop();
            }
        }
    }

    void mixer::stop_all() {
        voice_list retired;
        retired.reserve(m_retired_hint.load(std::memory_order_acquire));
        std::lock_guard<std::mutex> lock(m_voices_mutex);
        take_retired(retired);
        for (const auto& v : m_voices) {
            v->stop();
        }
    }

    std::vector<std::shared_ptr<voice>> mixer::query(const std::string& id) {
        voice_list retired;
        retired.reserve(m_retired_hint.load(std::memory_order_acquire));
        voice_list found;
        found.reserve(m_active_hint.load(std::memory_order_relaxed));
        std::lock_guard<std::mutex> lock(m_voices_mutex);
        take_retired(retired);
        for (const auto& v : m_voices) {
            if (v->id() == id) {
                found.push_back(v);
            }
        }
        return found;
    }

    std::shared_ptr<voice> mixer::query_one(const std::string& id) {
        {
            std::lock_guard<std::mutex> lock(m_voices_mutex);
            auto it = std::find_if(m_voices.begin(), m_voices.end(),
                                   [&id](const std::shared_ptr<voice>& v) { return v->id() == id; });
            if (it != m_voices.end()) {
                return *it;
            }
        }
        throw not_found_error("No active voice with id '" + id + "'");
    }

    std::size_t mixer::active_count() const {
        std::lock_guard<std::mutex> lock(m_voices_mutex);
        return m_voices.size();
    }

    void mixer::ensure_block(std::size_t n) {
        const bool grown_mix = m_mix_buf.ensure(n);
        const bool grown_voice = m_voice_buf.ensure(n);
        if (grown_mix || grown_voice) {
            LOG_WARN("mixer", "Mix buffers grown to", n, "frames");
        }
    }

    const stereo_frame* mixer::tick(std::size_t n) {
        std::lock_guard<std::mutex> render_lock(m_render_mutex);

        ensure_block(n);
        m_mix_buf.zero(n);
        if (n == 0) {
            return m_mix_buf.data();
        }

        {
            std::lock_guard<std::mutex> lock(m_voices_mutex);
            // both vectors are empty here, so trading them never allocates
            if (m_snapshot_spare.capacity() > m_snapshot.capacity()) {
                m_snapshot.swap(m_snapshot_spare);
                m_snapshot_capacity = m_snapshot.capacity();
            }
            m_snapshot.assign(m_voices.begin(), m_voices.end());
        }

        stereo_frame* dst = m_mix_buf.data();
        stereo_frame* scratch = m_voice_buf.data();
        for (const auto& v : m_snapshot) {
            v->get_frames(scratch, n);
            mix_clipped(dst, scratch, n);
        }
        m_snapshot.clear();

        {
            std::lock_guard<std::mutex> lock(m_voices_mutex);
            auto keep = m_voices.begin();
            for (auto it = m_voices.begin(); it != m_voices.end(); ++it) {
                if ((*it)->finished()) {
                    m_retired.push_back(std::move(*it));
                } else {
                    if (keep != it) {
                        *keep = std::move(*it);
                    }
                    ++keep;
                }
            }
            m_voices.erase(keep, m_voices.end());
            m_active_hint.store(m_voices.size(), std::memory_order_relaxed);
            m_retired_hint.store(m_retired.size(), std::memory_order_release);
        }
        return dst;
    }

    void mixer::render(stereo_frame* out, std::size_t n) {
        if (!out) {
            THROW_RUNTIME("mixer::render called with a null buffer");
        }
        const stereo_frame* block = tick(n);
        if (n > 0) {
            std::memcpy(out, block, n * sizeof(stereo_frame));
        }
    }
}
