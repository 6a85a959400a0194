#include <voxmix/voice.hh>
#include <voxmix/sdk/frame_generator.hh>
#include <voxmix/sdk/sample_store.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <cmath>

namespace voxmix {
    namespace {
        float sanitize_pan(float p) noexcept {
            if (!std::isfinite(p)) {
                return 0.0f;
            }
            return std::clamp(p, -1.0f, 1.0f);
        }
    }

    std::ostream& operator<<(std::ostream& os, voice_state s) {
        switch (s) {
            case voice_state::playing: return os << "playing";
            case voice_state::looping: return os << "looping";
            case voice_state::pending_removal: return os << "pending_removal";
            case voice_state::finished: return os << "finished";
        }
        return os << "unknown";
    }

    voice::voice(std::string id,
                 std::shared_ptr<const sample_store> store,
                 sample_rate_t device_rate,
                 float volume,
                 float pitch,
                 float pan,
                 bool loop)
        : m_id(std::move(id)),
          m_store(std::move(store)),
          m_device_rate(device_rate),
          m_loop(loop),
          m_volume(volume),
          m_pitch(pitch),
          m_pan(sanitize_pan(pan)),
          m_prev_volume(volume),
          m_prev_pitch(pitch) {
        if (!m_store) {
            THROW_RUNTIME("voice requires a sample store");
        }
        if (m_device_rate == 0) {
            THROW_RUNTIME("voice requires a positive device rate");
        }
    }

    void voice::get_frames(stereo_frame* out, std::size_t n) noexcept {
        const bool removing = m_remove.load(std::memory_order_acquire);
        const float volume = removing ? 0.0f : m_volume.load(std::memory_order_relaxed);
        const float pitch = m_pitch.load(std::memory_order_relaxed);

        frame_params params;
        params.volume = {m_prev_volume, volume};
        params.pitch = {m_prev_pitch, pitch};
        params.pan = m_pan.load(std::memory_order_relaxed);
        params.loop = m_loop;
        params.device_rate = m_device_rate;

        double cursor = generate_frames(*m_store, m_cursor.load(std::memory_order_relaxed), params, out, n);

        const auto length = static_cast<double>(m_store->length());
        if (m_loop && length > 0.0 && std::isfinite(cursor)) {
            cursor = std::fmod(cursor, length);
            if (cursor < 0.0) {
                cursor += length;
            }
            if (cursor >= length) {
                cursor = 0.0;
            }
        }
        m_cursor.store(cursor, std::memory_order_release);

        m_prev_volume = volume;
        m_prev_pitch = pitch;
        if (removing) {
            m_faded_out.store(true, std::memory_order_release);
        }
    }

    double voice::get_time() const noexcept {
        return cursor() / static_cast<double>(m_store->rate());
    }

    bool voice::finished() const noexcept {
        if (m_faded_out.load(std::memory_order_acquire) || m_store->empty()) {
            return true;
        }
        if (m_loop) {
            return false;
        }
        const double c = cursor();
        const auto last = static_cast<double>(m_store->length() - 1);
        return !(c >= 0.0 && c <= last);
    }

    void voice::stop() noexcept {
        m_volume.store(0.0f, std::memory_order_relaxed);
        m_remove.store(true, std::memory_order_release);
    }

    voice_state voice::state() const noexcept {
        if (finished()) {
            return voice_state::finished;
        }
        if (m_remove.load(std::memory_order_acquire)) {
            return voice_state::pending_removal;
        }
        return m_loop ? voice_state::looping : voice_state::playing;
    }

    void voice::set_volume(float v) noexcept {
        m_volume.store(v, std::memory_order_relaxed);
    }

    float voice::get_volume() const noexcept {
        return m_volume.load(std::memory_order_relaxed);
    }

    void voice::set_pitch(float p) noexcept {
        m_pitch.store(p, std::memory_order_relaxed);
    }

    float voice::get_pitch() const noexcept {
        return m_pitch.load(std::memory_order_relaxed);
    }

    void voice::set_pan(float p) noexcept {
        m_pan.store(sanitize_pan(p), std::memory_order_relaxed);
    }

    float voice::get_pan() const noexcept {
        return m_pan.load(std::memory_order_relaxed);
    }

    double voice::cursor() const noexcept {
        return m_cursor.load(std::memory_order_acquire);
    }
}
