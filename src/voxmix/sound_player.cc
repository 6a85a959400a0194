#include <voxmix/sound_player.hh>
#include <voxmix/audio_device.hh>
#include <voxmix/mixer.hh>
#include <voxmix/sdk/audio_backend.hh>
#include <voxmix/sdk/audio_format.hh>
#include <failsafe/failsafe.hh>
#include <atomic>
#include <cstring>
#include <optional>

namespace voxmix {
    struct sound_player::impl {
        explicit impl(const player_config& config)
            : library(config.loader),
              mixer(library, config.sample_rate) {
        }

        std::shared_ptr<audio_backend> backend;
        bool initialized_backend = false;
        sample_library library;
        voxmix::mixer mixer;
        std::optional<audio_device> device;
        std::atomic<bool> shut_down{false};
    };

    namespace {
        callback_status player_callback(void* userdata, uint8_t* out, int len) {
            return static_cast<sound_player*>(userdata)->render(out, len);
        }
    }

    sound_player::sound_player(std::shared_ptr<audio_backend> backend, player_config config)
        : m_config(std::move(config)),
          m_pimpl(std::make_unique<impl>(m_config)) {
        m_pimpl->backend = std::move(backend);
        if (!m_pimpl->backend) {
            LOG_WARN("sound_player", "No audio backend given, playback is disabled");
            return;
        }

        audio_spec spec;
        spec.format = audio_f32sys;
        spec.channels = 2;
        spec.freq = m_config.sample_rate;

        try {
            if (!m_pimpl->backend->is_initialized()) {
                m_pimpl->backend->init();
                m_pimpl->initialized_backend = true;
            }
            auto dev = m_config.device_id.empty()
                           ? audio_device::open_default_device(m_pimpl->backend, spec)
                           : audio_device::open_device(m_pimpl->backend, m_config.device_id, spec);
            dev.start(&player_callback, this);
            m_pimpl->device.emplace(std::move(dev));
            LOG_INFO("sound_player", "Playing through", m_pimpl->device->get_device_name(),
                     "backend", m_pimpl->backend->get_name(), "at", m_config.sample_rate, "Hz");
        } catch (const std::exception& e) {
            LOG_ERROR("sound_player", "Audio device unavailable, playback is disabled:", e.what());
            m_pimpl->device.reset();
        }
    }

    sound_player::~sound_player() {
        shutdown();
    }

    std::shared_ptr<voice> sound_player::play(const std::string& source, const play_options& opts) {
        return m_pimpl->mixer.play(source, opts);
    }

    std::shared_ptr<voice> sound_player::play(std::shared_ptr<const sample_store> store, const play_options& opts) {
        return m_pimpl->mixer.play(std::move(store), opts);
    }

    void sound_player::stop(const std::string& id) {
        m_pimpl->mixer.stop(id);
    }

    void sound_player::stop_all() {
        m_pimpl->mixer.stop_all();
    }

    std::vector<std::shared_ptr<voice>> sound_player::query(const std::string& id) {
        return m_pimpl->mixer.query(id);
    }

    std::shared_ptr<voice> sound_player::query_one(const std::string& id) {
        return m_pimpl->mixer.query_one(id);
    }

    bool sound_player::is_enabled() const {
        return !m_pimpl->shut_down.load(std::memory_order_acquire)
               && m_pimpl->device && m_pimpl->device->has_stream()
               && !m_pimpl->device->is_complete();
    }

    sample_library& sound_player::library() noexcept {
        return m_pimpl->library;
    }

    voxmix::mixer& sound_player::mixer() noexcept {
        return m_pimpl->mixer;
    }

    callback_status sound_player::render(uint8_t* out, int len) {
        if (!out || len <= 0) {
            return callback_status::keep_going;
        }
        const auto bytes = static_cast<std::size_t>(len);
        if (m_pimpl->shut_down.load(std::memory_order_acquire)) {
            std::memset(out, 0, bytes);
            return callback_status::complete;
        }

        const std::size_t frames = bytes / sizeof(stereo_frame);
        const std::size_t used = frames * sizeof(stereo_frame);
        try {
            const stereo_frame* block = m_pimpl->mixer.tick(frames);
            std::memcpy(out, block, used);
        } catch (const std::exception& e) {
            LOG_ERROR("sound_player", "Mixing failed:", e.what());
            std::memset(out, 0, bytes);
            return callback_status::keep_going;
        }
        if (used < bytes) {
            std::memset(out + used, 0, bytes - used);
        }
        return callback_status::keep_going;
    }

    void sound_player::shutdown() {
        if (m_pimpl->shut_down.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        if (m_pimpl->device) {
            m_pimpl->device->stop();
            m_pimpl->device.reset();
        }
        m_pimpl->mixer.stop_all();
        if (m_pimpl->initialized_backend && m_pimpl->backend) {
            m_pimpl->backend->shutdown();
        }
        LOG_INFO("sound_player", "Shut down");
    }
}
