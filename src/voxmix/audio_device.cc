#include <voxmix/audio_device.hh>
#include <voxmix/error.hh>
#include <failsafe/failsafe.hh>

namespace voxmix {
    namespace {
        void check_backend(const std::shared_ptr<audio_backend>& backend) {
            if (!backend) {
                throw device_error("Backend is null");
            }
            if (!backend->is_initialized()) {
                throw device_error("Backend is not initialized");
            }
        }
    }

    std::vector<device_info> audio_device::enumerate_devices(
        const std::shared_ptr<audio_backend>& backend,
        bool playback_devices) {
        check_backend(backend);
        return backend->enumerate_devices(playback_devices);
    }

    audio_device audio_device::open_default_device(
        const std::shared_ptr<audio_backend>& backend,
        const audio_spec& spec) {
        check_backend(backend);

        device_info info;
        try {
            info = backend->get_default_device(true);
        } catch (const std::exception& e) {
            throw device_error(std::string("No default playback device: ") + e.what());
        }
        return audio_device(backend, info, spec);
    }

    audio_device audio_device::open_device(
        const std::shared_ptr<audio_backend>& backend,
        const std::string& device_id,
        const audio_spec& spec) {
        check_backend(backend);

        for (const auto& dev : backend->enumerate_devices(true)) {
            if (dev.id == device_id) {
                return audio_device(backend, dev, spec);
            }
        }
        throw device_error("Device not found: " + device_id);
    }

    struct audio_device::impl {
        // Order matters! The stream is destroyed before the device is closed
        std::shared_ptr<audio_backend> backend;
        uint32_t device_handle = 0;
        std::unique_ptr<audio_stream_interface> stream;

        audio_spec spec;
        std::string device_name;
        std::string device_id;

        ~impl() {
            if (stream) {
                stream->unbind_from_device();
                stream.reset();
            }
            if (backend && device_handle) {
                backend->close_device(device_handle);
                LOG_INFO("audio_device", "Closed", device_name);
            }
        }
    };

    audio_device::audio_device(std::shared_ptr<audio_backend> backend,
                               const device_info& info,
                               const audio_spec& desired_spec)
        : m_pimpl(std::make_unique<impl>()) {
        m_pimpl->backend = std::move(backend);
        m_pimpl->device_name = info.name;
        m_pimpl->device_id = info.id;

        audio_spec obtained;
        try {
            m_pimpl->device_handle = m_pimpl->backend->open_device(info.id, desired_spec, obtained);
        } catch (const std::exception& e) {
            throw device_error("Failed to open audio device " + info.name + ": " + e.what());
        }
        if (!m_pimpl->device_handle) {
            throw device_error("Failed to open audio device: " + info.name);
        }
        // the stream converts from the requested layout, so the mixer keeps its own rate
        m_pimpl->spec = desired_spec;
        LOG_INFO("audio_device", "Opened", info.name, "requested", desired_spec, "obtained", obtained);
    }

    audio_device::~audio_device() = default;
    audio_device::audio_device(audio_device&&) noexcept = default;
    audio_device& audio_device::operator=(audio_device&&) noexcept = default;

    std::string audio_device::get_device_name() const {
        return m_pimpl->device_name.empty() ? "Default Device" : m_pimpl->device_name;
    }

    std::string audio_device::get_device_id() const {
        return m_pimpl->device_id;
    }

    const audio_spec& audio_device::get_spec() const {
        return m_pimpl->spec;
    }

    sample_rate_t audio_device::get_freq() const {
        return m_pimpl->spec.freq;
    }

    bool audio_device::pause() {
        if (m_pimpl->stream) {
            return m_pimpl->stream->pause();
        }
        return m_pimpl->backend->pause_device(m_pimpl->device_handle);
    }

    bool audio_device::resume() {
        if (m_pimpl->stream) {
            return m_pimpl->stream->resume();
        }
        return m_pimpl->backend->resume_device(m_pimpl->device_handle);
    }

    bool audio_device::is_paused() const {
        if (m_pimpl->stream) {
            return m_pimpl->stream->is_paused();
        }
        return m_pimpl->backend->is_device_paused(m_pimpl->device_handle);
    }

    bool audio_device::is_complete() const {
        return m_pimpl->stream && m_pimpl->stream->is_complete();
    }

    void audio_device::start(audio_callback_fn callback, void* userdata) {
        if (!callback) {
            THROW_RUNTIME("audio_device::start requires a callback");
        }
        if (m_pimpl->stream) {
            throw device_error("A stream is already running on " + get_device_name());
        }
        try {
            m_pimpl->stream = m_pimpl->backend->create_stream(m_pimpl->device_handle, m_pimpl->spec,
                                                              callback, userdata);
        } catch (const std::exception& e) {
            throw device_error(std::string("Failed to create audio stream: ") + e.what());
        }
        if (!m_pimpl->stream) {
            throw device_error("Backend returned no stream for " + get_device_name());
        }
    }

    void audio_device::stop() {
        if (!m_pimpl->stream) {
            return;
        }
        m_pimpl->stream->unbind_from_device();
        m_pimpl->stream.reset();
    }

    bool audio_device::has_stream() const {
        return static_cast<bool>(m_pimpl->stream);
    }
}
