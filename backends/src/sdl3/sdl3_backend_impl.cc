#include "sdl3_backend_impl.hh"
#include "sdl3_audio_stream.hh"
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <cerrno>
#include <cstdlib>

namespace voxmix {
    namespace {
        std::string get_sdl_error() {
            const char* error = SDL_GetError();
            return error ? error : "Unknown SDL error";
        }

        SDL_AudioDeviceID default_device_id(bool playback) {
#if defined(VOXMIX_COMPILER_GCC)
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
# pragma GCC diagnostic ignored "-Wuseless-cast"
#elif defined(VOXMIX_COMPILER_CLANG)
# pragma clang diagnostic push
# pragma clang diagnostic ignored "-Wold-style-cast"
#endif
            return playback ? SDL_AUDIO_DEVICE_DEFAULT_PLAYBACK : SDL_AUDIO_DEVICE_DEFAULT_RECORDING;
#if defined(VOXMIX_COMPILER_GCC)
# pragma GCC diagnostic pop
#elif defined(VOXMIX_COMPILER_CLANG)
# pragma clang diagnostic pop
#endif
        }

        // "default", "" or a numeric SDL device id as produced by enumerate_devices()
        SDL_AudioDeviceID to_sdl_device_id(const std::string& device_id, bool playback) {
            if (device_id.empty() || device_id == "default") {
                return default_device_id(playback);
            }
            char* end = nullptr;
            errno = 0;
            const unsigned long parsed = std::strtoul(device_id.c_str(), &end, 10);
            if (errno != 0 || end == device_id.c_str() || *end != '\0') {
                THROW_RUNTIME("Invalid SDL3 device id: ", device_id);
            }
            return static_cast<SDL_AudioDeviceID>(parsed);
        }

        device_info fallback_device(bool playback) {
            device_info info;
            info.name = playback ? "Default Playback" : "Default Recording";
            info.id = "default";
            info.is_default = true;
            info.channels = 2;
            info.sample_rate = default_sample_rate;
            return info;
        }
    }

    audio_format sdl3_backend::sdl_to_voxmix_format(SDL_AudioFormat sdl_fmt) {
        switch (sdl_fmt) {
            case SDL_AUDIO_U8: return audio_format::u8;
            case SDL_AUDIO_S8: return audio_format::s8;
            case SDL_AUDIO_S16LE: return audio_format::s16le;
            case SDL_AUDIO_S16BE: return audio_format::s16be;
            case SDL_AUDIO_S32LE: return audio_format::s32le;
            case SDL_AUDIO_S32BE: return audio_format::s32be;
            case SDL_AUDIO_F32LE: return audio_format::f32le;
            case SDL_AUDIO_F32BE: return audio_format::f32be;
            default: return audio_format::unknown;
        }
    }

    sdl3_backend::~sdl3_backend() {
        if (m_initialized) {
            shutdown();
        }
    }

    void sdl3_backend::init() {
        if (m_initialized) {
            THROW_RUNTIME("SDL3 backend already initialized");
        }
        if (!SDL_InitSubSystem(SDL_INIT_AUDIO)) {
            THROW_RUNTIME("Failed to initialize SDL3 audio: ", get_sdl_error());
        }
        m_initialized = true;
        LOG_INFO("sdl3_backend", "Initialized, driver", SDL_GetCurrentAudioDriver() ? SDL_GetCurrentAudioDriver() : "none");
    }

    void sdl3_backend::shutdown() {
        if (!m_initialized) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(m_devices_mutex);
            for (const auto& [handle, state] : m_devices) {
                SDL_CloseAudioDevice(state.sdl_id);
            }
            m_devices.clear();
        }
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        m_initialized = false;
        LOG_INFO("sdl3_backend", "Shut down");
    }

    std::string sdl3_backend::get_name() const {
        return "SDL3";
    }

    bool sdl3_backend::is_initialized() const {
        return m_initialized;
    }

    std::vector<device_info> sdl3_backend::enumerate_devices(bool playback) {
        if (!m_initialized) {
            THROW_RUNTIME("Backend not initialized");
        }

        int count = 0;
        SDL_AudioDeviceID* sdl_devices = playback ? SDL_GetAudioPlaybackDevices(&count)
                                                  : SDL_GetAudioRecordingDevices(&count);

        std::vector<device_info> devices;
        if (sdl_devices) {
            for (std::size_t i = 0; i < static_cast<std::size_t>(count); i++) {
                const char* name = SDL_GetAudioDeviceName(sdl_devices[i]);
                SDL_AudioSpec spec;
                if (!name || !SDL_GetAudioDeviceFormat(sdl_devices[i], &spec, nullptr)) {
                    continue;
                }
                device_info info;
                info.name = name;
                info.id = std::to_string(sdl_devices[i]);
                info.is_default = false;
                info.channels = static_cast<channels_t>(spec.channels);
                info.sample_rate = static_cast<sample_rate_t>(spec.freq);
                devices.push_back(info);
            }
            SDL_free(sdl_devices);
        }

        // SDL3 does not flag the default device; the first one reported is the system choice
        if (devices.empty()) {
            devices.push_back(fallback_device(playback));
        } else {
            devices.front().is_default = true;
        }
        return devices;
    }

    device_info sdl3_backend::get_default_device(bool playback) {
        if (!m_initialized) {
            THROW_RUNTIME("Backend not initialized");
        }
        // opening "default" follows the system default even when it changes
        device_info info = fallback_device(playback);
        SDL_AudioSpec spec;
        if (SDL_GetAudioDeviceFormat(default_device_id(playback), &spec, nullptr)) {
            info.channels = static_cast<channels_t>(spec.channels);
            info.sample_rate = static_cast<sample_rate_t>(spec.freq);
        }
        return info;
    }

    uint32_t sdl3_backend::open_device(const std::string& device_id,
                                       const audio_spec& spec,
                                       audio_spec& obtained_spec) {
        if (!m_initialized) {
            THROW_RUNTIME("Backend not initialized");
        }

        SDL_AudioSpec wanted;
        SDL_zero(wanted);
        wanted.freq = static_cast<int>(spec.freq);
        wanted.format = sdl3_audio_stream::to_sdl_format(spec.format);
        wanted.channels = spec.channels;

        const SDL_AudioDeviceID sdl_id = SDL_OpenAudioDevice(to_sdl_device_id(device_id, true), &wanted);
        if (sdl_id == 0) {
            THROW_RUNTIME("Failed to open audio device: ", get_sdl_error());
        }

        SDL_AudioSpec obtained;
        if (!SDL_GetAudioDeviceFormat(sdl_id, &obtained, nullptr)) {
            SDL_CloseAudioDevice(sdl_id);
            THROW_RUNTIME("Failed to get audio device format: ", get_sdl_error());
        }
        obtained_spec.freq = static_cast<sample_rate_t>(obtained.freq);
        obtained_spec.format = sdl_to_voxmix_format(obtained.format);
        obtained_spec.channels = static_cast<channels_t>(obtained.channels);

        std::lock_guard<std::mutex> lock(m_devices_mutex);
        const uint32_t handle = m_next_handle++;
        device_state& state = m_devices[handle];
        state.sdl_id = sdl_id;
        state.spec = obtained_spec;
        return handle;
    }

    void sdl3_backend::close_device(uint32_t device_handle) {
        std::lock_guard<std::mutex> lock(m_devices_mutex);
        auto it = m_devices.find(device_handle);
        if (it != m_devices.end()) {
            SDL_CloseAudioDevice(it->second.sdl_id);
            m_devices.erase(it);
        }
    }

    bool sdl3_backend::pause_device(uint32_t device_handle) {
        std::lock_guard<std::mutex> lock(m_devices_mutex);
        auto it = m_devices.find(device_handle);
        if (it == m_devices.end()) {
            return false;
        }
        return SDL_PauseAudioDevice(it->second.sdl_id);
    }

    bool sdl3_backend::resume_device(uint32_t device_handle) {
        std::lock_guard<std::mutex> lock(m_devices_mutex);
        auto it = m_devices.find(device_handle);
        if (it == m_devices.end()) {
            return false;
        }
        return SDL_ResumeAudioDevice(it->second.sdl_id);
    }

    bool sdl3_backend::is_device_paused(uint32_t device_handle) {
        std::lock_guard<std::mutex> lock(m_devices_mutex);
        auto it = m_devices.find(device_handle);
        if (it == m_devices.end()) {
            THROW_RUNTIME("Invalid device handle");
        }
        return SDL_AudioDevicePaused(it->second.sdl_id);
    }

    std::unique_ptr<audio_stream_interface> sdl3_backend::create_stream(
        uint32_t device_handle,
        const audio_spec& spec,
        audio_callback_fn callback,
        void* userdata) {
        SDL_AudioDeviceID sdl_device = 0;
        {
            std::lock_guard<std::mutex> lock(m_devices_mutex);
            auto it = m_devices.find(device_handle);
            if (it == m_devices.end()) {
                THROW_RUNTIME("Invalid device handle");
            }
            sdl_device = it->second.sdl_id;
        }
        return std::make_unique<sdl3_audio_stream>(sdl_device, spec, callback, userdata);
    }
} // namespace voxmix
