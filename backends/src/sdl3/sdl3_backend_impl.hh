/**
 * @file sdl3_backend_impl.hh
 * @brief SDL3 backend implementation
 * @ingroup sdl3_backend
 */

#ifndef VOXMIX_SDL3_BACKEND_IMPL_HH
#define VOXMIX_SDL3_BACKEND_IMPL_HH

#include <voxmix/sdk/audio_backend.hh>
#include "sdl3.hh"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace voxmix {

/**
 * @class sdl3_backend
 * @brief SDL3 implementation of the audio backend interface
 * @ingroup sdl3_backend
 *
 * Device handles handed out to voxmix are small integers mapped to SDL
 * device ids. Each stream is an SDL_AudioStream bound to its device whose
 * get-callback pulls from the voxmix callback, so SDL does the conversion
 * to the device's native format.
 *
 * @note Internal class. Create instances via create_sdl3_backend().
 */
class sdl3_backend : public audio_backend {
private:
    bool m_initialized = false;

    struct device_state {
        SDL_AudioDeviceID sdl_id = 0;
        audio_spec spec;
    };

    std::map<uint32_t, device_state> m_devices;
    mutable std::mutex m_devices_mutex;
    uint32_t m_next_handle = 1;

    static audio_format sdl_to_voxmix_format(SDL_AudioFormat sdl_fmt);

public:
    sdl3_backend() = default;
    ~sdl3_backend() override;

    void init() override;
    void shutdown() override;
    std::string get_name() const override;
    bool is_initialized() const override;

    std::vector<device_info> enumerate_devices(bool playback) override;
    device_info get_default_device(bool playback) override;

    uint32_t open_device(const std::string& device_id,
                         const audio_spec& spec,
                         audio_spec& obtained_spec) override;
    void close_device(uint32_t device_handle) override;

    bool pause_device(uint32_t device_handle) override;
    bool resume_device(uint32_t device_handle) override;
    bool is_device_paused(uint32_t device_handle) override;

    std::unique_ptr<audio_stream_interface> create_stream(
        uint32_t device_handle,
        const audio_spec& spec,
        audio_callback_fn callback,
        void* userdata) override;
};

} // namespace voxmix

#endif // VOXMIX_SDL3_BACKEND_IMPL_HH
