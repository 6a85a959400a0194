#ifndef VOXMIX_SDL3_AUDIO_STREAM_HH
#define VOXMIX_SDL3_AUDIO_STREAM_HH

#include <voxmix/sdk/audio_stream_interface.hh>
#include <voxmix/sdk/audio_format.hh>
#include "sdl3.hh"
#include <atomic>
#include <memory>
#include <vector>

namespace voxmix {

/**
 * SDL3 audio stream that pulls from a voxmix callback.
 * SDL converts from the callback's spec to the device format.
 */
class sdl3_audio_stream : public audio_stream_interface {
public:
    sdl3_audio_stream(SDL_AudioDeviceID device_id, const audio_spec& spec,
                      audio_callback_fn callback, void* userdata);
    ~sdl3_audio_stream() override;

    bool pause() override;
    bool resume() override;
    bool is_paused() const override;
    bool is_complete() const override;
    void unbind_from_device() override;

    static SDL_AudioFormat to_sdl_format(audio_format fmt);

private:
    static void sdl_callback(void* userdata, SDL_AudioStream* stream, int additional_amount, int total_amount);

    SDL_AudioDeviceID m_device_id;
    std::shared_ptr<SDL_AudioStream> m_stream;
    audio_callback_fn m_callback;
    void* m_userdata;
    bool m_bound;
    std::atomic<bool> m_complete{false};
    std::vector<uint8_t> m_buffer;  // reused between callbacks
};

} // namespace voxmix

#endif // VOXMIX_SDL3_AUDIO_STREAM_HH
