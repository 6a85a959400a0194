#include "sdl3_audio_stream.hh"
#include <failsafe/failsafe.hh>

namespace voxmix {

namespace {
    constexpr std::size_t INITIAL_BUFFER_BYTES = 16 * 1024;

    // SDL_Quit() already destroys every stream, so only destroy while the subsystem is up
    void safe_destroy_audio_stream(SDL_AudioStream* stream) {
        if (stream && SDL_WasInit(SDL_INIT_AUDIO)) {
            SDL_DestroyAudioStream(stream);
        }
    }
}

SDL_AudioFormat sdl3_audio_stream::to_sdl_format(audio_format fmt) {
    switch (fmt) {
        case audio_format::u8:     return SDL_AUDIO_U8;
        case audio_format::s8:     return SDL_AUDIO_S8;
        case audio_format::s16le:  return SDL_AUDIO_S16LE;
        case audio_format::s16be:  return SDL_AUDIO_S16BE;
        case audio_format::s32le:  return SDL_AUDIO_S32LE;
        case audio_format::s32be:  return SDL_AUDIO_S32BE;
        case audio_format::f32le:  return SDL_AUDIO_F32LE;
        case audio_format::f32be:  return SDL_AUDIO_F32BE;
        default:                   return SDL_AUDIO_UNKNOWN;
    }
}

sdl3_audio_stream::sdl3_audio_stream(SDL_AudioDeviceID device_id, const audio_spec& spec,
                                     audio_callback_fn callback, void* userdata)
    : m_device_id(device_id)
    , m_callback(callback)
    , m_userdata(userdata)
    , m_bound(false)
    , m_buffer(INITIAL_BUFFER_BYTES) {

    if (!m_callback) {
        THROW_RUNTIME("SDL3 stream requires a callback");
    }

    SDL_AudioSpec src_spec;
    src_spec.format = to_sdl_format(spec.format);
    src_spec.channels = spec.channels;
    src_spec.freq = static_cast<int>(spec.freq);

    SDL_AudioSpec device_spec;
    if (!SDL_GetAudioDeviceFormat(m_device_id, &device_spec, nullptr)) {
        THROW_RUNTIME("Failed to get device format: ", SDL_GetError());
    }

    // Converts from the mixer's f32 stereo to whatever the device runs
    m_stream = std::shared_ptr<SDL_AudioStream>(
        SDL_CreateAudioStream(&src_spec, &device_spec),
        safe_destroy_audio_stream
    );
    if (!m_stream) {
        THROW_RUNTIME("Failed to create audio stream: ", SDL_GetError());
    }

    if (!SDL_SetAudioStreamGetCallback(m_stream.get(), sdl_callback, this)) {
        THROW_RUNTIME("Failed to set stream callback: ", SDL_GetError());
    }

    if (!SDL_BindAudioStream(m_device_id, m_stream.get())) {
        THROW_RUNTIME("Failed to bind stream to device: ", SDL_GetError());
    }
    m_bound = true;
}

sdl3_audio_stream::~sdl3_audio_stream() {
    unbind_from_device();
}

void sdl3_audio_stream::sdl_callback(void* userdata,
                                     SDL_AudioStream* stream,
                                     int additional_amount,
                                     [[maybe_unused]] int total_amount) {
    auto* self = static_cast<sdl3_audio_stream*>(userdata);
    if (!self || additional_amount <= 0) {
        return;
    }
    // once complete, the stream runs dry and SDL plays silence
    if (self->m_complete.load(std::memory_order_acquire)) {
        return;
    }

    const auto needed = static_cast<std::size_t>(additional_amount);
    if (self->m_buffer.size() < needed) {
        LOG_WARN("sdl3_backend", "Stream buffer grown to", needed, "bytes");
        self->m_buffer.resize(needed);
    }
    auto* data = self->m_buffer.data();
    if (self->m_callback(self->m_userdata, data, additional_amount) == callback_status::complete) {
        self->m_complete.store(true, std::memory_order_release);
    }
    SDL_PutAudioStreamData(stream, data, additional_amount);
}

bool sdl3_audio_stream::pause() {
    return SDL_PauseAudioStreamDevice(m_stream.get());
}

bool sdl3_audio_stream::resume() {
    return SDL_ResumeAudioStreamDevice(m_stream.get());
}

bool sdl3_audio_stream::is_paused() const {
    return SDL_AudioStreamDevicePaused(m_stream.get());
}

bool sdl3_audio_stream::is_complete() const {
    return m_complete.load(std::memory_order_acquire);
}

void sdl3_audio_stream::unbind_from_device() {
    if (m_bound && m_stream) {
        // SDL waits for a running callback to return before unbinding
        SDL_UnbindAudioStream(m_stream.get());
        m_bound = false;
    }
}

} // namespace voxmix
