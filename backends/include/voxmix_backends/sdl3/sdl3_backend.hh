/**
 * @file sdl3_backend.hh
 * @brief SDL3 audio backend factory
 * @ingroup backends
 */

#ifndef VOXMIX_BACKENDS_SDL3_BACKEND_HH
#define VOXMIX_BACKENDS_SDL3_BACKEND_HH

#include <memory>

// Include generated export header
#include "export_voxmix_backend_sdl3.h"

namespace voxmix {

/**
 * @defgroup sdl3_backend SDL3 Audio Backend
 * @ingroup backends
 * @brief Output through SDL3's stream-based audio subsystem
 *
 * The mixer's f32 stereo blocks are pushed into an SDL_AudioStream bound
 * to the device; SDL converts to the device's native format and rate.
 *
 * @{
 */

class audio_backend;

/**
 * @brief Create an SDL3 audio backend instance
 * @return New SDL3 backend instance, not yet initialized
 *
 * ## Usage Example
 *
 * @code
 * #include <voxmix_backends/sdl3/sdl3_backend.hh>
 * #include <voxmix/sound_player.hh>
 *
 * std::shared_ptr<voxmix::audio_backend> backend = voxmix::create_sdl3_backend();
 * voxmix::sound_player player(backend);   // initializes the backend
 * player.play("music.wav");
 * @endcode
 *
 * ## Configuration
 *
 * SDL3 backend respects environment variables:
 * - `SDL_AUDIO_DRIVER`: Force specific driver
 * - `SDL_AUDIO_DEVICE_SAMPLE_FRAMES`: Device buffer size, i.e. the mixer block size
 *
 * @see audio_backend
 */
VOXMIX_BACKEND_SDL3_EXPORT std::unique_ptr<audio_backend> create_sdl3_backend();

/** @} */ // end of sdl3_backend group

} // namespace voxmix

#endif // VOXMIX_BACKENDS_SDL3_BACKEND_HH
