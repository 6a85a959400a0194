#ifndef VOXMIX_BACKENDS_NULL_BACKEND_HH
#define VOXMIX_BACKENDS_NULL_BACKEND_HH

#include <memory>
#include <voxmix/export_voxmix.h>

// Public factory header for the Null backend

namespace voxmix {

class audio_backend;

/**
 * Create a Null audio backend instance.
 *
 * The Null backend provides:
 * - No actual audio output; stream callbacks are never invoked
 * - Headless environment support
 * - One fake playback device
 *
 * @return New Null backend instance
 *
 * @note The backend must be initialized by calling init() before use
 *
 * Example usage:
 * @code
 * std::shared_ptr<voxmix::audio_backend> backend = voxmix::create_null_backend();
 * voxmix::sound_player player(backend);
 * @endcode
 */
VOXMIX_EXPORT std::unique_ptr<audio_backend> create_null_backend();

} // namespace voxmix

#endif // VOXMIX_BACKENDS_NULL_BACKEND_HH
