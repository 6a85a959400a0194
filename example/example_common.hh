/**
 * @file example_common.hh
 * @brief Common utilities for voxmix examples
 *
 * This header provides backend selection based on build configuration.
 */

#ifndef VOXMIX_EXAMPLE_COMMON_HH
#define VOXMIX_EXAMPLE_COMMON_HH

#include <voxmix/backends/null/null_backend.hh>
#include <voxmix/sdk/audio_backend.hh>
#include <memory>

#ifdef VOXMIX_USE_SDL3_BACKEND
#include <voxmix_backends/sdl3/sdl3_backend.hh>
#endif

namespace voxmix {
    namespace examples {
        /**
         * @brief Create the default backend based on build configuration
         *
         * Without SDL3 the examples still run against the null backend,
         * which accepts a device but never plays anything.
         */
        inline std::shared_ptr <audio_backend> create_default_backend() {
#ifdef VOXMIX_USE_SDL3_BACKEND
            return std::shared_ptr <audio_backend>(create_sdl3_backend());
#else
            return std::shared_ptr <audio_backend>(create_null_backend());
#endif
        }

        inline const char* get_backend_name() {
#ifdef VOXMIX_USE_SDL3_BACKEND
            return "SDL3";
#else
            return "Null";
#endif
        }
    } // namespace examples
} // namespace voxmix

#endif // VOXMIX_EXAMPLE_COMMON_HH
