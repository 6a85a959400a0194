/**
 * @file types.hh
 * @brief Platform-independent type definitions
 * @ingroup sdk_types
 */

#ifndef VOXMIX_SDK_TYPES_HH
#define VOXMIX_SDK_TYPES_HH

#include <cstdint>
#include <cstddef>

namespace voxmix {

/**
 * @defgroup sdk_types Type Definitions
 * @ingroup sdk
 * @brief Core type definitions for audio processing
 *
 * ## Usage Example
 *
 * @code
 * sample_rate_t rate = 48000;
 * channels_t channels = 2;
 * stereo_frame f{0.5f, -0.5f};
 * @endcode
 *
 * @{
 */

/**
 * @typedef sample_rate_t
 * @brief Type for audio sample rates (Hz)
 *
 * The mixer runs at one fixed device rate; sample stores keep their
 * native rate and are resampled on the fly.
 */
using sample_rate_t = uint32_t;

/**
 * @typedef channels_t
 * @brief Type for audio channel count
 *
 * Output is always stereo. Decoded sources may be mono or stereo.
 */
using channels_t = uint8_t;

/**
 * @struct stereo_frame
 * @brief One sample per channel at a given instant
 */
struct stereo_frame {
    float left;
    float right;
};

/// Default device rate used when no rate is configured
inline constexpr sample_rate_t default_sample_rate = 48000;

/** @} */ // end of sdk_types group

} // namespace voxmix

#endif // VOXMIX_SDK_TYPES_HH
