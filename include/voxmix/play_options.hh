/**
 * @file play_options.hh
 * @brief Per-voice playback options
 * @ingroup core
 */

#ifndef VOXMIX_PLAY_OPTIONS_HH
#define VOXMIX_PLAY_OPTIONS_HH

#include <optional>
#include <string>

namespace voxmix {
    /**
     * @struct play_options
     * @brief Initial parameters of a voice
     *
     * @code
     * play_options opts;
     * opts.volume = 0.5f;
     * opts.pan = -0.25f;
     * opts.id = "footsteps";
     * player.play("step.wav", opts);
     * @endcode
     */
    struct play_options {
        float volume = 1.0f;              ///< Linear gain, negative values act as 0
        float pitch = 1.0f;               ///< Speed multiplier, 2 = one octave up
        float pan = 0.0f;                 ///< -1 (left) .. 1 (right)
        std::optional<std::string> id;    ///< Query handle, defaults to the source name
        bool loop = false;                ///< Wrap around at the end instead of finishing
    };
}

#endif // VOXMIX_PLAY_OPTIONS_HH
