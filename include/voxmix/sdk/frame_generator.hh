/**
 * @file frame_generator.hh
 * @brief Resampling, crossfading and panning of one voice block
 * @ingroup sdk
 */

#ifndef VOXMIX_SDK_FRAME_GENERATOR_HH
#define VOXMIX_SDK_FRAME_GENERATOR_HH

#include <voxmix/sdk/types.hh>
#include <voxmix/export_voxmix.h>

namespace voxmix {
    class sample_store;

    /**
     * @struct ramp
     * @brief Control value at the first and the last frame of a block
     */
    struct ramp {
        float start = 1.0f;
        float end = 1.0f;
    };

    /**
     * @struct frame_params
     * @brief Everything generate_frames() needs besides the store and cursor
     */
    struct frame_params {
        ramp volume;                             ///< Gain, clamped to >= 0
        ramp pitch;                              ///< Playback speed, 1 = native speed
        float pan = 0.0f;                        ///< -1 (left) .. 1 (right)
        bool loop = false;                       ///< Wrap positions into the store
        sample_rate_t device_rate = default_sample_rate;
    };

    /**
     * @brief Render exactly @p n frames of @p store starting at @p cursor
     * @param store Source frames
     * @param cursor Fractional start position in source frames
     * @param params Ramps, pan, loop flag and device rate
     * @param out Destination, at least @p n frames
     * @param n Number of frames to produce
     * @return The advanced cursor, not wrapped even when looping
     *
     * The pitch ramp is applied to the rate of advance, scaled by
     * store.rate() / device_rate, so a rate change glides across the block.
     * Positions are linearly interpolated. Without looping only positions
     * in [0, length - 1] are readable; the frames produced from them are
     * packed at the front of @p out and the rest is silence. The volume ramp
     * spans the produced frames only. Panning moves energy from one side to
     * the other.
     *
     * Real-time safe: no allocation, no locks, no exceptions. An empty
     * store, a zero device rate or a non-finite cursor render silence and
     * leave the cursor unchanged.
     */
    VOXMIX_EXPORT double generate_frames(const sample_store& store,
                                         double cursor,
                                         const frame_params& params,
                                         stereo_frame* out,
                                         std::size_t n) noexcept;
}

#endif // VOXMIX_SDK_FRAME_GENERATOR_HH
