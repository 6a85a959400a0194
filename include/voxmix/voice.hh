/**
 * @file voice.hh
 * @brief A single playing instance of a sample store
 * @ingroup core
 */

#ifndef VOXMIX_VOICE_HH
#define VOXMIX_VOICE_HH

#include <voxmix/sdk/types.hh>
#include <voxmix/export_voxmix.h>
#include <atomic>
#include <memory>
#include <ostream>
#include <string>

namespace voxmix {
    class sample_store;

    /**
     * @enum voice_state
     * @brief Where a voice is in its lifetime
     */
    enum class voice_state {
        playing,          ///< Advancing towards the end of the store
        looping,          ///< Wrapping around forever
        pending_removal,  ///< stop() was called, fading out on the next block
        finished          ///< Will be dropped by the mixer
    };

    VOXMIX_EXPORT std::ostream& operator<<(std::ostream& os, voice_state s);

    /**
     * @class voice
     * @brief Playback cursor plus crossfade state over a shared sample store
     * @ingroup core
     *
     * A voice is created by mixer::play() and rendered block by block from
     * the audio thread. Parameter changes made from the control thread are
     * picked up at the start of the next block and glided across it: each
     * block ramps from the values used by the previous block to the current
     * ones, so volume and pitch changes never click.
     *
     * ## Thread Safety
     *
     * - get_frames() must only be called from one thread (the audio thread)
     * - Setters, stop(), get_time() and state() may be called from any thread
     *
     * ## Stopping
     *
     * stop() does not cut the sound. The next block fades from the last
     * volume to silence, and only then does the voice report finished().
     *
     * @see mixer, generate_frames
     */
    class VOXMIX_EXPORT voice {
        public:
            /**
             * @brief Create a voice positioned at the first frame
             * @param id Query handle, need not be unique
             * @param store Frames to play, must not be null
             * @param device_rate Output rate the voice renders at
             * @param volume Initial gain
             * @param pitch Initial speed multiplier
             * @param pan Initial stereo position
             * @param loop Wrap instead of finishing
             */
            voice(std::string id,
                  std::shared_ptr<const sample_store> store,
                  sample_rate_t device_rate,
                  float volume = 1.0f,
                  float pitch = 1.0f,
                  float pan = 0.0f,
                  bool loop = false);

            voice(const voice&) = delete;
            voice& operator=(const voice&) = delete;

            /**
             * @brief Render the next block
             * @param out Destination of @p n frames
             * @param n Block size
             *
             * Real-time safe. Always writes exactly @p n frames.
             */
            void get_frames(stereo_frame* out, std::size_t n) noexcept;

            /// Elapsed position in seconds at the store's native rate
            [[nodiscard]] double get_time() const noexcept;

            /**
             * @brief Check whether the mixer may drop this voice
             *
             * True once a non-looping voice ran off its store, once a
             * stopped voice rendered its fade-out block, or when the store
             * is empty.
             */
            [[nodiscard]] bool finished() const noexcept;

            /**
             * @brief Request removal
             *
             * Sets the volume to 0 and marks the voice. Idempotent.
             */
            void stop() noexcept;

            [[nodiscard]] voice_state state() const noexcept;

            void set_volume(float v) noexcept;
            [[nodiscard]] float get_volume() const noexcept;

            void set_pitch(float p) noexcept;
            [[nodiscard]] float get_pitch() const noexcept;

            /**
             * @brief Set the stereo position, clamped to [-1, 1]
             */
            void set_pan(float p) noexcept;
            [[nodiscard]] float get_pan() const noexcept;

            [[nodiscard]] const std::string& id() const noexcept { return m_id; }
            [[nodiscard]] bool loops() const noexcept { return m_loop; }

            /// Fractional position in source frames
            [[nodiscard]] double cursor() const noexcept;

            [[nodiscard]] const std::shared_ptr<const sample_store>& store() const noexcept { return m_store; }

        private:
            const std::string m_id;
            const std::shared_ptr<const sample_store> m_store;
            const sample_rate_t m_device_rate;
            const bool m_loop;

            std::atomic<float> m_volume;
            std::atomic<float> m_pitch;
            std::atomic<float> m_pan;
            std::atomic<double> m_cursor{0.0};
            std::atomic<bool> m_remove{false};
            std::atomic<bool> m_faded_out{false};

            // audio thread only
            float m_prev_volume;
            float m_prev_pitch;
    };
}

#endif // VOXMIX_VOICE_HH
