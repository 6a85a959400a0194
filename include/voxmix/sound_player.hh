/**
 * @file sound_player.hh
 * @brief Application-facing playback API
 * @ingroup core
 */

#ifndef VOXMIX_SOUND_PLAYER_HH
#define VOXMIX_SOUND_PLAYER_HH

#include <voxmix/play_options.hh>
#include <voxmix/sample_library.hh>
#include <voxmix/voice.hh>
#include <voxmix/sdk/audio_stream_interface.hh>
#include <voxmix/sdk/types.hh>
#include <voxmix/export_voxmix.h>
#include <memory>
#include <string>
#include <vector>

namespace voxmix {
    class audio_backend;
    class mixer;
    class sample_store;

    /**
     * @struct player_config
     * @brief Construction parameters of a sound_player
     */
    struct player_config {
        sample_rate_t sample_rate = default_sample_rate;  ///< Device and mixing rate
        std::string device_id;                            ///< Empty selects the default device
        sample_loader loader;                             ///< Empty selects WAV files via dr_wav
    };

    /**
     * @class sound_player
     * @brief Owns the device, the mixer and the sample library
     * @ingroup core
     *
     * The player opens an f32 stereo device at the configured rate and
     * feeds it from its mixer. If the device cannot be opened the failure
     * is logged and the player runs disabled: every control call keeps
     * working and voices advance when render() is driven manually, but
     * nothing reaches a speaker.
     *
     * @code
     * std::shared_ptr<audio_backend> backend = create_sdl3_backend();
     * sound_player player(backend);
     *
     * play_options opts;
     * opts.pan = 0.5f;
     * player.play("laser.wav", opts);
     *
     * for (auto& v : player.query("laser.wav")) {
     *     v->set_pitch(1.5f);
     * }
     * player.stop("laser.wav");
     * @endcode
     */
    class VOXMIX_EXPORT sound_player {
        public:
            /**
             * @param backend Initialized on demand; null runs the player disabled
             * @param config Device rate, device id and sample loader
             */
            explicit sound_player(std::shared_ptr<audio_backend> backend, player_config config = {});
            ~sound_player();

            sound_player(const sound_player&) = delete;
            sound_player& operator=(const sound_player&) = delete;

            /**
             * @brief Start a voice for @p source
             * @throws load_error if the source cannot be loaded
             */
            std::shared_ptr<voice> play(const std::string& source, const play_options& opts = {});

            /// Start a voice for an already decoded store
            std::shared_ptr<voice> play(std::shared_ptr<const sample_store> store, const play_options& opts = {});

            void stop(const std::string& id);
            void stop_all();

            [[nodiscard]] std::vector<std::shared_ptr<voice>> query(const std::string& id);

            /**
             * @throws not_found_error if no voice carries @p id
             */
            [[nodiscard]] std::shared_ptr<voice> query_one(const std::string& id);

            /// True while a device stream is feeding from this player
            [[nodiscard]] bool is_enabled() const;

            [[nodiscard]] const player_config& config() const noexcept { return m_config; }

            sample_library& library() noexcept;
            voxmix::mixer& mixer() noexcept;

            /**
             * @brief Device hook: fill @p len bytes of f32 stereo
             * @return keep_going until shutdown() was called
             */
            callback_status render(uint8_t* out, int len);

            /**
             * @brief Close the stream and the device, stop every voice
             *
             * Idempotent. Called by the destructor.
             */
            void shutdown();

        private:
            struct impl;
            player_config m_config;
            std::unique_ptr<impl> m_pimpl;
    };
}

#endif // VOXMIX_SOUND_PLAYER_HH
