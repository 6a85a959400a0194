/**
 * @file music_player.hh
 * @brief Looping background music with a beat clock
 * @ingroup core
 */

#ifndef VOXMIX_MUSIC_PLAYER_HH
#define VOXMIX_MUSIC_PLAYER_HH

#include <voxmix/export_voxmix.h>
#include <memory>
#include <string>

namespace voxmix {
    class sound_player;
    class voice;

    /**
     * @class music_player
     * @brief Keeps one looping track under the id "music" and reports its position in beats
     * @ingroup core
     *
     * Rhythm games sync their events to get_time(), which follows the
     * track's own cursor and therefore stays in step with what is heard
     * even when the device rate differs from the file's rate.
     *
     * @code
     * music_player music(player);
     * music.play("theme.wav", 140.0f);
     * if (music.get_time() >= next_beat) { spawn_note(); }
     * @endcode
     */
    class VOXMIX_EXPORT music_player {
        public:
            static constexpr const char* MUSIC_ID = "music";
            static constexpr float DEFAULT_BPM = 120.0f;

            explicit music_player(sound_player& player);

            /**
             * @brief Replace the current track
             * @throws load_error if @p source cannot be loaded; the old track is stopped regardless
             */
            std::shared_ptr<voice> play(const std::string& source,
                                        float bpm = DEFAULT_BPM,
                                        float volume = 1.0f,
                                        float pitch = 1.0f,
                                        float pan = 0.0f);

            /**
             * @brief Beats elapsed in the current loop of the track
             * @throws not_found_error if no music is playing
             */
            [[nodiscard]] double get_time() const;

            [[nodiscard]] float bpm() const noexcept { return m_bpm; }

            void stop();

        private:
            sound_player& m_player;
            float m_bpm = DEFAULT_BPM;
    };
}

#endif // VOXMIX_MUSIC_PLAYER_HH
