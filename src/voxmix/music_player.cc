#include <voxmix/music_player.hh>
#include <voxmix/sound_player.hh>
#include <voxmix/voice.hh>
#include <voxmix/error.hh>

namespace voxmix {
    music_player::music_player(sound_player& player)
        : m_player(player) {
    }

    std::shared_ptr<voice> music_player::play(const std::string& source,
                                              float bpm,
                                              float volume,
                                              float pitch,
                                              float pan) {
        m_bpm = bpm;
        m_player.stop(MUSIC_ID);

        play_options opts;
        opts.volume = volume;
        opts.pitch = pitch;
        opts.pan = pan;
        opts.id = MUSIC_ID;
        opts.loop = true;
        return m_player.play(source, opts);
    }

    double music_player::get_time() const {
        // the previous track may still be fading out under the same id
        for (const auto& v : m_player.query(MUSIC_ID)) {
            const auto s = v->state();
            if (s != voice_state::pending_removal && s != voice_state::finished) {
                return v->get_time() * static_cast<double>(m_bpm) / 60.0;
            }
        }
        throw not_found_error("No music is playing");
    }

    void music_player::stop() {
        m_player.stop(MUSIC_ID);
    }
}
