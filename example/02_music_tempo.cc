/**
 * @example 02_music_tempo.cc
 * @brief Looping music with a beat clock
 *
 * Loops a track, prints every beat as it passes and slowly raises the
 * pitch so the beat clock can be seen to speed up with the music.
 */

#include "example_common.hh"
#include <voxmix/music_player.hh>
#include <voxmix/sound_player.hh>
#include <voxmix/voice.hh>
#include <voxmix/error.hh>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <thread>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <music.wav> [bpm]\n";
        return 1;
    }
    const float bpm = argc > 2 ? static_cast<float>(std::atof(argv[2])) : voxmix::music_player::DEFAULT_BPM;

    try {
        voxmix::sound_player player(voxmix::examples::create_default_backend());
        voxmix::music_player music(player);
        auto track = music.play(argv[1], bpm);

        long last_beat = -1;
        const auto start = std::chrono::steady_clock::now();
        while (std::chrono::steady_clock::now() - start < std::chrono::seconds(20)) {
            const double beats = music.get_time();
            const long beat = static_cast<long>(std::floor(beats));
            if (beat != last_beat) {
                std::cout << "beat " << beat << " (pitch " << track->get_pitch() << ")\n";
                last_beat = beat;
            }
            track->set_pitch(track->get_pitch() + 0.0005f);
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        music.stop();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
