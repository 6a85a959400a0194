/**
 * @example 01_play_file.cc
 * @brief Basic example: playing WAV files
 *
 * Plays every file given on the command line at once, spread across
 * the stereo field, and waits until all of them have finished.
 */

#include "example_common.hh"
#include <voxmix/sound_player.hh>
#include <voxmix/voice.hh>
#include <voxmix/error.hh>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <file.wav> [more.wav ...]\n";
        return 1;
    }

    try {
        voxmix::sound_player player(voxmix::examples::create_default_backend());
        if (!player.is_enabled()) {
            std::cerr << "No audio device, nothing will be heard\n";
            return 1;
        }
        std::cout << "Using " << voxmix::examples::get_backend_name() << " backend\n";

        const int count = argc - 1;
        std::vector<std::shared_ptr<voxmix::voice>> voices;
        for (int i = 0; i < count; ++i) {
            voxmix::play_options opts;
            opts.pan = count == 1 ? 0.0f : -1.0f + 2.0f * static_cast<float>(i) / static_cast<float>(count - 1);
            voices.push_back(player.play(argv[i + 1], opts));
            std::cout << "Playing " << argv[i + 1] << " at pan " << opts.pan << '\n';
        }

        // Check every 100ms if anything is still playing
        bool playing = true;
        while (playing) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            playing = false;
            for (const auto& v : voices) {
                playing = playing || !v->finished();
            }
        }

        std::cout << "Playback finished\n";
    } catch (const voxmix::load_error& e) {
        std::cerr << "Cannot load sound: " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
