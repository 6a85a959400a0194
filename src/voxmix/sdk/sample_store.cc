#include <voxmix/sdk/sample_store.hh>
#include <voxmix/sdk/decoder.hh>
#include <voxmix/error.hh>
#include <string>

namespace voxmix {
    namespace {
        constexpr std::size_t DECODE_CHUNK_SAMPLES = 16384;

        void check_layout(channels_t channels, sample_rate_t rate) {
            if (rate == 0) {
                throw load_error("Sample rate must be positive");
            }
            if (channels != 1 && channels != 2) {
                throw load_error("Unsupported channel count: " + std::to_string(static_cast<int>(channels)));
            }
        }
    }

    sample_store::sample_store(std::vector<stereo_frame> frames, sample_rate_t rate)
        : m_frames(std::move(frames)),
          m_rate(rate) {
        if (m_rate == 0) {
            throw load_error("Sample rate must be positive");
        }
    }

    std::shared_ptr<const sample_store> sample_store::from_interleaved(const std::vector<float>& samples,
                                                                       channels_t channels,
                                                                       sample_rate_t rate) {
        check_layout(channels, rate);

        std::vector<stereo_frame> frames;
        frames.reserve(samples.size() / channels);
        if (channels == 1) {
            for (float s : samples) {
                frames.push_back({s, s});
            }
        } else {
            for (std::size_t i = 0; i + 1 < samples.size(); i += 2) {
                frames.push_back({samples[i], samples[i + 1]});
            }
        }
        return std::make_shared<const sample_store>(std::move(frames), rate);
    }

    std::shared_ptr<const sample_store> sample_store::from_decoder(decoder& dec) {
        if (!dec.is_open()) {
            throw load_error("Decoder is not open");
        }
        check_layout(dec.get_channels(), dec.get_rate());

        // decoder::decode always hands back interleaved stereo for mono/stereo input
        std::vector<float> chunk(DECODE_CHUNK_SAMPLES);
        std::vector<stereo_frame> frames;
        frames.reserve(static_cast<std::size_t>(dec.total_frames()));
        bool call_again = true;
        while (call_again) {
            const auto got = dec.decode(chunk.data(), chunk.size(), call_again);
            for (std::size_t i = 0; i + 1 < got; i += 2) {
                frames.push_back({chunk[i], chunk[i + 1]});
            }
            if (got == 0) {
                break;
            }
        }
        return std::make_shared<const sample_store>(std::move(frames), dec.get_rate());
    }
}
