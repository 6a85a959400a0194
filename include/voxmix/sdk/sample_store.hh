/**
 * @file sample_store.hh
 * @brief Immutable decoded sound shared by voices
 * @ingroup sdk
 */

#ifndef VOXMIX_SDK_SAMPLE_STORE_HH
#define VOXMIX_SDK_SAMPLE_STORE_HH

#include <voxmix/sdk/types.hh>
#include <voxmix/export_voxmix.h>
#include <memory>
#include <vector>

namespace voxmix {
    class decoder;

    /**
     * @class sample_store
     * @brief Decoded stereo frames plus their native sample rate
     * @ingroup sdk
     *
     * A sample_store is built once per source and never modified
     * afterwards. Voices hold it through std::shared_ptr<const sample_store>,
     * so any number of voices can read the same frames concurrently
     * without copies.
     *
     * @code
     * auto dec = std::make_unique<decoder_drwav>();
     * auto io = io_from_file("laser.wav");
     * dec->open(io.get());
     * auto store = sample_store::from_decoder(*dec);
     * @endcode
     */
    class VOXMIX_EXPORT sample_store {
        public:
            /**
             * @brief Build from frames
             * @throws load_error if @p rate is zero
             */
            sample_store(std::vector<stereo_frame> frames, sample_rate_t rate);

            /**
             * @brief Build from interleaved samples
             * @param samples Interleaved data, @p channels samples per frame
             * @param channels 1 (duplicated to both sides) or 2
             * @param rate Native sample rate
             * @throws load_error on any other channel count or a zero rate
             */
            static std::shared_ptr<const sample_store> from_interleaved(const std::vector<float>& samples,
                                                                        channels_t channels,
                                                                        sample_rate_t rate);

            /**
             * @brief Drain an open decoder
             * @throws load_error if the decoder is closed or its layout is unsupported
             */
            static std::shared_ptr<const sample_store> from_decoder(decoder& dec);

            [[nodiscard]] sample_rate_t rate() const noexcept { return m_rate; }

            /// Number of frames
            [[nodiscard]] std::size_t length() const noexcept { return m_frames.size(); }

            [[nodiscard]] bool empty() const noexcept { return m_frames.empty(); }

            [[nodiscard]] const stereo_frame* frames() const noexcept { return m_frames.data(); }

            [[nodiscard]] const stereo_frame& operator[](std::size_t i) const noexcept { return m_frames[i]; }

            /// Playback length in seconds at the native rate
            [[nodiscard]] double duration() const noexcept {
                return static_cast<double>(m_frames.size()) / m_rate;
            }

        private:
            std::vector<stereo_frame> m_frames;
            sample_rate_t m_rate;
    };
}

#endif // VOXMIX_SDK_SAMPLE_STORE_HH
