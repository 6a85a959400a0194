/**
 * @file decoder.hh
 * @brief Base class for audio format decoders
 * @ingroup decoder_interface
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <voxmix/sdk/io_stream.hh>
#include <voxmix/sdk/types.hh>
#include <voxmix/export_voxmix.h>
#include <chrono>
#include <cstdint>
#include <memory>

namespace voxmix {
    /**
     * @class decoder
     * @brief Abstract base class for audio format decoders
     * @ingroup decoder_interface
     *
     * A decoder turns an encoded io_stream into interleaved float PCM.
     * voxmix decodes each source once, up front, into a sample_store, so
     * decoders are never driven from the audio thread.
     *
     * ## Implementing a Decoder
     *
     * @code
     * class my_decoder : public decoder {
     * public:
     *     const char* get_name() const override { return "My Format"; }
     *     void open(io_stream* stream) override {
     *         parse_header(stream);
     *         set_is_open(true);
     *     }
     *     channels_t get_channels() const override { return m_channels; }
     *     sample_rate_t get_rate() const override { return m_rate; }
     * protected:
     *     size_t do_decode(float* buf, size_t len, bool& call_again) override {
     *         // fill buf with up to len interleaved samples
     *     }
     * };
     * @endcode
     *
     * @see io_stream, sample_store::from_decoder
     */
    class VOXMIX_EXPORT decoder {
        public:
            decoder();
            virtual ~decoder();

            /**
             * @brief Check if decoder is open and ready
             */
            [[nodiscard]] bool is_open() const;

            /**
             * @brief Decode into interleaved stereo
             * @param[out] buf Buffer to fill with decoded samples
             * @param len Buffer size in samples (even)
             * @param[out] call_again Set to true if more data is available
             * @return Number of samples written
             *
             * Mono sources are duplicated into both channels. Sources with
             * any other layout are passed through unchanged; callers are
             * expected to reject them beforehand.
             */
            [[nodiscard]] size_t decode(float buf[], size_t len, bool& call_again);

            /**
             * @brief Human-readable decoder name
             */
            [[nodiscard]] virtual const char* get_name() const = 0;

            /**
             * @brief Parse the header and prepare for decoding
             * @param rwops Encoded input; the decoder does not take ownership
             * @throws load_error if the data is not in this decoder's format
             */
            virtual void open(io_stream* rwops) = 0;

            [[nodiscard]] virtual channels_t get_channels() const = 0;
            [[nodiscard]] virtual sample_rate_t get_rate() const = 0;

            /**
             * @brief Rewind to the beginning of the audio
             * @return true if successful
             */
            virtual bool rewind() = 0;

            /**
             * @brief Total duration, or zero if unknown
             */
            [[nodiscard]] virtual std::chrono::microseconds duration() const = 0;

            /// Frames in the whole stream, or zero if unknown. Used to size sample stores up front.
            [[nodiscard]] virtual std::uint64_t total_frames() const = 0;

        protected:
            void set_is_open(bool f);

            /**
             * @brief Decode in the source's native channel layout
             * @param buf Output buffer
             * @param len Maximum samples to write
             * @param[out] call_again false once the end of data is reached
             * @return Number of samples written
             */
            virtual size_t do_decode(float buf[], size_t len, bool& call_again) = 0;

        private:
            struct impl;
            std::unique_ptr<impl> m_pimpl;
    };
}

/*
 * Copyright (C) 2025
 *
 * This file is part of voxmix.
 *
 * voxmix is free software: you can redistribute it and/or modify it under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * voxmix is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with voxmix.  If not, see <http://www.gnu.org/licenses/>.
 */
