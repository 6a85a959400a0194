// This is copyrighted software. More information is at the end of this file.

#pragma once

#include <voxmix/sdk/decoder.hh>
#include <voxmix/sdk/types.hh>
#include <voxmix/export_voxmix.h>

namespace voxmix {
    /*!
     * \brief WAV decoder backed by dr_wav.
     *
     * Any PCM, IEEE float, A-law or mu-law WAV is read as float. Files
     * with more than two channels open fine but are rejected when a
     * sample_store is built from them.
     */
    class VOXMIX_EXPORT decoder_drwav : public decoder {
        public:
            decoder_drwav();
            ~decoder_drwav() override;

            [[nodiscard]] const char* get_name() const override;
            void open(io_stream* rwops) override;
            [[nodiscard]] channels_t get_channels() const override;
            [[nodiscard]] sample_rate_t get_rate() const override;
            bool rewind() override;
            [[nodiscard]] std::chrono::microseconds duration() const override;
            [[nodiscard]] std::uint64_t total_frames() const override;

        protected:
            size_t do_decode(float* buf, size_t len, bool& call_again) override;

        private:
            struct impl;
            std::unique_ptr <impl> m_pimpl;
    };
} // namespace voxmix

/*

Copyright (C) 2021 Nikos Chantziaras.

This file is part of SDL_audiolib.

SDL_audiolib is free software: you can redistribute it and/or modify it under
the terms of the GNU Lesser General Public License as published by the Free
Software Foundation, either version 3 of the License, or (at your option) any
later version.

SDL_audiolib is distributed in the hope that it will be useful, but WITHOUT
ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS
FOR A PARTICULAR PURPOSE. See the GNU Lesser General Public License for more
details.

You should have received a copy of the GNU Lesser General Public License
along with SDL_audiolib. If not, see <http://www.gnu.org/licenses/>.

*/
