// This is copyrighted software. More information is at the end of this file.
#include <voxmix/sdk/decoder.hh>

#include <memory>

namespace voxmix {
    struct decoder::impl final {
        bool m_is_open = false;
    };

    decoder::decoder()
        : m_pimpl(std::make_unique <impl>()) {
    }

    decoder::~decoder() = default;

    bool decoder::is_open() const {
        return m_pimpl->m_is_open;
    }

    // Conversion happens in-place, walking backwards.
    static void mono_to_stereo(float buf[], size_t len) {
        if (len < 2 || !buf) {
            return;
        }
        for (size_t i = len / 2, j = len; i > 0; --i) {
            buf[--j] = buf[i - 1];
            buf[--j] = buf[i - 1];
        }
    }

    size_t decoder::decode(float buf[], size_t len, bool& call_again) {
        if (this->get_channels() == 1) {
            auto src_len = this->do_decode(buf, len / 2, call_again);
            mono_to_stereo(buf, src_len * 2);
            return src_len * 2;
        }
        return this->do_decode(buf, len, call_again);
    }

    void decoder::set_is_open(bool f) {
        m_pimpl->m_is_open = f;
    }
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
