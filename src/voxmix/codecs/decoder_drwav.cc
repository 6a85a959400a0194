#include <voxmix/codecs/decoder_drwav.hh>
#include <voxmix/error.hh>
#include <voxmix/sdk/io_stream.hh>
#include <failsafe/failsafe.hh>

#define DR_WAV_NO_STDIO
#define DR_WAV_IMPLEMENTATION
#define DRWAV_API static
#define DRWAV_PRIVATE static
#include <dr_wav.h>

namespace chrono = std::chrono;

extern "C" {
static size_t drwav_read_callback(void* const rwops, void* const dst, const size_t len) {
    return static_cast <voxmix::io_stream*>(rwops)->read(dst, len);
}

static drwav_bool32 drwav_seek_callback(void* const rwops_void, const int offset, const drwav_seek_origin origin) {
    auto* const rwops = static_cast <voxmix::io_stream*>(rwops_void);
    const auto rwops_size = rwops->get_size();
    const auto cur_pos = rwops->tell();

    if (rwops_size < 0 || cur_pos < 0) {
        return DRWAV_FALSE;
    }

    voxmix::seek_origin whence;
    int64_t abs_offset = offset;
    switch (origin) {
        case drwav_seek_origin_start:
            whence = voxmix::seek_origin::set;
            break;
        case drwav_seek_origin_current:
            whence = voxmix::seek_origin::cur;
            abs_offset += cur_pos;
            break;
        default:
            return DRWAV_FALSE;
    }
    if (abs_offset >= rwops_size) {
        return DRWAV_FALSE;
    }
    return rwops->seek(offset, whence) >= 0 ? DRWAV_TRUE : DRWAV_FALSE;
}
} // extern "C"

namespace voxmix {
    struct decoder_drwav::impl final {
        drwav m_handle{};
        bool m_eof = false;
    };

    decoder_drwav::decoder_drwav()
        : m_pimpl(std::make_unique <impl>()) {
    }

    decoder_drwav::~decoder_drwav() {
        if (!is_open()) {
            return;
        }
        drwav_uninit(&m_pimpl->m_handle);
    }

    const char* decoder_drwav::get_name() const {
        return "WAV (dr_wav)";
    }

    void decoder_drwav::open(io_stream* const rwops) {
        if (is_open()) {
            return;
        }
        if (!rwops) {
            THROW_RUNTIME("No IO stream provided to decoder_drwav");
        }

        if (!drwav_init(&m_pimpl->m_handle, drwav_read_callback, drwav_seek_callback, rwops, nullptr)) {
            throw load_error("drwav_init failed: not a supported WAV stream");
        }
        set_is_open(true);
    }

    size_t decoder_drwav::do_decode(float* const buf, size_t len, bool& call_again) {
        if (m_pimpl->m_eof || !is_open() || get_channels() == 0) {
            call_again = false;
            return 0;
        }

        const auto frames = drwav_read_pcm_frames_f32(&m_pimpl->m_handle, len / get_channels(), buf);
        const auto ret = frames * get_channels();
        if (ret < static_cast <drwav_uint64>(len)) {
            m_pimpl->m_eof = true;
            call_again = false;
        } else {
            call_again = true;
        }
        return static_cast <size_t>(ret);
    }

    channels_t decoder_drwav::get_channels() const {
        return static_cast <channels_t>(m_pimpl->m_handle.channels);
    }

    sample_rate_t decoder_drwav::get_rate() const {
        return m_pimpl->m_handle.sampleRate;
    }

    bool decoder_drwav::rewind() {
        if (!is_open() || !drwav_seek_to_pcm_frame(&m_pimpl->m_handle, 0)) {
            return false;
        }
        m_pimpl->m_eof = false;
        return true;
    }

    chrono::microseconds decoder_drwav::duration() const {
        if (!is_open() || get_rate() == 0) {
            return {};
        }
        return chrono::duration_cast <chrono::microseconds>(
            chrono::duration <double>(static_cast <double>(m_pimpl->m_handle.totalPCMFrameCount) / get_rate()));
    }

    std::uint64_t decoder_drwav::total_frames() const {
        return is_open() ? static_cast <std::uint64_t>(m_pimpl->m_handle.totalPCMFrameCount) : 0;
    }
}
