/**
 * @file audio_format.hh
 * @brief Device sample formats and the device specification
 * @ingroup sdk_audio_format
 */

#ifndef VOXMIX_SDK_AUDIO_FORMAT_HH
#define VOXMIX_SDK_AUDIO_FORMAT_HH

#include <voxmix/sdk/types.hh>
#include <voxmix/export_voxmix.h>
#include <iosfwd>

namespace voxmix {

/**
 * @enum audio_format
 * @brief Sample formats a backend may report for a device
 *
 * The format value encodes:
 * - Bits 0-7: Bit size (8, 16, 32)
 * - Bit 8: Float flag
 * - Bit 12: Endian flag (0=little, 1=big)
 * - Bit 15: Signed flag
 *
 * The mixer always produces native-endian 32-bit float; backends convert
 * to whatever the hardware wants.
 */
enum class audio_format : uint16_t {
    unknown = 0,
    u8 = 0x0008,
    s8 = 0x8008,
    s16le = 0x8010,
    s16be = 0x9010,
    s32le = 0x8020,
    s32be = 0x9020,
    f32le = 0x8120,
    f32be = 0x9120
};

inline constexpr uint8_t audio_format_bit_size(audio_format fmt) {
    return static_cast<uint8_t>(static_cast<uint16_t>(fmt) & 0xFF);
}

inline constexpr uint8_t audio_format_byte_size(audio_format fmt) {
    return audio_format_bit_size(fmt) / 8;
}

inline constexpr bool audio_format_is_float(audio_format fmt) {
    return (static_cast<uint16_t>(fmt) & 0x0100) != 0;
}

#if defined(__BYTE_ORDER__) && (__BYTE_ORDER__ == __ORDER_BIG_ENDIAN__)
inline constexpr audio_format audio_f32sys = audio_format::f32be;
#else
inline constexpr audio_format audio_f32sys = audio_format::f32le;
#endif

/**
 * @struct audio_spec
 * @brief Device configuration requested from / obtained by a backend
 */
struct audio_spec {
    audio_format format = audio_f32sys;
    channels_t channels = 2;
    sample_rate_t freq = default_sample_rate;
};

VOXMIX_EXPORT std::ostream& operator<<(std::ostream& os, audio_format fmt);
VOXMIX_EXPORT std::ostream& operator<<(std::ostream& os, const audio_spec& spec);

} // namespace voxmix

#endif // VOXMIX_SDK_AUDIO_FORMAT_HH
