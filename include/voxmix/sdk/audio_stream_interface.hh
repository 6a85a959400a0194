#ifndef VOXMIX_AUDIO_STREAM_INTERFACE_HH
#define VOXMIX_AUDIO_STREAM_INTERFACE_HH

#include <voxmix/export_voxmix.h>
#include <cstddef>
#include <cstdint>

namespace voxmix {

/**
 * Result of an audio callback invocation.
 */
enum class callback_status {
    keep_going,  ///< More data will follow
    complete     ///< The producer is done; the stream outputs silence from now on
};

/**
 * Pull callback invoked on the device thread.
 * @param userdata Opaque pointer passed to create_stream()
 * @param stream Buffer to fill, in the stream's audio_spec
 * @param len Size of the buffer in bytes
 */
using audio_callback_fn = callback_status (*)(void* userdata, uint8_t* stream, int len);

/**
 * Abstract interface for a callback-driven audio stream.
 * A stream is bound to its device when the backend creates it.
 */
class VOXMIX_EXPORT audio_stream_interface {
public:
    virtual ~audio_stream_interface() = default;

    /**
     * Pause the audio stream.
     * @return true on success, false on failure
     */
    virtual bool pause() = 0;

    /**
     * Resume the audio stream.
     * @return true on success, false on failure
     */
    virtual bool resume() = 0;

    /**
     * Check if the stream is paused.
     * @return true if paused, false otherwise
     */
    virtual bool is_paused() const = 0;

    /**
     * Check whether the callback reported callback_status::complete.
     * A complete stream never invokes the callback again.
     */
    virtual bool is_complete() const = 0;

    /**
     * Unbind this stream from its device.
     * After this call the callback is not invoked anymore.
     */
    virtual void unbind_from_device() = 0;
};

} // namespace voxmix

#endif // VOXMIX_AUDIO_STREAM_INTERFACE_HH
