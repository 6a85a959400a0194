/**
 * @file audio_backend.hh
 * @brief Platform audio backend interface
 * @ingroup backends
 */

#ifndef VOXMIX_SDK_AUDIO_BACKEND_HH
#define VOXMIX_SDK_AUDIO_BACKEND_HH

#include <string>
#include <memory>
#include <vector>
#include <ostream>
#include <voxmix/sdk/audio_format.hh>
#include <voxmix/sdk/types.hh>
#include <voxmix/sdk/audio_stream_interface.hh>
#include <voxmix/export_voxmix.h>

namespace voxmix {

/**
 * @struct device_info
 * @brief Audio device information
 * @ingroup backends
 */
struct device_info {
    std::string name;           ///< Human-readable device name
    std::string id;             ///< Unique device identifier
    bool is_default;            ///< True if this is the default device
    channels_t channels;        ///< Number of audio channels supported
    sample_rate_t sample_rate;  ///< Native sample rate in Hz
};

inline std::ostream& operator<<(std::ostream& os, const device_info& info) {
    os << "device_info{"
       << "name=\"" << info.name << "\", "
       << "id=\"" << info.id << "\", "
       << "default=" << (info.is_default ? "true" : "false") << ", "
       << "channels=" << static_cast<int>(info.channels) << ", "
       << "sample_rate=" << info.sample_rate
       << "}";
    return os;
}

/**
 * @class audio_backend
 * @brief Abstract interface for platform audio subsystems
 * @ingroup backends
 *
 * A backend owns the platform audio API: it opens output devices and
 * creates callback streams on them. voxmix ships an SDL3 backend
 * (voxmix_backend_sdl3) and a silent null backend for headless runs and
 * tests.
 *
 * ## Implementing a Backend
 *
 * @code
 * class my_backend : public audio_backend {
 * public:
 *     void init() override {
 *         // Initialize platform API
 *     }
 *
 *     uint32_t open_device(const std::string& id,
 *                          const audio_spec& spec,
 *                          audio_spec& obtained) override {
 *         // Open platform device, return a non-zero handle
 *     }
 *
 *     std::unique_ptr<audio_stream_interface> create_stream(
 *         uint32_t handle, const audio_spec& spec,
 *         audio_callback_fn callback, void* userdata) override {
 *         // Call callback from the device thread until it returns complete
 *     }
 *
 *     // ... implement other methods
 * };
 * @endcode
 *
 * ## Thread Safety
 *
 * - init()/shutdown() must be called from the main thread
 * - Device operations are thread-safe after init()
 * - Stream callbacks run on platform-specific threads
 */
class VOXMIX_EXPORT audio_backend {
public:
    virtual ~audio_backend() = default;

    // ========================================================================
    // Initialization and lifecycle management
    // ========================================================================

    /**
     * Initialize the audio subsystem.
     * @throws std::runtime_error if initialization fails
     */
    virtual void init() = 0;

    /**
     * Shutdown the audio subsystem and close all open devices.
     */
    virtual void shutdown() = 0;

    /**
     * Get the name of this backend.
     * @return Backend name (e.g., "SDL3", "Null")
     */
    virtual std::string get_name() const = 0;

    virtual bool is_initialized() const = 0;

    // ========================================================================
    // Device enumeration
    // ========================================================================

    /**
     * Enumerate available audio devices.
     * @param playback true for output devices, false for recording devices
     * @throws std::runtime_error if the backend is not initialized
     */
    virtual std::vector<device_info> enumerate_devices(bool playback) = 0;

    virtual device_info get_default_device(bool playback) = 0;

    // ========================================================================
    // Device management
    // ========================================================================

    /**
     * Open an audio device.
     * @param device_id Device identifier from enumerate_devices(), empty for the default
     * @param spec Desired audio specification
     * @param obtained_spec Receives the specification actually used
     * @return Non-zero device handle
     * @throws std::runtime_error if the device cannot be opened
     */
    virtual uint32_t open_device(const std::string& device_id,
                                 const audio_spec& spec,
                                 audio_spec& obtained_spec) = 0;

    /**
     * Close a device. Unknown handles are ignored.
     */
    virtual void close_device(uint32_t device_handle) = 0;

    // ========================================================================
    // Device control
    // ========================================================================

    virtual bool pause_device(uint32_t device_handle) = 0;

    virtual bool resume_device(uint32_t device_handle) = 0;

    virtual bool is_device_paused(uint32_t device_handle) = 0;

    // ========================================================================
    // Stream creation
    // ========================================================================

    /**
     * Create a stream that pulls audio from @p callback.
     * @param device_handle Device from open_device()
     * @param spec Format the callback produces; the backend converts to the device format
     * @param callback Invoked on the device thread with a buffer to fill
     * @param userdata Passed back to @p callback
     * @return The stream, bound to the device
     * @throws std::runtime_error on invalid handles or platform failures
     */
    virtual std::unique_ptr<audio_stream_interface> create_stream(
        uint32_t device_handle,
        const audio_spec& spec,
        audio_callback_fn callback,
        void* userdata
    ) = 0;

    // ========================================================================
    // Convenience wrappers
    // ========================================================================

    std::vector<device_info> enumerate_playback_devices() {
        return enumerate_devices(true);
    }

    device_info get_default_playback_device() {
        return get_default_device(true);
    }
};

} // namespace voxmix

#endif // VOXMIX_SDK_AUDIO_BACKEND_HH
