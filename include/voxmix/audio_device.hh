/**
 * @file audio_device.hh
 * @brief Audio output device and its callback stream
 * @ingroup devices
 */

#ifndef VOXMIX_AUDIO_DEVICE_HH
#define VOXMIX_AUDIO_DEVICE_HH

#include <vector>
#include <string>
#include <memory>
#include <voxmix/export_voxmix.h>
#include <voxmix/sdk/audio_format.hh>
#include <voxmix/sdk/types.hh>
#include <voxmix/sdk/audio_backend.hh>

namespace voxmix {
    /**
     * @class audio_device
     * @brief An opened output device with at most one callback stream
     * @ingroup devices
     *
     * audio_device wraps a backend device handle with RAII: the stream is
     * unbound and the device closed when the object is destroyed.
     *
     * ## Basic Usage
     *
     * @code
     * std::shared_ptr<audio_backend> backend = create_sdl3_backend();
     * backend->init();
     * auto device = audio_device::open_default_device(backend);
     * device.start(&my_callback, &my_state);
     * @endcode
     *
     * ## Thread Safety
     *
     * - Opening and closing must happen on the control thread
     * - The callback runs on the backend's audio thread
     *
     * @see audio_backend, sound_player
     */
    class VOXMIX_EXPORT audio_device {
        public:
            /**
             * @brief Enumerate available devices
             * @throws device_error if the backend is null or not initialized
             */
            static std::vector<device_info> enumerate_devices(
                const std::shared_ptr<audio_backend>& backend,
                bool playback_devices = true);

            /**
             * @brief Open the backend's default playback device
             * @param backend Initialized backend
             * @param spec Requested format; f32 stereo at 48 kHz by default
             * @throws device_error if the device cannot be opened
             */
            static audio_device open_default_device(
                const std::shared_ptr<audio_backend>& backend,
                const audio_spec& spec = {});

            /**
             * @brief Open a device by its identifier
             * @throws device_error if the id is unknown or the device cannot be opened
             */
            static audio_device open_device(
                const std::shared_ptr<audio_backend>& backend,
                const std::string& device_id,
                const audio_spec& spec = {});

            ~audio_device();
            audio_device(audio_device&&) noexcept;
            audio_device& operator=(audio_device&&) noexcept;

            [[nodiscard]] std::string get_device_name() const;
            [[nodiscard]] std::string get_device_id() const;

            /// Format the device was actually opened with
            [[nodiscard]] const audio_spec& get_spec() const;
            [[nodiscard]] sample_rate_t get_freq() const;

            // routed to the running stream when there is one, else to the device
            bool pause();
            bool resume();
            [[nodiscard]] bool is_paused() const;

            /**
             * @brief Create and bind the callback stream
             * @param callback Producer of f32 stereo frames in get_spec() layout
             * @param userdata Passed back to @p callback
             * @throws device_error if a stream is already running or the backend fails
             */
            void start(audio_callback_fn callback, void* userdata);

            /**
             * @brief Unbind and destroy the stream; the callback is not invoked afterwards
             */
            void stop();

            [[nodiscard]] bool has_stream() const;

            /**
             * @brief True once the stream callback returned callback_status::complete
             */
            [[nodiscard]] bool is_complete() const;

        private:
            audio_device(std::shared_ptr<audio_backend> backend,
                         const device_info& info,
                         const audio_spec& desired_spec);

            struct impl;
            std::unique_ptr<impl> m_pimpl;
    };
}

#endif // VOXMIX_AUDIO_DEVICE_HH
