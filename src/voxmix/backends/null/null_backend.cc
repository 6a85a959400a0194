#include <voxmix/backends/null/null_backend.hh>
#include <voxmix/sdk/audio_backend.hh>
#include <voxmix/sdk/audio_stream_interface.hh>
#include <failsafe/failsafe.hh>
#include <map>
#include <mutex>

namespace voxmix {
    namespace {
        constexpr const char* NULL_DEVICE_ID = "null";

        class null_stream : public audio_stream_interface {
            public:
                bool pause() override {
                    m_paused = true;
                    return true;
                }

                bool resume() override {
                    m_paused = false;
                    return true;
                }

                bool is_paused() const override { return m_paused; }
                bool is_complete() const override { return false; }

                void unbind_from_device() override {}

            private:
                bool m_paused = false;
        };

        /**
         * Null audio backend for testing and headless environments.
         * Opens any number of fake devices that accept whatever spec is asked for.
         */
        class null_backend : public audio_backend {
            public:
                null_backend() = default;
                ~null_backend() override = default;

                void init() override { m_initialized = true; }

                void shutdown() override {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    m_devices.clear();
                    m_initialized = false;
                }

                std::string get_name() const override { return "Null"; }
                bool is_initialized() const override { return m_initialized; }

                std::vector<device_info> enumerate_devices(bool playback) override {
                    if (!m_initialized) {
                        THROW_RUNTIME("Backend not initialized");
                    }
                    if (!playback) {
                        return {};
                    }
                    return {get_default_device(true)};
                }

                device_info get_default_device(bool playback) override {
                    device_info info;
                    info.name = playback ? "Null Playback" : "Null Recording";
                    info.id = NULL_DEVICE_ID;
                    info.is_default = true;
                    info.channels = 2;
                    info.sample_rate = default_sample_rate;
                    return info;
                }

                uint32_t open_device(const std::string& device_id,
                                     const audio_spec& spec,
                                     audio_spec& obtained_spec) override {
                    if (!m_initialized) {
                        THROW_RUNTIME("Backend not initialized");
                    }
                    if (!device_id.empty() && device_id != NULL_DEVICE_ID && device_id != "default") {
                        THROW_RUNTIME("Unknown null device: " + device_id);
                    }
                    std::lock_guard<std::mutex> lock(m_mutex);
                    const uint32_t handle = m_next_handle++;
                    m_devices[handle] = false;
                    obtained_spec = spec;
                    return handle;
                }

                void close_device(uint32_t device_handle) override {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    m_devices.erase(device_handle);
                }

                bool pause_device(uint32_t device_handle) override {
                    return set_paused(device_handle, true);
                }

                bool resume_device(uint32_t device_handle) override {
                    return set_paused(device_handle, false);
                }

                bool is_device_paused(uint32_t device_handle) override {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    auto it = m_devices.find(device_handle);
                    if (it == m_devices.end()) {
                        THROW_RUNTIME("Invalid device handle");
                    }
                    return it->second;
                }

                std::unique_ptr<audio_stream_interface> create_stream(
                    uint32_t device_handle,
                    [[maybe_unused]] const audio_spec& spec,
                    [[maybe_unused]] audio_callback_fn callback,
                    [[maybe_unused]] void* userdata) override {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    if (m_devices.find(device_handle) == m_devices.end()) {
                        THROW_RUNTIME("Invalid device handle");
                    }
                    return std::make_unique<null_stream>();
                }

            private:
                bool set_paused(uint32_t device_handle, bool paused) {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    auto it = m_devices.find(device_handle);
                    if (it == m_devices.end()) {
                        return false;
                    }
                    it->second = paused;
                    return true;
                }

                bool m_initialized = false;
                std::map<uint32_t, bool> m_devices;  // handle -> paused
                std::mutex m_mutex;
                uint32_t m_next_handle = 1;
        };
    }

    std::unique_ptr<audio_backend> create_null_backend() {
        return std::make_unique<null_backend>();
    }
}
