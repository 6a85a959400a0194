#ifndef VOXMIX_MOCK_BACKENDS_HH
#define VOXMIX_MOCK_BACKENDS_HH

#include <voxmix/sdk/audio_backend.hh>
#include <voxmix/sdk/audio_stream_interface.hh>
#include <voxmix/sdk/audio_format.hh>
#include <voxmix/sdk/types.hh>
#include <memory>
#include <vector>
#include <map>
#include <atomic>
#include <mutex>
#include <cstring>
#include <stdexcept>

namespace voxmix::test {

    // What a mock stream shares with its backend, so tests can drive the
    // callback after the stream object itself went away
    struct mock_stream_state {
        audio_spec spec;
        audio_callback_fn callback = nullptr;
        void* userdata = nullptr;
        std::atomic<bool> bound{false};
        std::atomic<bool> paused{false};
        std::atomic<bool> complete{false};
        std::atomic<int> callback_calls{0};
    };

    // Mock stream implementation for testing
    class mock_stream : public audio_stream_interface {
        public:
            explicit mock_stream(std::shared_ptr<mock_stream_state> state)
                : m_state(std::move(state)) {
                m_state->bound = true;
            }

            ~mock_stream() override {
                m_state->bound = false;
            }

            bool pause() override {
                m_state->paused = true;
                return true;
            }

            bool resume() override {
                m_state->paused = false;
                return true;
            }

            bool is_paused() const override { return m_state->paused; }
            bool is_complete() const override { return m_state->complete; }

            void unbind_from_device() override {
                m_state->bound = false;
            }

        private:
            std::shared_ptr<mock_stream_state> m_state;
    };

    // Mock backend with error injection; pull() plays the role of the device thread
    class mock_backend : public audio_backend {
        private:
            bool m_initialized{false};
            std::map<uint32_t, bool> m_devices;  // handle -> paused
            uint32_t m_next_handle{1};
            mutable std::mutex m_mutex;
            std::shared_ptr<mock_stream_state> m_last_stream;

        public:
            // Statistics for testing
            std::atomic<int> init_calls{0};
            std::atomic<int> shutdown_calls{0};
            std::atomic<int> open_device_calls{0};
            std::atomic<int> close_device_calls{0};
            std::atomic<int> create_stream_calls{0};

            // Error injection
            bool fail_init{false};
            bool fail_open_device{false};
            bool fail_create_stream{false};

            void init() override {
                init_calls++;
                if (fail_init) {
                    throw std::runtime_error("Mock backend init failed");
                }
                m_initialized = true;
            }

            void shutdown() override {
                shutdown_calls++;
                std::lock_guard<std::mutex> lock(m_mutex);
                m_devices.clear();
                m_initialized = false;
            }

            std::string get_name() const override { return "Mock"; }
            bool is_initialized() const override { return m_initialized; }

            std::vector<device_info> enumerate_devices(bool playback) override {
                if (!m_initialized) {
                    throw std::runtime_error("Backend not initialized");
                }
                if (!playback) {
                    return {};
                }
                device_info secondary;
                secondary.name = "Mock Secondary Device";
                secondary.id = "mock_secondary";
                secondary.is_default = false;
                secondary.channels = 2;
                secondary.sample_rate = 44100;
                return {get_default_device(true), secondary};
            }

            device_info get_default_device(bool) override {
                device_info info;
                info.name = "Mock Default Device";
                info.id = "mock_default";
                info.is_default = true;
                info.channels = 2;
                info.sample_rate = 48000;
                return info;
            }

            uint32_t open_device(const std::string&, const audio_spec& spec, audio_spec& obtained) override {
                open_device_calls++;
                if (fail_open_device) {
                    throw std::runtime_error("Mock device open failed");
                }
                std::lock_guard<std::mutex> lock(m_mutex);
                const uint32_t handle = m_next_handle++;
                m_devices[handle] = false;
                obtained = spec;
                return handle;
            }

            void close_device(uint32_t handle) override {
                close_device_calls++;
                std::lock_guard<std::mutex> lock(m_mutex);
                m_devices.erase(handle);
            }

            bool pause_device(uint32_t handle) override {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto it = m_devices.find(handle);
                if (it == m_devices.end()) return false;
                it->second = true;
                return true;
            }

            bool resume_device(uint32_t handle) override {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto it = m_devices.find(handle);
                if (it == m_devices.end()) return false;
                it->second = false;
                return true;
            }

            bool is_device_paused(uint32_t handle) override {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto it = m_devices.find(handle);
                if (it == m_devices.end()) {
                    throw std::runtime_error("Invalid device handle");
                }
                return it->second;
            }

            std::unique_ptr<audio_stream_interface> create_stream(uint32_t handle,
                                                                  const audio_spec& spec,
                                                                  audio_callback_fn callback,
                                                                  void* userdata) override {
                create_stream_calls++;
                if (fail_create_stream) {
                    throw std::runtime_error("Mock stream creation failed");
                }
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_devices.find(handle) == m_devices.end()) {
                    throw std::runtime_error("Invalid device handle");
                }
                auto state = std::make_shared<mock_stream_state>();
                state->spec = spec;
                state->callback = callback;
                state->userdata = userdata;
                m_last_stream = state;
                return std::make_unique<mock_stream>(state);
            }

            // Test helpers

            std::shared_ptr<mock_stream_state> last_stream() const {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_last_stream;
            }

            std::size_t open_device_count() const {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_devices.size();
            }

            // Invoke the stream callback like a device would; empty result when unbound
            std::vector<stereo_frame> pull(std::size_t frames) {
                auto state = last_stream();
                if (!state || !state->bound || state->complete) {
                    return {};
                }
                std::vector<stereo_frame> out(frames);
                const auto status = state->callback(state->userdata,
                                                    reinterpret_cast<uint8_t*>(out.data()),
                                                    static_cast<int>(frames * sizeof(stereo_frame)));
                state->callback_calls++;
                if (status == callback_status::complete) {
                    state->complete = true;
                }
                return out;
            }
    };

} // namespace voxmix::test

#endif // VOXMIX_MOCK_BACKENDS_HH
