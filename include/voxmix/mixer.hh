/**
 * @file mixer.hh
 * @brief Active voice set and the per-block mixing loop
 * @ingroup core
 */

#ifndef VOXMIX_MIXER_HH
#define VOXMIX_MIXER_HH

#include <voxmix/play_options.hh>
#include <voxmix/voice.hh>
#include <voxmix/sdk/buffer.hh>
#include <voxmix/sdk/types.hh>
#include <voxmix/export_voxmix.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace voxmix {
    class sample_library;
    class sample_store;

    /**
     * @class mixer
     * @brief Sums every active voice into one stereo block
     * @ingroup core
     *
     * tick() is driven by the device callback. It copies the active voice
     * list under a short lock, renders every voice without holding it,
     * adds each voice into the block with incremental clipping and finally
     * drops the voices that finished. Control calls (play, stop, query)
     * only take the list lock.
     *
     * Dropped voices are parked on a retire list and released by the next
     * control call, so the audio thread never frees voice memory.
     *
     * @code
     * sample_library lib;
     * mixer m(lib, 48000);
     * m.play("laser.wav", {});
     * const stereo_frame* block = m.tick(512);
     * @endcode
     */
    class VOXMIX_EXPORT mixer {
        public:
            /**
             * @param library Resolves source names; must outlive the mixer
             * @param device_rate Output rate in Hz
             * @param block_hint Block size to preallocate for
             */
            explicit mixer(sample_library& library,
                           sample_rate_t device_rate = default_sample_rate,
                           std::size_t block_hint = 4096);

            mixer(const mixer&) = delete;
            mixer& operator=(const mixer&) = delete;

            /**
             * @brief Start a voice for @p source
             * @return The new voice, already audible on the next tick
             * @throws load_error if the source cannot be loaded; no voice is added
             *
             * The voice id is opts.id, or @p source when unset.
             */
            std::shared_ptr<voice> play(const std::string& source, const play_options& opts = {});

            /**
             * @brief Start a voice for an already decoded store
             *
             * The voice id is opts.id, or empty when unset.
             */
            std::shared_ptr<voice> play(std::shared_ptr<const sample_store> store, const play_options& opts = {});

            /// Request removal of every voice with @p id
            void stop(const std::string& id);

            void stop_all();

            /// Active voices with @p id in play order, possibly none
            [[nodiscard]] std::vector<std::shared_ptr<voice>> query(const std::string& id);

            /**
             * @brief First active voice with @p id
             * @throws not_found_error if there is none
             */
            [[nodiscard]] std::shared_ptr<voice> query_one(const std::string& id);

            [[nodiscard]] std::size_t active_count() const;

            /**
             * @brief Render the next block of @p n frames
             * @return Mixed frames, valid until the next tick()
             */
            const stereo_frame* tick(std::size_t n);

            /// tick() into a caller buffer of @p n frames
            void render(stereo_frame* out, std::size_t n);

            [[nodiscard]] sample_rate_t device_rate() const noexcept { return m_device_rate; }

        private:
            std::shared_ptr<voice> add_voice(std::string id,
                                             std::shared_ptr<const sample_store> store,
                                             const play_options& opts);
            [[nodiscard]] bool needs_room(std::size_t voices) const;
            void take_retired(std::vector<std::shared_ptr<voice>>& into);
            void ensure_block(std::size_t n);

            using voice_list = std::vector<std::shared_ptr<voice>>;

            sample_library& m_library;
            const sample_rate_t m_device_rate;

            // Everything below up to m_render_mutex is guarded by m_voices_mutex.
            // Control calls grow these vectors from storage reserved outside the
            // lock, so neither thread allocates while holding it.
            mutable std::mutex m_voices_mutex;
            voice_list m_voices;
            voice_list m_retired;
            voice_list m_snapshot_spare;           // swapped into m_snapshot by tick()
            std::size_t m_snapshot_capacity = 0;   // capacity of m_snapshot, published by tick()
            std::atomic<std::size_t> m_active_hint{0};
            std::atomic<std::size_t> m_retired_hint{0};

            // only ever taken by tick(); control calls never wait on a render
            std::mutex m_render_mutex;
            voice_list m_snapshot;
            buffer<stereo_frame> m_mix_buf;
            buffer<stereo_frame> m_voice_buf;
    };
}

#endif // VOXMIX_MIXER_HH
