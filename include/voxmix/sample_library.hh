/**
 * @file sample_library.hh
 * @brief Load-once cache of decoded sounds
 * @ingroup core
 */

#ifndef VOXMIX_SAMPLE_LIBRARY_HH
#define VOXMIX_SAMPLE_LIBRARY_HH

#include <voxmix/export_voxmix.h>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace voxmix {
    class sample_store;

    /**
     * @brief Turns a source name into decoded frames
     *
     * Must return a non-null store or throw. Any exception is reported to
     * the caller of sample_library::get() as load_error.
     */
    using sample_loader = std::function<std::shared_ptr<const sample_store>(const std::string& source)>;

    /**
     * @class sample_library
     * @brief Maps source names to shared sample stores, decoding each once
     * @ingroup core
     *
     * The library is only used from control threads; the audio thread
     * sees stores exclusively through the voices that reference them.
     * Clearing the library does not affect voices that are still playing.
     *
     * @code
     * sample_library lib;                       // WAV files via dr_wav
     * auto laser = lib.get("sfx/laser.wav");    // decoded here
     * auto again = lib.get("sfx/laser.wav");    // same pointer, no decoding
     * @endcode
     */
    class VOXMIX_EXPORT sample_library {
        public:
            /**
             * @param loader Custom loader; an empty function selects load_wav_file()
             */
            explicit sample_library(sample_loader loader = {});

            /**
             * @brief Cached store for @p source, loading it on first use
             * @throws load_error if the loader fails; nothing is cached then
             */
            std::shared_ptr<const sample_store> get(const std::string& source);

            /**
             * @brief Load @p source ahead of its first play
             * @throws load_error as get()
             */
            void preload(const std::string& source);

            [[nodiscard]] bool contains(const std::string& source) const;
            [[nodiscard]] std::size_t size() const;
            void clear();

            /**
             * @brief Default loader: read a WAV file from disk
             * @throws io_error if the file cannot be opened
             * @throws load_error if the data is not a supported WAV stream
             */
            static std::shared_ptr<const sample_store> load_wav_file(const std::string& path);

        private:
            sample_loader m_loader;
            mutable std::mutex m_mutex;
            std::unordered_map<std::string, std::shared_ptr<const sample_store>> m_stores;
    };
}

#endif // VOXMIX_SAMPLE_LIBRARY_HH
