#include <voxmix/sample_library.hh>
#include <voxmix/sdk/sample_store.hh>
#include <voxmix/sdk/io_stream.hh>
#include <voxmix/codecs/decoder_drwav.hh>
#include <voxmix/error.hh>
#include <failsafe/failsafe.hh>

namespace voxmix {
    sample_library::sample_library(sample_loader loader)
        : m_loader(std::move(loader)) {
        if (!m_loader) {
            m_loader = &sample_library::load_wav_file;
        }
    }

    std::shared_ptr<const sample_store> sample_library::get(const std::string& source) {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_stores.find(source);
        if (it != m_stores.end()) {
            return it->second;
        }

        std::shared_ptr<const sample_store> store;
        try {
            store = m_loader(source);
        } catch (const load_error& e) {
            LOG_ERROR("sample_library", "Failed to load", source, ":", e.what());
            throw;
        } catch (const std::exception& e) {
            LOG_ERROR("sample_library", "Failed to load", source, ":", e.what());
            throw load_error("Failed to load '" + source + "': " + e.what());
        }
        if (!store) {
            LOG_ERROR("sample_library", "Loader returned nothing for", source);
            throw load_error("Failed to load '" + source + "': loader returned no data");
        }

        LOG_INFO("sample_library", "Loaded", source, ":", store->length(), "frames at", store->rate(), "Hz");
        m_stores.emplace(source, store);
        return store;
    }

    void sample_library::preload(const std::string& source) {
        (void)get(source);
    }

    bool sample_library::contains(const std::string& source) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_stores.find(source) != m_stores.end();
    }

    std::size_t sample_library::size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_stores.size();
    }

    void sample_library::clear() {
        std::unordered_map<std::string, std::shared_ptr<const sample_store>> released;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            released.swap(m_stores);
        }
        LOG_DEBUG("sample_library", "Released", released.size(), "cached sounds");
    }

    std::shared_ptr<const sample_store> sample_library::load_wav_file(const std::string& path) {
        auto io = io_from_file(path);
        decoder_drwav dec;
        dec.open(io.get());
        return sample_store::from_decoder(dec);
    }
}
