/**
 * @file buffer.hh
 * @brief Fixed-size scratch buffer for the mixing path
 * @ingroup sdk
 */

#pragma once

#include <algorithm>
#include <memory>
#include <type_traits>

namespace voxmix {
    /**
     * @class buffer
     * @brief Zero-initialized heap array sized explicitly by its owner
     * @tparam T Element type (must be trivially copyable)
     * @ingroup sdk
     *
     * The mixer keeps its block buffers in this container. Unlike
     * std::vector there is no implicit growth: the audio thread only ever
     * reuses the allocation, and growing is an explicit ensure() call.
     *
     * @code
     * buffer<stereo_frame> block(512);
     * block.ensure(1024);      // reallocates, contents are dropped
     * block.zero(1024);        // silence the first 1024 frames
     * @endcode
     */
    template<typename T>
    class buffer final {
        static_assert(std::is_trivially_copyable_v<T>, "buffer<T> requires trivially copyable T");
    public:
        explicit buffer(std::size_t size)
            : m_data(std::make_unique<T[]>(size)), m_size(size) {
            std::fill_n(m_data.get(), m_size, T{});
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return m_size;
        }

        T* data() noexcept { return m_data.get(); }
        const T* data() const noexcept { return m_data.get(); }

        /**
         * @brief Make room for at least @p count elements
         * @return true if a reallocation happened
         *
         * Existing contents are not preserved when the buffer grows.
         * Never shrinks.
         */
        bool ensure(std::size_t count) {
            if (count <= m_size) {
                return false;
            }
            m_data = std::make_unique<T[]>(count);
            m_size = count;
            std::fill_n(m_data.get(), m_size, T{});
            return true;
        }

        /**
         * @brief Reset the first @p count elements to T{}
         */
        void zero(std::size_t count) noexcept {
            std::fill_n(m_data.get(), std::min(count, m_size), T{});
        }

    private:
        std::unique_ptr<T[]> m_data;
        std::size_t m_size;
    };
}
