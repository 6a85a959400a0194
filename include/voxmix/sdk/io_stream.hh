/**
 * @file io_stream.hh
 * @brief Read-only binary stream abstraction used by decoders
 * @ingroup sdk_io
 */

#ifndef VOXMIX_SDK_IO_STREAM_HH
#define VOXMIX_SDK_IO_STREAM_HH

#include <voxmix/sdk/types.hh>
#include <voxmix/export_voxmix.h>
#include <filesystem>
#include <memory>

namespace voxmix {

/**
 * @enum seek_origin
 * @brief Seek origin for stream positioning
 * @ingroup sdk_io
 */
enum class seek_origin : int {
    set = 0,  ///< From beginning of stream (SEEK_SET)
    cur = 1,  ///< From current position (SEEK_CUR)
    end = 2   ///< From end of stream (SEEK_END)
};

/**
 * @class io_stream
 * @brief Abstract interface for reading encoded audio
 * @ingroup sdk_io
 *
 * Decoders pull their input through this interface so that files and
 * in-memory blobs are handled the same way.
 *
 * @code
 * auto file = io_from_file("explosion.wav");
 * auto blob = io_from_memory(bytes.data(), bytes.size());
 * @endcode
 *
 * @see io_from_file(), io_from_memory(), decoder
 */
class VOXMIX_EXPORT io_stream {
public:
    virtual ~io_stream() = default;

    /**
     * @brief Read up to @p size_bytes into @p ptr
     * @return Number of bytes actually read, 0 at end of stream
     */
    virtual size_t read(void* ptr, size_t size_bytes) = 0;

    /**
     * @brief Reposition the stream
     * @return New absolute position, or -1 on failure
     */
    virtual int64_t seek(int64_t offset, seek_origin whence) = 0;

    /// Current absolute position, or -1 if closed
    virtual int64_t tell() = 0;

    /// Total size in bytes, or -1 if unknown
    virtual int64_t get_size() = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;
};

/**
 * @brief Open a file for binary reading
 * @param path File to open
 * @return Stream positioned at the start of the file
 * @throws io_error if the file cannot be opened
 */
VOXMIX_EXPORT std::unique_ptr<io_stream> io_from_file(const std::filesystem::path& path);

/**
 * @brief Wrap a memory block
 * @param mem Data (not copied, must outlive the stream)
 * @param size_bytes Size of the block
 */
VOXMIX_EXPORT std::unique_ptr<io_stream> io_from_memory(const void* mem, size_t size_bytes);

} // namespace voxmix

#endif // VOXMIX_SDK_IO_STREAM_HH
