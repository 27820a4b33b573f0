/**
 * @file memory_io.hpp
 * @brief Memory-mapped input files
 *
 * @details Provides:
 *          - MappedFile: RAII wrapper around a read-only mmap
 *
 *          - MemReaderState: cursor for FFmpeg custom I/O over a mapping
 *
 *          - MemoryLoader: file mapping plus the FFmpeg read/seek callbacks
 *
 * @note CSV logs are parsed straight out of the mapping (text()) and media
 *       containers are decoded from it through a custom AVIOContext.
 */

#ifndef GESTURE_SLICER_MEMORY_IO_HPP
#define GESTURE_SLICER_MEMORY_IO_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "types.hpp"

namespace gesture_slicer {

/**
 * @brief MemReaderState: read cursor for FFmpeg custom I/O.
 */
struct alignas(CACHE_LINE_SIZE) MemReaderState {
  const uint8_t *ptr; //< Pointer to buffer start
  size_t size;        //< Total buffer size
  size_t pos;         //< Current read position
};

/**
 * @class MappedFile
 * @brief RAII wrapper for memory-mapped files.
 * @note Move-only; unmaps and closes on destruction.
 */
class MappedFile {
public:
  MappedFile() = default;
  ~MappedFile();

  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;

  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  const uint8_t *data() const { return data_; }
  size_t size() const { return size_; }
  bool is_valid() const { return data_ != nullptr; }

  /// View of the mapping as text (empty view when not mapped)
  std::string_view text() const {
    return data_ ? std::string_view(reinterpret_cast<const char *>(data_),
                                    size_)
                 : std::string_view();
  }

private:
  friend class MemoryLoader;
  void release();

  uint8_t *data_ = nullptr;
  size_t size_ = 0;
  int fd_ = -1;
};

/**
 * @class MemoryLoader
 * @brief Maps files into memory and serves them to FFmpeg.
 */
class MemoryLoader {
public:
  /**
   * @brief Map an entire file read-only.
   * @param path Path to the file
   * @param file Output MappedFile (takes ownership of the mapping)
   * @param sequential Hint the kernel for sequential read-ahead
   * @return true on success, false if the file is absent, empty or unmappable
   */
  static bool load_file(const std::string &path, MappedFile &file,
                        bool sequential = true);

  /**
   * @brief FFmpeg read callback for custom I/O.
   */
  static int read(void *opaque, uint8_t *buf, int buf_size);

  /**
   * @brief FFmpeg seek callback for custom I/O.
   * @note Handles AVSEEK_SIZE as well as SEEK_SET/CUR/END.
   */
  static int64_t seek(void *opaque, int64_t offset, int whence);
};

} // namespace gesture_slicer

#endif // GESTURE_SLICER_MEMORY_IO_HPP
