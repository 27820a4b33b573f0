/**
 * @file memory_io.cpp
 * @brief Memory-mapped input files implementation
 *
 * @details Provides implementations for:
 *
 *          - MappedFile: RAII wrapper for mmap
 *
 *          - MemoryLoader::load_file - Map file into memory
 *
 *          - MemoryLoader::read / seek - FFmpeg custom I/O callbacks
 */

#include "gesture_slicer/memory_io.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

extern "C" {
#include <libavformat/avio.h>
#include <libavutil/error.h>
}

#include "gesture_slicer/logging.hpp"

namespace gesture_slicer {

// **---- MappedFile Implementation ----**

void MappedFile::release() {
  if (data_)
    munmap(data_, size_);
  if (fd_ != -1)
    close(fd_);
  data_ = nullptr;
  size_ = 0;
  fd_ = -1;
}

MappedFile::~MappedFile() { release(); }

MappedFile::MappedFile(MappedFile &&other) noexcept
    : data_(std::exchange(other.data_, nullptr)),
      size_(std::exchange(other.size_, 0)),
      fd_(std::exchange(other.fd_, -1)) {}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    release();
    data_ = std::exchange(other.data_, nullptr);
    size_ = std::exchange(other.size_, 0);
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

// **---- MemoryLoader Implementation ----**

bool MemoryLoader::load_file(const std::string &path, MappedFile &file,
                             bool sequential) {
  /// A missing file is an ordinary answer here (absent log or media)
  const int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd == -1)
    return false;

  struct stat sb;
  if (fstat(fd, &sb) == -1 || !S_ISREG(sb.st_mode)) {
    LOG_WARN("Cannot map {}: not a regular file", path);
    close(fd);
    return false;
  }

  /// Zero-length files cannot be mapped; callers treat them as empty logs
  if (sb.st_size <= 0) {
    close(fd);
    return false;
  }

  const size_t length = static_cast<size_t>(sb.st_size);
  void *addr = mmap(nullptr, length, PROT_READ, MAP_PRIVATE, fd, 0);
  if (addr == MAP_FAILED) {
    LOG_ERROR("Cannot map {}: {}", path, std::strerror(errno));
    close(fd);
    return false;
  }
  if (sequential)
    madvise(addr, length, MADV_SEQUENTIAL);

  file.release();
  file.data_ = static_cast<uint8_t *>(addr);
  file.size_ = length;
  file.fd_ = fd;
  return true;
}

int MemoryLoader::read(void *opaque, uint8_t *buf, int buf_size) {
  auto *state = static_cast<MemReaderState *>(opaque);
  if (state->pos >= state->size || buf_size <= 0)
    return AVERROR_EOF;
  const size_t n =
      std::min(state->size - state->pos, static_cast<size_t>(buf_size));
  std::memcpy(buf, state->ptr + state->pos, n);
  state->pos += n;
  return static_cast<int>(n);
}

int64_t MemoryLoader::seek(void *opaque, int64_t offset, int whence) {
  auto *state = static_cast<MemReaderState *>(opaque);
  const auto size = static_cast<int64_t>(state->size);
  if (whence == AVSEEK_SIZE)
    return size;

  int64_t base = 0;
  switch (whence & ~AVSEEK_FORCE) {
  case SEEK_SET:
    break;
  case SEEK_CUR:
    base = static_cast<int64_t>(state->pos);
    break;
  case SEEK_END:
    base = size;
    break;
  default:
    return AVERROR(EINVAL);
  }

  const int64_t target = std::clamp<int64_t>(base + offset, 0, size);
  state->pos = static_cast<size_t>(target);
  return target;
}

} // namespace gesture_slicer
