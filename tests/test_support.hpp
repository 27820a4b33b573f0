/**
 * @file test_support.hpp
 * @brief Scratch directories, file helpers and synthetic clips for the tests
 */

#ifndef GESTURE_SLICER_TEST_SUPPORT_HPP
#define GESTURE_SLICER_TEST_SUPPORT_HPP

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include <unistd.h>

#include <gtest/gtest.h>

#include "gesture_slicer/video_io.hpp"

namespace gesture_slicer {
namespace testing_support {

/// Fresh directory under the system temp dir, removed on destruction
class ScratchDir {
public:
  ScratchDir() {
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = "gesture_slicer_";
    if (info)
      name += std::string(info->test_suite_name()) + "_" + info->name();
    name += "_" + std::to_string(::getpid());
    path_ = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }

  ~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  ScratchDir(const ScratchDir &) = delete;
  ScratchDir &operator=(const ScratchDir &) = delete;

  const std::filesystem::path &path() const { return path_; }

  std::string file(const std::string &relative) const {
    return (path_ / relative).string();
  }

private:
  std::filesystem::path path_;
};

inline void write_file(const std::string &path, const std::string &content) {
  std::filesystem::path p(path);
  if (p.has_parent_path())
    std::filesystem::create_directories(p.parent_path());
  std::ofstream out(path, std::ios::binary);
  out << content;
}

inline std::string read_file(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

/// Flat YUV420P picture with the given luma
inline AVFrame *make_flat_frame(int width, int height, uint8_t luma) {
  AVFrame *f = av_frame_alloc();
  if (!f)
    return nullptr;
  f->format = AV_PIX_FMT_YUV420P;
  f->width = width;
  f->height = height;
  if (av_frame_get_buffer(f, 0) < 0) {
    av_frame_free(&f);
    return nullptr;
  }
  for (int y = 0; y < height; ++y) {
    std::fill_n(f->data[0] + y * f->linesize[0], width, luma);
  }
  for (int p = 1; p < 3; ++p) {
    for (int y = 0; y < (height + 1) / 2; ++y) {
      std::fill_n(f->data[p] + y * f->linesize[p], (width + 1) / 2,
                  uint8_t{128});
    }
  }
  return f;
}

/**
 * @brief Encode a clip whose frames get brighter one step at a time.
 * @return Frames written, or -1 when the writer could not be set up
 */
inline int64_t write_ramp_video(const std::string &path, int width, int height,
                                double fps, int frames) {
  std::filesystem::path p(path);
  if (p.has_parent_path())
    std::filesystem::create_directories(p.parent_path());

  VideoWriter writer(path, width, height, fps);
  if (!writer.initialize())
    return -1;
  for (int i = 0; i < frames; ++i) {
    const int luma = 16 + (frames > 1 ? i * 200 / (frames - 1) : 0);
    AVFrame *f = make_flat_frame(width, height, static_cast<uint8_t>(luma));
    const bool ok = f && writer.write(f);
    av_frame_free(&f);
    if (!ok)
      return -1;
  }
  if (!writer.finish())
    return -1;
  return writer.frames_written();
}

/// Average of the first plane
inline double mean_luma(const AVFrame *f) {
  double sum = 0.0;
  for (int y = 0; y < f->height; ++y) {
    const uint8_t *row = f->data[0] + y * f->linesize[0];
    for (int x = 0; x < f->width; ++x) {
      sum += row[x];
    }
  }
  return sum / (static_cast<double>(f->width) * f->height);
}

} // namespace testing_support
} // namespace gesture_slicer

#endif // GESTURE_SLICER_TEST_SUPPORT_HPP
