/**
 * @file video_io.hpp
 * @brief FFmpeg-backed frame decoding and clip encoding
 *
 * @details Two small interfaces separate the segment logic from the codec
 *          layer:
 *
 *          - FrameSource: "decode the frame at container position N"
 *
 *          - FrameSink: "append this frame to the output clip"
 *
 *          VideoReader and VideoWriter implement them with libavformat,
 *          libavcodec and libswscale.
 *
 * @attention THREAD MODEL:
 *            - Each camera worker owns its reader and writers.
 *
 *            - FFmpeg codec state is never shared between threads.
 */

#ifndef GESTURE_SLICER_VIDEO_IO_HPP
#define GESTURE_SLICER_VIDEO_IO_HPP

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libswscale/swscale.h>
}

#include <cstdint>
#include <string>

#include "memory_io.hpp"
#include "types.hpp"

namespace gesture_slicer {

/**
 * @struct ModalityProfile
 * @brief Decode parameters that depend on the sensor.
 * @note Depth and infrared were recorded as 8-bit single-channel video;
 *       decoding them to GRAY8 drops the meaningless chroma planes.
 */
struct ModalityProfile {
  AVPixelFormat pixel_format; //< Format frames are handed out in
  int bit_depth;              //< Bits per sample of the significant plane
  bool grayscale;
};

ModalityProfile profile_for(CameraModality modality);

/**
 * @struct VideoProperties
 * @brief What a probe of the container reports.
 */
struct VideoProperties {
  int width = 0;
  int height = 0;
  double frame_rate = 0.0;
  double duration = 0.0; //< Seconds, 0 if unknown
};

/**
 * @class FrameSource
 * @brief Random access to decoded frames by container position.
 */
class FrameSource {
public:
  virtual ~FrameSource() = default;

  virtual const VideoProperties &properties() const = 0;

  /**
   * @brief Decode the frame at a container position.
   * @note Requests are expected in non-decreasing order; going backwards
   *       costs a seek. The returned frame stays valid until the next call.
   * @return nullptr when the position lies beyond the last decodable frame
   */
  virtual const AVFrame *frame_at(int64_t frame_index) = 0;
};

/**
 * @class FrameSink
 * @brief Destination of re-sampled frames.
 */
class FrameSink {
public:
  virtual ~FrameSink() = default;

  /// Append one frame; false on encoder or I/O failure
  virtual bool write(const AVFrame *frame) = 0;

  /// Flush and close the output; false on failure
  virtual bool finish() = 0;
};

/**
 * @class VideoReader
 * @brief Decodes a media container mapped into RAM.
 *
 * @attention
 * `MANAGEMENT`:
 *
 *            - Uses AVFMT_FLAG_CUSTOM_IO over a MappedFile
 *
 *            - Destructor handles partial initialization failures and
 *              frees the custom IO context itself
 *
 * `POSITIONING`:
 *
 *            - A frame's container position is derived from its pts and the
 *              stream's average frame rate
 *
 *            - Forward requests decode forward; large jumps and backward
 *              requests seek to the nearest preceding keyframe
 */
class VideoReader : public FrameSource {
  AVFormatContext *fmt_ctx = nullptr;
  AVCodecContext *dec_ctx = nullptr;
  AVFrame *frame = nullptr;     //< Decoder output
  AVFrame *converted = nullptr; //< Frame in the modality's pixel format
  AVPacket *pkt = nullptr;
  AVIOContext *avio_ctx = nullptr;
  uint8_t *avio_buffer = nullptr;
  SwsContext *sws_ctx = nullptr;

  MappedFile file_data;
  MemReaderState mem_state{};
  int video_stream_idx = -1;

  std::string path_;
  ModalityProfile profile_;
  VideoProperties props_;

  double time_base_ = 0.0;
  int64_t start_pts_ = 0;
  int64_t current_index_ = -1;   //< Position of `frame`, -1 if none
  int64_t converted_index_ = -1; //< Position of `converted`, -1 if none
  bool eof_ = false;

  bool seek_to(int64_t frame_index);
  bool decode_next();
  bool convert_current();
  int64_t position_of(const AVFrame *f);

public:
  VideoReader(std::string path, CameraModality modality);
  ~VideoReader() override;

  VideoReader(const VideoReader &) = delete;
  VideoReader &operator=(const VideoReader &) = delete;

  /**
   * @brief Map the file, open the demuxer and decoder.
   * @return true on success, false on failure (logged)
   */
  bool initialize();

  const VideoProperties &properties() const override { return props_; }
  const AVFrame *frame_at(int64_t frame_index) override;
};

/**
 * @class VideoWriter
 * @brief Encodes frames into an MP4 clip (MPEG-4 Part 2) at a fixed rate.
 * @note Input frames of any size or pixel format are scaled and converted
 *       to the clip's size and YUV420P.
 */
class VideoWriter : public FrameSink {
  AVFormatContext *ofmt_ctx = nullptr;
  AVCodecContext *enc_ctx = nullptr;
  AVStream *stream = nullptr;
  AVFrame *enc_frame = nullptr;
  AVPacket *pkt = nullptr;
  SwsContext *sws_ctx = nullptr;

  std::string path_;
  int width_;
  int height_;
  double frame_rate_;
  int64_t next_pts_ = 0;
  bool header_written_ = false;
  bool finished_ = false;

  bool encode(AVFrame *f);

public:
  VideoWriter(std::string path, int width, int height, double frame_rate);
  ~VideoWriter() override;

  VideoWriter(const VideoWriter &) = delete;
  VideoWriter &operator=(const VideoWriter &) = delete;

  /**
   * @brief Create the output file, encoder and container header.
   * @return true on success, false on failure (logged)
   */
  bool initialize();

  bool write(const AVFrame *frame) override;
  bool finish() override;

  int64_t frames_written() const { return next_pts_; }
};

/// Human readable FFmpeg error string
std::string av_error_string(int errnum);

} // namespace gesture_slicer

#endif // GESTURE_SLICER_VIDEO_IO_HPP
