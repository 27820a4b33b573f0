/**
 * @file video_io.cpp
 * @brief FFmpeg-backed frame decoding and clip encoding implementation
 *
 * @details VideoReader decodes from a read-only mapping through custom I/O
 *          and hands out frames converted to the modality's pixel format.
 *          VideoWriter scales and converts whatever it receives to YUV420P
 *          and muxes MPEG-4 Part 2 into MP4.
 *
 * @attention OPTIMIZATIONS:
 *
 *          - Only the frame that is finally returned is converted
 *
 *          - Short forward jumps decode through instead of seeking
 *
 *          - Scaler contexts are cached across frames
 */

#include "gesture_slicer/video_io.hpp"

#include <algorithm>
#include <cmath>

extern "C" {
#include <libavutil/error.h>
#include <libavutil/imgutils.h>
}

#include "gesture_slicer/logging.hpp"

namespace gesture_slicer {

namespace {

/// Fallback when the container does not declare a rate
constexpr double DEFAULT_FRAME_RATE = 25.0;

/// Largest time base denominator MPEG-4 Part 2 accepts
constexpr int MPEG4_MAX_TIMEBASE_DEN = 65535;

} // anonymous namespace

std::string av_error_string(int errnum) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(errnum, buf, sizeof(buf));
  return buf;
}

ModalityProfile profile_for(CameraModality modality) {
  switch (modality) {
  case CameraModality::AzureDepth:
  case CameraModality::AzureIr:
    return {AV_PIX_FMT_GRAY8, 8, true};
  case CameraModality::Webcam:
  case CameraModality::AzureColor:
    break;
  }
  return {AV_PIX_FMT_YUV420P, 8, false};
}

// **---- VideoReader Implementation ----**

VideoReader::VideoReader(std::string path, CameraModality modality)
    : path_(std::move(path)), profile_(profile_for(modality)) {
  frame = av_frame_alloc();
  converted = av_frame_alloc();
  pkt = av_packet_alloc();
}

VideoReader::~VideoReader() {
  if (sws_ctx)
    sws_freeContext(sws_ctx);

  if (dec_ctx)
    avcodec_free_context(&dec_ctx);

  /// AVFMT_FLAG_CUSTOM_IO leaves the IO context to us
  if (fmt_ctx)
    avformat_close_input(&fmt_ctx);

  if (avio_ctx) {
    /// FFmpeg may have replaced the buffer we handed it
    av_freep(&avio_ctx->buffer);
    avio_context_free(&avio_ctx);
  } else if (avio_buffer) {
    av_free(avio_buffer);
  }

  av_frame_free(&frame);
  av_frame_free(&converted);
  av_packet_free(&pkt);
}

bool VideoReader::initialize() {
  if (!frame || !converted || !pkt) {
    LOG_ERROR("{}: failed to allocate frame or packet", path_);
    return false;
  }

  if (!MemoryLoader::load_file(path_, file_data)) {
    LOG_ERROR("{}: cannot map media file", path_);
    return false;
  }

  fmt_ctx = avformat_alloc_context();
  if (!fmt_ctx) {
    LOG_ERROR("Failed to allocate AVFormatContext");
    return false;
  }

  avio_buffer = static_cast<uint8_t *>(av_malloc(AVIO_BUFFER_SIZE));
  if (!avio_buffer) {
    LOG_ERROR("Failed to allocate AVIO buffer");
    return false;
  }

  mem_state = {file_data.data(), file_data.size(), 0};

  avio_ctx =
      avio_alloc_context(avio_buffer, AVIO_BUFFER_SIZE, 0, &mem_state,
                         MemoryLoader::read, nullptr, MemoryLoader::seek);
  if (!avio_ctx) {
    LOG_ERROR("Failed to allocate AVIOContext");
    return false;
  }

  fmt_ctx->pb = avio_ctx;
  fmt_ctx->flags |= AVFMT_FLAG_CUSTOM_IO;

  int ret = avformat_open_input(&fmt_ctx, "RAM", nullptr, nullptr);
  if (ret < 0) {
    /// On failure fmt_ctx is freed and nulled; avio_ctx is still ours
    LOG_ERROR("{}: avformat_open_input failed: {}", path_,
              av_error_string(ret));
    return false;
  }

  ret = avformat_find_stream_info(fmt_ctx, nullptr);
  if (ret < 0) {
    LOG_ERROR("{}: avformat_find_stream_info failed: {}", path_,
              av_error_string(ret));
    return false;
  }

  video_stream_idx =
      av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_stream_idx < 0) {
    LOG_ERROR("{}: no video stream found", path_);
    return false;
  }

  for (unsigned int i = 0; i < fmt_ctx->nb_streams; i++) {
    if (i != static_cast<unsigned int>(video_stream_idx)) {
      fmt_ctx->streams[i]->discard = AVDISCARD_ALL;
    }
  }

  AVStream *st = fmt_ctx->streams[video_stream_idx];
  const AVCodec *codec = avcodec_find_decoder(st->codecpar->codec_id);
  if (!codec) {
    LOG_ERROR("{}: no decoder for codec ID {}", path_,
              static_cast<int>(st->codecpar->codec_id));
    return false;
  }

  dec_ctx = avcodec_alloc_context3(codec);
  if (!dec_ctx) {
    LOG_ERROR("Failed to allocate decoder context");
    return false;
  }
  ret = avcodec_parameters_to_context(dec_ctx, st->codecpar);
  if (ret < 0) {
    LOG_ERROR("{}: avcodec_parameters_to_context failed: {}", path_,
              av_error_string(ret));
    return false;
  }

  /// Single-threaded decoding (we parallelize at camera level instead)
  dec_ctx->thread_count = 1;

  /// Depth and IR only need the luma plane
  if (profile_.grayscale)
    dec_ctx->flags |= AV_CODEC_FLAG_GRAY;

  ret = avcodec_open2(dec_ctx, codec, nullptr);
  if (ret < 0) {
    LOG_ERROR("{}: avcodec_open2 failed: {}", path_, av_error_string(ret));
    return false;
  }

  // **--- STREAM PROPERTIES ---**

  AVRational rate = st->avg_frame_rate;
  if (rate.num <= 0 || rate.den <= 0)
    rate = st->r_frame_rate;
  props_.frame_rate =
      (rate.num > 0 && rate.den > 0) ? av_q2d(rate) : DEFAULT_FRAME_RATE;
  props_.width = dec_ctx->width;
  props_.height = dec_ctx->height;
  props_.duration = (fmt_ctx->duration != AV_NOPTS_VALUE)
                        ? fmt_ctx->duration / static_cast<double>(AV_TIME_BASE)
                        : 0.0;

  if (props_.width <= 0 || props_.height <= 0) {
    LOG_ERROR("{}: stream reports no frame size", path_);
    return false;
  }

  time_base_ = av_q2d(st->time_base);
  start_pts_ = (st->start_time != AV_NOPTS_VALUE) ? st->start_time : 0;

  converted->format = profile_.pixel_format;
  converted->width = props_.width;
  converted->height = props_.height;
  ret = av_frame_get_buffer(converted, 0);
  if (ret < 0) {
    LOG_ERROR("{}: cannot allocate conversion buffer: {}", path_,
              av_error_string(ret));
    return false;
  }

  return true;
}

int64_t VideoReader::position_of(const AVFrame *f) {
  int64_t ts = f->best_effort_timestamp;
  if (ts == AV_NOPTS_VALUE)
    ts = f->pts;
  if (ts == AV_NOPTS_VALUE)
    return current_index_ + 1;
  return std::llround((ts - start_pts_) * time_base_ * props_.frame_rate);
}

bool VideoReader::seek_to(int64_t frame_index) {
  const int64_t ts =
      start_pts_ +
      std::llround(frame_index / props_.frame_rate / time_base_);
  int ret = av_seek_frame(fmt_ctx, video_stream_idx, ts, AVSEEK_FLAG_BACKWARD);
  if (ret < 0) {
    LOG_WARN("{}: seek to frame {} failed: {}", path_, frame_index,
             av_error_string(ret));
    return false;
  }
  avcodec_flush_buffers(dec_ctx);
  current_index_ = -1;
  converted_index_ = -1;
  eof_ = false;
  return true;
}

bool VideoReader::decode_next() {
  while (true) {
    int ret = avcodec_receive_frame(dec_ctx, frame);
    if (ret >= 0) {
      current_index_ = position_of(frame);
      return true;
    }
    if (ret == AVERROR_EOF)
      return false;
    if (ret != AVERROR(EAGAIN)) {
      LOG_WARN("{}: decode error: {}", path_, av_error_string(ret));
      return false;
    }

    /// Decoder wants input
    ret = av_read_frame(fmt_ctx, pkt);
    if (ret < 0) {
      if (eof_)
        return false;
      eof_ = true;
      avcodec_send_packet(dec_ctx, nullptr); // Enter draining mode
      continue;
    }

    if (pkt->stream_index == video_stream_idx) {
      ret = avcodec_send_packet(dec_ctx, pkt);
      if (ret < 0 && ret != AVERROR(EAGAIN)) {
        LOG_WARN("{}: dropping undecodable packet: {}", path_,
                 av_error_string(ret));
      }
    }
    av_packet_unref(pkt);
  }
}

bool VideoReader::convert_current() {
  /// Callers may hold references to the previous picture
  int ret = av_frame_make_writable(converted);
  if (ret < 0) {
    LOG_ERROR("{}: cannot make frame writable: {}", path_,
              av_error_string(ret));
    return false;
  }

  sws_ctx = sws_getCachedContext(
      sws_ctx, frame->width, frame->height,
      static_cast<AVPixelFormat>(frame->format), props_.width, props_.height,
      profile_.pixel_format, SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws_ctx) {
    LOG_ERROR("{}: no scaler for pixel format {}", path_, frame->format);
    return false;
  }

  sws_scale(sws_ctx, frame->data, frame->linesize, 0, frame->height,
            converted->data, converted->linesize);
  converted->pts = current_index_;
  converted_index_ = current_index_;
  return true;
}

const AVFrame *VideoReader::frame_at(int64_t frame_index) {
  if (!dec_ctx || frame_index < 0)
    return nullptr;

  if (converted_index_ >= 0 && frame_index == converted_index_)
    return converted;

  // **--- POSITIONING ---**

  const int64_t jump =
      std::max<int64_t>(16, std::llround(props_.frame_rate * 2.0));
  const bool need_seek = frame_index < current_index_ ||
                         frame_index > current_index_ + jump;
  if (need_seek && !seek_to(frame_index) && frame_index < current_index_)
    return nullptr;

  while (current_index_ < frame_index) {
    if (!decode_next())
      break;
  }

  /// Past the last decodable frame
  if (current_index_ < frame_index)
    return nullptr;

  if (current_index_ != converted_index_ && !convert_current())
    return nullptr;
  return converted;
}

// **---- VideoWriter Implementation ----**

VideoWriter::VideoWriter(std::string path, int width, int height,
                         double frame_rate)
    : path_(std::move(path)), width_(width & ~1), height_(height & ~1),
      frame_rate_(frame_rate) {}

VideoWriter::~VideoWriter() {
  if (sws_ctx)
    sws_freeContext(sws_ctx);
  if (enc_ctx)
    avcodec_free_context(&enc_ctx);
  if (ofmt_ctx) {
    if (!(ofmt_ctx->oformat->flags & AVFMT_NOFILE))
      avio_closep(&ofmt_ctx->pb);
    avformat_free_context(ofmt_ctx);
  }
  av_frame_free(&enc_frame);
  av_packet_free(&pkt);
}

bool VideoWriter::initialize() {
  if (width_ < 2 || height_ < 2 || frame_rate_ <= 0.0) {
    LOG_ERROR("{}: invalid clip geometry {}x{} @ {} fps", path_, width_,
              height_, frame_rate_);
    return false;
  }

  int ret = avformat_alloc_output_context2(&ofmt_ctx, nullptr, "mp4",
                                           path_.c_str());
  if (ret < 0 || !ofmt_ctx) {
    LOG_ERROR("{}: cannot create MP4 muxer: {}", path_, av_error_string(ret));
    return false;
  }

  const AVCodec *codec = avcodec_find_encoder(AV_CODEC_ID_MPEG4);
  if (!codec) {
    LOG_ERROR("No MPEG-4 encoder available in this FFmpeg build");
    return false;
  }

  stream = avformat_new_stream(ofmt_ctx, nullptr);
  if (!stream) {
    LOG_ERROR("{}: cannot add video stream", path_);
    return false;
  }

  enc_ctx = avcodec_alloc_context3(codec);
  if (!enc_ctx) {
    LOG_ERROR("Failed to allocate encoder context");
    return false;
  }

  const AVRational rate = av_d2q(frame_rate_, MPEG4_MAX_TIMEBASE_DEN);
  enc_ctx->width = width_;
  enc_ctx->height = height_;
  enc_ctx->pix_fmt = AV_PIX_FMT_YUV420P;
  enc_ctx->time_base = av_inv_q(rate);
  enc_ctx->framerate = rate;
  enc_ctx->gop_size = 12;
  /// ~0.2 bits per pixel keeps 640x480@30 around 1.8 Mbit/s
  enc_ctx->bit_rate = static_cast<int64_t>(width_ * height_ * frame_rate_ * 0.2);
  enc_ctx->thread_count = 1;

  if (ofmt_ctx->oformat->flags & AVFMT_GLOBALHEADER)
    enc_ctx->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

  ret = avcodec_open2(enc_ctx, codec, nullptr);
  if (ret < 0) {
    LOG_ERROR("{}: cannot open MPEG-4 encoder: {}", path_,
              av_error_string(ret));
    return false;
  }

  ret = avcodec_parameters_from_context(stream->codecpar, enc_ctx);
  if (ret < 0) {
    LOG_ERROR("{}: avcodec_parameters_from_context failed: {}", path_,
              av_error_string(ret));
    return false;
  }
  stream->time_base = enc_ctx->time_base;
  stream->avg_frame_rate = rate;

  if (!(ofmt_ctx->oformat->flags & AVFMT_NOFILE)) {
    ret = avio_open(&ofmt_ctx->pb, path_.c_str(), AVIO_FLAG_WRITE);
    if (ret < 0) {
      LOG_ERROR("{}: cannot open for writing: {}", path_,
                av_error_string(ret));
      return false;
    }
  }

  ret = avformat_write_header(ofmt_ctx, nullptr);
  if (ret < 0) {
    LOG_ERROR("{}: avformat_write_header failed: {}", path_,
              av_error_string(ret));
    return false;
  }
  header_written_ = true;

  enc_frame = av_frame_alloc();
  pkt = av_packet_alloc();
  if (!enc_frame || !pkt) {
    LOG_ERROR("Failed to allocate encoder frame or packet");
    return false;
  }
  enc_frame->format = AV_PIX_FMT_YUV420P;
  enc_frame->width = width_;
  enc_frame->height = height_;
  ret = av_frame_get_buffer(enc_frame, 0);
  if (ret < 0) {
    LOG_ERROR("{}: cannot allocate encoder frame: {}", path_,
              av_error_string(ret));
    return false;
  }
  return true;
}

bool VideoWriter::encode(AVFrame *f) {
  int ret = avcodec_send_frame(enc_ctx, f);
  if (ret < 0) {
    LOG_ERROR("{}: avcodec_send_frame failed: {}", path_,
              av_error_string(ret));
    return false;
  }

  while (true) {
    ret = avcodec_receive_packet(enc_ctx, pkt);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
      return true;
    if (ret < 0) {
      LOG_ERROR("{}: avcodec_receive_packet failed: {}", path_,
                av_error_string(ret));
      return false;
    }

    av_packet_rescale_ts(pkt, enc_ctx->time_base, stream->time_base);
    pkt->stream_index = stream->index;

    /// Takes ownership of the packet's reference
    ret = av_interleaved_write_frame(ofmt_ctx, pkt);
    if (ret < 0) {
      LOG_ERROR("{}: av_interleaved_write_frame failed: {}", path_,
                av_error_string(ret));
      return false;
    }
  }
}

bool VideoWriter::write(const AVFrame *f) {
  if (!header_written_ || finished_ || !f)
    return false;

  int ret = av_frame_make_writable(enc_frame);
  if (ret < 0) {
    LOG_ERROR("{}: cannot make frame writable: {}", path_,
              av_error_string(ret));
    return false;
  }

  sws_ctx = sws_getCachedContext(
      sws_ctx, f->width, f->height, static_cast<AVPixelFormat>(f->format),
      width_, height_, AV_PIX_FMT_YUV420P, SWS_BILINEAR, nullptr, nullptr,
      nullptr);
  if (!sws_ctx) {
    LOG_ERROR("{}: no scaler for pixel format {}", path_, f->format);
    return false;
  }

  sws_scale(sws_ctx, f->data, f->linesize, 0, f->height, enc_frame->data,
            enc_frame->linesize);
  enc_frame->pts = next_pts_++;
  return encode(enc_frame);
}

bool VideoWriter::finish() {
  if (finished_)
    return true;
  finished_ = true;
  if (!header_written_)
    return false;

  bool ok = encode(nullptr); // Drain delayed packets
  int ret = av_write_trailer(ofmt_ctx);
  if (ret < 0) {
    LOG_ERROR("{}: av_write_trailer failed: {}", path_, av_error_string(ret));
    ok = false;
  }
  return ok;
}

} // namespace gesture_slicer
