/**
 * @file types.cpp
 * @brief Name tables for camera modalities and segment states
 */

#include "gesture_slicer/types.hpp"

namespace gesture_slicer {

const char *modality_name(CameraModality modality) {
  switch (modality) {
  case CameraModality::Webcam:
    return "webcam";
  case CameraModality::AzureColor:
    return "azure_color";
  case CameraModality::AzureDepth:
    return "azure_depth";
  case CameraModality::AzureIr:
    return "azure_ir";
  }
  return "unknown";
}

const char *status_name(SegmentStatus status) {
  switch (status) {
  case SegmentStatus::Planned:
    return "planned";
  case SegmentStatus::FramesFound:
    return "frames_found";
  case SegmentStatus::Encoded:
    return "encoded";
  case SegmentStatus::Accepted:
    return "accepted";
  case SegmentStatus::NoFrames:
    return "no_frames";
  case SegmentStatus::TooShort:
    return "too_short";
  case SegmentStatus::EncodeFailed:
    return "encode_failed";
  case SegmentStatus::Rejected:
    return "rejected";
  }
  return "unknown";
}

} // namespace gesture_slicer
