/**
 * @file camera_catalog.hpp
 * @brief Dataset layout and camera discovery for one participant
 *
 * @details Layout under the base path:
 *
 *          - logs/auto_labels_{pid}.csv                    gesture log
 *
 *          - logs/{pid}/webcam_{N}.csv                     webcam frame log
 *
 *          - logs/{pid}/webcam_azure_kinect.csv            Azure frame log
 *
 *          - images/{pid}/{N}/webcam_{N}.mp4               webcam media
 *
 *          - images/{pid}/azure/webcam_azure_kinect_{color,depth,ir}.mp4
 *
 *          - post-processed/{pid}/camera_{id}/             clips
 *
 *          - post-processed/{pid}/training_summary.csv     manifest
 *
 * @note A camera exists when its frame log exists. The three Azure
 *       modalities come from one log and become three cameras.
 */

#ifndef GESTURE_SLICER_CAMERA_CATALOG_HPP
#define GESTURE_SLICER_CAMERA_CATALOG_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace gesture_slicer {

struct PipelineConfig;

namespace Layout {

std::string camera_log_dir(const std::string &base, const std::string &pid);
std::string webcam_log(const std::string &base, const std::string &pid,
                       const std::string &camera_id);
std::string webcam_media(const std::string &base, const std::string &pid,
                         const std::string &camera_id);
std::string azure_log(const std::string &base, const std::string &pid);
std::string azure_media(const std::string &base, const std::string &pid,
                        CameraModality modality);
std::string output_dir(const std::string &base, const std::string &pid);
std::string camera_output_dir(const std::string &base, const std::string &pid,
                              const std::string &camera_id);
std::string manifest_path(const std::string &base, const std::string &pid);

/// "{dir}/{stem}_labeled.csv" next to a frame log
std::string labeled_log(const std::string &log_path);

} // namespace Layout

/**
 * @struct CameraEntry
 * @brief A camera that will be processed.
 */
struct CameraEntry {
  CameraStream stream;
  std::string log_path;   //< Frame-timestamp log (shared by Azure modalities)
  std::string media_path; //< Container to decode
  size_t order = 0;       //< Position in the catalog
};

/**
 * @struct SkippedCamera
 * @brief A discovered camera that will not be processed, and why.
 */
struct SkippedCamera {
  std::string camera_id;
  std::string reason;
};

class CameraCatalog {
public:
  /**
   * @brief Find the cameras of `cfg.participant_id` under `cfg.base_path`.
   * @note Excluded cameras and cameras whose media is missing are listed in
   *       skipped(); media is not checked in stats-only mode.
   */
  static CameraCatalog discover(const PipelineConfig &cfg);

  /**
   * @brief Media path of a camera.
   * @throws MissingMediaError when the file does not exist
   */
  static std::string require_media(const std::string &camera_id,
                                   const std::string &path);

  const std::vector<CameraEntry> &cameras() const { return cameras_; }
  const std::vector<SkippedCamera> &skipped() const { return skipped_; }

  /// Distinct frame logs of the processed cameras, in catalog order
  std::vector<std::string> timestamp_logs() const;

  /// Catalog order: numeric ids ascending, then other ids alphabetically
  static bool camera_id_less(const std::string &a, const std::string &b);

private:
  std::vector<CameraEntry> cameras_;
  std::vector<SkippedCamera> skipped_;
};

} // namespace gesture_slicer

#endif // GESTURE_SLICER_CAMERA_CATALOG_HPP
