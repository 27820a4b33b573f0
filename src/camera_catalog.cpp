/**
 * @file camera_catalog.cpp
 * @brief Dataset layout and camera discovery implementation
 */

#include "gesture_slicer/camera_catalog.hpp"

#include <algorithm>
#include <filesystem>

#include <fmt/core.h>

#include "gesture_slicer/config.hpp"
#include "gesture_slicer/errors.hpp"
#include "gesture_slicer/logging.hpp"

namespace gesture_slicer {

namespace fs = std::filesystem;

namespace {

constexpr const char *LOG_PREFIX = "webcam_";
constexpr const char *AZURE_NAME = "azure_kinect";
constexpr const char *LABELED_SUFFIX = "_labeled";

bool is_number(const std::string &s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
           return c >= '0' && c <= '9';
         });
}

const char *azure_suffix(CameraModality modality) {
  switch (modality) {
  case CameraModality::AzureColor:
    return "color";
  case CameraModality::AzureDepth:
    return "depth";
  case CameraModality::AzureIr:
    return "ir";
  case CameraModality::Webcam:
    break;
  }
  return "";
}

} // anonymous namespace

// **---- Layout ----**

namespace Layout {

std::string camera_log_dir(const std::string &base, const std::string &pid) {
  return (fs::path(base) / "logs" / pid).string();
}

std::string webcam_log(const std::string &base, const std::string &pid,
                       const std::string &camera_id) {
  return (fs::path(camera_log_dir(base, pid)) /
          fmt::format("{}{}.csv", LOG_PREFIX, camera_id))
      .string();
}

std::string webcam_media(const std::string &base, const std::string &pid,
                         const std::string &camera_id) {
  return (fs::path(base) / "images" / pid / camera_id /
          fmt::format("{}{}.mp4", LOG_PREFIX, camera_id))
      .string();
}

std::string azure_log(const std::string &base, const std::string &pid) {
  return webcam_log(base, pid, AZURE_NAME);
}

std::string azure_media(const std::string &base, const std::string &pid,
                        CameraModality modality) {
  return (fs::path(base) / "images" / pid / "azure" /
          fmt::format("{}{}_{}.mp4", LOG_PREFIX, AZURE_NAME,
                      azure_suffix(modality)))
      .string();
}

std::string output_dir(const std::string &base, const std::string &pid) {
  return (fs::path(base) / "post-processed" / pid).string();
}

std::string camera_output_dir(const std::string &base, const std::string &pid,
                              const std::string &camera_id) {
  return (fs::path(output_dir(base, pid)) / fmt::format("camera_{}", camera_id))
      .string();
}

std::string manifest_path(const std::string &base, const std::string &pid) {
  return (fs::path(output_dir(base, pid)) / "training_summary.csv").string();
}

std::string labeled_log(const std::string &log_path) {
  fs::path p(log_path);
  return (p.parent_path() /
          fmt::format("{}{}.csv", p.stem().string(), LABELED_SUFFIX))
      .string();
}

} // namespace Layout

// **---- CameraCatalog ----**

bool CameraCatalog::camera_id_less(const std::string &a, const std::string &b) {
  const bool na = is_number(a);
  const bool nb = is_number(b);
  if (na != nb)
    return na;
  if (na) {
    /// Compare numerically without overflow: strip zeros, then length
    auto strip = [](const std::string &s) {
      size_t p = s.find_first_not_of('0');
      return p == std::string::npos ? std::string("0") : s.substr(p);
    };
    std::string sa = strip(a), sb = strip(b);
    if (sa.size() != sb.size())
      return sa.size() < sb.size();
    if (sa != sb)
      return sa < sb;
  }
  return a < b;
}

std::string CameraCatalog::require_media(const std::string &camera_id,
                                         const std::string &path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec))
    throw MissingMediaError(camera_id, path);
  return path;
}

CameraCatalog CameraCatalog::discover(const PipelineConfig &cfg) {
  CameraCatalog catalog;
  const std::string &base = cfg.base_path;
  const std::string &pid = cfg.participant_id;
  const std::string log_dir = Layout::camera_log_dir(base, pid);

  std::error_code ec;
  if (!fs::is_directory(log_dir, ec)) {
    LOG_WARN("No camera log directory at {}", log_dir);
    return catalog;
  }

  // **--- SCAN FRAME LOGS ---**

  std::vector<CameraEntry> found;
  const std::string prefix = LOG_PREFIX;
  const std::string labeled = LABELED_SUFFIX;
  for (const auto &entry : fs::directory_iterator(log_dir)) {
    if (!entry.is_regular_file())
      continue;
    const fs::path &p = entry.path();
    if (p.extension() != ".csv")
      continue;
    const std::string stem = p.stem().string();
    if (stem.compare(0, prefix.size(), prefix) != 0)
      continue;
    if (stem.size() > labeled.size() &&
        stem.compare(stem.size() - labeled.size(), labeled.size(), labeled) == 0)
      continue; // Our own output

    const std::string id = stem.substr(prefix.size());
    if (id.empty())
      continue;

    if (id == AZURE_NAME) {
      for (CameraModality m : {CameraModality::AzureColor,
                               CameraModality::AzureDepth,
                               CameraModality::AzureIr}) {
        CameraEntry cam;
        cam.stream.camera_id = modality_name(m);
        cam.stream.modality = m;
        cam.log_path = p.string();
        cam.media_path = Layout::azure_media(base, pid, m);
        found.push_back(std::move(cam));
      }
    } else {
      CameraEntry cam;
      cam.stream.camera_id = id;
      cam.stream.modality = CameraModality::Webcam;
      cam.log_path = p.string();
      cam.media_path = Layout::webcam_media(base, pid, id);
      found.push_back(std::move(cam));
    }
  }

  std::sort(found.begin(), found.end(),
            [](const CameraEntry &a, const CameraEntry &b) {
              return camera_id_less(a.stream.camera_id, b.stream.camera_id);
            });

  // **--- FILTER ---**

  for (auto &cam : found) {
    const std::string &id = cam.stream.camera_id;
    if (std::find(cfg.excluded_cameras.begin(), cfg.excluded_cameras.end(),
                  id) != cfg.excluded_cameras.end()) {
      catalog.skipped_.push_back({id, "excluded"});
      continue;
    }

    if (!cfg.stats_only) {
      try {
        require_media(id, cam.media_path);
      } catch (const MissingMediaError &e) {
        LOG_WARN("[Camera {}] {}; skipping camera", id, e.what());
        catalog.skipped_.push_back({id, "missing media"});
        continue;
      }
    }

    cam.order = catalog.cameras_.size();
    catalog.cameras_.push_back(std::move(cam));
  }
  return catalog;
}

std::vector<std::string> CameraCatalog::timestamp_logs() const {
  std::vector<std::string> logs;
  for (const auto &cam : cameras_) {
    if (std::find(logs.begin(), logs.end(), cam.log_path) == logs.end())
      logs.push_back(cam.log_path);
  }
  return logs;
}

} // namespace gesture_slicer
