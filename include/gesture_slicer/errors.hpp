/**
 * @file errors.hpp
 * @brief Exceptions for failures that leave a stage with nothing to work on
 *
 * @details Only two conditions are exceptional:
 *
 *          - MalformedLogError: a gesture or timestamp log cannot be used at
 *            all. Fatal for the participant run.
 *
 *          - MissingMediaError: a camera's media container is absent. The
 *            pipeline catches it and skips that camera.
 *
 * @note Corrupted frame rows, empty windows and short windows are not
 *       exceptions; they are counted and surfaced as manifest flags.
 */

#ifndef GESTURE_SLICER_ERRORS_HPP
#define GESTURE_SLICER_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace gesture_slicer {

/**
 * @class MalformedLogError
 * @brief A gesture or frame-timestamp log is missing, empty or unparsable.
 */
class MalformedLogError : public std::runtime_error {
public:
  MalformedLogError(const std::string &path, const std::string &what)
      : std::runtime_error(path + ": " + what), path_(path) {}

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

/**
 * @class MissingMediaError
 * @brief The media container expected for a camera does not exist.
 */
class MissingMediaError : public std::runtime_error {
public:
  MissingMediaError(const std::string &camera_id, const std::string &path)
      : std::runtime_error("camera " + camera_id + ": media not found: " +
                           path),
        camera_id_(camera_id) {}

  const std::string &camera_id() const { return camera_id_; }

private:
  std::string camera_id_;
};

} // namespace gesture_slicer

#endif // GESTURE_SLICER_ERRORS_HPP
