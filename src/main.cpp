/**
 * @file main.cpp
 * @brief Entry point for Gesture Slicer
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Configuration from environment variables
 *
 *          - SIGINT / SIGTERM as a cooperative stop request
 *
 * @note Usage: gesture_slicer <participant_id> [base_path]
 *       All tunables are read from the environment (see config.hpp).
 */

#include <csignal>
#include <cstdio>
#include <exception>
#include <string>

#include "gesture_slicer/config.hpp"
#include "gesture_slicer/errors.hpp"
#include "gesture_slicer/logging.hpp"
#include "gesture_slicer/pipeline.hpp"

using namespace gesture_slicer;

namespace {

RunControl run_control;

extern "C" void handle_stop_signal(int) { run_control.request_stop(); }

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 2 || argc > 3) {
    LOG_WARN("Usage: ./gesture_slicer <participant_id> [base_path]");
    return 1;
  }

  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);

  try {
    PipelineConfig cfg = PipelineConfig::from_env();
    cfg.participant_id = argv[1];
    if (argc == 3)
      cfg.base_path = argv[2];
    cfg.validate();

    ParticipantPipeline pipeline(cfg, &run_control);
    RunResult result = pipeline.run();

    if (result.cancelled) {
      LOG_WARN("Stopped before all segments were cut");
      return 130;
    }
    return 0;
  } catch (const MalformedLogError &e) {
    LOG_ERROR("Malformed log: {}", e.what());
  } catch (const std::invalid_argument &e) {
    LOG_ERROR("Invalid configuration: {}", e.what());
  } catch (const std::exception &e) {
    LOG_ERROR("{}", e.what());
  }
  return 1;
}
