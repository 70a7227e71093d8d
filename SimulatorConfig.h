#ifndef SIMULATOR_CONFIG_H
#define SIMULATOR_CONFIG_H

#include <stdexcept>
#include <string>
#include <vector>

#include "FrameLayout.h"

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Everything one simulated camera needs, after defaults and per-camera
// overrides have been merged.
struct SimulatorConfig {
  std::string camera;
  std::string video_path;
  std::string api_url;
  std::string device_id;

  int rtsp_port = 8554;
  int fps = 15;
  std::string mount_path = "/simulation";
  int warmup_frames = 90;

  CropLayout layout;
  int queue_size = 30;
  int event_queue_size = 100;

  std::string timezone = "UTC";
  long http_timeout_ms = 500;
  int stats_interval = 30;          // seconds, 0 disables the periodic summary
  int grace_period_ms = 2000;

  bool verbose = false;

  // Throws ConfigError on the first problem found
  void validate(bool check_video_exists = true) const;
};

// Evaluate a Tcl config script in a private interpreter and extract the
// settings for `camera`. Throws ConfigError.
SimulatorConfig loadConfigFile(const std::string& path, const std::string& camera);
SimulatorConfig loadConfigScript(const std::string& script, const std::string& camera);

// Camera names defined by a config script, sorted
std::vector<std::string> listCameras(const std::string& script);

#endif // SIMULATOR_CONFIG_H
