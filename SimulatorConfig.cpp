#include "SimulatorConfig.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <sstream>

#include <tcl.h>

#include "DeviceTable.h"
#include "SimClock.h"

namespace {

typedef std::unique_ptr<Tcl_Interp, void (*)(Tcl_Interp*)> InterpPtr;

InterpPtr evalScript(const std::string& script)
{
  static std::once_flag tcl_init;
  std::call_once(tcl_init, [] { Tcl_FindExecutable(nullptr); });

  InterpPtr interp(Tcl_CreateInterp(), Tcl_DeleteInterp);
  if (!interp) {
    throw ConfigError("cannot create Tcl interpreter");
  }
  if (Tcl_Eval(interp.get(), script.c_str()) != TCL_OK) {
    throw ConfigError(std::string("config script error: ") +
                      Tcl_GetStringResult(interp.get()));
  }
  return interp;
}

Tcl_Obj* getDictVar(Tcl_Interp* interp, const char* name, bool required)
{
  Tcl_Obj* obj = Tcl_GetVar2Ex(interp, name, nullptr, TCL_GLOBAL_ONLY);
  if (!obj) {
    if (required) throw ConfigError(std::string("config does not set '") + name + "'");
    return nullptr;
  }
  int size = 0;
  if (Tcl_DictObjSize(interp, obj, &size) != TCL_OK) {
    throw ConfigError(std::string("'") + name + "' is not a dict");
  }
  return obj;
}

std::vector<std::string> dictKeys(Tcl_Interp* interp, Tcl_Obj* dict)
{
  std::vector<std::string> keys;
  Tcl_DictSearch search;
  Tcl_Obj* key = nullptr;
  Tcl_Obj* value = nullptr;
  int done = 0;
  if (Tcl_DictObjFirst(interp, dict, &search, &key, &value, &done) != TCL_OK) {
    return keys;
  }
  for (; !done; Tcl_DictObjNext(&search, &key, &value, &done)) {
    keys.push_back(Tcl_GetString(key));
  }
  Tcl_DictObjDone(&search);
  std::sort(keys.begin(), keys.end());
  return keys;
}

// Looks a key up in the camera dict first, then in defaults
class Settings {
public:
  Settings(Tcl_Interp* interp, Tcl_Obj* camera, Tcl_Obj* defaults)
    : interp_(interp), camera_(camera), defaults_(defaults) {}

  Tcl_Obj* find(const char* key) const {
    Tcl_Obj* value = lookup(camera_, key);
    if (!value) value = lookup(defaults_, key);
    return value;
  }

  bool getString(const char* key, std::string& out) const {
    Tcl_Obj* value = find(key);
    if (!value) return false;
    out = Tcl_GetString(value);
    return true;
  }

  template <typename T>
  void getNumber(const char* key, T& out) const {
    Tcl_Obj* value = find(key);
    if (!value) return;
    Tcl_WideInt number = 0;
    if (Tcl_GetWideIntFromObj(interp_, value, &number) != TCL_OK) {
      throw ConfigError(std::string("'") + key + "' must be an integer, got '" +
                        Tcl_GetString(value) + "'");
    }
    if (number < static_cast<Tcl_WideInt>(std::numeric_limits<T>::min()) ||
        number > static_cast<Tcl_WideInt>(std::numeric_limits<T>::max())) {
      throw ConfigError(std::string("'") + key + "' out of range: " +
                        Tcl_GetString(value));
    }
    out = static_cast<T>(number);
  }

private:
  Tcl_Interp* interp_;
  Tcl_Obj* camera_;
  Tcl_Obj* defaults_;

  Tcl_Obj* lookup(Tcl_Obj* dict, const char* key) const {
    if (!dict) return nullptr;
    Tcl_Obj* keyObj = Tcl_NewStringObj(key, -1);
    Tcl_IncrRefCount(keyObj);
    Tcl_Obj* value = nullptr;
    int rc = Tcl_DictObjGet(interp_, dict, keyObj, &value);
    Tcl_DecrRefCount(keyObj);
    return rc == TCL_OK ? value : nullptr;
  }
};

SimulatorConfig extract(Tcl_Interp* interp, const std::string& camera)
{
  Tcl_Obj* cameras = getDictVar(interp, "cameras", true);
  Tcl_Obj* defaults = getDictVar(interp, "defaults", false);

  Tcl_Obj* nameObj = Tcl_NewStringObj(camera.c_str(), -1);
  Tcl_IncrRefCount(nameObj);
  Tcl_Obj* cameraDict = nullptr;
  Tcl_DictObjGet(interp, cameras, nameObj, &cameraDict);
  Tcl_DecrRefCount(nameObj);

  if (!cameraDict) {
    std::ostringstream msg;
    msg << "camera '" << camera << "' not found in config; available:";
    for (const auto& name : dictKeys(interp, cameras)) msg << " " << name;
    throw ConfigError(msg.str());
  }
  int size = 0;
  if (Tcl_DictObjSize(interp, cameraDict, &size) != TCL_OK) {
    throw ConfigError("settings for camera '" + camera + "' are not a dict");
  }

  Settings settings(interp, cameraDict, defaults);
  SimulatorConfig config;
  config.camera = camera;

  if (!settings.getString("video", config.video_path) || config.video_path.empty()) {
    throw ConfigError("camera '" + camera + "' has no 'video'");
  }
  if (!settings.getString("api_url", config.api_url) || config.api_url.empty()) {
    throw ConfigError("camera '" + camera + "' has no 'api_url'");
  }
  if (!settings.getString("device_id", config.device_id) || config.device_id.empty()) {
    config.device_id = resolveDeviceId(camera);
  }

  settings.getNumber("rtsp_port", config.rtsp_port);
  settings.getNumber("fps", config.fps);
  settings.getString("mount_path", config.mount_path);
  settings.getNumber("warmup_frames", config.warmup_frames);

  settings.getNumber("original_width", config.layout.original_width);
  settings.getNumber("original_height", config.layout.original_height);
  settings.getNumber("frame_width", config.layout.frame_width);
  settings.getNumber("frame_height", config.layout.frame_height);
  settings.getNumber("qrcode_size", config.layout.code_size);
  settings.getNumber("queue_size", config.queue_size);
  settings.getNumber("event_queue_size", config.event_queue_size);

  settings.getString("timezone", config.timezone);
  settings.getNumber("http_timeout_ms", config.http_timeout_ms);
  settings.getNumber("stats_interval", config.stats_interval);
  settings.getNumber("grace_period_ms", config.grace_period_ms);

  return config;
}

} // namespace

void SimulatorConfig::validate(bool check_video_exists) const
{
  if (check_video_exists && !std::filesystem::exists(video_path)) {
    throw ConfigError("video file not found: " + video_path);
  }
  if (fps <= 0) throw ConfigError("fps must be positive");
  if (rtsp_port <= 0 || rtsp_port > 65535) {
    throw ConfigError("rtsp_port out of range: " + std::to_string(rtsp_port));
  }
  if (queue_size <= 0 || event_queue_size <= 0) {
    throw ConfigError("queue sizes must be positive");
  }
  if (http_timeout_ms <= 0) throw ConfigError("http_timeout_ms must be positive");
  if (stats_interval < 0 || grace_period_ms < 0) {
    throw ConfigError("stats_interval and grace_period_ms must not be negative");
  }
  if (mount_path.empty() || mount_path[0] != '/') {
    throw ConfigError("mount_path must start with '/': " + mount_path);
  }

  std::string reason;
  if (!layout.isValid(&reason)) {
    throw ConfigError("bad frame layout: " + reason);
  }
}

SimulatorConfig loadConfigScript(const std::string& script, const std::string& camera)
{
  InterpPtr interp = evalScript(script);
  SimulatorConfig config = extract(interp.get(), camera);
  config.validate();

  if (!isKnownTimezone(config.timezone)) {
    std::cerr << "SimulatorConfig: unknown timezone '" << config.timezone
              << "', using UTC" << std::endl;
    config.timezone = "UTC";
  }
  return config;
}

SimulatorConfig loadConfigFile(const std::string& path, const std::string& camera)
{
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file: " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return loadConfigScript(buffer.str(), camera);
}

std::vector<std::string> listCameras(const std::string& script)
{
  InterpPtr interp = evalScript(script);
  Tcl_Obj* cameras = getDictVar(interp.get(), "cameras", true);
  return dictKeys(interp.get(), cameras);
}
