#include "SimClock.h"

#include <chrono>
#include <ctime>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>

namespace
{
  std::mutex tz_mutex;
  std::string tz_name = "UTC";
}

int64_t currentTimestampMs()
{
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

bool isKnownTimezone(const std::string& name)
{
  if (name.empty()) return false;
  if (name == "UTC" || name == "GMT") return true;
  if (name.find("..") != std::string::npos || name[0] == '/') return false;

  std::ifstream zone("/usr/share/zoneinfo/" + name, std::ios::binary);
  return zone.good();
}

bool setDisplayTimezone(const std::string& name)
{
  bool known = isKnownTimezone(name);
  if (!known) {
    std::cerr << "Unknown timezone '" << name << "', falling back to UTC" << std::endl;
  }

  std::lock_guard<std::mutex> lock(tz_mutex);
  tz_name = known ? name : "UTC";
  setenv("TZ", tz_name.c_str(), 1);
  tzset();
  return known;
}

std::string displayTimezone()
{
  std::lock_guard<std::mutex> lock(tz_mutex);
  return tz_name;
}

std::string formatTimestamp(int64_t timestamp_ms)
{
  std::time_t seconds = static_cast<std::time_t>(timestamp_ms / 1000);
  std::tm local{};
  localtime_r(&seconds, &local);

  char buf[32];
  size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
  return std::string(buf, n);
}
