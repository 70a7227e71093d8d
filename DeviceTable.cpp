#include "DeviceTable.h"

const char* const kUndefinedDeviceId = "UNDEFINE_SCO_ID";

const std::map<std::string, std::string>& cameraDeviceTable()
{
  static const std::map<std::string, std::string> table = {
    {"cam1", "CFRW1CSCOPO6776"},
    {"cam2", "CFRW1CSCOPO6541"},
    {"cam3", "CFRW1CSCOPO1189"},
    {"cam4", "CFRW1CSCOPO6592"},
    {"cam5", "CFRW1CSCOPO6591"},
    {"cam6", "CFRW1CSCOPO6744"},
    {"cam7", "CFRW1CSCOPO6714"},
    {"cam8", "CFRW1CSCOPO8300"},
    {"cam9", "CFRW1CSCOPO1007"},
    {"cam10", "CFRW1CSCOPO8209"},
    {"cam11", "CFRW1CSCOPO8208"},
  };
  return table;
}

std::string resolveDeviceId(const std::string& camera_name)
{
  const auto& table = cameraDeviceTable();
  auto it = table.find(camera_name);
  return (it != table.end()) ? it->second : kUndefinedDeviceId;
}
