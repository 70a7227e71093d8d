#ifndef DEVICE_TABLE_H
#define DEVICE_TABLE_H

#include <map>
#include <string>

// Device id used when a camera has no entry in the table
extern const char* const kUndefinedDeviceId;

// Fixed camera name -> checkout device id table
const std::map<std::string, std::string>& cameraDeviceTable();

// Table lookup; falls back to kUndefinedDeviceId
std::string resolveDeviceId(const std::string& camera_name);

#endif // DEVICE_TABLE_H
