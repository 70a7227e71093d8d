#ifndef CODE_PAYLOAD_H
#define CODE_PAYLOAD_H

#include <cstdint>
#include <memory>
#include <string>

#include <jansson.h>

// Text read from an optical code, with the timestamp of the frame it was
// found in. `structured` is set when the text parses as JSON.
struct CodePayload {
  std::string raw;
  std::shared_ptr<json_t> structured;
  int64_t sim_time = 0;
  int64_t frame_id = 0;

  bool isStructured() const { return structured != nullptr; }
};

// JSON value for `text`, or null when it is not valid JSON
std::shared_ptr<json_t> parseStructured(const std::string& text);

CodePayload makeCodePayload(const std::string& text, int64_t sim_time, int64_t frame_id = 0);

#endif // CODE_PAYLOAD_H
