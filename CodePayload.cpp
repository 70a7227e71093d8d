#include "CodePayload.h"

std::shared_ptr<json_t> parseStructured(const std::string& text)
{
  json_error_t error;
  json_t* value = json_loadb(text.data(), text.size(), JSON_DECODE_ANY, &error);
  if (!value) {
    return nullptr;
  }
  return std::shared_ptr<json_t>(value, [](json_t* v) { json_decref(v); });
}

CodePayload makeCodePayload(const std::string& text, int64_t sim_time, int64_t frame_id)
{
  CodePayload payload;
  payload.raw = text;
  payload.structured = parseStructured(text);
  payload.sim_time = sim_time;
  payload.frame_id = frame_id;
  return payload;
}
