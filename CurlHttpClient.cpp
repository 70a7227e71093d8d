#include "CurlHttpClient.h"

#include <mutex>
#include <stdexcept>

namespace {

// Collects the response body; the dispatcher only looks at the status
size_t appendResponse(char* data, size_t size, size_t nmemb, void* userdata)
{
  std::string* response = static_cast<std::string*>(userdata);
  response->append(data, size * nmemb);
  return size * nmemb;
}

} // namespace

void CurlHttpClient::globalInit()
{
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

CurlHttpClient::CurlHttpClient(long timeout_ms)
  : handle_(nullptr), headers_(nullptr), timeout_ms_(timeout_ms)
{
  globalInit();

  handle_ = curl_easy_init();
  if (!handle_) throw std::runtime_error("CurlHttpClient: curl_easy_init failed");

  headers_ = curl_slist_append(headers_, "Content-Type: application/json");
  headers_ = curl_slist_append(headers_, "User-Agent: rtspsim");
}

CurlHttpClient::~CurlHttpClient()
{
  curl_slist_free_all(headers_);
  if (handle_) curl_easy_cleanup(handle_);
}

HttpResult CurlHttpClient::postJson(const std::string& url, const std::string& body)
{
  std::string resp;
  long code = 0;

  curl_easy_setopt(handle_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle_, CURLOPT_HTTPHEADER, headers_);
  curl_easy_setopt(handle_, CURLOPT_POST, 1L);
  curl_easy_setopt(handle_, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(handle_, CURLOPT_WRITEFUNCTION, appendResponse);
  curl_easy_setopt(handle_, CURLOPT_WRITEDATA, &resp);
  curl_easy_setopt(handle_, CURLOPT_TIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(handle_, CURLOPT_NOSIGNAL, 1L);

  CURLcode rc = curl_easy_perform(handle_);
  if (rc == CURLE_OPERATION_TIMEDOUT) {
    return {HttpStatus::TIMEOUT, 0, curl_easy_strerror(rc)};
  }
  if (rc != CURLE_OK) {
    return {HttpStatus::TRANSPORT_ERROR, 0, curl_easy_strerror(rc)};
  }

  curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
  if (code < 200 || code >= 300) {
    return {HttpStatus::HTTP_ERROR, code, "HTTP " + std::to_string(code)};
  }
  return {HttpStatus::OK, code, ""};
}
