#ifndef CURL_HTTP_CLIENT_H
#define CURL_HTTP_CLIENT_H

#include <curl/curl.h>

#include "IHttpClient.h"

// libcurl transport. One easy handle is reused for every request so the
// connection to the API stays open; use from a single thread only.
class CurlHttpClient : public IHttpClient {
private:
  CURL* handle_;
  struct curl_slist* headers_;
  long timeout_ms_;

public:
  explicit CurlHttpClient(long timeout_ms = 500);
  ~CurlHttpClient();

  CurlHttpClient(const CurlHttpClient&) = delete;
  CurlHttpClient& operator=(const CurlHttpClient&) = delete;

  HttpResult postJson(const std::string& url, const std::string& body) override;

  // Process-wide libcurl setup; safe to call more than once
  static void globalInit();
};

#endif
