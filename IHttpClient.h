#ifndef IHTTP_CLIENT_H
#define IHTTP_CLIENT_H

#include <string>

enum class HttpStatus {
  OK,                 // 2xx response
  TIMEOUT,
  TRANSPORT_ERROR,    // connect, DNS, reset...
  HTTP_ERROR          // server answered with a non-2xx status
};

struct HttpResult {
  HttpStatus status;
  long code;            // HTTP status code, 0 when no response
  std::string error;    // transport message, empty on success
};

class IHttpClient {
public:
  virtual ~IHttpClient() = default;

  // Single attempt, never retried
  virtual HttpResult postJson(const std::string& url, const std::string& body) = 0;
};

#endif
