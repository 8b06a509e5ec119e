#pragma once

#include <string>
#include <vector>

struct HttpHeader {
  std::string name;
  std::string value;
};

using HttpHeaders = std::vector<HttpHeader>;

struct HttpResponse {
  int status = 0;    // <= 0: transport failure, body holds the reason
  std::string body;

  bool transportError() const { return status <= 0; }
};

// Implementations must tolerate calls from several fan-out tasks at once.
class HttpTransport {
public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse get(const std::string& url, const HttpHeaders& headers) = 0;
  virtual HttpResponse post(const std::string& url, const HttpHeaders& headers, const std::string& body) = 0;
};
