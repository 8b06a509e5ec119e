#pragma once

#include <HTTPClient.h>
#include <WiFiClientSecure.h>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>

#include "services/ConnectionSlots.h"
#include "services/HttpTransport.h"

// Each open TLS session holds roughly 40 KB of heap. Together with
// FANOUT_MAX_PARALLEL this bounds how many are open at once.
#ifndef HTTP_KEEPALIVE_SLOTS
#define HTTP_KEEPALIVE_SLOTS 2
#endif

// HTTPS over WiFiClientSecure with keep-alive. Connections are pooled per
// host; when every slot is busy a call falls back to a one-shot client.
class EspHttpTransport : public HttpTransport {
public:
  explicit EspHttpTransport(const char* rootCaPem);

  HttpResponse get(const std::string& url, const HttpHeaders& headers) override;
  HttpResponse post(const std::string& url, const HttpHeaders& headers, const std::string& body) override;

private:
  struct Connection {
    WiFiClientSecure tls;
    HTTPClient http;
    bool configured = false;
  };

  const char* rootCa_;
  SemaphoreHandle_t lock_;
  ConnectionSlots slots_;
  Connection conns_[HTTP_KEEPALIVE_SLOTS];

  HttpResponse request(const char* method, const std::string& url, const HttpHeaders& headers,
                       const std::string* body);
  void configure(WiFiClientSecure& tls);
  HttpResponse exchange(Connection& conn, const char* method, const std::string& url, const HttpHeaders& headers,
                        const std::string* body);
};
