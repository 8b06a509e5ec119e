#include "drivers/EspHttpTransport.h"

#include <WiFi.h>

#include "services/Logger.h"

namespace {
constexpr const char* kTag = "HTTP";
} // namespace

EspHttpTransport::EspHttpTransport(const char* rootCaPem)
: rootCa_(rootCaPem), lock_(xSemaphoreCreateMutex()), slots_(HTTP_KEEPALIVE_SLOTS) {
  if (!rootCa_ || !*rootCa_) {
    Log::warn(kTag, "no root CA configured; server certificates are not verified");
  }
}

HttpResponse EspHttpTransport::get(const std::string& url, const HttpHeaders& headers) {
  return request("GET", url, headers, nullptr);
}

HttpResponse EspHttpTransport::post(const std::string& url, const HttpHeaders& headers, const std::string& body) {
  return request("POST", url, headers, &body);
}

void EspHttpTransport::configure(WiFiClientSecure& tls) {
  if (rootCa_ && *rootCa_) {
    tls.setCACert(rootCa_);
  } else {
    tls.setInsecure();
  }
}

HttpResponse EspHttpTransport::request(const char* method, const std::string& url, const HttpHeaders& headers,
                                       const std::string* body) {
  if (WiFi.status() != WL_CONNECTED) {
    HttpResponse out;
    out.status = -1;
    out.body = "wifi not connected";
    return out;
  }

  bool sameHost = false;
  int slot = -1;
  if (lock_ && xSemaphoreTake(lock_, portMAX_DELAY) == pdTRUE) {
    slot = slots_.acquire(ConnectionSlots::hostOf(url), sameHost);
    xSemaphoreGive(lock_);
  }

  if (slot < 0) {
    Connection oneShot;
    configure(oneShot.tls);
    oneShot.http.setReuse(false);
    return exchange(oneShot, method, url, headers, body);
  }

  Connection& conn = conns_[slot];
  if (!conn.configured) {
    configure(conn.tls);
    conn.http.setReuse(true);
    conn.configured = true;
  }
  // HTTPClient reuses any open socket, so never hand it one to another host.
  if (!sameHost) conn.tls.stop();

  const HttpResponse out = exchange(conn, method, url, headers, body);

  const bool keepAlive = conn.tls.connected();
  if (xSemaphoreTake(lock_, portMAX_DELAY) == pdTRUE) {
    slots_.release(slot, keepAlive);
    xSemaphoreGive(lock_);
  }
  return out;
}

HttpResponse EspHttpTransport::exchange(Connection& conn, const char* method, const std::string& url,
                                        const HttpHeaders& headers, const std::string* body) {
  HttpResponse out;
  if (!conn.http.begin(conn.tls, url.c_str())) {
    out.status = -1;
    out.body = "begin failed";
    return out;
  }
  for (const auto& h : headers) {
    conn.http.addHeader(h.name.c_str(), h.value.c_str());
  }

  const int code = body ? conn.http.POST(reinterpret_cast<uint8_t*>(const_cast<char*>(body->data())), body->size())
                        : conn.http.GET();
  if (code <= 0) {
    out.status = code == 0 ? -1 : code;
    out.body = HTTPClient::errorToString(code).c_str();
#if APP_VERBOSE_LOG
    Log::debug(kTag, "%s failed: %s", method, out.body.c_str());
#endif
    conn.tls.stop();
  } else {
    out.status = code;
    out.body = conn.http.getString().c_str();
  }
  // Keeps the socket open when the server allowed keep-alive.
  conn.http.end();
  return out;
}
