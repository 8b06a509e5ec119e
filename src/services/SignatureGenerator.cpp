#include "services/SignatureGenerator.h"

#include <cstdio>
#include <cstring>
#include <ctime>

#include <mbedtls/cipher.h>
#include <mbedtls/cmac.h>

namespace {

uint32_t systemClock() {
  return static_cast<uint32_t>(std::time(nullptr));
}

int hexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

SignatureGenerator::SignatureGenerator(Clock clock)
: clock_(clock ? clock : systemClock) {}

bool SignatureGenerator::decodeKey(const std::string& secretHex, uint8_t out[16]) {
  if (secretHex.size() != 32) return false;
  for (size_t i = 0; i < 16; ++i) {
    const int hi = hexNibble(secretHex[2 * i]);
    const int lo = hexNibble(secretHex[2 * i + 1]);
    if (hi < 0 || lo < 0) return false;
    out[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return true;
}

SignError SignatureGenerator::sign(const std::string& secretHex, std::string& outHex) const {
  return signAt(clock_(), secretHex, outHex);
}

SignError SignatureGenerator::signAt(uint32_t unixSeconds, const std::string& secretHex, std::string& outHex) const {
  uint8_t key[16];
  if (!decodeKey(secretHex, key)) return SignError::invalid_key;

  // Little-endian bytes 1..3; the most significant byte is dropped.
  const uint8_t msg[3] = {
    static_cast<uint8_t>(unixSeconds >> 8),
    static_cast<uint8_t>(unixSeconds >> 16),
    static_cast<uint8_t>(unixSeconds >> 24),
  };

  const mbedtls_cipher_info_t* info = mbedtls_cipher_info_from_type(MBEDTLS_CIPHER_AES_128_ECB);
  uint8_t tag[16];
  const int rc = info ? mbedtls_cipher_cmac(info, key, 128, msg, sizeof(msg), tag) : -1;
  std::memset(key, 0, sizeof(key));
  if (rc != 0) return SignError::cipher_failure;

  char hex[sizeof(tag) * 2 + 1];
  for (size_t i = 0; i < sizeof(tag); ++i) {
    std::snprintf(hex + 2 * i, 3, "%02x", tag[i]);
  }
  outHex.assign(hex, sizeof(tag) * 2);
  return SignError::none;
}
