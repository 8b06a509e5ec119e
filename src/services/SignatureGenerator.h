#pragma once

#include <stdint.h>
#include <string>

enum class SignError { none, invalid_key, cipher_failure };

static inline const char* toString(SignError e) {
  switch (e) {
    case SignError::none:           return "none";
    case SignError::invalid_key:    return "invalid_key";
    case SignError::cipher_failure: return "cipher_failure";
    default:                        return "unknown";
  }
}

// AES-128 CMAC over the low 3 bytes of the little-endian UNIX time.
// The vendor accepts the tag only inside the current time window.
class SignatureGenerator {
public:
  using Clock = uint32_t (*)();

  explicit SignatureGenerator(Clock clock = nullptr);

  SignError sign(const std::string& secretHex, std::string& outHex) const;
  SignError signAt(uint32_t unixSeconds, const std::string& secretHex, std::string& outHex) const;

  static bool decodeKey(const std::string& secretHex, uint8_t out[16]);

private:
  Clock clock_;
};
