#include "calx/security/tokens.hpp"

#include <algorithm>
#include <iomanip>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <sstream>
#include <vector>

namespace calx::security {

namespace {

constexpr std::size_t kDeviceTokenBytes = 16;

std::string to_hex(const unsigned char *data, const std::size_t size) {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < size; ++i) {
    stream << std::setw(2) << static_cast<int>(data[i]);
  }
  return stream.str();
}

} // namespace

common::Result<std::string> random_hex(const std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  if (bytes > 0 && RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    return common::Result<std::string>::failure("random source unavailable");
  }
  return common::Result<std::string>::success(to_hex(data.data(), data.size()));
}

common::Result<std::string> generate_device_token() {
  auto hex = random_hex(kDeviceTokenBytes);
  if (!hex.ok()) {
    return hex;
  }
  return common::Result<std::string>::success(std::string(kDeviceTokenPrefix) + hex.value());
}

std::string hmac_sha256_hex(const std::string &key, const std::string &message) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
       reinterpret_cast<const unsigned char *>(message.data()), message.size(), digest, &length);
  return to_hex(digest, length);
}

bool constant_time_equals(const std::string &a, const std::string &b) {
  const std::size_t max_size = std::max(a.size(), b.size());
  unsigned char diff = static_cast<unsigned char>(a.size() != b.size());

  for (std::size_t i = 0; i < max_size; ++i) {
    const unsigned char lhs = i < a.size() ? static_cast<unsigned char>(a[i]) : 0;
    const unsigned char rhs = i < b.size() ? static_cast<unsigned char>(b[i]) : 0;
    diff |= static_cast<unsigned char>(lhs ^ rhs);
  }

  return diff == 0;
}

} // namespace calx::security
