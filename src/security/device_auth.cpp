#include "calx/security/device_auth.hpp"

#include "calx/common/fs.hpp"
#include "calx/security/tokens.hpp"

namespace calx::security {

namespace {

constexpr const char *kBearerPrefix = "bearer ";

} // namespace

common::Result<DeviceCredential> parse_device_entry(const std::string &entry) {
  const auto colon = entry.rfind(':');
  if (colon == std::string::npos) {
    return common::Result<DeviceCredential>::failure("device entry must be <device_id>:<hash>: " +
                                                     entry);
  }
  DeviceCredential credential{.device_id = common::trim(entry.substr(0, colon)),
                              .token_hash = common::to_lower(common::trim(entry.substr(colon + 1)))};
  if (credential.device_id.empty() || credential.token_hash.empty()) {
    return common::Result<DeviceCredential>::failure("device entry must be <device_id>:<hash>: " +
                                                     entry);
  }
  return common::Result<DeviceCredential>::success(std::move(credential));
}

DeviceAuthenticator::DeviceAuthenticator(std::string secret,
                                         std::vector<DeviceCredential> credentials)
    : secret_(std::move(secret)), credentials_(std::move(credentials)) {}

common::Result<DeviceAuthenticator>
DeviceAuthenticator::from_entries(std::string secret, const std::vector<std::string> &entries) {
  if (secret.empty()) {
    return common::Result<DeviceAuthenticator>::failure("device token secret is empty");
  }
  std::vector<DeviceCredential> credentials;
  credentials.reserve(entries.size());
  for (const auto &entry : entries) {
    auto parsed = parse_device_entry(entry);
    if (!parsed.ok()) {
      return common::Result<DeviceAuthenticator>::failure(parsed.error());
    }
    credentials.push_back(parsed.value());
  }
  return common::Result<DeviceAuthenticator>::success(
      DeviceAuthenticator(std::move(secret), std::move(credentials)));
}

common::Result<std::string>
DeviceAuthenticator::authenticate(const std::string &authorization) const {
  const std::string header = common::trim(authorization);
  if (header.size() <= 7 || common::to_lower(header.substr(0, 7)) != kBearerPrefix) {
    return common::Result<std::string>::failure("missing bearer token");
  }

  const std::string token = common::trim(header.substr(7));
  if (!common::starts_with(token, kDeviceTokenPrefix)) {
    return common::Result<std::string>::failure("invalid device token");
  }

  const std::string presented = hash_token(token);
  // No early exit: every credential is compared.
  const DeviceCredential *match = nullptr;
  for (const auto &credential : credentials_) {
    if (constant_time_equals(presented, credential.token_hash) && match == nullptr) {
      match = &credential;
    }
  }
  if (match == nullptr) {
    return common::Result<std::string>::failure("invalid device token");
  }
  return common::Result<std::string>::success(match->device_id);
}

std::string DeviceAuthenticator::hash_token(const std::string &token) const {
  return hmac_sha256_hex(secret_, token);
}

} // namespace calx::security
