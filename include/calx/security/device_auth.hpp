#pragma once

#include "calx/common/result.hpp"

#include <string>
#include <vector>

namespace calx::security {

struct DeviceCredential {
  std::string device_id;
  std::string token_hash;
};

[[nodiscard]] common::Result<DeviceCredential> parse_device_entry(const std::string &entry);

/// Verifies `Authorization: Bearer dev_tok_...` headers against HMAC-SHA256
/// hashes of issued device tokens.
class DeviceAuthenticator {
public:
  DeviceAuthenticator(std::string secret, std::vector<DeviceCredential> credentials);

  static common::Result<DeviceAuthenticator> from_entries(std::string secret,
                                                          const std::vector<std::string> &entries);

  [[nodiscard]] common::Result<std::string> authenticate(const std::string &authorization) const;

  [[nodiscard]] std::string hash_token(const std::string &token) const;
  [[nodiscard]] std::size_t device_count() const { return credentials_.size(); }

private:
  std::string secret_;
  std::vector<DeviceCredential> credentials_;
};

} // namespace calx::security
