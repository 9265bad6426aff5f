#pragma once

#include "calx/common/result.hpp"

#include <cstddef>
#include <string>

namespace calx::security {

constexpr const char *kDeviceTokenPrefix = "dev_tok_";

[[nodiscard]] common::Result<std::string> random_hex(std::size_t bytes);

[[nodiscard]] common::Result<std::string> generate_device_token();

[[nodiscard]] std::string hmac_sha256_hex(const std::string &key, const std::string &message);

[[nodiscard]] bool constant_time_equals(const std::string &a, const std::string &b);

} // namespace calx::security
