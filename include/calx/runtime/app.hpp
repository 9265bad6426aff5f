#pragma once

#include "calx/common/result.hpp"
#include "calx/config/schema.hpp"
#include "calx/continuation/store.hpp"
#include "calx/providers/traits.hpp"
#include "calx/query/service.hpp"
#include "calx/security/device_auth.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace calx::runtime {

class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;
  [[nodiscard]] config::Config &mutable_config();
  [[nodiscard]] continuation::ContinuationStore &store();

  [[nodiscard]] common::Result<std::vector<std::string>> validate() const;

  [[nodiscard]] common::Result<std::shared_ptr<query::QueryService>>
  create_query_service(std::shared_ptr<providers::HttpClient> http_client =
                           std::make_shared<providers::CurlHttpClient>());

  [[nodiscard]] common::Result<std::optional<security::DeviceAuthenticator>>
  create_authenticator() const;

private:
  config::Config config_;
  std::unique_ptr<continuation::ContinuationStore> store_;
};

} // namespace calx::runtime
