#include "calx/runtime/app.hpp"

#include "calx/config/config.hpp"
#include "calx/observability/factory.hpp"
#include "calx/observability/global.hpp"
#include "calx/policy/screen.hpp"
#include "calx/providers/factory.hpp"

namespace calx::runtime {

RuntimeContext::RuntimeContext(config::Config config)
    : config_(std::move(config)),
      store_(std::make_unique<continuation::ContinuationStore>(config_.continuation.max_sessions)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.error());
  }
  return common::Result<RuntimeContext>::success(RuntimeContext(std::move(loaded.value())));
}

const config::Config &RuntimeContext::config() const { return config_; }

config::Config &RuntimeContext::mutable_config() { return config_; }

continuation::ContinuationStore &RuntimeContext::store() { return *store_; }

common::Result<std::vector<std::string>> RuntimeContext::validate() const {
  return config::validate_config(config_);
}

common::Result<std::shared_ptr<query::QueryService>>
RuntimeContext::create_query_service(std::shared_ptr<providers::HttpClient> http_client) {
  using ServiceResult = common::Result<std::shared_ptr<query::QueryService>>;
  observability::set_global_observer(observability::create_observer(config_));

  auto provider =
      providers::create_provider(config_.provider.name, config_.provider.api_key,
                                 std::move(http_client));
  if (!provider.ok()) {
    return ServiceResult::failure(provider.error());
  }

  auto screen = policy::create_screen(config_.policy);
  if (!screen.ok()) {
    return ServiceResult::failure(screen.error());
  }
  std::shared_ptr<policy::IContentScreen> shared_screen = std::move(screen.value());

  auto service = std::make_shared<query::QueryService>(
      provider.value(), std::move(shared_screen), *store_, query::QueryOptions::from_config(config_));
  return ServiceResult::success(std::move(service));
}

common::Result<std::optional<security::DeviceAuthenticator>>
RuntimeContext::create_authenticator() const {
  using AuthResult = common::Result<std::optional<security::DeviceAuthenticator>>;
  if (!config_.gateway.require_device_auth) {
    return AuthResult::success(std::nullopt);
  }
  auto auth = security::DeviceAuthenticator::from_entries(config_.gateway.device_token_secret,
                                                          config_.gateway.device_tokens);
  if (!auth.ok()) {
    return AuthResult::failure(auth.error());
  }
  return AuthResult::success(std::move(auth.value()));
}

} // namespace calx::runtime
