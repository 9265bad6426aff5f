#pragma once

#include "calx/common/result.hpp"
#include "calx/continuation/store.hpp"
#include "calx/policy/screen.hpp"
#include "calx/providers/traits.hpp"
#include "calx/text/chunker.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace calx::config {
struct Config;
} // namespace calx::config

namespace calx::query {

constexpr const char *kPolicyBlockedMessage = "Content blocked by policy";
constexpr const char *kUpstreamFailureMessage = "AI provider error. Please try again.";
constexpr const char *kNotFoundMessage = "Query not found or expired";
constexpr const char *kPromptRequiredMessage = "Prompt is required";

struct FragmentResult {
  std::string chunk;
  bool has_more = false;
  std::optional<std::string> cursor;

  [[nodiscard]] std::string to_json() const;
};

enum class QueryErrorCode {
  NotFound,
  InvalidInput,
  PayloadTooLarge,
  UpstreamFailure,
  Internal,
};

struct QueryError {
  QueryErrorCode code = QueryErrorCode::Internal;
  std::string message;

  [[nodiscard]] std::string to_string() const;
};

using QueryResult = common::Result<FragmentResult, QueryError>;

struct QueryOptions {
  std::size_t max_fragment_size = text::kDefaultMaxFragmentSize;
  std::chrono::seconds session_ttl = continuation::kDefaultSessionTtl;
  std::size_t prompt_max_chars = 2500;
  std::size_t prompt_hard_limit = 4000;
  providers::GenerationConfig generation;

  [[nodiscard]] static QueryOptions from_config(const config::Config &config);
};

/// Composes generation, screening, sanitizing and chunking, and serves the
/// remaining fragments through the continuation store.
class QueryService {
public:
  QueryService(std::shared_ptr<providers::Provider> provider,
               std::shared_ptr<policy::IContentScreen> screen,
               continuation::ContinuationStore &store, QueryOptions options = {});

  [[nodiscard]] QueryResult submit(const std::string &device_id, const std::string &prompt);
  [[nodiscard]] QueryResult continue_query(const std::string &cursor);

  [[nodiscard]] const QueryOptions &options() const { return options_; }
  [[nodiscard]] std::string provider_name() const;
  [[nodiscard]] std::size_t active_sessions() const { return store_.size(); }

private:
  [[nodiscard]] std::optional<QueryError> validate_prompt(const std::string &prompt) const;

  std::shared_ptr<providers::Provider> provider_;
  std::shared_ptr<policy::IContentScreen> screen_;
  continuation::ContinuationStore &store_;
  QueryOptions options_;
};

} // namespace calx::query
