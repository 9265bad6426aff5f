#include "calx/query/service.hpp"

#include "calx/common/fs.hpp"
#include "calx/common/json_util.hpp"
#include "calx/config/schema.hpp"
#include "calx/observability/global.hpp"
#include "calx/providers/factory.hpp"
#include "calx/text/sanitizer.hpp"

#include <algorithm>
#include <sstream>

namespace calx::query {

namespace {

std::string code_name(const QueryErrorCode code) {
  switch (code) {
  case QueryErrorCode::NotFound:
    return "not_found";
  case QueryErrorCode::InvalidInput:
    return "invalid_input";
  case QueryErrorCode::PayloadTooLarge:
    return "payload_too_large";
  case QueryErrorCode::UpstreamFailure:
    return "upstream_failure";
  case QueryErrorCode::Internal:
    return "internal";
  }
  return "internal";
}

QueryResult failure(const QueryErrorCode code, std::string message) {
  return QueryResult::failure(QueryError{.code = code, .message = std::move(message)});
}

} // namespace

std::string FragmentResult::to_json() const {
  std::ostringstream json;
  json << "{\"chunk\":" << common::json_quote(chunk)
       << ",\"has_more\":" << (has_more ? "true" : "false");
  if (cursor.has_value()) {
    json << ",\"cursor\":" << common::json_quote(*cursor);
  }
  json << "}";
  return json.str();
}

std::string QueryError::to_string() const { return "Query error [" + code_name(code) + "] " + message; }

QueryOptions QueryOptions::from_config(const config::Config &config) {
  return QueryOptions{
      .max_fragment_size = config.continuation.max_fragment_size,
      .session_ttl = std::chrono::seconds(
          std::min(config.continuation.session_ttl_seconds, config::kMaxDurationSeconds)),
      .prompt_max_chars = config.limits.prompt_max_chars,
      .prompt_hard_limit = config.limits.prompt_hard_limit,
      .generation = providers::generation_config(config.provider),
  };
}

QueryService::QueryService(std::shared_ptr<providers::Provider> provider,
                           std::shared_ptr<policy::IContentScreen> screen,
                           continuation::ContinuationStore &store, QueryOptions options)
    : provider_(std::move(provider)), screen_(std::move(screen)), store_(store),
      options_(std::move(options)) {
  if (screen_ == nullptr) {
    screen_ = std::make_shared<policy::AllowAllScreen>();
  }
}

std::string QueryService::provider_name() const {
  return provider_ != nullptr ? provider_->name() : "none";
}

std::optional<QueryError> QueryService::validate_prompt(const std::string &prompt) const {
  if (common::trim(prompt).empty()) {
    return QueryError{.code = QueryErrorCode::InvalidInput, .message = kPromptRequiredMessage};
  }
  if (prompt.size() > options_.prompt_hard_limit) {
    return QueryError{.code = QueryErrorCode::PayloadTooLarge,
                      .message = "Prompt exceeds hard limit of " +
                                 std::to_string(options_.prompt_hard_limit) + " characters"};
  }
  if (prompt.size() > options_.prompt_max_chars) {
    return QueryError{.code = QueryErrorCode::InvalidInput,
                      .message = "Prompt exceeds maximum length of " +
                                 std::to_string(options_.prompt_max_chars) + " characters"};
  }
  return std::nullopt;
}

QueryResult QueryService::submit(const std::string &device_id, const std::string &prompt) {
  if (auto invalid = validate_prompt(prompt); invalid.has_value()) {
    return QueryResult::failure(std::move(*invalid));
  }
  if (provider_ == nullptr) {
    return failure(QueryErrorCode::Internal, "no generation provider configured");
  }

  const auto started = std::chrono::steady_clock::now();
  observability::record_query_submitted(device_id, provider_->name(), prompt.size());

  auto generated = provider_->generate(prompt, options_.generation);
  if (!generated.ok()) {
    observability::record_error("query", "device=" + device_id + " provider=" +
                                             provider_->name() + " " +
                                             generated.error().to_string());
    return failure(QueryErrorCode::UpstreamFailure, kUpstreamFailureMessage);
  }

  const std::string &raw = generated.value();
  if (const auto verdict = screen_->screen(raw); !verdict.safe) {
    observability::record_policy_blocked(device_id, verdict.reason.value_or("unspecified"));
    return QueryResult::success(FragmentResult{.chunk = kPolicyBlockedMessage, .has_more = false});
  }

  auto fragments = text::chunk(text::sanitize(raw), options_.max_fragment_size);
  const std::size_t fragment_count = fragments.size();
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_query_completed(device_id, fragment_count, raw.size(), elapsed);
  observability::record_metric(
      observability::FragmentCountMetric{.fragments = static_cast<std::uint64_t>(fragment_count)});

  if (fragment_count == 1) {
    return QueryResult::success(
        FragmentResult{.chunk = std::move(fragments.front()), .has_more = false});
  }

  std::string first = std::move(fragments.front());
  fragments.erase(fragments.begin());
  auto cursor = store_.create(device_id, std::move(fragments), options_.session_ttl);
  if (!cursor.ok()) {
    observability::record_error("continuation", cursor.error());
    return failure(QueryErrorCode::Internal, "Unable to store remaining fragments");
  }
  observability::record_metric(
      observability::ActiveSessionsMetric{.count = static_cast<std::uint64_t>(store_.size())});

  return QueryResult::success(
      FragmentResult{.chunk = std::move(first), .has_more = true, .cursor = cursor.value()});
}

QueryResult QueryService::continue_query(const std::string &cursor) {
  if (common::trim(cursor).empty()) {
    return failure(QueryErrorCode::InvalidInput, "Cursor is required");
  }

  auto next = store_.next(cursor);
  if (!next.ok()) {
    return failure(QueryErrorCode::NotFound, kNotFoundMessage);
  }

  auto &fragment = next.value();
  observability::record_continuation_served(cursor, fragment.has_more);

  FragmentResult result{.chunk = std::move(fragment.text), .has_more = fragment.has_more};
  if (result.has_more) {
    result.cursor = cursor;
  }
  return QueryResult::success(std::move(result));
}

} // namespace calx::query
