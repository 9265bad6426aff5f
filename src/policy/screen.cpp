#include "calx/policy/screen.hpp"

#include "calx/common/fs.hpp"

namespace calx::policy {

PatternScreen::PatternScreen(PrivateTag, std::vector<Entry> entries)
    : entries_(std::move(entries)) {}

common::Result<std::unique_ptr<PatternScreen>>
PatternScreen::create(const std::vector<std::string> &patterns) {
  using CreateResult = common::Result<std::unique_ptr<PatternScreen>>;
  std::vector<Entry> entries;
  entries.reserve(patterns.size());
  for (const auto &pattern : patterns) {
    if (common::trim(pattern).empty()) {
      continue;
    }
    try {
      entries.push_back(Entry{.label = pattern,
                              .regex = std::regex(pattern, std::regex::icase |
                                                               std::regex::ECMAScript)});
    } catch (const std::regex_error &err) {
      return CreateResult::failure("invalid blocked pattern '" + pattern + "': " + err.what());
    }
  }
  return CreateResult::success(std::make_unique<PatternScreen>(PrivateTag{}, std::move(entries)));
}

ScreenVerdict PatternScreen::screen(const std::string &text) const {
  for (const auto &entry : entries_) {
    if (std::regex_search(text, entry.regex)) {
      return ScreenVerdict{.safe = false, .reason = "matched " + entry.label};
    }
  }
  return ScreenVerdict{};
}

common::Result<std::unique_ptr<IContentScreen>> create_screen(const config::PolicyConfig &config) {
  using CreateResult = common::Result<std::unique_ptr<IContentScreen>>;
  const std::string backend = common::to_lower(common::trim(config.backend));
  if (backend.empty() || backend == "allow_all") {
    return CreateResult::success(std::make_unique<AllowAllScreen>());
  }
  if (backend == "patterns") {
    auto screen = PatternScreen::create(config.blocked_patterns);
    if (!screen.ok()) {
      return CreateResult::failure(screen.error());
    }
    return CreateResult::success(std::move(screen.value()));
  }
  return CreateResult::failure("unknown policy backend: " + config.backend);
}

} // namespace calx::policy
