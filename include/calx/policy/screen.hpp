#pragma once

#include "calx/common/result.hpp"
#include "calx/config/schema.hpp"

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace calx::policy {

struct ScreenVerdict {
  bool safe = true;
  std::optional<std::string> reason;
};

class IContentScreen {
public:
  virtual ~IContentScreen() = default;

  [[nodiscard]] virtual ScreenVerdict screen(const std::string &text) const = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

class AllowAllScreen final : public IContentScreen {
public:
  [[nodiscard]] ScreenVerdict screen(const std::string &) const override { return {}; }
  [[nodiscard]] std::string_view name() const override { return "allow_all"; }
};

class PatternScreen final : public IContentScreen {
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

public:
  struct Entry {
    std::string label;
    std::regex regex;
  };

  static common::Result<std::unique_ptr<PatternScreen>>
  create(const std::vector<std::string> &patterns);

  PatternScreen(PrivateTag, std::vector<Entry> entries);

  [[nodiscard]] ScreenVerdict screen(const std::string &text) const override;
  [[nodiscard]] std::string_view name() const override { return "patterns"; }
  [[nodiscard]] std::size_t pattern_count() const { return entries_.size(); }

private:
  std::vector<Entry> entries_;
};

[[nodiscard]] common::Result<std::unique_ptr<IContentScreen>>
create_screen(const config::PolicyConfig &config);

} // namespace calx::policy
