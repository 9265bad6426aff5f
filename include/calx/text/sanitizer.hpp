#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace calx::text {

struct SymbolReplacement {
  std::string_view glyph;
  std::string_view replacement;
};

[[nodiscard]] const std::vector<SymbolReplacement> &math_symbol_table();

// Individual pipeline stages, in the order sanitize() applies them.
[[nodiscard]] std::string strip_code_blocks(const std::string &text);
[[nodiscard]] std::string strip_markdown(const std::string &text);
[[nodiscard]] std::string convert_math_symbols(const std::string &text);
[[nodiscard]] std::string flatten_tables(const std::string &text);
[[nodiscard]] std::string normalize_whitespace(const std::string &text);

/// Turns raw model output into plain text for a small-screen renderer.
/// Total and deterministic: malformed markup is passed through, never rejected.
[[nodiscard]] std::string sanitize(const std::string &raw);

} // namespace calx::text
