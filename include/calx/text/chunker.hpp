#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace calx::text {

constexpr std::size_t kDefaultMaxFragmentSize = 2500;

/// Splits text into fragments of at most max_size characters (UTF-8 code points),
/// preferring sentence, then clause, then word boundaries outside open brackets.
[[nodiscard]] std::vector<std::string> chunk(const std::string &text,
                                             std::size_t max_size = kDefaultMaxFragmentSize);

// Byte offset of the cut; window.size() when nothing past the midpoint qualifies.
[[nodiscard]] std::size_t find_safe_boundary(std::string_view window);

[[nodiscard]] bool is_inside_brackets(std::string_view window, std::size_t pos);

[[nodiscard]] std::size_t utf8_length(std::string_view value);

} // namespace calx::text
