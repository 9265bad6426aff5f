#include "calx/text/chunker.hpp"

#include <array>
#include <cctype>

namespace calx::text {

namespace {

struct BracketPair {
  char open;
  char close;
};

constexpr std::array<BracketPair, 3> kBracketPairs = {{{'(', ')'}, {'[', ']'}, {'{', '}'}}};
constexpr std::string_view kSentenceTerminators = ".!?";
constexpr std::string_view kClauseTerminators = ",;:";

using Depths = std::array<long, kBracketPairs.size()>;

bool is_space(const char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

bool is_utf8_continuation(const char ch) {
  return (static_cast<unsigned char>(ch) & 0xC0U) == 0x80U;
}

void count_bracket(Depths &depths, const char ch) {
  for (std::size_t k = 0; k < kBracketPairs.size(); ++k) {
    if (ch == kBracketPairs[k].open) {
      ++depths[k];
    } else if (ch == kBracketPairs[k].close) {
      --depths[k];
    }
  }
}

bool balanced(const Depths &depths) {
  for (const long depth : depths) {
    if (depth > 0) {
      return false;
    }
  }
  return true;
}

std::string_view trim_view(std::string_view value) {
  while (!value.empty() && is_space(value.front())) {
    value.remove_prefix(1);
  }
  while (!value.empty() && is_space(value.back())) {
    value.remove_suffix(1);
  }
  return value;
}

std::size_t utf8_prefix_bytes(std::string_view value, std::size_t count) {
  std::size_t i = 0;
  while (i < value.size() && count > 0) {
    ++i;
    while (i < value.size() && is_utf8_continuation(value[i])) {
      ++i;
    }
    --count;
  }
  return i;
}

} // namespace

std::size_t utf8_length(std::string_view value) {
  std::size_t count = 0;
  for (const char ch : value) {
    if (!is_utf8_continuation(ch)) {
      ++count;
    }
  }
  return count;
}

bool is_inside_brackets(std::string_view window, const std::size_t pos) {
  Depths depths{};
  const std::size_t limit = pos < window.size() ? pos : window.size();
  for (std::size_t i = 0; i < limit; ++i) {
    count_bracket(depths, window[i]);
  }
  return !balanced(depths);
}

std::size_t find_safe_boundary(std::string_view window) {
  const std::size_t n = window.size();
  const std::size_t chars = utf8_length(window);
  std::size_t sentence = 0;
  std::size_t clause = 0;
  std::size_t space = 0;

  // depths always reflects window[0:i); a candidate at pos counts brackets before pos.
  // index counts characters before window[i] for the second-half rule.
  Depths depths{};
  std::size_t index = 0;
  for (std::size_t i = 0; i < n; ++i) {
    const char ch = window[i];
    if (is_utf8_continuation(ch)) {
      continue;
    }
    const bool followed_by_space = i + 1 < n && is_space(window[i + 1]);

    if (ch == ' ' && 2 * index > chars && balanced(depths)) {
      space = i;
    }

    count_bracket(depths, ch);
    ++index;
    const std::size_t after = i + 1;
    if (2 * index <= chars || !balanced(depths)) {
      continue;
    }
    if (ch == '\n' ||
        (kSentenceTerminators.find(ch) != std::string_view::npos && followed_by_space)) {
      sentence = after;
    } else if (kClauseTerminators.find(ch) != std::string_view::npos && followed_by_space) {
      clause = after;
    }
  }

  if (sentence > 0) {
    return sentence;
  }
  if (clause > 0) {
    return clause;
  }
  if (space > 0) {
    return space;
  }
  return n;
}

std::vector<std::string> chunk(const std::string &text, std::size_t max_size) {
  if (max_size == 0) {
    max_size = 1;
  }
  if (utf8_length(text) <= max_size) {
    return {text};
  }

  std::vector<std::string> fragments;
  std::string_view rest(text);
  while (utf8_length(rest) > max_size) {
    const std::string_view window = rest.substr(0, utf8_prefix_bytes(rest, max_size));
    const std::size_t cut = find_safe_boundary(window);
    const std::string_view piece = trim_view(window.substr(0, cut));
    if (!piece.empty()) {
      fragments.emplace_back(piece);
    }
    rest = trim_view(rest.substr(cut));
  }
  if (!rest.empty()) {
    fragments.emplace_back(rest);
  }
  return fragments;
}

} // namespace calx::text
