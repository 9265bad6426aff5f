#include "calx/text/sanitizer.hpp"

#include "calx/common/fs.hpp"

#include <cctype>
#include <regex>
#include <sstream>

namespace calx::text {

namespace {

constexpr std::string_view kFence = "```";
constexpr std::string_view kSqrtGlyph = "√";
constexpr std::string_view kBulletGlyph = "• ";

// Inline emphasis delimiters, longest first so "**" is consumed before "*".
constexpr std::string_view kEmphasisDelimiters[] = {"**", "__", "*", "_", "~~"};

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (true) {
    const auto end = text.find('\n', start);
    if (end == std::string::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, end - start));
    start = end + 1;
  }
  return lines;
}

std::string join_lines(const std::vector<std::string> &lines) {
  std::string out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      out.push_back('\n');
    }
    out += lines[i];
  }
  return out;
}

void replace_all(std::string &text, std::string_view from, std::string_view to) {
  if (from.empty()) {
    return;
  }
  std::size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

bool is_space(const char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

bool is_digit(const char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; }

std::size_t skip_indent(const std::string &line, std::size_t pos = 0) {
  while (pos < line.size() && is_space(line[pos])) {
    ++pos;
  }
  return pos;
}

// Removes `delim inner delim` wrappers where inner is non-empty and does not
// contain the delimiter's first character. Scans left to right, non-overlapping.
std::string strip_delimited(const std::string &text, std::string_view delim) {
  const char marker = delim.front();
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    if (text.compare(i, delim.size(), delim) == 0) {
      const std::size_t inner = i + delim.size();
      const std::size_t stop = text.find(marker, inner);
      if (stop != std::string::npos && stop > inner &&
          text.compare(stop, delim.size(), delim) == 0) {
        out.append(text, inner, stop - inner);
        i = stop + delim.size();
        continue;
      }
    }
    out.push_back(text[i]);
    ++i;
  }
  return out;
}

// `[label](target)` -> label. With image=true the leading '!' is required and an
// empty label is allowed.
std::string strip_link_syntax(const std::string &text, const bool image) {
  const std::size_t lead = image ? 1 : 0;
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    const bool opens = image ? text.compare(i, 2, "![") == 0 : text[i] == '[';
    if (opens) {
      const std::size_t label = i + lead + 1;
      const std::size_t close = text.find(']', label);
      const bool label_ok = close != std::string::npos && (image || close > label);
      if (label_ok && close + 1 < text.size() && text[close + 1] == '(') {
        const std::size_t paren = text.find(')', close + 2);
        if (paren != std::string::npos && paren > close + 2) {
          out.append(text, label, close - label);
          i = paren + 1;
          continue;
        }
      }
    }
    out.push_back(text[i]);
    ++i;
  }
  return out;
}

std::string fenced_block_body(const std::string &block) {
  if (block.find('\n') == std::string::npos) {
    return block.substr(kFence.size(), block.size() - 2 * kFence.size());
  }

  auto lines = split_lines(block);
  // The opening line carries the fence and an optional language tag.
  lines.erase(lines.begin());
  std::string &last = lines.back();
  last.erase(last.size() - kFence.size());
  if (common::trim(last).empty()) {
    lines.pop_back();
  }
  return join_lines(lines);
}

bool is_horizontal_rule(const std::string &line) {
  if (line.size() < 3) {
    return false;
  }
  for (const char ch : line) {
    if (ch != '-' && ch != '*' && ch != '_') {
      return false;
    }
  }
  return true;
}

std::string strip_line_markers(std::string line) {
  if (!line.empty() && line.front() == '>') {
    line.erase(0, skip_indent(line, 1));
  }

  std::size_t hashes = 0;
  while (hashes < line.size() && line[hashes] == '#') {
    ++hashes;
  }
  if (hashes >= 1 && hashes <= 6 && hashes < line.size() && is_space(line[hashes])) {
    line.erase(0, skip_indent(line, hashes));
  }

  if (is_horizontal_rule(line)) {
    return "";
  }

  const std::size_t indent = skip_indent(line);
  if (indent < line.size()) {
    const char marker = line[indent];
    if ((marker == '-' || marker == '*' || marker == '+') && indent + 1 < line.size() &&
        is_space(line[indent + 1])) {
      return std::string(kBulletGlyph) + line.substr(skip_indent(line, indent + 1));
    }

    std::size_t digits = indent;
    while (digits < line.size() && is_digit(line[digits])) {
      ++digits;
    }
    if (digits > indent && digits + 1 < line.size() && line[digits] == '.' &&
        is_space(line[digits + 1])) {
      return line.substr(skip_indent(line, digits + 1));
    }
  }
  return line;
}

std::string convert_square_roots(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    if (text.compare(i, kSqrtGlyph.size(), kSqrtGlyph) != 0) {
      out.push_back(text[i]);
      ++i;
      continue;
    }

    const std::size_t arg = i + kSqrtGlyph.size();
    if (arg < text.size() && text[arg] == '(') {
      const std::size_t close = text.find(')', arg + 1);
      if (close != std::string::npos && close > arg + 1) {
        out += "sqrt(" + convert_square_roots(text.substr(arg + 1, close - arg - 1)) + ")";
        i = close + 1;
        continue;
      }
    }

    std::size_t digits = arg;
    while (digits < text.size() && is_digit(text[digits])) {
      ++digits;
    }
    if (digits > arg) {
      out += "sqrt(" + text.substr(arg, digits - arg) + ")";
      i = digits;
      continue;
    }

    out += "sqrt";
    i = arg;
  }
  return out;
}

bool is_separator_row(const std::string &trimmed) {
  static const std::regex separator(R"(^\|[-:| ]+\|$)");
  return std::regex_match(trimmed, separator);
}

bool is_table_row(const std::string &line) {
  const auto first = line.find('|');
  const auto last = line.rfind('|');
  return first != std::string::npos && last > first + 1;
}

std::string flatten_row(const std::string &line) {
  std::vector<std::string> cells;
  std::stringstream stream(line);
  std::string cell;
  while (std::getline(stream, cell, '|')) {
    cell = common::trim(cell);
    if (!cell.empty()) {
      cells.push_back(std::move(cell));
    }
  }

  std::string out;
  for (std::size_t i = 0; i < cells.size(); ++i) {
    if (i > 0) {
      out += " | ";
    }
    out += cells[i];
  }
  return out;
}

} // namespace

const std::vector<SymbolReplacement> &math_symbol_table() {
  static const std::vector<SymbolReplacement> table = {
      // Big operators
      {"∫", "Integral of "},
      {"∑", "Sum of "},
      {"Σ", "Sum of "},
      {"∏", "Product of "},
      {"Π", "Product of "},
      {"∞", "infinity"},
      // Arithmetic and comparison
      {"±", "+/-"},
      {"×", "*"},
      {"⋅", "*"},
      {"÷", "/"},
      {"≠", "!="},
      {"≤", "<="},
      {"≥", ">="},
      {"≈", "~="},
      {"∝", " proportional to "},
      {"°", " degrees"},
      // Greek
      {"π", "pi"},
      {"θ", "theta"},
      {"α", "alpha"},
      {"β", "beta"},
      {"γ", "gamma"},
      {"δ", "delta"},
      {"Δ", "Delta"},
      {"λ", "lambda"},
      {"μ", "mu"},
      {"σ", "sigma"},
      {"ω", "omega"},
      {"Ω", "Omega"},
      // Arrows
      {"→", "->"},
      {"←", "<-"},
      {"↔", "<->"},
      {"⇒", "=>"},
      {"⇐", "<="},
      // Subscripts
      {"₀", "_0"},
      {"₁", "_1"},
      {"₂", "_2"},
      {"₃", "_3"},
      {"₄", "_4"},
      {"₅", "_5"},
      {"₆", "_6"},
      {"₇", "_7"},
      {"₈", "_8"},
      {"₉", "_9"},
      {"ₙ", "_n"},
      {"ₓ", "_x"},
      {"ᵢ", "_i"},
      {"ⱼ", "_j"},
      // Superscripts
      {"⁰", "^0"},
      {"¹", "^1"},
      {"²", "^2"},
      {"³", "^3"},
      {"⁴", "^4"},
      {"⁵", "^5"},
      {"⁶", "^6"},
      {"⁷", "^7"},
      {"⁸", "^8"},
      {"⁹", "^9"},
      {"ⁿ", "^n"},
      // Vulgar fractions
      {"½", "1/2"},
      {"⅓", "1/3"},
      {"¼", "1/4"},
      {"⅕", "1/5"},
      {"⅙", "1/6"},
      {"⅐", "1/7"},
      {"⅛", "1/8"},
      {"⅑", "1/9"},
      {"⅒", "1/10"},
      {"⅔", "2/3"},
      {"¾", "3/4"},
      {"⅖", "2/5"},
      {"⅗", "3/5"},
      {"⅘", "4/5"},
  };
  return table;
}

std::string strip_code_blocks(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    const auto open = text.find(kFence, pos);
    if (open == std::string::npos) {
      break;
    }
    const auto close = text.find(kFence, open + kFence.size());
    if (close == std::string::npos) {
      break;
    }
    out.append(text, pos, open - pos);
    out += fenced_block_body(text.substr(open, close + kFence.size() - open));
    pos = close + kFence.size();
  }
  if (pos < text.size()) {
    out.append(text, pos, std::string::npos);
  }
  return strip_delimited(out, "`");
}

std::string strip_markdown(const std::string &text) {
  auto lines = split_lines(text);
  for (auto &line : lines) {
    line = strip_line_markers(std::move(line));
  }

  std::string out = join_lines(lines);
  out = strip_link_syntax(out, true);
  out = strip_link_syntax(out, false);
  for (const auto delim : kEmphasisDelimiters) {
    out = strip_delimited(out, delim);
  }
  return out;
}

std::string convert_math_symbols(const std::string &text) {
  std::string out = convert_square_roots(text);
  for (const auto &entry : math_symbol_table()) {
    replace_all(out, entry.glyph, entry.replacement);
  }
  return out;
}

std::string flatten_tables(const std::string &text) {
  std::vector<std::string> kept;
  for (auto &line : split_lines(text)) {
    if (is_separator_row(common::trim(line))) {
      continue;
    }
    if (is_table_row(line)) {
      kept.push_back(flatten_row(line));
    } else {
      kept.push_back(std::move(line));
    }
  }
  return join_lines(kept);
}

std::string normalize_whitespace(const std::string &text) {
  std::string collapsed;
  collapsed.reserve(text.size());
  for (const char ch : text) {
    if (ch == ' ' && !collapsed.empty() && collapsed.back() == ' ') {
      continue;
    }
    collapsed.push_back(ch);
  }

  auto lines = split_lines(collapsed);
  for (auto &line : lines) {
    line = common::trim(line);
  }

  // Lines are trimmed first so whitespace-only lines count toward the blank run.
  std::vector<std::string> kept;
  for (auto &line : lines) {
    if (line.empty() && !kept.empty() && kept.back().empty()) {
      continue;
    }
    kept.push_back(std::move(line));
  }
  return common::trim(join_lines(kept));
}

std::string sanitize(const std::string &raw) {
  std::string text = strip_code_blocks(raw);
  text = strip_markdown(text);
  text = convert_math_symbols(text);
  text = flatten_tables(text);
  return normalize_whitespace(text);
}

} // namespace calx::text
