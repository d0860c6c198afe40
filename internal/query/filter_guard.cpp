#include "internal/query/filter_guard.hpp"

#include <array>
#include <cctype>
#include <cstddef>

#include "internal/util/errors.hpp"

namespace framecache::query {

namespace {

constexpr std::array<std::string_view, 21> kColumns = {
    "file_id", "folder_id",    "fname", "last_modified", "orientation", "capture_time", "f_number",
    "exposure_time", "iso",    "focal_length", "make", "model", "lens", "rating",
    "latitude", "longitude",   "width", "height", "is_portrait", "location", "has_meta",
};

constexpr std::array<std::string_view, 20> kKeywords = {
    "and", "or",   "not",  "like", "glob", "in",  "is",   "null",    "between", "true",
    "false", "escape", "case", "when", "then", "else", "end", "collate", "nocase", "distinct",
};

constexpr std::array<std::string_view, 6> kOrderingKeywords = {"asc", "desc", "nulls", "first", "last", "nocase"};

constexpr std::array<std::string_view, 11> kFunctions = {
    "lower", "upper", "abs", "length", "instr", "substr", "ifnull", "coalesce", "round", "min", "max",
};

template <std::size_t N>
bool Contains(const std::array<std::string_view, N>& set, std::string_view word) {
  for (auto entry : set) {
    if (entry == word) return true;
  }
  return false;
}

bool IsIdentStart(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool IsIdentPart(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool IsDigit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::string Trim(std::string_view value) {
  std::size_t begin = 0;
  std::size_t end   = value.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;
  return std::string(value.substr(begin, end - begin));
}

[[noreturn]] void Reject(std::string_view expression, std::size_t pos, std::string_view reason) {
  throw util::InvalidArgument(std::string(reason) + " at offset " + std::to_string(pos) + " in '" + std::string(expression) + "'");
}

} // namespace

std::string FilterGuard::Filter(std::string_view expression) {
  auto trimmed = Trim(expression);
  if (trimmed.empty()) return "1";
  Check(trimmed, false);
  return trimmed;
}

std::string FilterGuard::Ordering(std::string_view expression) {
  auto trimmed = Trim(expression);
  if (trimmed.empty()) return std::string(kDefaultOrdering);
  Check(trimmed, true);
  return trimmed;
}

void FilterGuard::Check(std::string_view expr, bool ordering) {
  int         depth      = 0;
  std::size_t i          = 0;
  std::size_t term_start = 0;
  bool        has_column = false;

  // SQLite reads a constant integer ORDER BY term as a result column
  // position, so every ordering term must reference a column
  auto end_term = [&](std::size_t pos) {
    if (ordering && !has_column) Reject(expr, term_start, "ordering term without a column");
    term_start = pos + 1;
    has_column = false;
  };

  while (i < expr.size()) {
    const char c = expr[i];

    if (std::isspace(static_cast<unsigned char>(c))) {
      ++i;
      continue;
    }

    if (IsIdentStart(c)) {
      const std::size_t start = i;
      while (i < expr.size() && IsIdentPart(expr[i])) ++i;

      std::string word(expr.substr(start, i - start));
      for (auto& ch : word) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));

      if (Contains(kColumns, word)) {
        has_column = true;
        continue;
      }
      if (Contains(kKeywords, word)) continue;
      if (ordering && Contains(kOrderingKeywords, word)) continue;
      if (Contains(kFunctions, word)) {
        std::size_t next = i;
        while (next < expr.size() && std::isspace(static_cast<unsigned char>(expr[next]))) ++next;
        if (next < expr.size() && expr[next] == '(') continue;
        Reject(expr, start, "function name without call");
      }
      Reject(expr, start, "unknown identifier '" + word + "'");
    }

    if (IsDigit(c) || (c == '.' && i + 1 < expr.size() && IsDigit(expr[i + 1]))) {
      while (i < expr.size() && IsDigit(expr[i])) ++i;
      if (i < expr.size() && expr[i] == '.') {
        ++i;
        while (i < expr.size() && IsDigit(expr[i])) ++i;
      }
      if (i < expr.size() && (expr[i] == 'e' || expr[i] == 'E')) {
        ++i;
        if (i < expr.size() && (expr[i] == '+' || expr[i] == '-')) ++i;
        if (i >= expr.size() || !IsDigit(expr[i])) Reject(expr, i, "malformed number");
        while (i < expr.size() && IsDigit(expr[i])) ++i;
      }
      if (i < expr.size() && IsIdentPart(expr[i])) Reject(expr, i, "malformed number");
      continue;
    }

    if (c == '\'') {
      const std::size_t start = i++;
      bool              closed = false;
      while (i < expr.size()) {
        if (expr[i] == '\'') {
          if (i + 1 < expr.size() && expr[i + 1] == '\'') {
            i += 2;
            continue;
          }
          ++i;
          closed = true;
          break;
        }
        ++i;
      }
      if (!closed) Reject(expr, start, "unterminated string");
      continue;
    }

    const char next = i + 1 < expr.size() ? expr[i + 1] : '\0';
    switch (c) {
      case '(':
        ++depth;
        ++i;
        continue;
      case ')':
        if (--depth < 0) Reject(expr, i, "unbalanced ')'");
        ++i;
        continue;
      case ',':
        if (depth == 0) end_term(i);
        ++i;
        continue;
      case '+':
      case '*':
      case '%':
        ++i;
        continue;
      case '-':
        if (next == '-') Reject(expr, i, "comment");
        ++i;
        continue;
      case '/':
        if (next == '*') Reject(expr, i, "comment");
        ++i;
        continue;
      case '=':
        i += next == '=' ? 2 : 1;
        continue;
      case '<':
        i += (next == '=' || next == '>') ? 2 : 1;
        continue;
      case '>':
        i += next == '=' ? 2 : 1;
        continue;
      case '!':
        if (next != '=') Reject(expr, i, "unexpected '!'");
        i += 2;
        continue;
      case '|':
        if (next != '|') Reject(expr, i, "unexpected '|'");
        i += 2;
        continue;
      default:
        Reject(expr, i, std::string("unexpected character '") + c + "'");
    }
  }

  if (depth != 0) Reject(expr, expr.size(), "unbalanced '('");
  end_term(expr.size());
}

} // namespace framecache::query
