#pragma once

#include <string>
#include <string_view>

namespace framecache::query {

inline constexpr std::string_view kDefaultOrdering = "capture_time ASC";

/*
  Allowlist validation for caller supplied filter and ordering
  expressions, which are spliced into SQL text.

  Accepted tokens:
    - column names of the all_data view
    - a fixed set of SQL keywords and scalar functions
    - numeric literals and single-quoted strings
    - the operators = == != <> < <= > >= + - * / % || ( ) ,

  Anything else (statement separators, comments, quoted identifiers,
  bind markers, unknown identifiers, unbalanced parentheses) throws
  util::InvalidArgument. Validation is lexical; a well-tokenised but
  malformed expression is still rejected later by SQLite.
*/
class FilterGuard {
 public:
  // empty or blank filter selects every row
  static std::string Filter(std::string_view expression);

  // empty or blank ordering falls back to kDefaultOrdering
  static std::string Ordering(std::string_view expression);

 private:
  static void Check(std::string_view expression, bool ordering);
};

} // namespace framecache::query
