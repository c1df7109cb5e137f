#pragma once

#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "decorr/core/LambdaState.hpp"

namespace decorr {

inline bool is_ws(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

inline std::string_view trim(std::string_view s) {
  std::size_t b = 0;
  while (b < s.size() && is_ws(s[b])) ++b;
  std::size_t e = s.size();
  while (e > b && is_ws(s[e - 1])) --e;
  return s.substr(b, e - b);
}

inline void split_ws(std::string_view s, std::vector<std::string_view>& out) {
  out.clear();
  std::size_t i = 0;
  const std::size_t n = s.size();
  while (i < n) {
    while (i < n && is_ws(s[i])) ++i;
    if (i >= n) break;
    std::size_t j = i;
    while (j < n && !is_ws(s[j])) ++j;
    out.emplace_back(s.substr(i, j - i));
    i = j;
  }
}

// Comma-separated list; items are trimmed and empty items dropped.
inline std::vector<std::string> split_csv(std::string_view s) {
  std::vector<std::string> out;
  std::size_t b = 0;
  while (b <= s.size()) {
    std::size_t e = s.find(',', b);
    if (e == std::string_view::npos) e = s.size();
    const auto item = trim(s.substr(b, e - b));
    if (!item.empty()) out.emplace_back(item);
    b = e + 1;
  }
  return out;
}

// Accepts everything std::from_chars accepts, including "nan" and "inf";
// the whole token must be consumed.
inline bool parse_double(std::string_view tok, double& value) {
  if (!tok.empty() && tok.front() == '+') tok.remove_prefix(1);
  const char* b = tok.data();
  const char* e = tok.data() + tok.size();
  auto res = std::from_chars(b, e, value);
  return res.ec == std::errc{} && res.ptr == e;
}

// "0.25" or "(0,0.25)" -> numeric state key; anything else -> nullopt.
inline std::optional<LambdaState> parse_lambda_state(std::string_view tok) {
  tok = trim(tok);
  if (tok.empty()) return std::nullopt;
  std::vector<double> values;
  if (tok.front() == '(' && tok.back() == ')') {
    tok = tok.substr(1, tok.size() - 2);
    for (const auto& item : split_csv(tok)) {
      double v = 0.0;
      if (!parse_double(item, v)) return std::nullopt;
      values.push_back(v);
    }
    if (values.empty()) return std::nullopt;
    return LambdaState(std::move(values));
  }
  double v = 0.0;
  if (!parse_double(tok, v)) return std::nullopt;
  return LambdaState::scalar(v);
}

} // namespace decorr
