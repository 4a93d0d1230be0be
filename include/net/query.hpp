#pragma once

#include <boost/algorithm/string/predicate.hpp>
#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace URL {

// Parses a whole decimal integer with an optional sign. Values past the
// int64 range saturate, so an oversized size still clamps to the maximum.
inline std::optional<std::int64_t> ParseInt(std::string_view s) {
  if (!s.empty() && s.front() == '+') {
    s.remove_prefix(1);
  }
  if (s.empty()) {
    return std::nullopt;
  }
  std::int64_t out = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  if (ec == std::errc::result_out_of_range) {
    return s.front() == '-' ? std::numeric_limits<std::int64_t>::min()
                            : std::numeric_limits<std::int64_t>::max();
  }
  if (ec != std::errc()) {
    return std::nullopt;
  }
  return out;
}

// Request target split into path and raw query parameters. Values are kept
// undecoded: every parameter the server reads is numeric.
struct Target {
  std::string path;
  std::vector<std::pair<std::string, std::string>> params;

  std::optional<std::string_view> Get(std::string_view key) const {
    for (const auto &[k, v] : params) {
      if (k == key) {
        return std::string_view{v};
      }
    }
    return std::nullopt;
  }

  // Integer parameter or nothing. "abc", "", "1.5" and out-of-range values
  // read as absent; a leading '+' is tolerated.
  std::optional<std::int64_t> GetInt(std::string_view key) const {
    auto v = Get(key);
    if (!v) {
      return std::nullopt;
    }
    return ParseInt(*v);
  }
};

inline Target SplitTarget(std::string_view target) {
  Target t;
  const auto q = target.find('?');
  t.path = std::string(target.substr(0, q));
  if (t.path.empty()) {
    t.path = "/";
  }
  if (q == std::string_view::npos) {
    return t;
  }
  std::string_view rest = target.substr(q + 1);
  const auto hash = rest.find('#');
  if (hash != std::string_view::npos) {
    rest = rest.substr(0, hash);
  }
  while (!rest.empty()) {
    const auto amp = rest.find('&');
    std::string_view pair = rest.substr(0, amp);
    if (!pair.empty()) {
      const auto eq = pair.find('=');
      if (eq == std::string_view::npos) {
        t.params.emplace_back(std::string(pair), std::string());
      } else {
        t.params.emplace_back(std::string(pair.substr(0, eq)),
                              std::string(pair.substr(eq + 1)));
      }
    }
    if (amp == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(amp + 1);
  }
  return t;
}

// Case-insensitive path match ignoring one trailing slash, so /api/ping/ and
// /API/Ping route the same way.
inline bool PathIs(std::string_view path, std::string_view route) {
  if (path.size() > 1 && path.back() == '/') {
    path.remove_suffix(1);
  }
  return path.size() == route.size() &&
         boost::algorithm::istarts_with(path, route);
}

} // namespace URL
