#pragma once

#include <map>
#include <string>

// Path and decoded query parameters of an HTTP request target.
struct RequestTarget {
  std::string path;
  std::map<std::string, std::string> query;

  std::string param(const std::string& key) const {
    auto it = query.find(key);
    return (it != query.end()) ? it->second : std::string();
  }
};

// Percent-decode; '+' is a space. Malformed escapes are kept verbatim.
inline std::string percentDecode(const std::string& in) {
  auto hex = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    const char c = in[i];
    if (c == '+') { out.push_back(' '); continue; }
    if (c == '%' && i + 2 < in.size()) {
      const int hi = hex(in[i + 1]);
      const int lo = hex(in[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    out.push_back(c);
  }
  return out;
}

inline RequestTarget parseRequestTarget(const std::string& target) {
  RequestTarget t;
  const size_t q = target.find('?');
  t.path = target.substr(0, q);
  if (q == std::string::npos) return t;
  const std::string qs = target.substr(q + 1);
  size_t start = 0;
  while (start <= qs.size()) {
    size_t amp = qs.find('&', start);
    const std::string pair = (amp == std::string::npos) ? qs.substr(start) : qs.substr(start, amp - start);
    if (!pair.empty()) {
      const size_t eq = pair.find('=');
      const std::string key = percentDecode(pair.substr(0, eq));
      const std::string val = (eq == std::string::npos) ? std::string() : percentDecode(pair.substr(eq + 1));
      t.query.emplace(key, val); // first occurrence wins
    }
    if (amp == std::string::npos) break;
    start = amp + 1;
  }
  return t;
}
