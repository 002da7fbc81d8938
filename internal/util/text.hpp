#pragma once

#include <cctype>
#include <string>
#include <string_view>

namespace resonance::util {

/*
  Key normalization shared by the loader and the scorer:
  lowercase, runs of anything outside [a-z0-9] collapse to a single '-',
  leading and trailing '-' removed. "  Grief & Loss! " -> "grief-loss".
*/
inline std::string NormalizeKey(std::string_view value) {
  std::string out;
  out.reserve(value.size());

  bool pending_dash = false;
  for (char raw : value) {
    const auto c = static_cast<unsigned char>(std::tolower(static_cast<unsigned char>(raw)));
    if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
      if (pending_dash && !out.empty()) {
        out.push_back('-');
      }
      pending_dash = false;
      out.push_back(static_cast<char>(c));
    } else {
      pending_dash = true;
    }
  }
  return out;
}

inline std::string StripTrailingSlashes(std::string_view value) {
  while (value.size() > 1 && value.back() == '/') {
    value.remove_suffix(1);
  }
  return std::string(value);
}

inline std::string StripLeadingSlashes(std::string_view value) {
  while (!value.empty() && value.front() == '/') {
    value.remove_prefix(1);
  }
  return std::string(value);
}

} // namespace resonance::util
