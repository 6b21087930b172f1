#include "strings.hpp"

#include <cctype>
#include <limits>

namespace kuberoll::util {

std::vector<std::string> SplitLines(std::string_view text) {
  std::vector<std::string> lines;

  std::size_t start = 0;
  while (start < text.size()) {
    auto end = text.find('\n', start);
    if (end == std::string_view::npos) end = text.size();

    auto line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    lines.emplace_back(line);

    start = end + 1;
  }

  return lines;
}

std::uint32_t ParseUint32(std::string_view digits) {
  constexpr auto kMax = std::numeric_limits<std::uint32_t>::max();

  std::uint64_t value = 0;
  for (char c : digits) {
    if (c < '0' || c > '9') break;
    value = value * 10 + static_cast<std::uint64_t>(c - '0');
    if (value > kMax) return kMax;
  }
  return static_cast<std::uint32_t>(value);
}

std::string ToLower(std::string_view value) {
  std::string lowered;
  lowered.reserve(value.size());
  for (char c : value) {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return lowered;
}

bool StartsWith(std::string_view value, std::string_view prefix) {
  return value.substr(0, prefix.size()) == prefix;
}

std::string Join(const std::vector<std::string>& parts, std::string_view separator) {
  std::string joined;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) joined.append(separator);
    joined.append(parts[i]);
  }
  return joined;
}

} // namespace kuberoll::util
