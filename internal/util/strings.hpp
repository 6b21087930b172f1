#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kuberoll::util {

// Splits on '\n', dropping a trailing '\r' from each line.
std::vector<std::string> SplitLines(std::string_view text);

// Digits only; saturates at UINT32_MAX instead of throwing.
std::uint32_t ParseUint32(std::string_view digits);

std::string ToLower(std::string_view value);
bool        StartsWith(std::string_view value, std::string_view prefix);
std::string Join(const std::vector<std::string>& parts, std::string_view separator);

} // namespace kuberoll::util
