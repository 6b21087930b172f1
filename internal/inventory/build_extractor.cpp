#include "build_extractor.hpp"

#include <regex>

#include "internal/util/strings.hpp"

namespace kuberoll::inventory {

namespace {

// <repository>:<tag>, where the tag may not contain ':' or '/' and ends in -<digits>.
const std::regex& TaggedImage() {
  static const std::regex kPattern(R"([^\s"',]+:[^\s"',:/]*-(\d+)(?=["']?(?:[\s,]|$)))");
  return kPattern;
}

const std::regex& TaggedImageField() {
  static const std::regex kPattern(R"(image:\s*["']?[^\s"']*:[^\s"':/]*-(\d+)(?=["']?(?:\s|$)))");
  return kPattern;
}

const std::regex& ImageField() {
  static const std::regex kPattern(R"((image:\s*["']?[^\s"']*):[^\s"':/]*(?=["']?(?:\s|$)))");
  return kPattern;
}

const std::regex& BuildRow() {
  static const std::regex kPattern(R"(^(\S+)\s+(\S+))");
  return kPattern;
}

} // namespace

std::optional<std::string> ExtractBuild(std::string_view text) {
  std::match_results<std::string_view::const_iterator> match;
  if (std::regex_search(text.begin(), text.end(), match, TaggedImage())) {
    return match[1].str();
  }
  return std::nullopt;
}

std::optional<std::string> ExtractManifestBuild(std::string_view manifest) {
  std::match_results<std::string_view::const_iterator> match;
  if (std::regex_search(manifest.begin(), manifest.end(), match, TaggedImageField())) {
    return match[1].str();
  }
  return std::nullopt;
}

std::unordered_map<std::string, std::optional<std::string>> ParseInstanceBuilds(std::string_view text) {
  std::unordered_map<std::string, std::optional<std::string>> builds;

  for (const auto& line : util::SplitLines(text)) {
    std::smatch match;
    if (!std::regex_search(line, match, BuildRow())) continue;

    // Header row of custom-columns output.
    if (match[1].str() == "NAME") continue;

    builds[match[1].str()] = ExtractBuild(match[2].str());
  }

  return builds;
}

std::optional<std::string> RewriteBuild(const std::string& manifest, const std::string& build) {
  if (!std::regex_search(manifest, ImageField())) {
    return std::nullopt;
  }
  return std::regex_replace(manifest, ImageField(), "$1:build-" + build, std::regex_constants::format_first_only);
}

} // namespace kuberoll::inventory
