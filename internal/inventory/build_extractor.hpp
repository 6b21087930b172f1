#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace kuberoll::inventory {

/*
  Build identifiers follow the image tag convention `build-<number>`; any tag
  ending in `-<digits>` is accepted and the digits are the build.
*/

// First image reference in `text` whose tag carries a build, e.g.
// "registry/app:build-42" -> "42". std::nullopt for "registry/app:latest".
std::optional<std::string> ExtractBuild(std::string_view text);

// Build of the first `image:` field of a deployment manifest. Image references
// elsewhere, such as the last-applied-configuration annotation, are ignored.
std::optional<std::string> ExtractManifestBuild(std::string_view manifest);

// Answer of the batched image query, one "<instance id> <image>[,<image>...]"
// row per instance. Keyed by id so the cluster's row order does not matter;
// a row whose images carry no build maps to std::nullopt.
std::unordered_map<std::string, std::optional<std::string>> ParseInstanceBuilds(std::string_view text);

// Replaces the tag of the first `image:` field with `build-<build>`.
// std::nullopt when the manifest has no tagged image field.
std::optional<std::string> RewriteBuild(const std::string& manifest, const std::string& build);

} // namespace kuberoll::inventory
