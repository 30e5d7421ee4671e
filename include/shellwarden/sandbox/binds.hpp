#pragma once

#include <optional>
#include <string>
#include <vector>

namespace shellwarden::sandbox {

/// One `host:container[:mode]` bind spec.
struct BindSpec {
  std::string host;
  std::string container;
  std::optional<std::string> mode;

  /// No mode counts as read-write, matching docker's default.
  [[nodiscard]] bool writable() const;
};

[[nodiscard]] std::optional<BindSpec> parse_bind(const std::string &spec);

/// Collapses binds that target the same container path (trailing '/' ignored),
/// keeping a read-write entry over a read-only one. Order follows the first
/// occurrence of each target.
[[nodiscard]] std::vector<std::string> dedupe_binds_prefer_rw(const std::vector<std::string> &binds);

} // namespace shellwarden::sandbox
