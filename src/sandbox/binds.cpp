#include "shellwarden/sandbox/binds.hpp"

#include "shellwarden/common/fs.hpp"

#include <sstream>
#include <unordered_map>

namespace shellwarden::sandbox {

namespace {

std::string normalize_target(std::string target) {
  while (target.size() > 1 && target.back() == '/') {
    target.pop_back();
  }
  return target;
}

} // namespace

bool BindSpec::writable() const {
  if (!mode.has_value()) {
    return true;
  }
  // Modes may be combined, e.g. "ro,z".
  std::stringstream stream(common::to_lower(*mode));
  std::string flag;
  while (std::getline(stream, flag, ',')) {
    flag = common::trim(flag);
    if (flag == "ro" || flag == "readonly") {
      return false;
    }
  }
  return true;
}

std::optional<BindSpec> parse_bind(const std::string &spec) {
  const std::string trimmed = common::trim(spec);
  const auto first = trimmed.find(':');
  if (first == std::string::npos || first == 0) {
    return std::nullopt;
  }

  BindSpec bind;
  bind.host = trimmed.substr(0, first);
  const std::string rest = trimmed.substr(first + 1);
  const auto second = rest.find(':');
  if (second == std::string::npos) {
    bind.container = rest;
  } else {
    bind.container = rest.substr(0, second);
    bind.mode = rest.substr(second + 1);
  }
  if (bind.container.empty()) {
    return std::nullopt;
  }
  return bind;
}

std::vector<std::string> dedupe_binds_prefer_rw(const std::vector<std::string> &binds) {
  std::vector<std::string> order;
  std::unordered_map<std::string, std::pair<std::string, bool>> chosen;

  for (const auto &raw : binds) {
    const auto bind = parse_bind(raw);
    if (!bind.has_value()) {
      continue;
    }
    const std::string target = normalize_target(bind->container);
    const bool writable = bind->writable();
    auto it = chosen.find(target);
    if (it == chosen.end()) {
      order.push_back(target);
      chosen.emplace(target, std::make_pair(common::trim(raw), writable));
      continue;
    }
    if (writable && !it->second.second) {
      it->second = std::make_pair(common::trim(raw), writable);
    }
  }

  std::vector<std::string> out;
  out.reserve(order.size());
  for (const auto &target : order) {
    out.push_back(chosen.at(target).first);
  }
  return out;
}

} // namespace shellwarden::sandbox
