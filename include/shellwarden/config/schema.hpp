#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace shellwarden::config {

struct SandboxConfig {
  std::string image = "node:20";
  std::string network_mode = "none";
  std::string default_mount_path;
  std::string working_dir = "/workspace/src";
  std::string user = "1000:1000";
  double cpu_count = 2.0;
  std::int64_t memory_bytes = 2LL * 1024 * 1024 * 1024;
  std::int64_t pids_limit = 512;
  std::int64_t default_timeout_sec = 900;
  bool ensure_mounts_exist = true;
  // "host:container" pairs mounted read-write next to the read-only repository.
  std::vector<std::string> writable_mounts;
  std::uint64_t docker_timeout_sec = 60;
};

struct RiskAssessorConfig {
  bool enabled = true;
  std::string provider = "openrouter";
  std::string model = "gpt-4o-mini";
  double temperature = 0.0;
  std::optional<std::string> api_key;
};

struct ReliabilityConfig {
  std::uint32_t provider_retries = 2;
  std::uint64_t provider_backoff_ms = 200;
  std::vector<std::string> fallback_providers;
};

struct ObservabilityConfig {
  std::string backend = "log";
  bool verbose = false;
};

struct Config {
  SandboxConfig sandbox;
  RiskAssessorConfig risk_assessor;
  ReliabilityConfig reliability;
  ObservabilityConfig observability;
};

} // namespace shellwarden::config
