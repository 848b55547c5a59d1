#pragma once

// stressrig/config.hpp - Stress run configuration.
//
// Sources, later wins:
//   1. Defaults below.
//   2. JSON file (load_config_file) or text (parse_config).
//   3. Environment (apply_env_overrides):
//        STRESSRIG_STRESS_IMAGE   docker_image
//        STRESSRIG_TIMEOUT_S      timeout_s
//        STRESSRIG_EVENT_LOG      event_log_path
//        STRESSRIG_MULTI_REGION   multi_region ("1"/"true")
//
// JSON shape:
//   {"stress_cmd":"...", "timeout_s":600, "stress_num":1, "keyspace_num":1,
//    "keyspace_name":"", "compaction_strategy":"", "round_robin":false,
//    "stop_test_on_failure":true, "docker_image":"...", "multi_region":false,
//    "archive_logs":false, "event_log_path":"", "run_id":"",
//    "nodes":[{"name":"db1","cql_address":"10.0.0.1","region":"eu-west",
//              "datacenter":"eu-westscylla_node_west"}],
//    "loaders":[{"name":"loader1","ip_address":"10.0.1.1","region":"eu-west",
//                "logdir":"/tmp/stress-logs/loader1","ssh_target":""}]}

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "stressrig/container.hpp"
#include "stressrig/topology.hpp"

namespace stressrig {

struct StressConfig {
  std::string stress_cmd;
  uint64_t timeout_s{600};
  uint32_t stress_num{1};
  uint32_t keyspace_num{1};
  std::string keyspace_name;
  std::string compaction_strategy;
  bool round_robin{false};
  bool stop_test_on_failure{true};
  std::string docker_image{kDefaultStressImage};
  bool multi_region{false};
  bool archive_logs{false};
  std::string event_log_path;
  std::string run_id;              // seeds the shell marker; empty: derived at startup
  std::vector<DbNode> nodes;
  std::vector<LoaderNode> loaders;

  // Problems found, empty when the config is usable.
  std::vector<std::string> validate() const;

  std::vector<std::string> node_addresses() const;
};

struct ConfigError {
  std::string message;
};

// Parses JSON text. Missing keys keep their defaults.
std::optional<StressConfig> parse_config(const std::string& json, ConfigError* err = nullptr);

std::optional<StressConfig> load_config_file(const std::string& path, ConfigError* err = nullptr);

void apply_env_overrides(StressConfig& config);

}  // namespace stressrig
