#include "stressrig/config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include "stressrig/jsonlite.hpp"
#include "stressrig/translator.hpp"

namespace stressrig {

namespace {

// Top-level keys must not be confused with keys inside the node arrays.
std::string strip_array(const std::string& json, const std::string& key) {
  const auto start = json.find("\"" + key + "\"");
  if (start == std::string::npos) return json;
  const auto open = json.find('[', start);
  if (open == std::string::npos) return json;
  int depth = 0;
  bool in_string = false;
  for (size_t i = open; i < json.size(); ++i) {
    const char c = json[i];
    if (in_string) {
      if (c == '\\') ++i;
      else if (c == '"') in_string = false;
      continue;
    }
    if (c == '"') in_string = true;
    else if (c == '[') ++depth;
    else if (c == ']' && --depth == 0) return json.substr(0, start) + json.substr(i + 1);
  }
  return json;
}

}  // namespace

std::vector<std::string> StressConfig::validate() const {
  std::vector<std::string> problems;
  if (stress_cmd.empty()) {
    problems.push_back("stress_cmd is empty");
  } else if (stress_cmd.find(kCqlStressTool) == std::string::npos) {
    problems.push_back("stress_cmd does not invoke " + std::string(kCqlStressTool));
  } else if (stress_subcommand(stress_cmd).empty()) {
    problems.push_back("stress_cmd has no subcommand after " + std::string(kCqlStressTool));
  }
  if (timeout_s == 0) problems.push_back("timeout_s must be positive");
  if (stress_num == 0) problems.push_back("stress_num must be positive");
  if (keyspace_num == 0) problems.push_back("keyspace_num must be positive");
  if (docker_image.empty()) problems.push_back("docker_image is empty");
  if (loaders.empty()) problems.push_back("no loaders configured");
  for (const auto& l : loaders) {
    if (l.name.empty()) problems.push_back("loader without a name");
    if (l.logdir.empty()) problems.push_back("loader " + l.name + " has no logdir");
  }
  for (const auto& n : nodes) {
    if (n.cql_address.empty()) problems.push_back("node " + n.name + " has no cql_address");
  }
  return problems;
}

std::vector<std::string> StressConfig::node_addresses() const {
  std::vector<std::string> out;
  out.reserve(nodes.size());
  for (const auto& n : nodes) out.push_back(n.cql_address);
  return out;
}

std::optional<StressConfig> parse_config(const std::string& json, ConfigError* err) {
  const auto first = json.find_first_not_of(" \t\r\n");
  if (first == std::string::npos || json[first] != '{') {
    if (err) err->message = "config must be a JSON object";
    return std::nullopt;
  }

  StressConfig c;
  const std::string top = strip_array(strip_array(json, "nodes"), "loaders");
  namespace jl = jsonlite;

  c.stress_cmd = jl::get_string(top, "stress_cmd", c.stress_cmd);
  c.timeout_s = jl::get_u64(top, "timeout_s", c.timeout_s);
  c.stress_num = static_cast<uint32_t>(jl::get_u64(top, "stress_num", c.stress_num));
  c.keyspace_num = static_cast<uint32_t>(jl::get_u64(top, "keyspace_num", c.keyspace_num));
  c.keyspace_name = jl::get_string(top, "keyspace_name", c.keyspace_name);
  c.compaction_strategy = jl::get_string(top, "compaction_strategy", c.compaction_strategy);
  c.round_robin = jl::get_bool(top, "round_robin", c.round_robin);
  c.stop_test_on_failure = jl::get_bool(top, "stop_test_on_failure", c.stop_test_on_failure);
  c.docker_image = jl::get_string(top, "docker_image", c.docker_image);
  c.multi_region = jl::get_bool(top, "multi_region", c.multi_region);
  c.archive_logs = jl::get_bool(top, "archive_logs", c.archive_logs);
  c.event_log_path = jl::get_string(top, "event_log_path", c.event_log_path);
  c.run_id = jl::get_string(top, "run_id", c.run_id);

  for (const auto& obj : jl::get_object_array(json, "nodes")) {
    DbNode n;
    n.name = jl::get_string(obj, "name");
    n.cql_address = jl::get_string(obj, "cql_address");
    n.region = jl::get_string(obj, "region");
    n.datacenter = jl::get_string(obj, "datacenter");
    c.nodes.push_back(std::move(n));
  }
  for (const auto& obj : jl::get_object_array(json, "loaders")) {
    LoaderNode l;
    l.name = jl::get_string(obj, "name");
    l.ip_address = jl::get_string(obj, "ip_address");
    l.region = jl::get_string(obj, "region");
    l.logdir = jl::get_string(obj, "logdir");
    l.ssh_target = jl::get_string(obj, "ssh_target");
    c.loaders.push_back(std::move(l));
  }
  return c;
}

std::optional<StressConfig> load_config_file(const std::string& path, ConfigError* err) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    if (err) err->message = "cannot open config file " + path;
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << ifs.rdbuf();
  return parse_config(ss.str(), err);
}

void apply_env_overrides(StressConfig& config) {
  if (const char* e = std::getenv("STRESSRIG_STRESS_IMAGE"); e && e[0]) {
    config.docker_image = e;
  }
  if (const char* e = std::getenv("STRESSRIG_TIMEOUT_S"); e && e[0]) {
    char* end = nullptr;
    const unsigned long long v = std::strtoull(e, &end, 10);
    if (end && *end == '\0') config.timeout_s = v;
  }
  if (const char* e = std::getenv("STRESSRIG_EVENT_LOG"); e && e[0]) {
    config.event_log_path = e;
  }
  if (const char* e = std::getenv("STRESSRIG_MULTI_REGION"); e && e[0]) {
    const std::string v(e);
    config.multi_region = (v == "1" || v == "true");
  }
}

}  // namespace stressrig
