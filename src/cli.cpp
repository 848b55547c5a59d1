#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "stressrig/config.hpp"
#include "stressrig/container.hpp"
#include "stressrig/log.hpp"
#include "stressrig/metrics.hpp"
#include "stressrig/observability.hpp"
#include "stressrig/stress_thread.hpp"
#include "stressrig/topology.hpp"
#include "stressrig/translator.hpp"
#include "stressrig/version.hpp"

namespace {

void usage() {
  std::cerr << "usage:\n"
               "  stressrig translate --cmd <command> [--keyspace-index N] [--keyspace-name X]\n"
               "                      [--compaction S] [--nodes a,b,...]\n"
               "  stressrig run --config <file.json> [--metrics]\n"
               "  stressrig version\n";
}

std::vector<std::string> split_csv(const std::string& s) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

bool parse_u32(const std::string& s, uint32_t* out) {
  if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) return false;
  try {
    const unsigned long v = std::stoul(s);
    if (v > 0xFFFFFFFFul) return false;
    *out = static_cast<uint32_t>(v);
    return true;
  } catch (const std::out_of_range&) {
    return false;
  }
}

int cmd_translate(int argc, char** argv) {
  std::string command;
  stressrig::TranslationContext ctx;
  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--cmd" && i + 1 < argc) {
      command = argv[++i];
    } else if (arg == "--keyspace-index" && i + 1 < argc) {
      if (!parse_u32(argv[++i], &ctx.keyspace_index) || ctx.keyspace_index == 0) {
        std::cerr << "{\"error\":\"--keyspace-index must be a positive integer\"}\n";
        return 2;
      }
    } else if (arg == "--keyspace-name" && i + 1 < argc) {
      ctx.keyspace_name = argv[++i];
    } else if (arg == "--compaction" && i + 1 < argc) {
      ctx.compaction_strategy = argv[++i];
    } else if (arg == "--nodes" && i + 1 < argc) {
      ctx.node_list = split_csv(argv[++i]);
    } else {
      usage();
      return 2;
    }
  }
  if (command.empty()) {
    usage();
    return 2;
  }
  stressrig::CqlStressTranslator translator;
  std::cout << translator.translate(command, ctx) << "\n";
  return 0;
}

int cmd_run(int argc, char** argv) {
  std::string config_path;
  bool print_metrics = false;
  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--metrics") {
      print_metrics = true;
    } else {
      usage();
      return 2;
    }
  }
  if (config_path.empty()) {
    usage();
    return 2;
  }

  stressrig::ConfigError err;
  auto config = stressrig::load_config_file(config_path, &err);
  if (!config) {
    stressrig::Logger::error("cli", "cannot load " + config_path + ": " + err.message);
    return 2;
  }
  stressrig::apply_env_overrides(*config);
  const auto problems = config->validate();
  if (!problems.empty()) {
    for (const auto& p : problems) stressrig::Logger::error("cli", "config: " + p);
    return 2;
  }

  stressrig::DockerSandbox sandbox;
  stressrig::NodeTopology topology(config->nodes);
  stressrig::DefaultEventSink sink(config->event_log_path);
  stressrig::StressThread stress(*config, sandbox, sink, &topology);

  stress.run();
  const auto outcomes = stress.get_results();

  bool all_ok = !outcomes.empty();
  for (const auto& o : outcomes) {
    std::cout << o.to_json() << "\n";
    all_ok = all_ok && o.ok();
  }
  stressrig::Logger::info("cli", "stats " + stressrig::global_stress_stats().to_json());
  if (print_metrics) std::cerr << stressrig::global_metrics().to_text();
  return all_ok ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
  stressrig::Logger::init_from_env();
  if (argc < 2) {
    usage();
    return 2;
  }
  const std::string cmd = argv[1];

  if (cmd == "translate") return cmd_translate(argc, argv);
  if (cmd == "run") return cmd_run(argc, argv);
  if (cmd == "version") {
    std::cout << stressrig::version::manifest_json() << "\n";
    return 0;
  }

  usage();
  return 2;
}
