#include "stressrig/translator.hpp"

#include <regex>
#include <sstream>

#include "stressrig/log.hpp"

namespace stressrig {

namespace {

bool contains(const std::string& s, std::string_view needle) {
  return s.find(needle) != std::string::npos;
}

// str.replace semantics: every non-overlapping occurrence, left to right.
std::string replace_all(const std::string& s, const std::string& from, const std::string& to) {
  if (from.empty()) return s;
  std::string out;
  out.reserve(s.size());
  size_t pos = 0;
  while (true) {
    const size_t hit = s.find(from, pos);
    if (hit == std::string::npos) break;
    out.append(s, pos, hit - pos);
    out += to;
    pos = hit + from.size();
  }
  out.append(s, pos, std::string::npos);
  return out;
}

std::string add_no_warmup(const std::string& cmd) {
  if (contains(cmd, "no-warmup")) return cmd;
  static const std::regex re("(" + std::string(kCqlStressTool) + " [\\w]+)");
  return std::regex_replace(cmd, re, "$1 no-warmup");
}

std::string inject_keyspace(const std::string& cmd, const TranslationContext& ctx) {
  static const std::regex existing("keyspace=[^\\s'\"]*");
  if (!ctx.keyspace_name.empty()) {
    // A configured name wins over anything already in the command.
    if (std::regex_search(cmd, existing)) {
      return std::regex_replace(cmd, existing, "keyspace=" + ctx.keyspace_name);
    }
    return replace_all(cmd, " -schema ", " -schema keyspace=" + ctx.keyspace_name + " ");
  }
  if (contains(cmd, "keyspace=")) return cmd;
  return replace_all(cmd, " -schema ",
                     " -schema keyspace=keyspace" + std::to_string(ctx.keyspace_index) + " ");
}

std::string inject_compaction(const std::string& cmd, const TranslationContext& ctx) {
  if (ctx.compaction_strategy.empty() || contains(cmd, "compaction(")) return cmd;
  return replace_all(cmd, " -schema ",
                     " -schema 'compaction(strategy=" + ctx.compaction_strategy + ")' ");
}

std::string rewrite_column_count(const std::string& cmd) {
  if (!contains(cmd, "-col")) return cmd;
  // cql-stress takes a plain column count where cassandra-stress took FIXED(k).
  static const std::regex re(" ('?)n=[\\s]*fixed\\(([0-9]+)\\)('?)", std::regex::icase);
  return std::regex_replace(cmd, re, " $1n=$2$3");
}

std::string rewrite_rate(const std::string& cmd) {
  if (!contains(cmd, "-rate")) return cmd;
  // In cql-stress "fixed" is a flag asking for coordinated-omission-fixed
  // latencies; the rate itself moves to throttle=.
  static const std::regex re(" fixed=[\\s]*([0-9]+/s)");
  return std::regex_replace(cmd, re, " throttle=$1 fixed");
}

std::string rewrite_population(const std::string& cmd) {
  if (!contains(cmd, "-pop")) return cmd;
  static const std::regex re(" seq=[\\s]*([\\d]+\\.\\.[\\d]+)");
  return std::regex_replace(cmd, re, " 'dist=SEQ($1)'");
}

std::string inject_nodes(const std::string& cmd, const TranslationContext& ctx) {
  if (ctx.node_list.empty() || contains(cmd, "-node")) return cmd;
  std::string out = cmd + " -node ";
  if (ctx.multi_region) {
    std::optional<std::string> dc;
    if (ctx.datacenter_lookup) dc = ctx.datacenter_lookup->resolve_datacenter(ctx.loader_region);
    if (dc) {
      out += "datacenter=" + *dc + " ";
    } else {
      Logger::error("translator", "Not found datacenter for loader region '" +
                                      ctx.loader_region +
                                      "', targeting nodes without a datacenter");
    }
  }
  for (size_t i = 0; i < ctx.node_list.size(); ++i) {
    if (i > 0) out += ',';
    out += ctx.node_list[i];
  }
  return out;
}

}  // namespace

std::string CqlStressTranslator::translate(const std::string& command,
                                           const TranslationContext& ctx) const {
  std::string cmd = add_no_warmup(command);
  cmd = inject_keyspace(cmd, ctx);
  cmd = inject_compaction(cmd, ctx);
  cmd = rewrite_column_count(cmd);
  cmd = rewrite_rate(cmd);
  cmd = rewrite_population(cmd);
  cmd = inject_nodes(cmd, ctx);
  return cmd;
}

std::string stress_subcommand(const std::string& command, std::string_view tool) {
  const size_t pos = command.find(tool);
  if (pos == std::string::npos) return "";
  std::istringstream rest(command.substr(pos + tool.size()));
  std::string word;
  rest >> word;
  return word;
}

}  // namespace stressrig
