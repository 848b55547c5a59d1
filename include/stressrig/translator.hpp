#pragma once

// stressrig/translator.hpp - cassandra-stress -> cql-stress command rewriting.
//
// The legacy dialect (cassandra-stress) and the target dialect
// (cql-stress-cassandra-stress) share most of their grammar. Only the flags
// that differ are rewritten; everything else passes through untouched.
//
// RULE ORDER (fixed; later rules inspect the output of earlier ones):
//   1. no-warmup after "<tool> <subcommand>" unless already present
//   2. keyspace: configured name > existing keyspace= > keyspace<index>
//   3. 'compaction(strategy=<s>)' in -schema unless a compaction( clause exists
//   4. -col:  n=FIXED(k) -> n=k       (case-insensitive, optional quotes)
//   5. -rate: fixed=N/s  -> throttle=N/s fixed
//   6. -pop:  seq=a..b   -> 'dist=SEQ(a..b)'
//   7. -node <addresses> when a node list is given and no -node exists
//
// Every rule is a no-op when its result is already present, so translating a
// translated command returns it unchanged. A rule whose section is absent
// (no -schema, -col, -rate or -pop) is skipped; sections are never invented.
//
// Thread-safety: translate() is const and touches no shared state.

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "stressrig/topology.hpp"

namespace stressrig {

constexpr std::string_view kCqlStressTool = "cql-stress-cassandra-stress";

struct TranslationContext {
  uint32_t keyspace_index{1};
  std::string keyspace_name;          // empty: derive from keyspace_index
  std::string compaction_strategy;    // empty: leave compaction alone
  std::vector<std::string> node_list; // CQL addresses; empty: no -node injection
  bool multi_region{false};
  std::string loader_region;
  const DatacenterLookup* datacenter_lookup{nullptr};  // not owned
};

// One dialect, one method. The orchestrator is parameterized by this
// interface rather than subclassed per tool.
class DialectTranslator {
 public:
  virtual ~DialectTranslator() = default;
  virtual std::string translate(const std::string& command,
                                const TranslationContext& ctx) const = 0;
};

class CqlStressTranslator final : public DialectTranslator {
 public:
  std::string translate(const std::string& command,
                        const TranslationContext& ctx) const override;
};

// The word following `tool` in `command` ("write", "read", "mixed", ...).
// Empty when the tool name is missing or is the last token.
std::string stress_subcommand(const std::string& command,
                              std::string_view tool = kCqlStressTool);

}  // namespace stressrig
