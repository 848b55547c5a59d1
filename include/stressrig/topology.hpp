#pragma once

// stressrig/topology.hpp - Loader/DB node descriptions and region lookup.
//
// DESIGN:
//   Every DB node belongs to exactly one region and one datacenter. A loader
//   only knows its region; the stress tool needs the datacenter name to keep
//   its traffic local in multi-region clusters. NodeTopology answers
//   "which datacenter serves region R" from the DB node list.
//
// INVARIANTS:
//   1. The first DB node registered for a region decides its datacenter.
//   2. Lookups never throw; a miss is std::nullopt and callers decide whether
//      it is fatal.

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace stressrig {

struct LoaderNode {
  std::string name;
  std::string ip_address;
  std::string region;
  std::string logdir;      // local directory for this loader's stress logs
  std::string ssh_target;  // empty: run the container CLI locally

  std::string to_json() const;
};

struct DbNode {
  std::string name;
  std::string cql_address;
  std::string region;
  std::string datacenter;
};

// Collaborator contract used by the translator.
class DatacenterLookup {
 public:
  virtual ~DatacenterLookup() = default;
  virtual std::optional<std::string> resolve_datacenter(const std::string& region) const = 0;
};

// ---------------------------------------------------------------------------
// NodeTopology - in-process region -> datacenter registry.
// ---------------------------------------------------------------------------
// Thread-safe.
class NodeTopology : public DatacenterLookup {
 public:
  NodeTopology() = default;
  explicit NodeTopology(const std::vector<DbNode>& db_nodes);

  // Idempotent by region: a second datacenter for the same region is ignored.
  void register_region(const std::string& region, const std::string& datacenter);

  std::optional<std::string> resolve_datacenter(const std::string& region) const override;

  std::map<std::string, std::string> datacenter_per_region() const;

  // {"<region>":"<datacenter>",...}
  std::string to_json() const;

 private:
  mutable std::mutex mu_;
  std::map<std::string, std::string> dc_by_region_;
};

}  // namespace stressrig
