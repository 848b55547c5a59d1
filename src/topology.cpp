#include "stressrig/topology.hpp"

#include <sstream>

#include "stressrig/jsonlite.hpp"

namespace stressrig {

std::string LoaderNode::to_json() const {
  std::ostringstream o;
  o << "{\"name\":\"" << jsonlite::escape(name) << "\""
    << ",\"ip_address\":\"" << jsonlite::escape(ip_address) << "\""
    << ",\"region\":\"" << jsonlite::escape(region) << "\"}";
  return o.str();
}

NodeTopology::NodeTopology(const std::vector<DbNode>& db_nodes) {
  for (const auto& n : db_nodes) {
    if (!n.region.empty() && !n.datacenter.empty()) register_region(n.region, n.datacenter);
  }
}

void NodeTopology::register_region(const std::string& region, const std::string& datacenter) {
  std::lock_guard<std::mutex> lk(mu_);
  dc_by_region_.emplace(region, datacenter);
}

std::optional<std::string> NodeTopology::resolve_datacenter(const std::string& region) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = dc_by_region_.find(region);
  if (it == dc_by_region_.end()) return std::nullopt;
  return it->second;
}

std::map<std::string, std::string> NodeTopology::datacenter_per_region() const {
  std::lock_guard<std::mutex> lk(mu_);
  return dc_by_region_;
}

std::string NodeTopology::to_json() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::string out = "{";
  bool first = true;
  for (const auto& [region, dc] : dc_by_region_) {
    if (!first) out += ',';
    first = false;
    out += "\"" + jsonlite::escape(region) + "\":\"" + jsonlite::escape(dc) + "\"";
  }
  out += '}';
  return out;
}

}  // namespace stressrig
