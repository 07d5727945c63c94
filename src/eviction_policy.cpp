#include "eviction_policy.hpp"
#include "errors.hpp"
#include "text_util.hpp"

namespace cachesim {

std::optional<Tag> select_victim(EvictionPolicy policy, const std::list<Tag>& order) {
  if (order.empty()) return std::nullopt;

  switch (policy) {
    case EvictionPolicy::FIFO: // el más viejo en llegar
    case EvictionPolicy::LRU:  // el menos usado recientemente
      return order.front();
    case EvictionPolicy::MRU:  // el más reciente
      return order.back();
  }
  return std::nullopt;
}

bool updates_recency(EvictionPolicy policy) {
  switch (policy) {
    case EvictionPolicy::FIFO: return false;
    case EvictionPolicy::LRU:
    case EvictionPolicy::MRU:  return true;
  }
  return false;
}

EvictionPolicy parse_eviction_policy(const std::string& name) {
  const auto u = text::upper(text::trim(name));
  if (u == "FIFO") return EvictionPolicy::FIFO;
  if (u == "LRU")  return EvictionPolicy::LRU;
  if (u == "MRU")  return EvictionPolicy::MRU;
  throw ConfigurationError("Política de reemplazo desconocida: '" + name + "'");
}

} // namespace cachesim
