#pragma once
#include "types.hpp"
#include <list>
#include <optional>
#include <string>

namespace cachesim {

// Conjunto cerrado de políticas de reemplazo.
enum class EvictionPolicy : std::uint8_t { FIFO, LRU, MRU };

/**
 * @brief Elige la víctima sobre el orden de un set.
 *
 * Convención del orden: front = más viejo / menos reciente,
 * back = más nuevo / más reciente. No modifica el set.
 * Devuelve nullopt si el set está vacío.
 */
std::optional<Tag> select_victim(EvictionPolicy policy, const std::list<Tag>& order);

// ¿Un hit mueve el tag al final? (LRU/MRU sí, FIFO no)
bool updates_recency(EvictionPolicy policy);

EvictionPolicy parse_eviction_policy(const std::string& name);

inline const char* to_string(EvictionPolicy p) {
  switch (p) {
    case EvictionPolicy::FIFO: return "FIFO";
    case EvictionPolicy::LRU:  return "LRU";
    case EvictionPolicy::MRU:  return "MRU";
  }
  return "?";
}

} // namespace cachesim
