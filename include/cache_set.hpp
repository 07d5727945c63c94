#pragma once
#include "types.hpp"
#include "cache_block.hpp"
#include "eviction_policy.hpp"
#include <cstddef>
#include <list>
#include <optional>
#include <unordered_map>

namespace cachesim {

/**
 * @brief Set de una caché: bloques residentes (tag -> CacheBlock) acotados
 * por la asociatividad.
 *
 * El orden se guarda explícito en una lista doblemente enlazada
 * (front = más viejo, back = más reciente) con un índice hash a sus nodos,
 * así touch/insert/remove/victim son O(1).
 *
 * Los errores de uso (insertar lleno, tocar un tag ausente) lanzan
 * CapacityExceeded / NotFound: el CacheLevel debe evitarlos.
 */
class CacheSet {
public:
  CacheSet(std::size_t associativity, EvictionPolicy policy);

  // Los bloques guardan iteradores a order_: copiar rompería esos punteros.
  CacheSet(const CacheSet&) = delete;
  CacheSet& operator=(const CacheSet&) = delete;
  CacheSet(CacheSet&&) = default;
  CacheSet& operator=(CacheSet&&) = default;

  bool contains(Tag tag) const { return blocks_.count(tag) != 0; }

  bool get_dirty(Tag tag) const;
  void set_dirty(Tag tag, bool dirty);

  void insert(Tag tag, bool dirty);
  void remove(Tag tag);
  void touch(Tag tag);

  std::optional<Tag> select_victim() const;

  std::size_t size()     const { return blocks_.size(); }
  std::size_t capacity() const { return associativity_; }
  bool        full()     const { return blocks_.size() >= associativity_; }
  bool        empty()    const { return blocks_.empty(); }
  EvictionPolicy policy() const { return policy_; }

  // Vista de sólo lectura del orden (dumps e invariantes)
  const std::list<Tag>& order() const { return order_; }

private:
  std::size_t    associativity_;
  EvictionPolicy policy_;

  std::list<Tag>                      order_;
  std::unordered_map<Tag, CacheBlock> blocks_;

  CacheBlock&       find_or_throw(Tag tag, const char* op);
  const CacheBlock& find_or_throw(Tag tag, const char* op) const;
};

} // namespace cachesim
