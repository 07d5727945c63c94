#pragma once
#include "types.hpp"
#include <list>

namespace cachesim {

// Bloque residente (versión light): sólo estado, sin datos.
// El orden de llegada/uso lo da la lista del CacheSet, no el bloque.
struct CacheBlock {
  bool dirty{false};                 // escrito y aún no devuelto al backing
  std::list<Tag>::iterator pos{};    // nodo en el orden del set
};

} // namespace cachesim
