#pragma once
/**
 * Hierarchy: dueña de los niveles y del cableado de la cadena.
 * Orden del vector: [0] = nivel más cerca del requester (L1) ... [n-1] = el
 * más cerca de memoria. Todo es sincrónico: un access() se resuelve
 * completo (misses, evicciones, writebacks) antes de devolver.
 * Instancias distintas no comparten estado.
 */

#include <cstddef>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "types.hpp"
#include "cache_level.hpp"
#include "notifier.hpp"

namespace cachesim {

struct ReplayOptions {
  bool strict = false;  // true: la primera línea/operación mala corta el replay
};

struct ReplaySummary {
  std::size_t accepted = 0;  // accesos ejecutados
  std::size_t skipped  = 0;  // líneas descartadas (modo no estricto)
};

class Hierarchy {
public:
  Hierarchy(const std::vector<LevelConfig>& levels, HierarchyNotifier& notifier);

  Hierarchy(const Hierarchy&) = delete;
  Hierarchy& operator=(const Hierarchy&) = delete;

  // ---- Accesos (entran por el nivel más externo). Sólo R/W:
  // WritebackNotify o cualquier otro código -> ProtocolError.
  void access(Operation op, Addr addr);
  void access(char code, Addr addr);

  // ---- Replay de traza
  ReplaySummary replay(std::istream& in, const ReplayOptions& opts = {});

  // ---- Consultas
  std::size_t size() const { return levels_.size(); }
  CacheLevel&       level(std::size_t idx)       { return *levels_.at(idx); }
  const CacheLevel& level(std::size_t idx) const { return *levels_.at(idx); }
  const CacheLevel& level(const std::string& name) const;
  std::vector<std::string> level_names() const;

  // Capacidad y unicidad de tags en todos los sets; devuelve las violaciones.
  std::vector<std::string> check_invariants() const;

  // ---- Utilidades
  void dump(std::ostream& os) const;

private:
  std::vector<std::unique_ptr<CacheLevel>> levels_;

  void wire();
};

} // namespace cachesim
