#pragma once
#include <cstdint>

namespace cachesim {

/**
 * Métricas por nivel.
 * - reads/writes: accesos R/W que llegaron al nivel (hits + misses).
 * - wb_notifies: bloques sucios recibidos del lado requester (cuentan como hit).
 * - writebacks: bloques sucios que este nivel devolvió al invalidarlos.
 * - evictions: bloques eliminados (por reemplazo o invalidación inclusiva).
 */
struct LevelMetrics {
  std::uint64_t reads = 0;
  std::uint64_t writes = 0;
  std::uint64_t read_hits = 0;
  std::uint64_t read_misses = 0;
  std::uint64_t write_hits = 0;
  std::uint64_t write_misses = 0;

  std::uint64_t wb_notifies = 0;
  std::uint64_t writebacks = 0;
  std::uint64_t evictions = 0;

  std::uint64_t hits()     const { return read_hits + write_hits + wb_notifies; }
  std::uint64_t misses()   const { return read_misses + write_misses; }
  std::uint64_t accesses() const { return reads + writes; }

  // Sobre accesos R/W (los WB notify no cuentan para la tasa)
  double hit_rate() const {
    const auto n = accesses();
    return n ? static_cast<double>(read_hits + write_hits) / static_cast<double>(n) : 0.0;
  }

  void reset() { *this = {}; }
};

} // namespace cachesim
