#pragma once
#include "types.hpp"
#include <string>

namespace cachesim {

/**
 * @brief Receptor de eventos de la jerarquía (estadísticas, logs, tests).
 *
 * Los niveles lo llaman "fire-and-forget": si un hook lanza una
 * std::exception, el nivel la loguea y sigue con la cascada.
 * Contrato: los hooks sólo pueden fallar con std::exception (o derivadas).
 * Cualquier otro tipo lanzado no se captura y corta la cascada en curso.
 */
class HierarchyNotifier {
public:
  virtual ~HierarchyNotifier() = default;

  virtual void report_hit(const std::string& level, Operation op, Addr addr) = 0;
  virtual void report_miss(const std::string& level, Operation op, Addr addr) = 0;
  virtual void report_writeback(const std::string& level, Addr addr) = 0;
  virtual void report_eviction(const std::string& level, Addr addr) = 0;
};

} // namespace cachesim
