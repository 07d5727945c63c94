#pragma once
#include "notifier.hpp"
#include "metrics.hpp"
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace cachesim {

// Notifier por defecto: acumula LevelMetrics por nombre de nivel.
// Con echo activo, imprime cada evento en stdout (una línea por evento).
class StatsCollector : public HierarchyNotifier {
public:
  explicit StatsCollector(bool echo = false) : echo_(echo) {}

  void report_hit(const std::string& level, Operation op, Addr addr) override;
  void report_miss(const std::string& level, Operation op, Addr addr) override;
  void report_writeback(const std::string& level, Addr addr) override;
  void report_eviction(const std::string& level, Addr addr) override;

  // Nivel sin eventos -> métricas en cero
  const LevelMetrics& metrics(const std::string& level) const;
  void clear_metrics() { per_level_.clear(); }

  void set_echo(bool on) { echo_ = on; }

  // Tabla de métricas en el orden dado (el de la jerarquía)
  void print(std::ostream& os, const std::vector<std::string>& levels) const;

private:
  std::map<std::string, LevelMetrics> per_level_;
  bool echo_;

  void echo(const std::string& level, const char* event, const char* op, Addr addr) const;
};

} // namespace cachesim
