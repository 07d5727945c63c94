#include "stats.hpp"
#include "config.hpp"
#include <iomanip>

namespace cachesim {

void StatsCollector::echo(const std::string& level, const char* event, const char* op,
                          Addr addr) const {
  if (!echo_) return;
  SOUT << level << ' ' << event << ' ' << op
       << " 0x" << std::hex << std::setw(cfg::kAddrHexDigits) << std::setfill('0') << addr
       << std::dec << '\n';
}

void StatsCollector::report_hit(const std::string& level, Operation op, Addr addr) {
  auto& m = per_level_[level];
  switch (op) {
    case Operation::Read:            m.reads++;  m.read_hits++;  break;
    case Operation::Write:           m.writes++; m.write_hits++; break;
    case Operation::WritebackNotify: m.wb_notifies++;            break;
  }
  echo(level, "hit", to_string(op), addr);
}

void StatsCollector::report_miss(const std::string& level, Operation op, Addr addr) {
  auto& m = per_level_[level];
  switch (op) {
    case Operation::Read:  m.reads++;  m.read_misses++;  break;
    case Operation::Write: m.writes++; m.write_misses++; break;
    case Operation::WritebackNotify: break; // un WB notify nunca es miss
  }
  echo(level, "miss", to_string(op), addr);
}

void StatsCollector::report_writeback(const std::string& level, Addr addr) {
  per_level_[level].writebacks++;
  echo(level, "writeback", "-", addr);
}

void StatsCollector::report_eviction(const std::string& level, Addr addr) {
  per_level_[level].evictions++;
  echo(level, "evict", "-", addr);
}

const LevelMetrics& StatsCollector::metrics(const std::string& level) const {
  static const LevelMetrics kEmpty{};
  auto it = per_level_.find(level);
  return it == per_level_.end() ? kEmpty : it->second;
}

void StatsCollector::print(std::ostream& os, const std::vector<std::string>& levels) const {
  os << "----- Métricas por nivel -----\n";
  for (const auto& name : levels) {
    const auto& m = metrics(name);
    os << name
       << " | Reads: " << m.reads
       << " | Writes: " << m.writes
       << " | Hits: " << (m.read_hits + m.write_hits)
       << " (R " << m.read_hits << " / W " << m.write_hits << ")"
       << " | Misses: " << m.misses()
       << " (R " << m.read_misses << " / W " << m.write_misses << ")"
       << " | HitRate: " << std::fixed << std::setprecision(2) << (m.hit_rate() * 100.0) << "%"
       << " | WB-in: " << m.wb_notifies
       << " | Writebacks: " << m.writebacks
       << " | Evictions: " << m.evictions
       << "\n";
  }
  os << "------------------------------\n";
}

} // namespace cachesim
