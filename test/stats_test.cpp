#include <iostream>
#include <sstream>
#include <string>
#include "hierarchy.hpp"
#include "stats.hpp"
#include "test_helpers.hpp"

using namespace cachesim;

static LevelConfig make_cfg(const std::string& name, std::size_t size, std::size_t ways) {
  LevelConfig c;
  c.name = name;
  c.size = size;
  c.block_size = 16;
  c.associativity = ways;
  c.eviction = EvictionPolicy::LRU;
  return c;
}

bool testStats() {
  std::cout << "[StatsTest] Testing...\n";
  bool passed = true;

  passed &= runTest("Counters follow the two-level scenario", [&]() {
    StatsCollector stats;
    Hierarchy h({make_cfg("L1", 64, 1), make_cfg("L2", 128, 2)}, stats);
    h.access('W', 0x00);
    h.access('R', 0x40);
    h.access('R', 0x40);
    const auto& l1 = stats.metrics("L1");
    const auto& l2 = stats.metrics("L2");
    return l1.writes == 1 && l1.write_misses == 1 && l1.reads == 2 &&
           l1.read_misses == 1 && l1.read_hits == 1 &&
           l1.writebacks == 1 && l1.evictions == 1 &&
           l2.reads == 2 && l2.read_misses == 2 && l2.wb_notifies == 1 &&
           l2.hits() == 1 && l2.writebacks == 0;
  });
  passed &= runTest("Hit rate over reads and writes", [&]() {
    LevelMetrics m;
    m.reads = 3; m.read_hits = 2; m.read_misses = 1;
    m.writes = 1; m.write_hits = 1;
    m.wb_notifies = 5;
    return m.accesses() == 4 && m.hit_rate() == 0.75 && LevelMetrics{}.hit_rate() == 0.0;
  });
  passed &= runTest("Unknown level reports zeros", [&]() {
    StatsCollector stats;
    return stats.metrics("L7").accesses() == 0;
  });
  passed &= runTest("Reset clears counters", [&]() {
    StatsCollector stats;
    stats.report_miss("L1", Operation::Read, 0x0);
    LevelMetrics copy = stats.metrics("L1");
    copy.reset();
    stats.clear_metrics();
    return copy.reads == 0 && stats.metrics("L1").reads == 0;
  });
  passed &= runTest("Printed table lists levels in order", [&]() {
    StatsCollector stats;
    Hierarchy h({make_cfg("L1", 64, 1), make_cfg("L2", 128, 2)}, stats);
    h.access('R', 0x00);
    std::ostringstream os;
    stats.print(os, h.level_names());
    const auto out = os.str();
    const auto p1 = out.find("L1 | Reads: 1");
    const auto p2 = out.find("L2 | Reads: 1");
    return p1 != std::string::npos && p2 != std::string::npos && p1 < p2 &&
           out.find("HitRate: 0.00%") != std::string::npos;
  });

  std::cout << "[StatsTest] " << (passed ? "Passed" : "Failed") << "\n";
  return passed;
}
