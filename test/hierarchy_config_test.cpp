#include <iostream>
#include <string>
#include "errors.hpp"
#include "hierarchy_config.hpp"
#include "test_helpers.hpp"

using namespace cachesim;

static const char* kTwoLevels =
    "; jerarquía de ejemplo\n"
    "[L1]\n"
    "size = 64\n"
    "block_size = 16\n"
    "associativity = 1\n"
    "eviction_policy = lru\n"
    "write_policy = WB\n"
    "\n"
    "[L2]   # backing de L1\n"
    "SIZE=0x80\n"
    "block_size=16\n"
    "associativity=2\n"
    "eviction_policy=FIFO\n"
    "write_policy=write-back\n";

// Sección L1 completa con una línea reemplazada/agregada
static std::string l1_with(const std::string& extra) {
  return "[L1]\nsize = 64\nblock_size = 16\nassociativity = 1\n"
         "eviction_policy = LRU\nwrite_policy = WB\n" + extra;
}

bool testHierarchyConfig() {
  std::cout << "[HierarchyConfigTest] Testing...\n";
  bool passed = true;

  passed &= runTest("Two-level file parsed in order", [&]() {
    auto lv = parse_hierarchy_config(kTwoLevels);
    return lv.size() == 2 &&
           lv[0].name == "L1" && lv[0].size == 64 && lv[0].block_size == 16 &&
           lv[0].associativity == 1 && lv[0].eviction == EvictionPolicy::LRU &&
           lv[1].name == "L2" && lv[1].size == 128 && lv[1].associativity == 2 &&
           lv[1].eviction == EvictionPolicy::FIFO &&
           lv[1].write_policy == WritePolicy::WriteBack;
  });
  passed &= runTest("Default hierarchy is valid", [&]() {
    auto lv = default_hierarchy_config();
    return lv.size() == 2 && lv[0].name == "L1" && lv[1].name == "L2";
  });

  passed &= runTest("Missing key rejected", [&]() {
    return throwsA<ConfigurationError>([] {
      parse_hierarchy_config("[L1]\nsize = 64\nblock_size = 16\neviction_policy = LRU\n"
                             "write_policy = WB\n");
    });
  });
  passed &= runTest("Unknown key rejected", [&]() {
    return throwsA<ConfigurationError>([] { parse_hierarchy_config(l1_with("latency = 4\n")); });
  });
  passed &= runTest("Repeated key rejected", [&]() {
    return throwsA<ConfigurationError>([] { parse_hierarchy_config(l1_with("size = 128\n")); });
  });
  passed &= runTest("Duplicate section rejected", [&]() {
    return throwsA<ConfigurationError>([] {
      parse_hierarchy_config(l1_with("") + l1_with(""));
    });
  });
  passed &= runTest("Bad numbers rejected", [&]() {
    return throwsA<ConfigurationError>([] {
             parse_hierarchy_config("[L1]\nsize = 64k\n");
           }) &&
           throwsA<ConfigurationError>([] { parse_hierarchy_config("[L1]\nsize = -64\n"); });
  });
  passed &= runTest("Unsupported policies rejected", [&]() {
    return throwsA<ConfigurationError>([] {
             parse_hierarchy_config("[L1]\neviction_policy = RANDOM\n");
           }) &&
           throwsA<ConfigurationError>([] {
             parse_hierarchy_config("[L1]\nwrite_policy = WT\n");
           });
  });
  passed &= runTest("Keys outside a section rejected", [&]() {
    return throwsA<ConfigurationError>([] { parse_hierarchy_config("size = 64\n"); });
  });
  passed &= runTest("Empty file rejected", [&]() {
    return throwsA<ConfigurationError>([] { parse_hierarchy_config("; nada\n\n"); });
  });
  passed &= runTest("Error message carries the line number", [&]() {
    try {
      parse_hierarchy_config("[L1]\nsize = 64\nfoo\n");
    } catch (const ConfigurationError& e) {
      return std::string(e.what()).find("linea 3") != std::string::npos;
    }
    return false;
  });
  passed &= runTest("Missing file rejected", [&]() {
    return throwsA<ConfigurationError>([] { load_hierarchy_config("/nonexistent/x.cfg"); });
  });

  std::cout << "[HierarchyConfigTest] " << (passed ? "Passed" : "Failed") << "\n";
  return passed;
}
