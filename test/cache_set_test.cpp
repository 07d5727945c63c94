#include <iostream>
#include <list>
#include <string>
#include "cache_set.hpp"
#include "errors.hpp"
#include "eviction_policy.hpp"
#include "test_helpers.hpp"

using namespace cachesim;

// Set de 3 ways con tags 1,2,3 insertados en orden
static CacheSet filled(EvictionPolicy p) {
  CacheSet s(3, p);
  s.insert(1, false);
  s.insert(2, false);
  s.insert(3, false);
  return s;
}

bool testCacheSet() {
  std::cout << "[CacheSetTest] Testing...\n";
  bool passed = true;

  passed &= runTest("FIFO evicts oldest", [&]() {
    auto s = filled(EvictionPolicy::FIFO);
    return s.select_victim() == std::optional<Tag>(1);
  });
  passed &= runTest("LRU evicts least recent", [&]() {
    auto s = filled(EvictionPolicy::LRU);
    return s.select_victim() == std::optional<Tag>(1);
  });
  passed &= runTest("MRU evicts most recent", [&]() {
    auto s = filled(EvictionPolicy::MRU);
    return s.select_victim() == std::optional<Tag>(3);
  });
  passed &= runTest("LRU after touch(1) evicts 2", [&]() {
    auto s = filled(EvictionPolicy::LRU);
    s.touch(1);
    return s.select_victim() == std::optional<Tag>(2);
  });
  passed &= runTest("MRU after touch(1) evicts 1", [&]() {
    auto s = filled(EvictionPolicy::MRU);
    s.touch(1);
    return s.select_victim() == std::optional<Tag>(1);
  });
  passed &= runTest("FIFO ignores touch", [&]() {
    auto s = filled(EvictionPolicy::FIFO);
    s.touch(1);
    s.touch(2);
    return s.select_victim() == std::optional<Tag>(1) &&
           s.order() == std::list<Tag>({1, 2, 3});
  });
  passed &= runTest("Empty set has no victim", [&]() {
    CacheSet s(2, EvictionPolicy::LRU);
    return !s.select_victim().has_value() && s.empty();
  });

  passed &= runTest("Dirty flag get/set", [&]() {
    CacheSet s(2, EvictionPolicy::LRU);
    s.insert(7, true);
    s.insert(8, false);
    bool ok = s.get_dirty(7) && !s.get_dirty(8);
    s.set_dirty(7, false);
    s.set_dirty(8, true);
    return ok && !s.get_dirty(7) && s.get_dirty(8);
  });
  passed &= runTest("Remove keeps order of the rest", [&]() {
    auto s = filled(EvictionPolicy::LRU);
    s.remove(2);
    return !s.contains(2) && s.size() == 2 && s.order() == std::list<Tag>({1, 3});
  });
  passed &= runTest("Reinsert after remove goes to the back", [&]() {
    auto s = filled(EvictionPolicy::FIFO);
    s.remove(1);
    s.insert(1, false);
    return s.order() == std::list<Tag>({2, 3, 1}) && s.select_victim() == std::optional<Tag>(2);
  });

  passed &= runTest("Insert into full set throws CapacityExceeded", [&]() {
    auto s = filled(EvictionPolicy::LRU);
    return s.full() && throwsA<CapacityExceeded>([&] { s.insert(4, false); }) && s.size() == 3;
  });
  passed &= runTest("Duplicate insert is a contract error", [&]() {
    CacheSet s(4, EvictionPolicy::LRU);
    s.insert(5, false);
    return throwsA<SetContractError>([&] { s.insert(5, true); }) && s.size() == 1;
  });
  passed &= runTest("Absent tag throws NotFound", [&]() {
    CacheSet s(2, EvictionPolicy::LRU);
    return throwsA<NotFound>([&] { s.remove(9); }) &&
           throwsA<NotFound>([&] { s.touch(9); }) &&
           throwsA<NotFound>([&] { (void)s.get_dirty(9); }) &&
           throwsA<NotFound>([&] { s.set_dirty(9, true); });
  });

  passed &= runTest("Policy parsing", [&]() {
    return parse_eviction_policy("fifo") == EvictionPolicy::FIFO &&
           parse_eviction_policy(" LRU ") == EvictionPolicy::LRU &&
           parse_eviction_policy("Mru") == EvictionPolicy::MRU &&
           throwsA<ConfigurationError>([] { parse_eviction_policy("RANDOM"); });
  });

  std::cout << "[CacheSetTest] " << (passed ? "Passed" : "Failed") << "\n";
  return passed;
}
