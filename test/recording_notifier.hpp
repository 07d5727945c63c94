#pragma once
#include "notifier.hpp"
#include <stdexcept>
#include <string>
#include <vector>

/* Notifier de tests: guarda cada evento en orden */
struct Event {
  std::string level;
  std::string kind;   // "hit" | "miss" | "writeback" | "evict"
  char op;            // 'R' | 'W' | 'B' | '-'
  cachesim::Addr addr;
};

class RecordingNotifier : public cachesim::HierarchyNotifier {
public:
  std::vector<Event> events;

  void report_hit(const std::string& level, cachesim::Operation op, cachesim::Addr addr) override {
    events.push_back({level, "hit", cachesim::to_string(op)[0], addr});
  }
  void report_miss(const std::string& level, cachesim::Operation op, cachesim::Addr addr) override {
    events.push_back({level, "miss", cachesim::to_string(op)[0], addr});
  }
  void report_writeback(const std::string& level, cachesim::Addr addr) override {
    events.push_back({level, "writeback", '-', addr});
  }
  void report_eviction(const std::string& level, cachesim::Addr addr) override {
    events.push_back({level, "evict", '-', addr});
  }

  std::size_t count(const std::string& level, const std::string& kind) const {
    std::size_t n = 0;
    for (const auto& e : events)
      if (e.level == level && e.kind == kind) ++n;
    return n;
  }

  std::size_t count(const std::string& level, const std::string& kind, cachesim::Addr addr) const {
    std::size_t n = 0;
    for (const auto& e : events)
      if (e.level == level && e.kind == kind && e.addr == addr) ++n;
    return n;
  }

  // Posición del primer evento que coincide (o -1)
  int index_of(const std::string& level, const std::string& kind, cachesim::Addr addr) const {
    for (std::size_t i = 0; i < events.size(); ++i)
      if (events[i].level == level && events[i].kind == kind && events[i].addr == addr)
        return static_cast<int>(i);
    return -1;
  }

  void clear() { events.clear(); }
};

/* Notifier que siempre falla: la cascada tiene que seguir igual */
class ThrowingNotifier : public cachesim::HierarchyNotifier {
public:
  int calls = 0;
  void report_hit(const std::string&, cachesim::Operation, cachesim::Addr) override { fail(); }
  void report_miss(const std::string&, cachesim::Operation, cachesim::Addr) override { fail(); }
  void report_writeback(const std::string&, cachesim::Addr) override { fail(); }
  void report_eviction(const std::string&, cachesim::Addr) override { fail(); }

private:
  void fail() {
    ++calls;
    throw std::runtime_error("notifier caído");
  }
};
