#include "hierarchy.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "trace.hpp"

#include <set>
#include <sstream>
#include <stdexcept>

namespace cachesim {

// ---------- Ciclo de vida ----------
Hierarchy::Hierarchy(const std::vector<LevelConfig>& levels, HierarchyNotifier& notifier) {
  if (levels.empty()) throw ConfigurationError("La jerarquía necesita al menos un nivel");

  std::set<std::string> names;
  for (const auto& lc : levels) {
    if (!names.insert(lc.name).second)
      throw ConfigurationError("Nombre de nivel duplicado: " + lc.name);
    levels_.push_back(std::make_unique<CacheLevel>(lc, notifier));
  }
  wire();
}

// requester = anterior, backing = siguiente
void Hierarchy::wire() {
  for (std::size_t i = 0; i < levels_.size(); ++i) {
    CacheLevel* req  = (i > 0) ? levels_[i - 1].get() : nullptr;
    CacheLevel* back = (i + 1 < levels_.size()) ? levels_[i + 1].get() : nullptr;
    levels_[i]->connect(req, back);

    // Inclusión: invalidaciones y writebacks viajan como una sola dirección
    // de bloque, así que vecinos con bloques distintos no se pueden cablear.
    if (back && back->config().block_size != levels_[i]->config().block_size) {
      throw ConfigurationError("block_size distinto entre " + levels_[i]->name() + " (" +
                               std::to_string(levels_[i]->config().block_size) + "B) y " +
                               back->name() + " (" +
                               std::to_string(back->config().block_size) + "B)");
    }
  }
}

// ---------- Accesos ----------
// Desde afuera sólo entran R/W; WritebackNotify es una llamada entre niveles.
void Hierarchy::access(Operation op, Addr addr) {
  if (op == Operation::WritebackNotify)
    throw ProtocolError("WritebackNotify no es un acceso externo válido");
  levels_.front()->access(op, addr);
}

void Hierarchy::access(char code, Addr addr) {
  switch (code) {
    case 'R': case 'r': access(Operation::Read, addr); return;
    case 'W': case 'w': access(Operation::Write, addr); return;
    default:
      throw ProtocolError(std::string("Operación externa desconocida '") + code + "'");
  }
}

ReplaySummary Hierarchy::replay(std::istream& in, const ReplayOptions& opts) {
  ReplaySummary sum;
  std::string line;
  std::size_t lineno = 0;

  while (std::getline(in, line)) {
    ++lineno;
    try {
      const auto rec = parse_trace_line(line, lineno);
      if (!rec) continue;
      access(rec->op, rec->addr);
      ++sum.accepted;
    } catch (const TraceError& e) {
      if (opts.strict) throw;
      ++sum.skipped;
      LOG_IF(cfg::kLogTrace, "[TRACE] descartada: " << e.what());
    } catch (const ProtocolError& e) {
      if (opts.strict) throw;
      ++sum.skipped;
      LOG_IF(cfg::kLogTrace, "[TRACE] linea " << lineno << " descartada: " << e.what());
    }
  }
  return sum;
}

// ---------- Estado/consultas ----------
const CacheLevel& Hierarchy::level(const std::string& name) const {
  for (const auto& l : levels_)
    if (l->name() == name) return *l;
  throw std::out_of_range("Nivel inexistente: " + name);
}

std::vector<std::string> Hierarchy::level_names() const {
  std::vector<std::string> out;
  out.reserve(levels_.size());
  for (const auto& l : levels_) out.push_back(l->name());
  return out;
}

std::vector<std::string> Hierarchy::check_invariants() const {
  std::vector<std::string> bad;
  for (const auto& l : levels_) {
    for (std::size_t s = 0; s < l->num_sets(); ++s) {
      const auto& set = l->set(s);
      if (set.size() > set.capacity()) {
        std::ostringstream oss;
        oss << l->name() << " set " << s << ": " << set.size() << " bloques > "
            << set.capacity() << " ways";
        bad.push_back(oss.str());
      }
      const std::set<Tag> uniq(set.order().begin(), set.order().end());
      if (uniq.size() != set.order().size() || set.order().size() != set.size()) {
        std::ostringstream oss;
        oss << l->name() << " set " << s << ": tags repetidos u orden inconsistente";
        bad.push_back(oss.str());
      }
    }
  }
  return bad;
}

void Hierarchy::dump(std::ostream& os) const {
  for (const auto& l : levels_) {
    l->debug_dump(os);
    os << "------------------------------------------------------------------\n";
  }
}

} // namespace cachesim
