#include "cache_level.hpp"
#include "config.hpp"
#include "errors.hpp"
#include <cctype>
#include <exception>
#include <iomanip>
#include <ostream>
#include <string>

namespace cachesim
{

  // Nivel de caché inclusivo, write-back / write-allocate.
  // - access: WB notify / hit / miss (con fetch al backing_side).
  // - evict: invalida primero en el requester_side, luego local.
  // - invalidate: writeback si está sucio, recién después borra.
  CacheLevel::CacheLevel(const LevelConfig &config, HierarchyNotifier &notifier)
      : config_(config),
        decoder_(config.block_size,
                 AddressDecoder::derive_num_sets(config.size, config.block_size,
                                                 config.associativity)),
        notifier_(notifier)
  {
    if (config_.name.empty())
      throw ConfigurationError("Nivel sin nombre");

    // Sets vacíos, uno por índice
    sets_.reserve(decoder_.num_sets());
    for (std::size_t s = 0; s < decoder_.num_sets(); ++s)
      sets_.emplace_back(config_.associativity, config_.eviction);
  }

  void CacheLevel::connect(CacheLevel *requester_side, CacheLevel *backing_side)
  {
    requester_side_ = requester_side;
    backing_side_   = backing_side;
    LOG_IF(cfg::kLogHier, "[HIER " << name() << "] requester="
                                   << (requester_side_ ? requester_side_->name() : "-")
                                   << " backing="
                                   << (backing_side_ ? backing_side_->name() : "-")
                                   << " sets=" << num_sets()
                                   << " ways=" << config_.associativity
                                   << " block=" << config_.block_size << "B"
                                   << " policy=" << to_string(config_.eviction));
  }

  // ===== Hooks del notifier (fire-and-forget) =====
  void CacheLevel::notify_hit(Operation op, Addr addr)
  {
    try {
      notifier_.report_hit(name(), op, addr);
    } catch (const std::exception &e) {
      LOG_IF(cfg::kLogNotify, "[CACHE " << name() << "] report_hit falló: " << e.what());
    }
  }

  void CacheLevel::notify_miss(Operation op, Addr addr)
  {
    try {
      notifier_.report_miss(name(), op, addr);
    } catch (const std::exception &e) {
      LOG_IF(cfg::kLogNotify, "[CACHE " << name() << "] report_miss falló: " << e.what());
    }
  }

  void CacheLevel::notify_writeback(Addr addr)
  {
    try {
      notifier_.report_writeback(name(), addr);
    } catch (const std::exception &e) {
      LOG_IF(cfg::kLogNotify, "[CACHE " << name() << "] report_writeback falló: " << e.what());
    }
  }

  void CacheLevel::notify_eviction(Addr addr)
  {
    try {
      notifier_.report_eviction(name(), addr);
    } catch (const std::exception &e) {
      LOG_IF(cfg::kLogNotify, "[CACHE " << name() << "] report_eviction falló: " << e.what());
    }
  }

  // ===== Consultas =====
  bool CacheLevel::has_block(Addr addr) const
  {
    const Addr block = decoder_.block_align(addr);
    return sets_[decoder_.index(block)].contains(decoder_.tag(block));
  }

  bool CacheLevel::is_dirty(Addr addr) const
  {
    const Addr block = decoder_.block_align(addr);
    const auto &set = sets_[decoder_.index(block)];
    const Tag tag = decoder_.tag(block);
    return set.contains(tag) && set.get_dirty(tag);
  }

  // ===== Protocolo =====
  void CacheLevel::access(char code, Addr addr)
  {
    switch (std::toupper(static_cast<unsigned char>(code))) {
      case 'R': access(Operation::Read, addr); return;
      case 'W': access(Operation::Write, addr); return;
      case 'B': access(Operation::WritebackNotify, addr); return;
      default:
        throw ProtocolError(std::string("Operación desconocida '") + code + "' en " + name());
    }
  }

  void CacheLevel::access(Operation op, Addr addr)
  {
    // Validación antes de tocar nada
    switch (op) {
      case Operation::Read:
      case Operation::Write:
      case Operation::WritebackNotify:
        break;
      default:
        throw ProtocolError("Código de operación inválido (" +
                            std::to_string(static_cast<int>(op)) + ") en " + name());
    }

    const Addr block = decoder_.block_align(addr);
    const std::size_t set_idx = decoder_.index(block);
    const Tag tag = decoder_.tag(block);

    if (op == Operation::WritebackNotify) {
      handle_writeback_notify(block);
      return;
    }

    const bool hit = sets_[set_idx].contains(tag);
    LOG_IF(cfg::kLogCache, "[CACHE " << name() << "] " << to_string(op) << " addr=0x"
                                     << std::hex << addr << std::dec << " set=" << set_idx
                                     << " tag=0x" << std::hex << tag << std::dec
                                     << (hit ? " (hit)" : " (miss)"));
    if (hit)
      handle_hit(op, addr, set_idx, tag);
    else
      handle_miss(op, addr, set_idx, tag);
  }

  // Bloque sucio que baja desde el requester_side: sólo registra estado.
  void CacheLevel::handle_writeback_notify(Addr block_addr)
  {
    const std::size_t set_idx = decoder_.index(block_addr);
    const Tag tag = decoder_.tag(block_addr);

    if (sets_[set_idx].contains(tag)) {
      sets_[set_idx].set_dirty(tag, true);
    } else {
      // Con inclusión el bloque ya debería estar; si no, se aloca sucio
      // respetando la capacidad del set.
      if (sets_[set_idx].full())
        evict(set_idx);
      sets_[set_idx].insert(tag, true);
    }
    LOG_IF(cfg::kLogEvict, "[CACHE " << name() << "] WB recibido addr=0x"
                                     << std::hex << block_addr << std::dec << " -> dirty=1");
    notify_hit(Operation::WritebackNotify, block_addr);
  }

  void CacheLevel::handle_hit(Operation op, Addr addr, std::size_t set_idx, Tag tag)
  {
    notify_hit(op, addr);
    if (op == Operation::Write && is_endpoint())
      sets_[set_idx].set_dirty(tag, true);
    sets_[set_idx].touch(tag);
  }

  void CacheLevel::handle_miss(Operation op, Addr addr, std::size_t set_idx, Tag tag)
  {
    notify_miss(op, addr);

    if (sets_[set_idx].full())
      evict(set_idx);

    // Write-allocate: siempre se trae con Read, el dirty se pone acá
    const Addr block = decoder_.block_align(addr);
    if (backing_side_)
      backing_side_->access(Operation::Read, addr);

    bool dirty = (op == Operation::Write && is_endpoint());
    if (backing_side_ && backing_side_->is_dirty(block))
      dirty = true; // hereda datos modificados aún no devueltos a memoria

    sets_[set_idx].insert(tag, dirty);
  }

  void CacheLevel::evict(std::size_t set_idx)
  {
    const auto victim = sets_[set_idx].select_victim();
    if (!victim) return;

    const Addr victim_addr = decoder_.recompose(*victim, set_idx);
    LOG_IF(cfg::kLogEvict, "[CACHE " << name() << "] EVICT set=" << set_idx
                                     << " victim=0x" << std::hex << victim_addr << std::dec
                                     << " (" << to_string(config_.eviction) << ")");

    // Inclusión: la copia interna desaparece antes que la nuestra
    if (requester_side_ && requester_side_->has_block(victim_addr))
      requester_side_->invalidate(victim_addr, true);

    invalidate(victim_addr, false);
  }

  void CacheLevel::invalidate(Addr addr, bool propagate_to_requester)
  {
    const Addr block = decoder_.block_align(addr);
    const std::size_t set_idx = decoder_.index(block);
    const Tag tag = decoder_.tag(block);

    if (!sets_[set_idx].contains(tag))
      return;

    // Orden: requester_side primero, writeback/borrado local después.
    // El writeback interno tiene que caer en este nivel mientras el bloque
    // sigue acá (si no, lo re-alocaría al borrarlo).
    if (propagate_to_requester && requester_side_)
      requester_side_->invalidate(block, true);

    // Writeback ANTES de borrar: si no, se pierden escrituras
    if (sets_[set_idx].get_dirty(tag)) {
      notify_writeback(block);
      LOG_IF(cfg::kLogEvict, "[CACHE " << name() << "] WB addr=0x"
                                       << std::hex << block << std::dec << " -> "
                                       << (backing_side_ ? backing_side_->name() : "memoria"));
      if (backing_side_)
        backing_side_->access(Operation::WritebackNotify, block);
      sets_[set_idx].set_dirty(tag, false);
    }

    sets_[set_idx].remove(tag);
    notify_eviction(block);
    LOG_IF(cfg::kLogEvict, "[CACHE " << name() << "] INVALIDATE addr=0x"
                                     << std::hex << block << std::dec);
  }

  // Dump legible de toda la caché
  void CacheLevel::debug_dump(std::ostream &os, std::optional<Addr> highlight_addr) const
  {
    os << "=== Cache " << name() << " | size=" << config_.size << "B"
       << " sets=" << num_sets()
       << " ways=" << config_.associativity
       << " block=" << config_.block_size << "B"
       << " policy=" << to_string(config_.eviction)
       << " write=" << to_string(config_.write_policy) << " ===\n";

    std::size_t hi_set = 0;
    Tag hi_tag = 0;
    bool has_hi = false;
    if (highlight_addr.has_value()) {
      const Addr b = decoder_.block_align(*highlight_addr);
      hi_set = decoder_.index(b); hi_tag = decoder_.tag(b); has_hi = true;
    }

    for (std::size_t s = 0; s < num_sets(); ++s) {
      const auto &set = sets_[s];
      if (set.empty()) continue;
      os << "Set " << s << " (" << set.size() << "/" << set.capacity() << "):\n";
      std::size_t pos = 0;
      for (Tag t : set.order()) {
        const bool mark = has_hi && s == hi_set && t == hi_tag;
        os << "  [" << pos++ << "]"
           << " Tag=0x" << std::hex << t
           << " | Addr=0x" << std::setw(cfg::kAddrHexDigits) << std::setfill('0')
           << decoder_.recompose(t, s) << std::setfill(' ') << std::dec
           << " | D=" << (set.get_dirty(t) ? 1 : 0)
           << (mark ? "   *" : "")
           << "\n";
      }
    }
  }

} // namespace cachesim
