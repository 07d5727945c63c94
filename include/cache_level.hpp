#pragma once
#include "config.hpp"
#include "types.hpp"
#include "address_decoder.hpp"
#include "cache_set.hpp"
#include "eviction_policy.hpp"
#include "notifier.hpp"
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace cachesim {

// Geometría y políticas de un nivel (todo obligatorio, se valida al construir).
struct LevelConfig {
  std::string    name;
  std::size_t    size{0};           // bytes totales
  std::size_t    block_size{0};     // bytes por bloque
  std::size_t    associativity{0};  // ways por set
  EvictionPolicy eviction{EvictionPolicy::LRU};
  WritePolicy    write_policy{WritePolicy::WriteBack};
};

/**
 * @brief Un nivel de caché set-asociativa, write-back / write-allocate, inclusiva.
 *
 * Topología (punteros NO dueños, los cablea la Hierarchy):
 *   - requester_side: vecino más cerca del que origina el acceso (L1 no tiene).
 *   - backing_side:   vecino más cerca de memoria (el último nivel no tiene).
 *
 * Protocolo resumido:
 * - Miss: evict si el set está lleno, Read al backing_side, y recién después
 *   se inserta el bloque (write-allocate: un write miss también trae el bloque).
 * - Write: marca dirty sólo en los extremos de la cadena (sin requester o sin
 *   backing). Los niveles intermedios no se ensucian por un Write.
 * - Si el backing_side tiene el bloque sucio, la copia nueva hereda el dirty.
 * - Evicción: primero se invalida la copia del requester_side (inclusión),
 *   después la propia. Un bloque sucio siempre hace writeback (WritebackNotify
 *   al backing_side) ANTES de desaparecer.
 */
class CacheLevel {
public:
  CacheLevel(const LevelConfig& config, HierarchyNotifier& notifier);

  CacheLevel(const CacheLevel&) = delete;
  CacheLevel& operator=(const CacheLevel&) = delete;

  // Cableado de la cadena (nullptr = extremo)
  void connect(CacheLevel* requester_side, CacheLevel* backing_side);

  // Punto de entrada del protocolo. ProtocolError si op no es válida.
  void access(Operation op, Addr addr);
  // Variante con código de traza: 'R', 'W', 'B'
  void access(char code, Addr addr);

  // Consultas puras
  bool has_block(Addr addr) const;
  bool is_dirty(Addr addr) const;

  // Elimina el bloque (writeback previo si está sucio). No-op si no está.
  void invalidate(Addr addr, bool propagate_to_requester);

  const std::string&    name()    const { return config_.name; }
  const LevelConfig&    config()  const { return config_; }
  const AddressDecoder& decoder() const { return decoder_; }
  std::size_t           num_sets() const { return decoder_.num_sets(); }
  const CacheSet&       set(std::size_t idx) const { return sets_.at(idx); }

  CacheLevel* requester_side() const { return requester_side_; }
  CacheLevel* backing_side()   const { return backing_side_; }

  /**
   * @brief Dump legible del contenido (orden del set: viejo -> reciente).
   * @param os              flujo de salida
   * @param highlight_addr  dirección a resaltar; si su bloque está, se marca con '*'
   */
  void debug_dump(std::ostream& os, std::optional<Addr> highlight_addr = std::nullopt) const;

private:
  // --- Orden IMPORTA: config y decoder antes que 'sets_' ---
  LevelConfig        config_;
  AddressDecoder     decoder_;
  HierarchyNotifier& notifier_;

  CacheLevel* requester_side_ = nullptr;
  CacheLevel* backing_side_   = nullptr;

  std::vector<CacheSet> sets_;

  bool is_endpoint() const { return requester_side_ == nullptr || backing_side_ == nullptr; }

  void handle_writeback_notify(Addr block_addr);
  void handle_hit (Operation op, Addr addr, std::size_t set_idx, Tag tag);
  void handle_miss(Operation op, Addr addr, std::size_t set_idx, Tag tag);

  void evict(std::size_t set_idx);

  // Hooks protegidos: un fallo del notifier no corta la cascada
  void notify_hit(Operation op, Addr addr);
  void notify_miss(Operation op, Addr addr);
  void notify_writeback(Addr addr);
  void notify_eviction(Addr addr);
};

} // namespace cachesim
