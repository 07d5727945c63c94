#pragma once
#include "types.hpp"
#include <cstddef>

namespace cachesim {

// Dirección descompuesta en (tag, set, offset).
struct DecodedAddr {
  Tag         tag{0};
  std::size_t index{0};
  std::size_t offset{0};
};

/**
 * @brief Conversión dirección <-> (tag, índice, offset) con máscaras de bits.
 *
 * block_size y num_sets tienen que ser potencias de 2: con otros divisores
 * las máscaras no dan la división correcta, así que el constructor lanza
 * ConfigurationError.
 */
class AddressDecoder {
public:
  AddressDecoder(std::size_t block_size, std::size_t num_sets);

  // size / (block_size * associativity), validando que divida exacto y no dé 0.
  static std::size_t derive_num_sets(std::size_t size, std::size_t block_size,
                                     std::size_t associativity);

  std::size_t index(Addr addr) const {
    return static_cast<std::size_t>((addr >> offset_bits_) & (num_sets_ - 1));
  }
  Tag tag(Addr addr) const { return addr >> (index_bits_ + offset_bits_); }
  std::size_t offset(Addr addr) const {
    return static_cast<std::size_t>(addr & (block_size_ - 1));
  }
  Addr block_align(Addr addr) const { return addr & ~static_cast<Addr>(block_size_ - 1); }

  Addr recompose(Tag tag, std::size_t index) const {
    return (tag << (index_bits_ + offset_bits_)) | (static_cast<Addr>(index) << offset_bits_);
  }

  DecodedAddr decompose(Addr addr) const { return {tag(addr), index(addr), offset(addr)}; }

  std::size_t block_size()  const { return block_size_; }
  std::size_t num_sets()    const { return num_sets_; }
  unsigned    offset_bits() const { return offset_bits_; }
  unsigned    index_bits()  const { return index_bits_; }

private:
  std::size_t block_size_;
  std::size_t num_sets_;
  unsigned    offset_bits_;
  unsigned    index_bits_;
};

inline bool is_power_of_two(std::size_t v) { return v != 0 && (v & (v - 1)) == 0; }

} // namespace cachesim
