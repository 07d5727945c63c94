#include "address_decoder.hpp"
#include "errors.hpp"
#include <string>

namespace cachesim {

// log2 exacto (v ya validado como potencia de 2)
static unsigned log2_exact(std::size_t v) {
  unsigned bits = 0;
  while (v > 1) { v >>= 1; ++bits; }
  return bits;
}

AddressDecoder::AddressDecoder(std::size_t block_size, std::size_t num_sets)
    : block_size_(block_size), num_sets_(num_sets), offset_bits_(0), index_bits_(0) {
  if (!is_power_of_two(block_size_))
    throw ConfigurationError("block_size debe ser potencia de 2 (vale " +
                             std::to_string(block_size_) + ")");
  if (!is_power_of_two(num_sets_))
    throw ConfigurationError("num_sets debe ser potencia de 2 (vale " +
                             std::to_string(num_sets_) + ")");
  offset_bits_ = log2_exact(block_size_);
  index_bits_  = log2_exact(num_sets_);
}

std::size_t AddressDecoder::derive_num_sets(std::size_t size, std::size_t block_size,
                                            std::size_t associativity) {
  if (size == 0 || block_size == 0 || associativity == 0)
    throw ConfigurationError("size, block_size y associativity deben ser > 0");

  const std::size_t set_bytes = block_size * associativity;
  if (size % set_bytes != 0)
    throw ConfigurationError("size=" + std::to_string(size) +
                             " no es múltiplo de block_size*associativity=" +
                             std::to_string(set_bytes));

  const std::size_t sets = size / set_bytes;
  if (sets == 0)
    throw ConfigurationError("la geometría da 0 sets");
  return sets;
}

} // namespace cachesim
