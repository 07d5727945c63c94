#include "cache_set.hpp"
#include "errors.hpp"
#include <iterator>
#include <sstream>
#include <string>

namespace cachesim {

static std::string tag_str(Tag tag) {
  std::ostringstream oss;
  oss << "0x" << std::hex << tag;
  return oss.str();
}

CacheSet::CacheSet(std::size_t associativity, EvictionPolicy policy)
    : associativity_(associativity), policy_(policy) {
  blocks_.reserve(associativity_);
}

CacheBlock& CacheSet::find_or_throw(Tag tag, const char* op) {
  auto it = blocks_.find(tag);
  if (it == blocks_.end())
    throw NotFound(std::string("CacheSet::") + op + ": tag " + tag_str(tag) + " no residente");
  return it->second;
}

const CacheBlock& CacheSet::find_or_throw(Tag tag, const char* op) const {
  auto it = blocks_.find(tag);
  if (it == blocks_.end())
    throw NotFound(std::string("CacheSet::") + op + ": tag " + tag_str(tag) + " no residente");
  return it->second;
}

bool CacheSet::get_dirty(Tag tag) const {
  return find_or_throw(tag, "get_dirty").dirty;
}

void CacheSet::set_dirty(Tag tag, bool dirty) {
  find_or_throw(tag, "set_dirty").dirty = dirty;
}

// Inserta al final del orden (más nuevo / más reciente)
void CacheSet::insert(Tag tag, bool dirty) {
  if (blocks_.count(tag))
    throw SetContractError("CacheSet::insert: tag " + tag_str(tag) + " duplicado");
  if (full())
    throw CapacityExceeded("CacheSet::insert: set lleno (" + std::to_string(associativity_) +
                           " ways), hay que evictar antes de " + tag_str(tag));

  order_.push_back(tag);
  CacheBlock blk;
  blk.dirty = dirty;
  blk.pos   = std::prev(order_.end());
  blocks_.emplace(tag, blk);
}

void CacheSet::remove(Tag tag) {
  auto& blk = find_or_throw(tag, "remove");
  order_.erase(blk.pos);
  blocks_.erase(tag);
}

// LRU/MRU: mover al final. FIFO: el orden de llegada no cambia.
void CacheSet::touch(Tag tag) {
  auto& blk = find_or_throw(tag, "touch");
  if (!updates_recency(policy_)) return;
  order_.splice(order_.end(), order_, blk.pos);
}

std::optional<Tag> CacheSet::select_victim() const {
  return cachesim::select_victim(policy_, order_);
}

} // namespace cachesim
