#pragma once
#include "cache_level.hpp"
#include <string>
#include <vector>

//
// Parser del archivo de configuración de la jerarquía (.cfg).
//
// Formato (una sección por nivel, en orden requester -> backing):
//   [L1]
//   size            = 64
//   block_size      = 16
//   associativity   = 1
//   eviction_policy = LRU      ; FIFO | LRU | MRU
//   write_policy    = WB       ; sólo write-back
//
// Notas rápidas:
// - Los comentarios empiezan con ';' o '#'
// - Las cinco claves son obligatorias en cada sección
// - Cualquier error lanza ConfigurationError con el número de línea
//

namespace cachesim {

std::vector<LevelConfig> parse_hierarchy_config(const std::string& src);

std::vector<LevelConfig> load_hierarchy_config(const std::string& path);

// L1/L2 por defecto (constantes de cfg::)
std::vector<LevelConfig> default_hierarchy_config();

} // namespace cachesim
