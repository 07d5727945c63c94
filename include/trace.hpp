#pragma once
#include "types.hpp"
#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace cachesim {

// Un acceso de la traza. 'op' queda crudo ('R', 'W' u otro):
// la Hierarchy decide y lanza ProtocolError si no es R/W.
struct TraceRecord {
  char        op{'R'};
  Addr        addr{0};
  std::size_t line{0};
};

// Formato por línea:  <op> <addr>   (addr decimal o 0xHEX)
// Líneas vacías y comentarios (';' o '#') -> nullopt.
// Línea mal formada -> TraceError.
std::optional<TraceRecord> parse_trace_line(const std::string& line, std::size_t lineno);

// Traza completa (para tests y trazas chicas). Estricto: la primera línea
// mala lanza.
std::vector<TraceRecord> parse_trace(std::istream& in);

} // namespace cachesim
