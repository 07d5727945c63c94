#pragma once
#include <cstdint>
#include <string>

namespace cachesim {

using Addr = std::uint64_t;  // Dirección en bytes (espacio lineal)
using Tag  = std::uint64_t;  // Bits por encima de índice + offset

// Operaciones que recibe un nivel.
// WritebackNotify = bloque sucio que llega desde el lado requester.
enum class Operation : std::uint8_t { Read, Write, WritebackNotify };

// Sólo existe write-back/write-allocate; se acepta en la config y se valida.
enum class WritePolicy : std::uint8_t { WriteBack };

inline const char* to_string(Operation op) {
  switch (op) {
    case Operation::Read:            return "R";
    case Operation::Write:           return "W";
    case Operation::WritebackNotify: return "B";
  }
  return "?";
}

inline const char* to_string(WritePolicy wp) {
  switch (wp) {
    case WritePolicy::WriteBack: return "WB";
  }
  return "?";
}

// "WB", "WRITEBACK", "WRITE-BACK", "WBWA" (case-insensitive).
// Lanza ConfigurationError para cualquier otra cosa (ver errors.hpp).
WritePolicy parse_write_policy(const std::string& name);

} // namespace cachesim
