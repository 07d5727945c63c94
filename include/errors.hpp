#pragma once
#include <stdexcept>
#include <string>

namespace cachesim {

// Geometría inválida (no potencia de 2, tamaños que no dividen, .cfg mal formado).
// Fatal en construcción.
class ConfigurationError : public std::runtime_error {
public:
  explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// Código de operación desconocido. Se detecta antes de tocar estado.
class ProtocolError : public std::runtime_error {
public:
  explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

// Línea de traza ilegible (dirección inválida, campos de más/menos).
class TraceError : public std::runtime_error {
public:
  TraceError(const std::string& what, std::size_t line)
      : std::runtime_error("linea " + std::to_string(line) + ": " + what), line_(line) {}
  std::size_t line() const { return line_; }

private:
  std::size_t line_;
};

// Violaciones de contrato internas de CacheSet: si alguien fuera del
// CacheLevel las ve, es un bug de secuenciación en el nivel.
class SetContractError : public std::logic_error {
public:
  explicit SetContractError(const std::string& what) : std::logic_error(what) {}
};

class CapacityExceeded : public SetContractError {
public:
  explicit CapacityExceeded(const std::string& what) : SetContractError(what) {}
};

class NotFound : public SetContractError {
public:
  explicit NotFound(const std::string& what) : SetContractError(what) {}
};

} // namespace cachesim
