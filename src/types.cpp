#include "types.hpp"
#include "errors.hpp"
#include "text_util.hpp"

namespace cachesim {

WritePolicy parse_write_policy(const std::string& name) {
  const auto u = text::upper(text::trim(name));
  if (u == "WB" || u == "WRITEBACK" || u == "WRITE-BACK" || u == "WBWA")
    return WritePolicy::WriteBack;
  throw ConfigurationError("Política de escritura no soportada: '" + name +
                           "' (sólo write-back/write-allocate)");
}

} // namespace cachesim
