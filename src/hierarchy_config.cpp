#include "hierarchy_config.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "text_util.hpp"
#include <fstream>
#include <iterator>
#include <optional>
#include <set>
#include <sstream>

namespace cachesim {

using text::trim;
using text::strip_comment;

namespace {

// Sección en construcción: qué claves ya aparecieron
struct PendingLevel {
  LevelConfig cfg;
  std::size_t line{0};
  std::set<std::string> keys;
};

const char* const kRequiredKeys[] = {
  "size", "block_size", "associativity", "eviction_policy", "write_policy"
};

[[noreturn]] void fail(std::size_t lineno, const std::string& msg) {
  throw ConfigurationError("cfg linea " + std::to_string(lineno) + ": " + msg);
}

std::size_t parse_size(const std::string& v, std::size_t lineno) {
  if (v.empty() || v[0] == '-') fail(lineno, "valor numérico inválido: '" + v + "'");
  std::size_t used = 0;
  unsigned long long n = 0;
  try {
    if (v.size() > 2 && v[0] == '0' && (v[1] == 'x' || v[1] == 'X'))
      n = std::stoull(v, &used, 16);
    else
      n = std::stoull(v, &used, 10);
  } catch (const std::exception&) {
    fail(lineno, "valor numérico inválido: '" + v + "'");
  }
  if (used != v.size()) fail(lineno, "valor numérico inválido: '" + v + "'");
  return static_cast<std::size_t>(n);
}

void finish_level(const PendingLevel& p, std::vector<LevelConfig>& out) {
  for (const char* k : kRequiredKeys) {
    if (!p.keys.count(k))
      fail(p.line, "nivel [" + p.cfg.name + "] sin clave obligatoria '" + k + "'");
  }
  out.push_back(p.cfg);
}

} // namespace

std::vector<LevelConfig> parse_hierarchy_config(const std::string& src) {
  std::vector<LevelConfig> levels;
  std::set<std::string> seen_names;
  std::optional<PendingLevel> cur;

  std::istringstream is(src);
  std::string raw;
  std::size_t lineno = 0;
  while (std::getline(is, raw)) {
    ++lineno;
    const auto line = trim(strip_comment(raw));
    if (line.empty()) continue;

    // [Nombre]
    if (line.front() == '[') {
      if (line.back() != ']') fail(lineno, "sección mal cerrada: " + line);
      const auto name = trim(line.substr(1, line.size() - 2));
      if (name.empty())          fail(lineno, "sección sin nombre");
      if (seen_names.count(name)) fail(lineno, "nivel duplicado: " + name);
      seen_names.insert(name);

      if (cur) finish_level(*cur, levels);
      cur = PendingLevel{};
      cur->cfg.name = name;
      cur->line = lineno;
      continue;
    }

    // clave = valor
    const auto eq = line.find('=');
    if (eq == std::string::npos) fail(lineno, "se esperaba 'clave = valor': " + line);
    if (!cur) fail(lineno, "clave fuera de una sección [nivel]");

    const auto key = text::upper(trim(line.substr(0, eq)));
    const auto val = trim(line.substr(eq + 1));
    if (val.empty()) fail(lineno, "valor vacío para " + key);

    std::string canon;
    if (key == "SIZE") {
      canon = "size";
      cur->cfg.size = parse_size(val, lineno);
    } else if (key == "BLOCK_SIZE") {
      canon = "block_size";
      cur->cfg.block_size = parse_size(val, lineno);
    } else if (key == "ASSOCIATIVITY") {
      canon = "associativity";
      cur->cfg.associativity = parse_size(val, lineno);
    } else if (key == "EVICTION_POLICY") {
      canon = "eviction_policy";
      try {
        cur->cfg.eviction = parse_eviction_policy(val);
      } catch (const ConfigurationError& e) {
        fail(lineno, e.what());
      }
    } else if (key == "WRITE_POLICY") {
      canon = "write_policy";
      try {
        cur->cfg.write_policy = parse_write_policy(val);
      } catch (const ConfigurationError& e) {
        fail(lineno, e.what());
      }
    } else {
      fail(lineno, "clave desconocida: " + trim(line.substr(0, eq)));
    }

    if (!cur->keys.insert(canon).second)
      fail(lineno, "clave repetida en [" + cur->cfg.name + "]: " + canon);
  }

  if (cur) finish_level(*cur, levels);
  if (levels.empty()) throw ConfigurationError("cfg sin niveles");
  return levels;
}

// Lee el archivo completo y delega
std::vector<LevelConfig> load_hierarchy_config(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw ConfigurationError("No se puede abrir cfg: " + path);
  std::string src((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return parse_hierarchy_config(src);
}

std::vector<LevelConfig> default_hierarchy_config() {
  LevelConfig l1;
  l1.name = "L1";
  l1.size = cfg::kDefaultL1Size;
  l1.block_size = cfg::kDefaultBlock;
  l1.associativity = cfg::kDefaultL1Ways;
  l1.eviction = EvictionPolicy::LRU;

  LevelConfig l2;
  l2.name = "L2";
  l2.size = cfg::kDefaultL2Size;
  l2.block_size = cfg::kDefaultBlock;
  l2.associativity = cfg::kDefaultL2Ways;
  l2.eviction = EvictionPolicy::LRU;

  return {l1, l2};
}

} // namespace cachesim
