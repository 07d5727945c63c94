#include "config.hpp"
#include "errors.hpp"
#include "hierarchy.hpp"
#include "hierarchy_config.hpp"
#include "stats.hpp"
#include <fstream>
#include <iostream>
#include <string>

/**
 * Uso:
 *   cachesim [config.cfg] [-t|--trace traza.txt] [--strict] [--events] [--dump]
 *   - sin config: jerarquía L1/L2 por defecto
 *   - sin -t: la traza se lee de stdin
 *   - --strict: la primera línea u operación inválida corta la simulación
 *   - --events: imprime cada hit/miss/writeback/evicción
 *   - --dump:   vuelca el contenido final de cada nivel
 */
static void usage(const char* argv0) {
  SERR << "Uso: " << argv0
       << " [config.cfg] [-t|--trace traza] [--strict] [--events] [--dump]\n";
}

int main(int argc, char **argv)
{
  std::string cfgPath;
  std::string tracePath;
  bool strict = false;
  bool events = false;
  bool dump = false;

  // Parse simple de argumentos: el primer no-flag es el .cfg
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "-t" || a == "--trace") {
      if (i + 1 >= argc) { usage(argv[0]); return 2; }
      tracePath = argv[++i];
    } else if (a == "--strict") {
      strict = true;
    } else if (a == "--events") {
      events = true;
    } else if (a == "--dump") {
      dump = true;
    } else if (a == "-h" || a == "--help") {
      usage(argv[0]);
      return 0;
    } else if (!a.empty() && a[0] == '-') {
      SERR << "[Main] Opción desconocida: " << a << "\n";
      usage(argv[0]);
      return 2;
    } else if (cfgPath.empty()) {
      cfgPath = a;
    } else {
      usage(argv[0]);
      return 2;
    }
  }

  try {
    const auto levels = cfgPath.empty() ? cachesim::default_hierarchy_config()
                                        : cachesim::load_hierarchy_config(cfgPath);

    cachesim::StatsCollector stats(events);
    cachesim::Hierarchy hier(levels, stats);

    cachesim::ReplayOptions opts;
    opts.strict = strict;

    cachesim::ReplaySummary sum;
    if (tracePath.empty()) {
      sum = hier.replay(std::cin, opts);
    } else {
      std::ifstream in(tracePath);
      if (!in) {
        SERR << "[Main] No se puede abrir la traza: " << tracePath << "\n";
        return 1;
      }
      sum = hier.replay(in, opts);
    }

    SOUT << "[Sim] Accesos: " << sum.accepted << " | Descartados: " << sum.skipped << "\n";
    {
      std::osyncstream out(std::cout);
      stats.print(out, hier.level_names());
      if (dump) hier.dump(out);
    }
  } catch (const cachesim::ConfigurationError& e) {
    SERR << "[Main] Error de configuración: " << e.what() << "\n";
    return 1;
  } catch (const cachesim::TraceError& e) {
    SERR << "[Main] Error en la traza: " << e.what() << "\n";
    return 1;
  } catch (const cachesim::ProtocolError& e) {
    SERR << "[Main] Error de protocolo: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
