#pragma once
#include <cstddef>
#include <iostream> // logs
#include <syncstream>

namespace cfg
{
    // Stdout/stderr sincronizados (varias jerarquías pueden reportar a la vez)
    #define SOUT  std::osyncstream(std::cout)
    #define SERR  std::osyncstream(std::cerr)

    // --- Geometría por defecto (si el .cfg no trae jerarquía se usa esta) ---
    inline constexpr std::size_t kDefaultL1Size  = 1024;
    inline constexpr std::size_t kDefaultL2Size  = 8192;
    inline constexpr std::size_t kDefaultBlock   = 32;
    inline constexpr std::size_t kDefaultL1Ways  = 2;
    inline constexpr std::size_t kDefaultL2Ways  = 4;

    // Ancho del campo de direcciones en dumps (dígitos hex)
    inline constexpr int kAddrHexDigits = 8;

    // --- Flags de log rápidos ---
    inline constexpr bool kLogCache  = false; // hits/misses (muy verboso con trazas grandes)
    inline constexpr bool kLogEvict  = false; // evicciones/writebacks/invalidaciones
    inline constexpr bool kLogHier   = true;  // cableado de la jerarquía
    inline constexpr bool kLogTrace  = true;  // líneas de traza descartadas
    inline constexpr bool kLogNotify = true;  // fallos en los hooks del notifier

    // Macro simple de logging condicional
    #define LOG_IF(flag, msg)        \
        do {                         \
            if (flag) {              \
                SERR << msg << '\n'; \
            }                        \
        } while (0)
} // namespace cfg
