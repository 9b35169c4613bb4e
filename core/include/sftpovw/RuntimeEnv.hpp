// Interruptores de ejecución leídos del entorno.
#pragma once

#include <cctype>
#include <cstdlib>
#include <string>

namespace sftpovw {

inline std::string normalizedEnv(const char *name) {
    if (!name)
        return {};
    const char *raw = std::getenv(name);
    if (!raw || !*raw)
        return {};
    std::string out(raw);
    std::size_t start = 0;
    while (start < out.size() &&
           std::isspace(static_cast<unsigned char>(out[start]))) {
        ++start;
    }
    std::size_t end = out.size();
    while (end > start &&
           std::isspace(static_cast<unsigned char>(out[end - 1]))) {
        --end;
    }
    out = out.substr(start, end - start);
    for (char &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

inline bool envFlagEnabled(const char *name) {
    const std::string v = normalizedEnv(name);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

// SFTPOVW_DEBUG fuerza logging de depuración sin importar --quiet/--verbose.
inline bool debugLoggingForced() { return envFlagEnabled("SFTPOVW_DEBUG"); }

// Algoritmo de digest por defecto (SFTPOVW_HASH_ALGO); vacío si no está definido.
inline std::string envDigestAlgorithm() {
    return normalizedEnv("SFTPOVW_HASH_ALGO");
}

// La contraseña se toma literal: sin recortar ni cambiar mayúsculas.
inline std::string envPassword() {
    const char *raw = std::getenv("SFTPOVW_PASSWORD");
    return raw ? std::string(raw) : std::string();
}

} // namespace sftpovw
