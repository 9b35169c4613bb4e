// Utilidades de cadena para rutas remotas (siempre separadas por '/').
#pragma once
#include <string>

namespace sftpovw {

// Parte de directorio de una ruta remota: "a/b" -> "a", "/b" -> "/", "b" -> "".
inline std::string remoteDirName(const std::string &path) {
    const auto pos = path.find_last_of('/');
    if (pos == std::string::npos)
        return {};
    if (pos == 0)
        return "/";
    return path.substr(0, pos);
}

inline std::string remoteBaseName(const std::string &path) {
    const auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

inline std::string joinRemotePath(const std::string &base,
                                  const std::string &name) {
    if (base.empty())
        return name;
    if (base.back() == '/')
        return base + name;
    return base + "/" + name;
}

} // namespace sftpovw
