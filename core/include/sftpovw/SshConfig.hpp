// Lector mínimo de ~/.ssh/config: resuelve HostName, User, Port e IdentityFile
// para un alias como lo hace OpenSSH (gana el primer valor, patrones Host con
// '*', '?' y negación '!'). Los bloques Match se ignoran.
#pragma once
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

namespace sftpovw {

struct SshHostConfig {
    std::string hostName; // el propio alias si no hay HostName
    std::optional<std::string> user;
    std::optional<std::uint16_t> port;
    std::optional<std::string> identityFile;
};

// true si host encaja con la lista de patrones separada por espacios.
bool sshHostMatches(const std::string& patterns, const std::string& host);

// "~" y "~/..." se expanden contra $HOME.
std::string expandUserPath(const std::string& path);

bool parseSshConfig(std::istream& in, const std::string& host,
                    SshHostConfig& out, std::string& err);

// Un archivo inexistente no es error: out solo lleva el alias.
bool lookupSshConfig(const std::string& path, const std::string& host,
                     SshHostConfig& out, std::string& err);

} // namespace sftpovw
