// Verificación de contenido: digest de archivos remotos vía la extensión SFTP
// check-file, con respaldo ejecutando "<algo>sum" en el host remoto, y el
// mismo digest calculado sobre archivos locales.
#pragma once
#include "SftpSession.hpp"
#include "SftpTypes.hpp"
#include <string>
#include <utility>
#include <vector>

namespace sftpovw {

struct DigestOptions {
    DigestAlgorithm algorithm = DigestAlgorithm::Sha1;
    std::string command; // utilidad remota; vacío = "<algo>sum"
};

constexpr int kExitCommandNotFound = 127;
constexpr int kExitSomeFilesFailed = 1;

// Utilidad remota según las opciones ("sha1sum" por defecto).
std::string digestCommandFor(const DigestOptions& opt);

// "<utilidad> <ruta-citada> ..." tal como llega al shell remoto. Las rutas
// relativas que empiezan por '-' se pasan como "./<ruta>".
std::string buildDigestCommand(const std::string& utility,
                               const std::vector<std::string>& paths);

// Interpreta líneas "<digest><espacios><ruta>" como las imprimen las
// herramientas *sum de coreutils, incluido el marcador binario '*' y los
// nombres escapados con '\'. Se ignoran líneas inválidas o rutas no pedidas.
void parseDigestOutput(const std::string& output,
                       const std::vector<std::string>& requested,
                       DigestResult& out);

// Rutas pedidas sin entrada en result.
std::vector<std::string> missingDigests(const std::vector<std::string>& paths,
                                        const DigestResult& result);

class Verifier {
public:
    explicit Verifier(SftpSession& session, DigestOptions opt = {})
        : session_(session), opt_(std::move(opt)) {}

    const DigestOptions& options() const { return opt_; }

    // Primero la extensión. Si el servidor responde "unsupported" para alguna
    // ruta, todo el lote pasa por digestByCommand. Las rutas que fallan por
    // separado (p.ej. inexistentes) se registran y quedan fuera del resultado.
    bool digest(const std::vector<std::string>& paths, DigestResult& out,
                OpError& err);

    // Una sola ejecución remota para todo el lote. Salida 127 = CommandNotFound.
    // La salida 1 (archivos ilegibles) y otros fallos solo dan
    // UnknownCommandError si no se pudo interpretar nada.
    bool digestByCommand(const std::vector<std::string>& paths,
                         DigestResult& out, OpError& err);

private:
    SftpSession& session_;
    DigestOptions opt_;
};

bool digestLocal(const std::vector<std::string>& paths, DigestAlgorithm algo,
                 DigestResult& out, OpError& err);

} // namespace sftpovw
