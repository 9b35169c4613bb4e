// Tipos básicos compartidos por la capa de sesión, los protocolos de reemplazo
// y la CLI. Structs planos para poder rellenarlos y copiarlos libremente.
#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sftpovw {

// Política de validación de known_hosts para la clave del servidor.
enum class KnownHostsPolicy {
    Strict,     // Requiere coincidencia exacta con known_hosts.
    AcceptNew,  // TOFU: guarda hosts nuevos, rechaza claves cambiadas.
    Off         // Sin verificación.
};

struct FileInfo {
    std::string   name;       // nombre base (vacío en resultados de stat)
    bool          is_dir = false;
    std::uint64_t size  = 0;  // bytes
    std::uint64_t mtime = 0;  // segundos epoch
    std::uint32_t mode  = 0;  // tipo POSIX + bits de permisos
};

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    std::optional<std::string> known_hosts_path; // por defecto: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    // Se consulta cuando AcceptNew encuentra un host desconocido. Sin callback
    // el host se acepta y se guarda.
    std::function<bool(const std::string& host,
                       std::uint16_t port,
                       const std::string& algorithm,
                       const std::string& fingerprint)> hostkey_confirm_cb;
};

// Salida de una ejecución de comando remoto.
struct ExecResult {
    std::string stdoutData;
    std::string stderrData;
    int exitStatus = -1;
};

// Algoritmos de digest comunes a la extensión check-file, los comandos *sum y
// el cálculo local.
enum class DigestAlgorithm { Md5, Sha1, Sha224, Sha256, Sha384, Sha512 };

const char* digestAlgorithmName(DigestAlgorithm algo);
bool digestAlgorithmFromName(const std::string& name, DigestAlgorithm& out);

// Respuesta de check-file para una ruta. Unsupported solo indica que el
// servidor (o backend) no ofrece la extensión; un archivo inexistente es un
// error que devuelve la propia llamada.
struct ExtensionDigest {
    enum class Status { Supported, Unsupported };
    Status status = Status::Unsupported;
    std::string hex;
};

// Ruta -> digest hex en minúsculas.
using DigestResult = std::map<std::string, std::string>;

// Protocolos de reemplazo, ordenados por fuerza de la garantía de consistencia.
enum class ReplaceLevel {
    Unsafe = 0,         // sobrescribir en su sitio
    RemoveFirst = 1,    // borrar y luego escribir
    RenameAside = 2,    // apartar el viejo, escribir, borrar el viejo
    StageAndRename = 3, // escribir temporal, renombrar sobre el destino
    StageTwoTemps = 4   // escribir temp1, mover el viejo a temp2, promover temp1
};

constexpr ReplaceLevel kDefaultReplaceLevel = ReplaceLevel::StageAndRename;

bool replaceLevelFromInt(int value, ReplaceLevel& out);
const char* replaceLevelName(ReplaceLevel level);

enum class ErrorKind {
    None,
    NamingExhausted,     // sin nombre temporal libre tras los intentos
    TransferFailure,     // falló una primitiva de la sesión
    CommandNotFound,     // falta la utilidad de digest remota (salida 127)
    UnknownCommandError, // el comando de digest remoto falló sin salida
    LocalIo,             // falló una operación del sistema de archivos local
    InvalidArgument,
    NotConnected
};

const char* errorKindName(ErrorKind kind);

// Error de las operaciones del core. Los protocolos de reemplazo rellenan el
// contexto de transferencia para diagnosticar el fallo solo con el error.
struct OpError {
    ErrorKind kind = ErrorKind::None;
    std::string message;
    std::optional<ReplaceLevel> level;
    double elapsedSeconds = 0.0;
    std::uint64_t bytesDone = 0;

    bool ok() const { return kind == ErrorKind::None; }
    void clear() { *this = OpError{}; }
    void set(ErrorKind k, std::string msg) {
        kind = k;
        message = std::move(msg);
    }
    std::string describe() const;
};

} // namespace sftpovw
