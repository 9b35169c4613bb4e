// Interfaz abstracta de sesión SFTP para los protocolos de reemplazo y el
// verificador. Los backends (libssh2, mock en memoria) implementan las
// primitivas; todo lo que está por encima no depende del backend.
#pragma once
#include "SftpTypes.hpp"
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace sftpovw {

class SftpSession {
public:
    virtual ~SftpSession() = default;

    virtual bool connect(const SessionOptions& opt, std::string& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Listado de directorio remoto (sin "." ni "..")
    virtual bool list(const std::string& remote_dir,
                      std::vector<FileInfo>& out,
                      std::string& err) = 0;

    // Crear/truncar remote y copiar src hasta EOF. written lleva los bytes
    // enviados, también si la llamada falla.
    virtual bool write(std::istream& src,
                       const std::string& remote,
                       std::uint64_t sizeHint,
                       std::uint64_t& written,
                       std::string& err) = 0;

    // Copiar remote a dst. got lleva los bytes recibidos.
    virtual bool read(const std::string& remote,
                      std::ostream& dst,
                      std::uint64_t& got,
                      std::string& err) = 0;

    // Metadatos (stat). Devuelve true si existe; si "no existe" devuelve
    // false con err vacío, cualquier otro fallo rellena err.
    virtual bool stat(const std::string& remote_path,
                      FileInfo& info,
                      std::string& err) = 0;

    virtual bool rename(const std::string& from,
                        const std::string& to,
                        std::string& err,
                        bool overwrite = false) = 0;

    virtual bool removeFile(const std::string& remote_path,
                            std::string& err) = 0;

    // Ejecutar un comando en el host remoto. stdin se cierra de inmediato.
    // Devuelve false solo si el comando no pudo lanzarse.
    virtual bool exec(const std::string& command,
                      ExecResult& out,
                      std::string& err) = 0;

    // Extensión check-file (draft-ietf-secsh-filexfer-extensions). Devuelve
    // true y out.status indica si la extensión respondió.
    virtual bool checkFile(const std::string& remote_path,
                           DigestAlgorithm algo,
                           ExtensionDigest& out,
                           std::string& err) = 0;

    // Comprobar existencia (deja err vacío si "no existe")
    bool exists(const std::string& remote_path, bool& isDir, std::string& err);

    // ¿Es directorio? Una ruta inexistente simplemente "no es directorio".
    bool isDirectory(const std::string& remote_path, std::string& err);
};

} // namespace sftpovw
