// Protocolos de reemplazo por etapas para put (stream -> remoto) y get
// (remoto -> archivo local).
//
//   nivel 0  escribir dest en su sitio
//   nivel 1  borrar dest, escribir dest
//   nivel 2  apartar dest a un temporal, escribir dest, borrar el temporal
//   nivel 3  escribir un temporal, renombrarlo sobre dest
//   nivel 4  escribir temp1, mover dest a temp2, renombrar temp1 a dest, borrar temp2
//
// Los pasos se ejecutan en orden y nunca se reintentan. Ante un fallo el
// OpError lleva el nivel, el tiempo transcurrido y los bytes transferidos.
// Los temporales creados antes del fallo se conservan; listRemoteTemporaries /
// listLocalTemporaries los encuentran después.
#pragma once
#include "SftpSession.hpp"
#include "SftpTypes.hpp"
#include <cstdint>
#include <iosfwd>
#include <string>

namespace sftpovw {

class ReplaceEngine {
public:
    explicit ReplaceEngine(SftpSession& session) : session_(session) {}

    // Subir src a remote. Un sizeHint distinto de 0 debe coincidir con lo escrito.
    bool put(std::istream& src,
             const std::string& remote,
             std::uint64_t sizeHint,
             ReplaceLevel level,
             std::uint64_t& written,
             OpError& err);

    // Descargar remote a la ruta local.
    bool get(const std::string& remote,
             const std::string& local,
             ReplaceLevel level,
             std::uint64_t& got,
             OpError& err);

private:
    SftpSession& session_;

    bool putUnsafe(std::istream& src, const std::string& dst, std::uint64_t sizeHint,
                   std::uint64_t& written, OpError& err);
    bool putRemoveFirst(std::istream& src, const std::string& dst, std::uint64_t sizeHint,
                        std::uint64_t& written, OpError& err);
    bool putRenameAside(std::istream& src, const std::string& dst, std::uint64_t sizeHint,
                        std::uint64_t& written, OpError& err);
    bool putStageAndRename(std::istream& src, const std::string& dst, std::uint64_t sizeHint,
                           std::uint64_t& written, OpError& err);
    bool putStageTwoTemps(std::istream& src, const std::string& dst, std::uint64_t sizeHint,
                          std::uint64_t& written, OpError& err);

    bool getUnsafe(const std::string& src, const std::string& dst,
                   std::uint64_t& got, OpError& err);
    bool getRemoveFirst(const std::string& src, const std::string& dst,
                        std::uint64_t& got, OpError& err);
    bool getRenameAside(const std::string& src, const std::string& dst,
                        std::uint64_t& got, OpError& err);
    bool getStageAndRename(const std::string& src, const std::string& dst,
                           std::uint64_t& got, OpError& err);
    bool getStageTwoTemps(const std::string& src, const std::string& dst,
                          std::uint64_t& got, OpError& err);

    // Pasos remotos
    bool writeRemote(std::istream& src, const std::string& path, std::uint64_t sizeHint,
                     std::uint64_t& written, OpError& err);
    bool existsRemote(const std::string& path, bool& exists, OpError& err);
    bool renameRemote(const std::string& from, const std::string& to, bool overwrite,
                      OpError& err);
    bool removeRemote(const std::string& path, OpError& err);

    // Pasos locales
    bool download(const std::string& remote, const std::string& localPath,
                  std::uint64_t& got, OpError& err);
    bool existsLocal(const std::string& path, bool& exists, OpError& err);
    bool renameLocal(const std::string& from, const std::string& to, OpError& err);
    bool removeLocal(const std::string& path, OpError& err);
};

} // namespace sftpovw
