#include "sftpovw/Replace.hpp"
#include "sftpovw/Logging.hpp"
#include "sftpovw/TempNames.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <istream>
#include <system_error>

namespace fs = std::filesystem;

namespace sftpovw {

static double secondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start)
        .count();
}

bool ReplaceEngine::put(std::istream& src, const std::string& remote,
                        std::uint64_t sizeHint, ReplaceLevel level,
                        std::uint64_t& written, OpError& err) {
    err.clear();
    written = 0;
    if (!session_.isConnected()) {
        err.set(ErrorKind::NotConnected, "session not connected");
        err.level = level;
        return false;
    }

    const auto started = std::chrono::steady_clock::now();
    bool ok = false;
    switch (level) {
    case ReplaceLevel::Unsafe:
        ok = putUnsafe(src, remote, sizeHint, written, err);
        break;
    case ReplaceLevel::RemoveFirst:
        ok = putRemoveFirst(src, remote, sizeHint, written, err);
        break;
    case ReplaceLevel::RenameAside:
        ok = putRenameAside(src, remote, sizeHint, written, err);
        break;
    case ReplaceLevel::StageAndRename:
        ok = putStageAndRename(src, remote, sizeHint, written, err);
        break;
    case ReplaceLevel::StageTwoTemps:
        ok = putStageTwoTemps(src, remote, sizeHint, written, err);
        break;
    default:
        err.set(ErrorKind::InvalidArgument,
                "unsupported replace level " + std::to_string(static_cast<int>(level)));
        break;
    }
    const double elapsed = secondsSince(started);

    if (ok) {
        qCInfo(ovwReplace).nospace()
            << "put " << remote.c_str() << " level=" << static_cast<int>(level)
            << " bytes=" << written << " elapsed=" << elapsed << "s";
        return true;
    }
    err.level = level;
    err.elapsedSeconds = elapsed;
    err.bytesDone = written;
    qCWarning(ovwReplace).nospace()
        << "put " << remote.c_str() << " failed level=" << static_cast<int>(level)
        << " bytes=" << written << " elapsed=" << elapsed
        << "s: " << err.message.c_str();
    return false;
}

bool ReplaceEngine::get(const std::string& remote, const std::string& local,
                        ReplaceLevel level, std::uint64_t& got, OpError& err) {
    err.clear();
    got = 0;
    if (!session_.isConnected()) {
        err.set(ErrorKind::NotConnected, "session not connected");
        err.level = level;
        return false;
    }

    const auto started = std::chrono::steady_clock::now();
    bool ok = false;
    switch (level) {
    case ReplaceLevel::Unsafe:
        ok = getUnsafe(remote, local, got, err);
        break;
    case ReplaceLevel::RemoveFirst:
        ok = getRemoveFirst(remote, local, got, err);
        break;
    case ReplaceLevel::RenameAside:
        ok = getRenameAside(remote, local, got, err);
        break;
    case ReplaceLevel::StageAndRename:
        ok = getStageAndRename(remote, local, got, err);
        break;
    case ReplaceLevel::StageTwoTemps:
        ok = getStageTwoTemps(remote, local, got, err);
        break;
    default:
        err.set(ErrorKind::InvalidArgument,
                "unsupported replace level " + std::to_string(static_cast<int>(level)));
        break;
    }
    const double elapsed = secondsSince(started);

    if (ok) {
        qCInfo(ovwReplace).nospace()
            << "get " << remote.c_str() << " -> " << local.c_str()
            << " level=" << static_cast<int>(level) << " bytes=" << got
            << " elapsed=" << elapsed << "s";
        return true;
    }
    err.level = level;
    err.elapsedSeconds = elapsed;
    err.bytesDone = got;
    qCWarning(ovwReplace).nospace()
        << "get " << remote.c_str() << " -> " << local.c_str()
        << " failed level=" << static_cast<int>(level) << " bytes=" << got
        << " elapsed=" << elapsed << "s: " << err.message.c_str();
    return false;
}

// ---- niveles de put ----

bool ReplaceEngine::putUnsafe(std::istream& src, const std::string& dst,
                              std::uint64_t sizeHint, std::uint64_t& written,
                              OpError& err) {
    return writeRemote(src, dst, sizeHint, written, err);
}

bool ReplaceEngine::putRemoveFirst(std::istream& src, const std::string& dst,
                                   std::uint64_t sizeHint, std::uint64_t& written,
                                   OpError& err) {
    bool exists = false;
    if (!existsRemote(dst, exists, err))
        return false;
    if (exists && !removeRemote(dst, err))
        return false;
    return writeRemote(src, dst, sizeHint, written, err);
}

bool ReplaceEngine::putRenameAside(std::istream& src, const std::string& dst,
                                   std::uint64_t sizeHint, std::uint64_t& written,
                                   OpError& err) {
    std::string tmp;
    if (!remoteTempName(session_, dst, tmp, err))
        return false;
    bool exists = false;
    if (!existsRemote(dst, exists, err))
        return false;
    if (exists && !renameRemote(dst, tmp, false, err))
        return false;

    if (!writeRemote(src, dst, sizeHint, written, err)) {
        // dst nunca queda a medias: borrar lo escrito y, si lo había,
        // restaurar el contenido anterior.
        std::string e;
        bool isDir = false;
        bool cleaned = session_.exists(dst, isDir, e) ? session_.removeFile(dst, e)
                                                      : e.empty();
        if (!cleaned) {
            qCWarning(ovwReplace) << "cleanup failed:" << dst.c_str() << e.c_str();
            err.message += " (cleanup of " + dst + " failed: " + e + ")";
        } else if (exists) {
            qCWarning(ovwReplace) << "restore" << tmp.c_str() << "->" << dst.c_str();
            if (!session_.rename(tmp, dst, e, true)) {
                qCWarning(ovwReplace) << "restore failed:" << e.c_str();
                err.message += " (restore of " + tmp + " failed: " + e + ")";
            }
        }
        return false;
    }
    if (exists)
        return removeRemote(tmp, err);
    return true;
}

bool ReplaceEngine::putStageAndRename(std::istream& src, const std::string& dst,
                                      std::uint64_t sizeHint,
                                      std::uint64_t& written, OpError& err) {
    std::string tmp;
    if (!remoteTempName(session_, dst, tmp, err))
        return false;
    if (!writeRemote(src, tmp, sizeHint, written, err))
        return false;
    return renameRemote(tmp, dst, true, err);
}

bool ReplaceEngine::putStageTwoTemps(std::istream& src, const std::string& dst,
                                     std::uint64_t sizeHint,
                                     std::uint64_t& written, OpError& err) {
    std::string tmp1, tmp2;
    if (!remoteTempName(session_, dst, tmp1, err))
        return false;
    if (!remoteTempName(session_, dst, tmp2, err))
        return false;
    if (!writeRemote(src, tmp1, sizeHint, written, err))
        return false;

    // Se comprueba solo ahora que el contenido nuevo ya está preparado.
    bool exists = false;
    if (!existsRemote(dst, exists, err))
        return false;
    if (exists && !renameRemote(dst, tmp2, false, err))
        return false;
    if (!renameRemote(tmp1, dst, false, err))
        return false;
    if (exists)
        return removeRemote(tmp2, err);
    return true;
}

// ---- niveles de get ----

bool ReplaceEngine::getUnsafe(const std::string& src, const std::string& dst,
                              std::uint64_t& got, OpError& err) {
    return download(src, dst, got, err);
}

bool ReplaceEngine::getRemoveFirst(const std::string& src, const std::string& dst,
                                   std::uint64_t& got, OpError& err) {
    bool exists = false;
    if (!existsLocal(dst, exists, err))
        return false;
    if (exists && !removeLocal(dst, err))
        return false;
    return download(src, dst, got, err);
}

bool ReplaceEngine::getRenameAside(const std::string& src, const std::string& dst,
                                   std::uint64_t& got, OpError& err) {
    bool exists = false;
    if (!existsLocal(dst, exists, err))
        return false;
    std::string tmp;
    if (exists) {
        if (!localTempName(dst, tmp, err))
            return false;
        if (!renameLocal(dst, tmp, err))
            return false;
    }

    if (!download(src, dst, got, err)) {
        std::error_code ec;
        if (exists) {
            qCWarning(ovwReplace) << "restore(local)" << tmp.c_str() << "->"
                                  << dst.c_str();
            fs::rename(tmp, dst, ec);
            if (ec) {
                qCWarning(ovwReplace) << "restore failed:" << ec.message().c_str();
                err.message += " (restore of " + tmp + " failed: " + ec.message() + ")";
            }
        } else {
            // download() crea dst antes de leer; no debe quedar nada.
            fs::remove(dst, ec);
            if (ec) {
                qCWarning(ovwReplace) << "cleanup failed:" << dst.c_str()
                                      << ec.message().c_str();
                err.message += " (cleanup of " + dst + " failed: " + ec.message() + ")";
            }
        }
        return false;
    }
    if (exists)
        return removeLocal(tmp, err);
    return true;
}

bool ReplaceEngine::getStageAndRename(const std::string& src, const std::string& dst,
                                      std::uint64_t& got, OpError& err) {
    std::string tmp;
    if (!localTempName(dst, tmp, err))
        return false;
    if (!download(src, tmp, got, err))
        return false;
    return renameLocal(tmp, dst, err);
}

bool ReplaceEngine::getStageTwoTemps(const std::string& src, const std::string& dst,
                                     std::uint64_t& got, OpError& err) {
    std::string tmp1;
    if (!localTempName(dst, tmp1, err))
        return false;
    if (!download(src, tmp1, got, err))
        return false;

    bool exists = false;
    if (!existsLocal(dst, exists, err))
        return false;
    std::string tmp2;
    if (exists) {
        if (!localTempName(dst, tmp2, err))
            return false;
        if (!renameLocal(dst, tmp2, err))
            return false;
    }
    if (!renameLocal(tmp1, dst, err))
        return false;
    if (exists)
        return removeLocal(tmp2, err);
    return true;
}

// ---- pasos remotos ----

bool ReplaceEngine::writeRemote(std::istream& src, const std::string& path,
                                std::uint64_t sizeHint, std::uint64_t& written,
                                OpError& err) {
    qCInfo(ovwReplace) << "put" << path.c_str();
    std::string e;
    if (!session_.write(src, path, sizeHint, written, e)) {
        err.set(ErrorKind::TransferFailure, "write " + path + ": " + e);
        return false;
    }
    if (sizeHint != 0 && written != sizeHint) {
        err.set(ErrorKind::TransferFailure,
                "size mismatch writing " + path + ": " + std::to_string(written) +
                    " != " + std::to_string(sizeHint));
        return false;
    }
    return true;
}

bool ReplaceEngine::existsRemote(const std::string& path, bool& exists,
                                 OpError& err) {
    std::string e;
    bool isDir = false;
    exists = session_.exists(path, isDir, e);
    if (!exists && !e.empty()) {
        err.set(ErrorKind::TransferFailure, "stat " + path + ": " + e);
        return false;
    }
    return true;
}

bool ReplaceEngine::renameRemote(const std::string& from, const std::string& to,
                                 bool overwrite, OpError& err) {
    qCInfo(ovwReplace) << "rename" << from.c_str() << "->" << to.c_str();
    std::string e;
    if (!session_.rename(from, to, e, overwrite)) {
        err.set(ErrorKind::TransferFailure, "rename " + from + " -> " + to + ": " + e);
        return false;
    }
    return true;
}

bool ReplaceEngine::removeRemote(const std::string& path, OpError& err) {
    qCInfo(ovwReplace) << "unlink" << path.c_str();
    std::string e;
    if (!session_.removeFile(path, e)) {
        err.set(ErrorKind::TransferFailure, "unlink " + path + ": " + e);
        return false;
    }
    return true;
}

// ---- pasos locales ----

bool ReplaceEngine::download(const std::string& remote, const std::string& localPath,
                             std::uint64_t& got, OpError& err) {
    qCInfo(ovwReplace) << "get" << remote.c_str() << "->" << localPath.c_str();
    std::ofstream out(localPath, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        err.set(ErrorKind::LocalIo, "cannot open " + localPath + " for writing");
        return false;
    }
    std::string e;
    if (!session_.read(remote, out, got, e)) {
        err.set(ErrorKind::TransferFailure, "read " + remote + ": " + e);
        return false;
    }
    out.close();
    if (out.fail()) {
        err.set(ErrorKind::LocalIo, "write " + localPath + " failed");
        return false;
    }
    return true;
}

bool ReplaceEngine::existsLocal(const std::string& path, bool& exists, OpError& err) {
    std::error_code ec;
    exists = fs::exists(path, ec);
    if (ec) {
        err.set(ErrorKind::LocalIo, "stat " + path + ": " + ec.message());
        return false;
    }
    return true;
}

bool ReplaceEngine::renameLocal(const std::string& from, const std::string& to,
                                OpError& err) {
    qCInfo(ovwReplace) << "rename(local)" << from.c_str() << "->" << to.c_str();
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        err.set(ErrorKind::LocalIo, "rename " + from + " -> " + to + ": " + ec.message());
        return false;
    }
    return true;
}

bool ReplaceEngine::removeLocal(const std::string& path, OpError& err) {
    qCInfo(ovwReplace) << "unlink(local)" << path.c_str();
    std::error_code ec;
    if (!fs::remove(path, ec) && ec) {
        err.set(ErrorKind::LocalIo, "unlink " + path + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace sftpovw
