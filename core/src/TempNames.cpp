#include "sftpovw/TempNames.hpp"
#include "sftpovw/Logging.hpp"
#include "sftpovw/RemotePath.hpp"

#include <openssl/rand.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace sftpovw {

bool randomHexSuffix(std::size_t bytes, std::string& out, std::string& err) {
    std::vector<unsigned char> buf(bytes);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        err = "RAND_bytes failed";
        return false;
    }
    static const char digits[] = "0123456789abcdef";
    out.clear();
    out.reserve(bytes * 2);
    for (unsigned char b : buf) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0f]);
    }
    return true;
}

bool makeTempName(const std::string& target, const ExistsCheck& existsCheck,
                  std::string& out, OpError& err) {
    for (int attempt = 0; attempt < kTempNameAttempts; ++attempt) {
        std::string suffix, e;
        if (!randomHexSuffix(kTempSuffixBytes, suffix, e)) {
            err.set(ErrorKind::LocalIo, e);
            return false;
        }
        const std::string candidate = target + "." + suffix;
        bool exists = false;
        if (!existsCheck(candidate, exists, e)) {
            err.set(ErrorKind::TransferFailure,
                    "existence check failed for " + candidate + ": " + e);
            return false;
        }
        if (!exists) {
            qCDebug(ovwNaming) << "temp name" << candidate.c_str()
                               << "attempt" << attempt + 1;
            out = candidate;
            return true;
        }
        qCDebug(ovwNaming) << "temp name collision" << candidate.c_str();
    }
    err.set(ErrorKind::NamingExhausted,
            "cannot create temporary name for " + target + " after " +
                std::to_string(kTempNameAttempts) + " attempts");
    return false;
}

bool remoteTempName(SftpSession& session, const std::string& target,
                    std::string& out, OpError& err) {
    return makeTempName(
        target,
        [&session](const std::string& candidate, bool& exists, std::string& e) {
            bool isDir = false;
            exists = session.exists(candidate, isDir, e);
            return exists || e.empty();
        },
        out, err);
}

bool looksLikeTemporary(const std::string& targetBase, const std::string& entry,
                        std::size_t tempNameLength) {
    const std::string prefix = targetBase + ".";
    return entry.size() == tempNameLength &&
           entry.compare(0, prefix.size(), prefix) == 0;
}

bool listRemoteTemporaries(SftpSession& session, const std::string& target,
                           std::vector<std::string>& out, OpError& err) {
    out.clear();
    std::string candidate;
    if (!remoteTempName(session, target, candidate, err))
        return false;

    const std::string dir = remoteDirName(target);
    const std::string base = remoteBaseName(target);
    const std::size_t tempLen = remoteBaseName(candidate).size();

    std::vector<FileInfo> entries;
    std::string e;
    if (!session.list(dir.empty() ? "." : dir, entries, e)) {
        err.set(ErrorKind::TransferFailure, "list " + dir + ": " + e);
        return false;
    }
    for (const auto& fi : entries) {
        if (looksLikeTemporary(base, fi.name, tempLen))
            out.push_back(joinRemotePath(dir, fi.name));
    }
    qCInfo(ovwNaming) << "temporaries of" << target.c_str() << ":" << out.size();
    return true;
}

bool localTempName(const std::string& target, std::string& out, OpError& err) {
    std::string tmpl = target + ".XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    const int fd = ::mkstemp(buf.data());
    if (fd < 0) {
        const int code = errno;
        err.set(code == EEXIST ? ErrorKind::NamingExhausted : ErrorKind::LocalIo,
                "mkstemp " + tmpl + ": " + std::strerror(code));
        return false;
    }
    ::close(fd);
    out.assign(buf.data());
    qCDebug(ovwNaming) << "local temp name" << out.c_str();
    return true;
}

bool listLocalTemporaries(const std::string& target,
                          std::vector<std::string>& out, OpError& err) {
    out.clear();
    std::string candidate;
    if (!localTempName(target, candidate, err))
        return false;
    std::error_code ec;
    fs::remove(candidate, ec);
    if (ec) {
        err.set(ErrorKind::LocalIo, "remove " + candidate + ": " + ec.message());
        return false;
    }

    const fs::path targetPath(target);
    const fs::path dir = targetPath.parent_path();
    const std::string base = targetPath.filename().string();
    const std::size_t tempLen = fs::path(candidate).filename().string().size();

    for (fs::directory_iterator it(dir.empty() ? fs::path(".") : dir, ec), end;
         !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (looksLikeTemporary(base, name, tempLen))
            out.push_back((dir / name).string());
    }
    if (ec) {
        err.set(ErrorKind::LocalIo, "list " + dir.string() + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace sftpovw
