#include "sftpovw/Digest.hpp"
#include "sftpovw/Hashing.hpp"
#include "sftpovw/Logging.hpp"
#include "sftpovw/ShellQuote.hpp"

#include <cctype>
#include <fstream>
#include <set>
#include <sstream>
#include <vector>

namespace sftpovw {

std::string digestCommandFor(const DigestOptions& opt) {
    if (!opt.command.empty())
        return opt.command;
    return std::string(digestAlgorithmName(opt.algorithm)) + "sum";
}

// Un '-' inicial se leería como opción ("-" es stdin, "-c" modo verificación).
static std::string digestArgument(const std::string& path) {
    if (!path.empty() && path.front() == '-')
        return "./" + path;
    return path;
}

std::string buildDigestCommand(const std::string& utility,
                               const std::vector<std::string>& paths) {
    std::vector<std::string> argv;
    argv.reserve(paths.size() + 1);
    argv.push_back(utility);
    for (const auto& p : paths)
        argv.push_back(digestArgument(p));
    return shellJoin(argv);
}

static bool isHexDigest(const std::string& s) {
    if (s.empty())
        return false;
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c)))
            return false;
    }
    return true;
}

static std::string unescapeName(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (std::size_t i = 0; i < name.size(); ++i) {
        if (name[i] != '\\' || i + 1 >= name.size()) {
            out.push_back(name[i]);
            continue;
        }
        const char n = name[++i];
        if (n == 'n')
            out.push_back('\n');
        else if (n == 'r')
            out.push_back('\r');
        else
            out.push_back(n);
    }
    return out;
}

void parseDigestOutput(const std::string& output,
                       const std::vector<std::string>& requested,
                       DigestResult& out) {
    const std::set<std::string> wanted(requested.begin(), requested.end());
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        bool escaped = false;
        if (!line.empty() && line.front() == '\\') {
            escaped = true;
            line.erase(0, 1);
        }
        std::size_t pos = 0;
        while (pos < line.size() && !std::isspace(static_cast<unsigned char>(line[pos])))
            ++pos;
        std::string digest = line.substr(0, pos);
        if (!isHexDigest(digest) || pos >= line.size())
            continue;

        std::string name;
        if (line[pos] == ' ' && pos + 1 < line.size() &&
            (line[pos + 1] == ' ' || line[pos + 1] == '*')) {
            name = line.substr(pos + 2); // coreutils: "<digest> <modo><nombre>"
        } else {
            while (pos < line.size() &&
                   std::isspace(static_cast<unsigned char>(line[pos])))
                ++pos;
            name = line.substr(pos);
        }
        if (escaped)
            name = unescapeName(name);
        if (name.empty() || wanted.count(name) == 0)
            continue;

        for (char& c : digest)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        out[name] = digest;
    }
}

std::vector<std::string> missingDigests(const std::vector<std::string>& paths,
                                        const DigestResult& result) {
    std::vector<std::string> missing;
    for (const auto& p : paths) {
        if (result.find(p) == result.end())
            missing.push_back(p);
    }
    return missing;
}

static std::string firstLine(const std::string& text) {
    const auto nl = text.find('\n');
    return nl == std::string::npos ? text : text.substr(0, nl);
}

bool Verifier::digest(const std::vector<std::string>& paths, DigestResult& out,
                      OpError& err) {
    err.clear();
    out.clear();
    if (paths.empty())
        return true;
    if (!session_.isConnected()) {
        err.set(ErrorKind::NotConnected, "session not connected");
        return false;
    }

    qCInfo(ovwDigest) << "digest by sftp extension:" << paths.size() << "path(s)"
                      << digestAlgorithmName(opt_.algorithm);
    DigestResult res;
    std::string firstError;
    std::size_t failures = 0;
    for (const auto& p : paths) {
        ExtensionDigest ext;
        std::string e;
        if (!session_.checkFile(p, opt_.algorithm, ext, e)) {
            qCWarning(ovwDigest) << "check-file" << p.c_str() << "failed:" << e.c_str();
            if (firstError.empty())
                firstError = p + ": " + e;
            ++failures;
            continue;
        }
        if (ext.status == ExtensionDigest::Status::Unsupported) {
            qCInfo(ovwDigest) << "check-file unsupported, using remote command";
            return digestByCommand(paths, out, err);
        }
        std::string hex = ext.hex;
        for (char& c : hex)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        res[p] = hex;
    }

    if (res.empty()) {
        err.set(ErrorKind::TransferFailure, "check-file failed: " + firstError);
        return false;
    }
    if (failures > 0) {
        qCWarning(ovwDigest) << "partial digest:" << res.size() << "of"
                             << paths.size() << "path(s)";
    }
    out = std::move(res);
    return true;
}

bool Verifier::digestByCommand(const std::vector<std::string>& paths,
                               DigestResult& out, OpError& err) {
    err.clear();
    out.clear();
    if (paths.empty())
        return true;
    if (!session_.isConnected()) {
        err.set(ErrorKind::NotConnected, "session not connected");
        return false;
    }

    const std::string utility = digestCommandFor(opt_);
    const std::string cmd = buildDigestCommand(utility, paths);
    qCInfo(ovwDigest) << "digest by command:" << cmd.c_str();

    ExecResult r;
    std::string e;
    if (!session_.exec(cmd, r, e)) {
        err.set(ErrorKind::TransferFailure, "exec " + utility + ": " + e);
        return false;
    }

    // La herramienta imprime los nombres tal como se pasaron: se interpreta
    // contra los argumentos y el resultado se indexa por las rutas pedidas.
    std::vector<std::string> args;
    args.reserve(paths.size());
    for (const auto& p : paths)
        args.push_back(digestArgument(p));
    DigestResult printed;
    parseDigestOutput(r.stdoutData, args, printed);
    DigestResult res;
    for (std::size_t i = 0; i < paths.size(); ++i) {
        auto it = printed.find(args[i]);
        if (it != printed.end())
            res[paths[i]] = it->second;
    }

    if (r.exitStatus == kExitCommandNotFound) {
        err.set(ErrorKind::CommandNotFound,
                utility + ": command not found on remote host" +
                    (r.stderrData.empty() ? std::string()
                                          : " (" + firstLine(r.stderrData) + ")"));
        return false;
    }
    if (r.exitStatus == kExitSomeFilesFailed) {
        qCWarning(ovwDigest) << utility.c_str() << "could not read some files:"
                             << firstLine(r.stderrData).c_str();
        if (res.empty()) {
            err.set(ErrorKind::UnknownCommandError,
                    utility + " exited with status 1 and no digest: " +
                        firstLine(r.stderrData));
            return false;
        }
    } else if (r.exitStatus != 0) {
        if (res.empty()) {
            err.set(ErrorKind::UnknownCommandError,
                    utility + " exited with status " + std::to_string(r.exitStatus) +
                        ": " + firstLine(r.stderrData));
            return false;
        }
        qCWarning(ovwDigest) << utility.c_str() << "exited with status"
                             << r.exitStatus << "keeping partial result";
    }

    const auto missing = missingDigests(paths, res);
    if (!missing.empty()) {
        qCWarning(ovwDigest) << "partial digest:" << missing.size()
                             << "path(s) without result, first" << missing.front().c_str();
    }
    out = std::move(res);
    return true;
}

bool digestLocal(const std::vector<std::string>& paths, DigestAlgorithm algo,
                 DigestResult& out, OpError& err) {
    err.clear();
    out.clear();
    std::vector<char> buf(64 * 1024);
    for (const auto& p : paths) {
        std::ifstream in(p, std::ios::binary);
        if (!in.is_open()) {
            err.set(ErrorKind::LocalIo, "cannot open " + p + " for reading");
            return false;
        }
        Hasher h;
        std::string e;
        if (!h.init(algo, e)) {
            err.set(ErrorKind::LocalIo, e);
            return false;
        }
        while (in) {
            in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
            const std::streamsize n = in.gcount();
            if (n > 0 && !h.update(buf.data(), static_cast<std::size_t>(n), e)) {
                err.set(ErrorKind::LocalIo, e);
                return false;
            }
        }
        if (in.bad()) {
            err.set(ErrorKind::LocalIo, "read " + p + " failed");
            return false;
        }
        std::string hex;
        if (!h.finalHex(hex, e)) {
            err.set(ErrorKind::LocalIo, e);
            return false;
        }
        out[p] = hex;
    }
    qCDebug(ovwDigest) << "local digest:" << out.size() << "path(s)";
    return true;
}

} // namespace sftpovw
