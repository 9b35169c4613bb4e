#include "sftpovw/MockSftpSession.hpp"
#include "sftpovw/Hashing.hpp"
#include "sftpovw/RemotePath.hpp"
#include "sftpovw/ShellQuote.hpp"

#include <istream>
#include <ostream>
#include <sys/stat.h>

namespace sftpovw {

static constexpr std::uint32_t kDirMode = S_IFDIR | 0755;
static constexpr std::uint32_t kFileMode = S_IFREG | 0644;

bool MockSftpSession::connect(const SessionOptions& opt, std::string& err) {
    if (opt.host.empty() || opt.username.empty()) {
        err = "host and user are required";
        return false;
    }
    connected_ = true;
    lastOpt_ = opt;
    return true;
}

void MockSftpSession::disconnect() {
    connected_ = false;
}

bool MockSftpSession::ready(std::string& err) const {
    if (!connected_) {
        err = "not connected";
        return false;
    }
    return true;
}

bool MockSftpSession::injected(Op op, std::string& err) {
    for (auto it = faults_.begin(); it != faults_.end(); ++it) {
        if (it->op != op)
            continue;
        if (--it->remaining == 0) {
            err = it->message;
            faults_.erase(it);
            return true;
        }
    }
    return false;
}

bool MockSftpSession::parentIsDir(const std::string& path) const {
    const std::string parent = remoteDirName(path);
    if (parent.empty())
        return true; // relativa al directorio de trabajo (implícito)
    auto it = fs_.find(parent);
    return it != fs_.end() && it->second.isDir;
}

void MockSftpSession::addDir(const std::string& path) {
    const std::string parent = remoteDirName(path);
    if (!parent.empty() && parent != path && fs_.find(parent) == fs_.end())
        addDir(parent);
    fs_[path] = Node{true, {}, clock_++};
}

void MockSftpSession::addFile(const std::string& path, const std::string& content) {
    const std::string parent = remoteDirName(path);
    if (!parent.empty() && fs_.find(parent) == fs_.end())
        addDir(parent);
    fs_[path] = Node{false, content, clock_++};
}

bool MockSftpSession::hasPath(const std::string& path) const {
    return fs_.find(path) != fs_.end();
}

std::string MockSftpSession::fileContent(const std::string& path) const {
    auto it = fs_.find(path);
    return it == fs_.end() ? std::string() : it->second.content;
}

std::vector<std::string> MockSftpSession::paths() const {
    std::vector<std::string> out;
    for (const auto& kv : fs_)
        out.push_back(kv.first);
    return out;
}

void MockSftpSession::failOn(Op op, int occurrence, const std::string& message) {
    faults_.push_back(Fault{op, occurrence < 1 ? 1 : occurrence, message});
}

void MockSftpSession::failWriteAfter(std::uint64_t bytes) {
    writeLimitArmed_ = true;
    writeLimit_ = bytes;
}

bool MockSftpSession::list(const std::string& remote_dir,
                           std::vector<FileInfo>& out,
                           std::string& err) {
    if (!ready(err) || injected(Op::List, err))
        return false;
    const std::string dir = (remote_dir.empty() || remote_dir == ".") ? "" : remote_dir;
    if (!dir.empty()) {
        auto it = fs_.find(dir);
        if (it == fs_.end() || !it->second.isDir) {
            err = "no such directory: " + dir;
            return false;
        }
    }
    out.clear();
    for (const auto& kv : fs_) {
        if (kv.first == dir || kv.first == "/" || remoteDirName(kv.first) != dir)
            continue;
        FileInfo fi;
        fi.name = remoteBaseName(kv.first);
        fi.is_dir = kv.second.isDir;
        fi.size = kv.second.content.size();
        fi.mtime = kv.second.mtime;
        fi.mode = kv.second.isDir ? kDirMode : kFileMode;
        out.push_back(fi);
    }
    return true;
}

bool MockSftpSession::write(std::istream& src, const std::string& remote,
                            std::uint64_t /*sizeHint*/, std::uint64_t& written,
                            std::string& err) {
    written = 0;
    if (!ready(err))
        return false;
    journal_.push_back("write " + remote);
    if (injected(Op::Write, err))
        return false;
    auto it = fs_.find(remote);
    if (it != fs_.end() && it->second.isDir) {
        err = "is a directory: " + remote;
        return false;
    }
    if (!parentIsDir(remote)) {
        err = "no such directory for " + remote;
        return false;
    }

    Node& node = fs_[remote];
    node = Node{false, {}, clock_++};
    char buf[4096];
    for (;;) {
        src.read(buf, sizeof(buf));
        const std::streamsize n = src.gcount();
        if (n > 0) {
            std::size_t take = static_cast<std::size_t>(n);
            if (writeLimitArmed_ && written + take > writeLimit_)
                take = static_cast<std::size_t>(writeLimit_ - written);
            node.content.append(buf, take);
            written += take;
            if (take < static_cast<std::size_t>(n)) {
                writeLimitArmed_ = false;
                err = "connection lost after " + std::to_string(written) + " bytes";
                return false;
            }
        }
        if (src.eof())
            break;
        if (!src) {
            err = "local read failed";
            return false;
        }
    }
    return true;
}

bool MockSftpSession::read(const std::string& remote, std::ostream& dst,
                           std::uint64_t& got, std::string& err) {
    got = 0;
    if (!ready(err))
        return false;
    journal_.push_back("read " + remote);
    if (injected(Op::Read, err))
        return false;
    auto it = fs_.find(remote);
    if (it == fs_.end() || it->second.isDir) {
        err = "no such file: " + remote;
        return false;
    }
    const std::string& data = it->second.content;
    dst.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!dst) {
        err = "local write failed";
        return false;
    }
    got = data.size();
    return true;
}

bool MockSftpSession::stat(const std::string& remote_path, FileInfo& info,
                           std::string& err) {
    if (!ready(err) || injected(Op::Stat, err))
        return false;
    auto it = fs_.find(remote_path);
    if (it == fs_.end()) {
        err.clear();
        return false;
    }
    info = FileInfo{};
    info.is_dir = it->second.isDir;
    info.size = it->second.content.size();
    info.mtime = it->second.mtime;
    info.mode = it->second.isDir ? kDirMode : kFileMode;
    return true;
}

bool MockSftpSession::rename(const std::string& from, const std::string& to,
                             std::string& err, bool overwrite) {
    if (!ready(err))
        return false;
    journal_.push_back("rename " + from + " " + to);
    if (injected(Op::Rename, err))
        return false;
    auto src = fs_.find(from);
    if (src == fs_.end()) {
        err = "no such file: " + from;
        return false;
    }
    auto dst = fs_.find(to);
    if (dst != fs_.end()) {
        if (!overwrite) {
            err = "file already exists: " + to;
            return false;
        }
        if (dst->second.isDir) {
            err = "is a directory: " + to;
            return false;
        }
    }
    if (!parentIsDir(to)) {
        err = "no such directory for " + to;
        return false;
    }
    Node moved = src->second;
    fs_.erase(src);
    fs_[to] = moved;
    return true;
}

bool MockSftpSession::removeFile(const std::string& remote_path, std::string& err) {
    if (!ready(err))
        return false;
    journal_.push_back("unlink " + remote_path);
    if (injected(Op::Remove, err))
        return false;
    auto it = fs_.find(remote_path);
    if (it == fs_.end()) {
        err = "no such file: " + remote_path;
        return false;
    }
    if (it->second.isDir) {
        err = "is a directory: " + remote_path;
        return false;
    }
    fs_.erase(it);
    return true;
}

ExecResult MockSftpSession::emulateCommand(const std::string& command) {
    ExecResult r;
    std::vector<std::string> argv;
    if (!shellSplit(command, argv) || argv.empty()) {
        r.stderrData = "sh: syntax error\n";
        r.exitStatus = 2;
        return r;
    }
    const std::string& tool = argv.front();
    DigestAlgorithm algo{};
    const std::string suffix = "sum";
    if (tool.size() <= suffix.size() ||
        tool.compare(tool.size() - suffix.size(), suffix.size(), suffix) != 0 ||
        !digestAlgorithmFromName(tool.substr(0, tool.size() - suffix.size()), algo)) {
        r.stderrData = "sh: 1: " + tool + ": not found\n";
        r.exitStatus = 127;
        return r;
    }

    r.exitStatus = 0;
    for (std::size_t i = 1; i < argv.size(); ++i) {
        const std::string& p = argv[i];
        auto it = fs_.find(p);
        if (it == fs_.end() || it->second.isDir) {
            r.stderrData += tool + ": " + p + ": No such file or directory\n";
            r.exitStatus = 1;
            continue;
        }
        std::string hex, e;
        if (!hexDigest(algo, it->second.content, hex, e)) {
            r.stderrData += tool + ": " + e + "\n";
            r.exitStatus = 1;
            continue;
        }
        r.stdoutData += hex + "  " + p + "\n";
    }
    return r;
}

bool MockSftpSession::exec(const std::string& command, ExecResult& out,
                           std::string& err) {
    out = ExecResult{};
    if (!ready(err))
        return false;
    commands_.push_back(command);
    journal_.push_back("exec " + command);
    if (injected(Op::Exec, err))
        return false;
    if (!execQueue_.empty()) {
        out = execQueue_.front();
        execQueue_.pop_front();
        return true;
    }
    out = emulateCommand(command);
    return true;
}

bool MockSftpSession::checkFile(const std::string& remote_path, DigestAlgorithm algo,
                                ExtensionDigest& out, std::string& err) {
    out = ExtensionDigest{};
    if (!ready(err) || injected(Op::CheckFile, err))
        return false;
    if (!checkFileSupported_) {
        out.status = ExtensionDigest::Status::Unsupported;
        return true;
    }
    auto it = fs_.find(remote_path);
    if (it == fs_.end() || it->second.isDir) {
        err = "no such file: " + remote_path;
        return false;
    }
    if (!hexDigest(algo, it->second.content, out.hex, err))
        return false;
    out.status = ExtensionDigest::Status::Supported;
    return true;
}

} // namespace sftpovw
