#include "sftpovw/SftpSession.hpp"

#include <sys/stat.h>

namespace sftpovw {

bool SftpSession::exists(const std::string& remote_path, bool& isDir,
                         std::string& err) {
    isDir = false;
    err.clear();
    FileInfo info;
    if (!stat(remote_path, info, err))
        return false;
    isDir = info.is_dir;
    return true;
}

bool SftpSession::isDirectory(const std::string& remote_path, std::string& err) {
    err.clear();
    FileInfo info;
    if (!stat(remote_path, info, err))
        return false;
    return (info.mode & S_IFMT) == S_IFDIR;
}

} // namespace sftpovw
