#include "sftpovw/SftpTypes.hpp"

#include <cctype>
#include <cstdio>

namespace sftpovw {

const char* digestAlgorithmName(DigestAlgorithm algo) {
    switch (algo) {
    case DigestAlgorithm::Md5:
        return "md5";
    case DigestAlgorithm::Sha1:
        return "sha1";
    case DigestAlgorithm::Sha224:
        return "sha224";
    case DigestAlgorithm::Sha256:
        return "sha256";
    case DigestAlgorithm::Sha384:
        return "sha384";
    case DigestAlgorithm::Sha512:
        return "sha512";
    }
    return "unknown";
}

bool digestAlgorithmFromName(const std::string& name, DigestAlgorithm& out) {
    std::string n;
    n.reserve(name.size());
    for (char c : name) {
        if (c == '-')
            continue; // aceptar "sha-256"
        n.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    static const DigestAlgorithm all[] = {
        DigestAlgorithm::Md5,    DigestAlgorithm::Sha1,   DigestAlgorithm::Sha224,
        DigestAlgorithm::Sha256, DigestAlgorithm::Sha384, DigestAlgorithm::Sha512,
    };
    for (DigestAlgorithm a : all) {
        if (n == digestAlgorithmName(a)) {
            out = a;
            return true;
        }
    }
    return false;
}

bool replaceLevelFromInt(int value, ReplaceLevel& out) {
    switch (value) {
    case 0:
        out = ReplaceLevel::Unsafe;
        return true;
    case 1:
        out = ReplaceLevel::RemoveFirst;
        return true;
    case 2:
        out = ReplaceLevel::RenameAside;
        return true;
    case 3:
        out = ReplaceLevel::StageAndRename;
        return true;
    case 4:
        out = ReplaceLevel::StageTwoTemps;
        return true;
    default:
        return false;
    }
}

const char* replaceLevelName(ReplaceLevel level) {
    switch (level) {
    case ReplaceLevel::Unsafe:
        return "unsafe";
    case ReplaceLevel::RemoveFirst:
        return "remove-first";
    case ReplaceLevel::RenameAside:
        return "rename-aside";
    case ReplaceLevel::StageAndRename:
        return "stage-and-rename";
    case ReplaceLevel::StageTwoTemps:
        return "stage-two-temps";
    }
    return "unknown";
}

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::NamingExhausted:
        return "NamingExhausted";
    case ErrorKind::TransferFailure:
        return "TransferFailure";
    case ErrorKind::CommandNotFound:
        return "CommandNotFound";
    case ErrorKind::UnknownCommandError:
        return "UnknownCommandError";
    case ErrorKind::LocalIo:
        return "LocalIo";
    case ErrorKind::InvalidArgument:
        return "InvalidArgument";
    case ErrorKind::NotConnected:
        return "NotConnected";
    }
    return "Unknown";
}

std::string OpError::describe() const {
    std::string out = std::string("[") + errorKindName(kind) + "] " + message;
    if (level.has_value()) {
        char ctx[96];
        std::snprintf(ctx, sizeof(ctx), " (level=%d elapsed=%.3fs bytes=%llu)",
                      static_cast<int>(*level), elapsedSeconds,
                      static_cast<unsigned long long>(bytesDone));
        out += ctx;
    }
    return out;
}

} // namespace sftpovw
