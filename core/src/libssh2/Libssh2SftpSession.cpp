// Backend libssh2: gestiona socket TCP, sesión SSH, canal SFTP y canales exec.
// La sesión queda en modo bloqueante salvo al vaciar la salida de exec.
#include "sftpovw/Libssh2SftpSession.hpp"
#include "sftpovw/Logging.hpp"

#include <libssh2.h>
#include <libssh2_sftp.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <istream>
#include <ostream>
#include <thread>
#include <utility>

// Sockets POSIX
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace sftpovw {

static constexpr std::size_t kChunk = 64 * 1024;

static int libssh2InitOnce() {
    static const int rc = libssh2_init(0);
    return rc;
}

// Callback keyboard-interactive: responde cada prompt con la contraseña que
// llega por el puntero abstract de la sesión.
static void kbdintPassword(const char* /*name*/, int /*name_len*/,
                           const char* /*instruction*/, int /*instruction_len*/,
                           int num_prompts,
                           const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                           LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                           void** abstract) {
    const std::string* pass =
        (abstract && *abstract) ? static_cast<const std::string*>(*abstract) : nullptr;
    for (int i = 0; i < num_prompts; ++i) {
        responses[i].text = nullptr;
        responses[i].length = 0;
        if (!pass || pass->empty())
            continue;
        char* buf = static_cast<char*>(std::malloc(pass->size() + 1));
        if (!buf)
            continue;
        std::memcpy(buf, pass->data(), pass->size());
        buf[pass->size()] = '\0';
        responses[i].text = buf;
        responses[i].length = static_cast<unsigned int>(pass->size());
    }
}

static int knownHostKeyType(int hostkeyType) {
    switch (hostkeyType) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return LIBSSH2_KNOWNHOST_KEY_ED25519;
    default:
        return LIBSSH2_KNOWNHOST_KEY_UNKNOWN;
    }
}

static const char* hostKeyTypeName(int hostkeyType) {
    switch (hostkeyType) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return "RSA";
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return "DSA";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return "ECDSA-256";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return "ECDSA-384";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return "ECDSA-521";
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return "ED25519";
    default:
        return "UNKNOWN";
    }
}

Libssh2SftpSession::Libssh2SftpSession() = default;

Libssh2SftpSession::~Libssh2SftpSession() {
    disconnect();
}

bool Libssh2SftpSession::ready(std::string& err) const {
    if (!connected_ || !sftp_) {
        err = "not connected";
        return false;
    }
    return true;
}

std::string Libssh2SftpSession::lastError() const {
    if (!session_)
        return "no session";
    char* msg = nullptr;
    int len = 0;
    const int code = libssh2_session_last_error(session_, &msg, &len, 0);
    std::string out = (msg && len > 0) ? std::string(msg, static_cast<std::size_t>(len))
                                       : std::string("libssh2 error");
    out += " (" + std::to_string(code);
    if (code == LIBSSH2_ERROR_SFTP_PROTOCOL && sftp_)
        out += ", sftp status " + std::to_string(libssh2_sftp_last_error(sftp_));
    out += ")";
    return out;
}

bool Libssh2SftpSession::lastErrorIsNoSuchFile() const {
    if (!session_ || !sftp_ ||
        libssh2_session_last_errno(session_) != LIBSSH2_ERROR_SFTP_PROTOCOL)
        return false;
    const unsigned long st = libssh2_sftp_last_error(sftp_);
    return st == LIBSSH2_FX_NO_SUCH_FILE || st == LIBSSH2_FX_NO_SUCH_PATH;
}

bool Libssh2SftpSession::tcpConnect(const std::string& host, std::uint16_t port,
                                    std::string& err) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    const int gai = ::getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + ::gai_strerror(gai);
        return false;
    }

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        const int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1)
            continue;
        int on = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
#if defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            ::freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    ::freeaddrinfo(res);
    err = "cannot connect to " + host + ":" + portStr;
    return false;
}

bool Libssh2SftpSession::verifyHostKey(const SessionOptions& opt, std::string& err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off)
        return true;

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = "cannot initialize known_hosts";
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else if (const char* home = std::getenv("HOME")) {
        khPath = std::string(home) + "/.ssh/known_hosts";
    }
    const bool loaded =
        !khPath.empty() &&
        libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    if (!loaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = "known_hosts missing or unreadable (strict policy): " + khPath;
        return false;
    }

    std::size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = "cannot read server host key";
        return false;
    }
    const int typemask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW |
                         knownHostKeyType(keytype);

    struct libssh2_knownhost* found = nullptr;
    const int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port, hostkey,
                                               keylen, typemask, &found);
    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        libssh2_knownhost_free(nh);
        err = "host key for " + opt.host + " does not match known_hosts";
        return false;
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_FAILURE) {
        libssh2_knownhost_free(nh);
        err = "known_hosts check failed for " + opt.host;
        return false;
    }
    if (opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = "host " + opt.host + " not found in known_hosts";
        return false;
    }

    // AcceptNew: host desconocido.
    std::string fp = "SHA256:";
    const unsigned char* h = reinterpret_cast<const unsigned char*>(
        libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256));
    for (int i = 0; h && i < 32; ++i) {
        char b[4];
        std::snprintf(b, sizeof(b), i ? ":%02X" : "%02X", static_cast<unsigned>(h[i]));
        fp += b;
    }
    if (opt.hostkey_confirm_cb &&
        !opt.hostkey_confirm_cb(opt.host, opt.port, hostKeyTypeName(keytype), fp)) {
        libssh2_knownhost_free(nh);
        err = "unknown host key rejected: " + fp;
        return false;
    }
    qCInfo(ovwSession) << "adding" << opt.host.c_str() << hostKeyTypeName(keytype)
                       << fp.c_str() << "to" << khPath.c_str();
    const std::string entryHost =
        opt.port == 22 ? opt.host : "[" + opt.host + "]:" + std::to_string(opt.port);
    const int added = libssh2_knownhost_addc(nh, entryHost.c_str(), nullptr, hostkey,
                                             keylen, nullptr, 0, typemask, nullptr);
    const bool stored =
        added == 0 && !khPath.empty() &&
        libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) == 0;
    libssh2_knownhost_free(nh);
    if (!stored) {
        err = "cannot store host key in " + khPath;
        return false;
    }
    return true;
}

bool Libssh2SftpSession::agentAuth(const std::string& user) {
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (!agent)
        return false;
    bool authed = false;
    if (libssh2_agent_connect(agent) == 0 && libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey* identity = nullptr;
        struct libssh2_agent_publickey* prev = nullptr;
        const int kMaxAgentTries = 3;
        for (int tries = 0;
             tries < kMaxAgentTries &&
             libssh2_agent_get_identity(agent, &identity, prev) == 0;
             ++tries) {
            prev = identity;
            if (libssh2_agent_userauth(agent, user.c_str(), identity) == 0) {
                authed = true;
                break;
            }
        }
        libssh2_agent_disconnect(agent);
    }
    libssh2_agent_free(agent);
    return authed;
}

bool Libssh2SftpSession::authenticate(const SessionOptions& opt, std::string& err) {
    const std::string& user = opt.username;

    if (opt.private_key_path.has_value()) {
        const char* passphrase =
            opt.private_key_passphrase ? opt.private_key_passphrase->c_str() : nullptr;
        if (libssh2_userauth_publickey_fromfile(session_, user.c_str(), nullptr,
                                                opt.private_key_path->c_str(),
                                                passphrase) == 0) {
            qCDebug(ovwSession) << "authenticated with key" << opt.private_key_path->c_str();
            return true;
        }
        err = "public key authentication failed: " + lastError();
        return false;
    }

    const char* methodsRaw = libssh2_userauth_list(session_, user.c_str(),
                                                   static_cast<unsigned>(user.size()));
    if (!methodsRaw && libssh2_userauth_authenticated(session_))
        return true; // "none" aceptado
    const std::string methods = methodsRaw ? methodsRaw : "";
    auto offered = [&methods](const char* m) {
        return methods.find(m) != std::string::npos;
    };
    qCDebug(ovwSession) << "server auth methods:" << methods.c_str();

    if (opt.password.has_value()) {
        if (offered("password") &&
            libssh2_userauth_password(session_, user.c_str(), opt.password->c_str()) == 0)
            return true;
        if (offered("keyboard-interactive")) {
            std::string pass = *opt.password;
            void** abs = libssh2_session_abstract(session_);
            if (abs)
                *abs = &pass;
            const int rc = libssh2_userauth_keyboard_interactive(session_, user.c_str(),
                                                                 kbdintPassword);
            if (abs)
                *abs = nullptr;
            if (rc == 0)
                return true;
        }
    }
    if (offered("publickey") && agentAuth(user))
        return true;

    err = "authentication failed for " + user + " (methods: " + methods + "): " +
          lastError();
    return false;
}

bool Libssh2SftpSession::connect(const SessionOptions& opt, std::string& err) {
    if (connected_) {
        err = "already connected";
        return false;
    }
    if (opt.host.empty() || opt.username.empty()) {
        err = "host and user are required";
        return false;
    }
    if (libssh2InitOnce() != 0) {
        err = "libssh2_init failed";
        return false;
    }
    if (!tcpConnect(opt.host, opt.port, err))
        return false;

    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        disconnect();
        return false;
    }
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, 20000);
    libssh2_keepalive_config(session_, 1, 30);

    if (libssh2_session_handshake(session_, sock_) != 0) {
        err = "SSH handshake failed: " + lastError();
        disconnect();
        return false;
    }
    if (!verifyHostKey(opt, err) || !authenticate(opt, err)) {
        disconnect();
        return false;
    }

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = "SFTP subsystem failed: " + lastError();
        disconnect();
        return false;
    }
    connected_ = true;
    qCInfo(ovwSession) << "connected" << opt.username.c_str() << "@" << opt.host.c_str()
                       << "port" << opt.port;
    return true;
}

void Libssh2SftpSession::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    if (connected_)
        qCInfo(ovwSession) << "disconnected";
    connected_ = false;
}

bool Libssh2SftpSession::list(const std::string& remote_dir,
                              std::vector<FileInfo>& out,
                              std::string& err) {
    if (!ready(err))
        return false;
    const std::string path = remote_dir.empty() ? "." : remote_dir;

    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        err = "opendir " + path + ": " + lastError();
        return false;
    }

    out.clear();
    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    for (;;) {
        std::memset(&attrs, 0, sizeof(attrs));
        const int rc = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                               longentry, sizeof(longentry), &attrs);
        if (rc == 0)
            break;
        if (rc < 0) {
            err = "readdir " + path + ": " + lastError();
            libssh2_sftp_closedir(dir);
            return false;
        }
        FileInfo fi{};
        fi.name.assign(filename, static_cast<std::size_t>(rc));
        if (fi.name == "." || fi.name == "..")
            continue;
        if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
            fi.mode = static_cast<std::uint32_t>(attrs.permissions);
            fi.is_dir = (attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR;
        }
        if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE)
            fi.size = attrs.filesize;
        if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
            fi.mtime = attrs.mtime;
        out.push_back(std::move(fi));
    }
    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2SftpSession::write(std::istream& src, const std::string& remote,
                               std::uint64_t sizeHint, std::uint64_t& written,
                               std::string& err) {
    written = 0;
    if (!ready(err))
        return false;

    LIBSSH2_SFTP_HANDLE* wh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC, 0644,
        LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        err = "open for writing: " + lastError();
        return false;
    }
    qCDebug(ovwSession) << "write" << remote.c_str() << "expected" << sizeHint;

    std::vector<char> buf(kChunk);
    for (;;) {
        src.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const std::streamsize n = src.gcount();
        const char* p = buf.data();
        std::size_t remain = static_cast<std::size_t>(n > 0 ? n : 0);
        while (remain > 0) {
            const ssize_t w = libssh2_sftp_write(wh, p, remain);
            if (w < 0) {
                err = "remote write: " + lastError();
                libssh2_sftp_close(wh);
                return false;
            }
            remain -= static_cast<std::size_t>(w);
            p += w;
            written += static_cast<std::uint64_t>(w);
        }
        if (src.eof())
            break;
        if (!src) {
            err = "local read failed";
            libssh2_sftp_close(wh);
            return false;
        }
    }

    // fsync@openssh.com es opcional; sin él igualmente se cierra el handle.
    if (libssh2_sftp_fsync(wh) != 0)
        qCDebug(ovwSession) << "fsync unavailable for" << remote.c_str();
    if (libssh2_sftp_close(wh) != 0) {
        err = "close after write: " + lastError();
        return false;
    }
    return true;
}

bool Libssh2SftpSession::read(const std::string& remote, std::ostream& dst,
                              std::uint64_t& got, std::string& err) {
    got = 0;
    if (!ready(err))
        return false;

    LIBSSH2_SFTP_HANDLE* rh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), static_cast<unsigned>(remote.size()), LIBSSH2_FXF_READ,
        0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        err = "open for reading: " + lastError();
        return false;
    }

    std::vector<char> buf(kChunk);
    for (;;) {
        const ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n == 0)
            break;
        if (n < 0) {
            err = "remote read: " + lastError();
            libssh2_sftp_close(rh);
            return false;
        }
        dst.write(buf.data(), n);
        if (!dst) {
            err = "local write failed";
            libssh2_sftp_close(rh);
            return false;
        }
        got += static_cast<std::uint64_t>(n);
    }
    libssh2_sftp_close(rh);
    return true;
}

bool Libssh2SftpSession::stat(const std::string& remote_path, FileInfo& info,
                              std::string& err) {
    if (!ready(err))
        return false;
    LIBSSH2_SFTP_ATTRIBUTES st{};
    const int rc = libssh2_sftp_stat_ex(sftp_, remote_path.c_str(),
                                        static_cast<unsigned>(remote_path.size()),
                                        LIBSSH2_SFTP_STAT, &st);
    if (rc != 0) {
        if (lastErrorIsNoSuchFile()) {
            err.clear();
            return false;
        }
        err = "stat " + remote_path + ": " + lastError();
        return false;
    }
    info = FileInfo{};
    if (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        info.mode = static_cast<std::uint32_t>(st.permissions);
        info.is_dir = (st.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR;
    }
    if (st.flags & LIBSSH2_SFTP_ATTR_SIZE)
        info.size = st.filesize;
    if (st.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
        info.mtime = st.mtime;
    return true;
}

bool Libssh2SftpSession::rename(const std::string& from, const std::string& to,
                                std::string& err, bool overwrite) {
    if (!ready(err))
        return false;
    if (overwrite) {
        // El rename de SFTPv3 rechaza un destino existente;
        // posix-rename@openssh.com lo reemplaza de forma atómica.
        if (libssh2_sftp_posix_rename_ex(sftp_, from.c_str(), from.size(), to.c_str(),
                                         to.size()) == 0)
            return true;
        const bool unsupported =
            libssh2_session_last_errno(session_) == LIBSSH2_ERROR_SFTP_PROTOCOL &&
            libssh2_sftp_last_error(sftp_) == LIBSSH2_FX_OP_UNSUPPORTED;
        if (!unsupported) {
            err = "posix-rename " + from + " -> " + to + ": " + lastError();
            return false;
        }
        qCDebug(ovwSession) << "posix-rename unsupported, using rename";
    }
    long flags = LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    if (overwrite)
        flags |= LIBSSH2_SFTP_RENAME_OVERWRITE;
    if (libssh2_sftp_rename_ex(sftp_, from.c_str(), static_cast<unsigned>(from.size()),
                               to.c_str(), static_cast<unsigned>(to.size()), flags) != 0) {
        err = "rename " + from + " -> " + to + ": " + lastError();
        return false;
    }
    return true;
}

bool Libssh2SftpSession::removeFile(const std::string& remote_path, std::string& err) {
    if (!ready(err))
        return false;
    if (libssh2_sftp_unlink_ex(sftp_, remote_path.c_str(),
                               static_cast<unsigned>(remote_path.size())) != 0) {
        err = "unlink " + remote_path + ": " + lastError();
        return false;
    }
    return true;
}

bool Libssh2SftpSession::exec(const std::string& command, ExecResult& out,
                              std::string& err) {
    out = ExecResult{};
    if (!ready(err))
        return false;

    LIBSSH2_CHANNEL* ch = libssh2_channel_open_session(session_);
    if (!ch) {
        err = "cannot open exec channel: " + lastError();
        return false;
    }
    if (libssh2_channel_exec(ch, command.c_str()) != 0) {
        err = "exec request refused: " + lastError();
        libssh2_channel_free(ch);
        return false;
    }
    libssh2_channel_send_eof(ch);

    // Vaciar stdout y stderr a la vez para que no se llene ninguna ventana.
    libssh2_session_set_blocking(session_, 0);
    char buf[16 * 1024];
    bool failed = false;
    for (;;) {
        bool progressed = false;
        ssize_t n = libssh2_channel_read(ch, buf, sizeof(buf));
        if (n > 0) {
            out.stdoutData.append(buf, static_cast<std::size_t>(n));
            progressed = true;
        } else if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            failed = true;
        }
        n = libssh2_channel_read_stderr(ch, buf, sizeof(buf));
        if (n > 0) {
            out.stderrData.append(buf, static_cast<std::size_t>(n));
            progressed = true;
        } else if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            failed = true;
        }
        if (failed || (!progressed && libssh2_channel_eof(ch)))
            break;
        if (!progressed)
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    libssh2_session_set_blocking(session_, 1);

    if (failed) {
        err = "reading command output: " + lastError();
        libssh2_channel_free(ch);
        return false;
    }
    libssh2_channel_close(ch);
    libssh2_channel_wait_closed(ch);
    out.exitStatus = libssh2_channel_get_exit_status(ch);
    libssh2_channel_free(ch);
    qCDebug(ovwSession) << "exec exit status" << out.exitStatus;
    return true;
}

bool Libssh2SftpSession::checkFile(const std::string& remote_path, DigestAlgorithm algo,
                                   ExtensionDigest& out, std::string& err) {
    if (!ready(err))
        return false;
    qCDebug(ovwSession) << "check-file" << digestAlgorithmName(algo)
                        << remote_path.c_str() << "not available in libssh2";
    out = ExtensionDigest{};
    out.status = ExtensionDigest::Status::Unsupported;
    return true;
}

} // namespace sftpovw
