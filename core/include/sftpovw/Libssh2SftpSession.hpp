// SftpSession sobre libssh2: gestiona socket TCP, sesión SSH y canal SFTP.
// Los comandos remotos usan canales exec aparte sobre la misma sesión SSH.
#pragma once
#include "SftpSession.hpp"
#include <string>
#include <vector>

// Forward a los tipos INTERNOS de libssh2 (con guion bajo)
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace sftpovw {

class Libssh2SftpSession : public SftpSession {
public:
    Libssh2SftpSession();
    ~Libssh2SftpSession() override;

    Libssh2SftpSession(const Libssh2SftpSession&) = delete;
    Libssh2SftpSession& operator=(const Libssh2SftpSession&) = delete;

    bool connect(const SessionOptions& opt, std::string& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

    bool list(const std::string& remote_dir,
              std::vector<FileInfo>& out,
              std::string& err) override;

    bool write(std::istream& src,
               const std::string& remote,
               std::uint64_t sizeHint,
               std::uint64_t& written,
               std::string& err) override;

    bool read(const std::string& remote,
              std::ostream& dst,
              std::uint64_t& got,
              std::string& err) override;

    bool stat(const std::string& remote_path,
              FileInfo& info,
              std::string& err) override;

    bool rename(const std::string& from,
                const std::string& to,
                std::string& err,
                bool overwrite = false) override;

    bool removeFile(const std::string& remote_path,
                    std::string& err) override;

    bool exec(const std::string& command,
              ExecResult& out,
              std::string& err) override;

    // libssh2 no expone peticiones extendidas genéricas: check-file nunca
    // está disponible con este backend.
    bool checkFile(const std::string& remote_path,
                   DigestAlgorithm algo,
                   ExtensionDigest& out,
                   std::string& err) override;

private:
    bool connected_ = false;
    int  sock_ = -1;
    _LIBSSH2_SESSION* session_ = nullptr;
    _LIBSSH2_SFTP*    sftp_    = nullptr;

    bool tcpConnect(const std::string& host, std::uint16_t port, std::string& err);
    bool verifyHostKey(const SessionOptions& opt, std::string& err);
    bool authenticate(const SessionOptions& opt, std::string& err);
    bool agentAuth(const std::string& user);
    bool ready(std::string& err) const;
    // Último error de la sesión libssh2, con el código SFTP si lo hay.
    std::string lastError() const;
    bool lastErrorIsNoSuchFile() const;
};

} // namespace sftpovw
