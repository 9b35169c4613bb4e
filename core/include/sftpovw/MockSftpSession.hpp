// SftpSession en memoria para tests y ejecuciones sin red. Las rutas se usan
// tal cual (separadas por '/', sin normalizar); el directorio padre debe
// existir antes de escribir un archivo dentro.
#pragma once
#include "SftpSession.hpp"
#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <vector>

namespace sftpovw {

class MockSftpSession : public SftpSession {
public:
    enum class Op { List, Write, Read, Stat, Rename, Remove, Exec, CheckFile };

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

    // Primero se devuelven los resultados encolados. Si no hay, se emula
    // "<algo>sum ARCHIVO..." sobre el FS en memoria; cualquier otro sale con 127.
    bool exec(const std::string& command,
              ExecResult& out,
              std::string& err) override;

    bool checkFile(const std::string& remote_path,
                   DigestAlgorithm algo,
                   ExtensionDigest& out,
                   std::string& err) override;

    // Mini "FS remoto" simulado: preparación e inspección
    void addDir(const std::string& path);
    void addFile(const std::string& path, const std::string& content);
    bool hasPath(const std::string& path) const;
    std::string fileContent(const std::string& path) const;
    std::vector<std::string> paths() const;

    // Inyección de fallos. occurrence cuenta llamadas a op desde ahora
    // (1 = la siguiente). Cada fallo se consume al dispararse.
    void failOn(Op op, int occurrence = 1, const std::string& message = "injected failure");
    // La próxima escritura guarda solo los primeros `bytes` bytes y falla.
    void failWriteAfter(std::uint64_t bytes);
    void setCheckFileSupported(bool supported) { checkFileSupported_ = supported; }
    void queueExecResult(const ExecResult& r) { execQueue_.push_back(r); }

    // Llamadas de escritura y transferencia en orden, p.ej. "write /a", "rename /a /b".
    const std::vector<std::string>& journal() const { return journal_; }
    void clearJournal() { journal_.clear(); }
    const std::vector<std::string>& commands() const { return commands_; }
    const SessionOptions& lastOptions() const { return lastOpt_; }

private:
    struct Node {
        bool isDir = false;
        std::string content;
        std::uint64_t mtime = 0;
    };
    struct Fault {
        Op op;
        int remaining;
        std::string message;
    };

    bool connected_ = false;
    SessionOptions lastOpt_{};
    std::map<std::string, Node> fs_{{"/", Node{true, {}, 0}}};
    std::uint64_t clock_ = 1;

    std::vector<Fault> faults_;
    bool writeLimitArmed_ = false;
    std::uint64_t writeLimit_ = 0;
    bool checkFileSupported_ = false;
    std::deque<ExecResult> execQueue_;

    std::vector<std::string> journal_;
    std::vector<std::string> commands_;

    bool ready(std::string& err) const;
    bool injected(Op op, std::string& err);
    bool parentIsDir(const std::string& path) const;
    ExecResult emulateCommand(const std::string& command);
};

} // namespace sftpovw
