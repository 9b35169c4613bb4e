// Conexión/desconexión acotada al ámbito: pase lo que pase entre open() y el
// final del ámbito, una sesión abierta se desconecta.
#pragma once
#include "SftpSession.hpp"

namespace sftpovw {

class ScopedSession {
public:
    explicit ScopedSession(SftpSession& session) : session_(session) {}
    ~ScopedSession() { close(); }

    ScopedSession(const ScopedSession&) = delete;
    ScopedSession& operator=(const ScopedSession&) = delete;

    bool open(const SessionOptions& opt, std::string& err) {
        if (opened_) {
            err = "session already open";
            return false;
        }
        opened_ = session_.connect(opt, err);
        return opened_;
    }

    void close() {
        if (opened_) {
            session_.disconnect();
            opened_ = false;
        }
    }

    bool isOpen() const { return opened_; }
    SftpSession& session() { return session_; }

private:
    SftpSession& session_;
    bool opened_ = false;
};

} // namespace sftpovw
