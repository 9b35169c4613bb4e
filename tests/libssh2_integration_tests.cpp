// Integration tests for Libssh2SftpSession and the staged protocols against a
// real SFTP server. Skipped (exit code 77) unless the SFTPOVW_IT_* variables
// are set.
#include "TestSupport.hpp"

#include "sftpovw/Digest.hpp"
#include "sftpovw/Libssh2SftpSession.hpp"
#include "sftpovw/RemotePath.hpp"
#include "sftpovw/Replace.hpp"
#include "sftpovw/ScopedSession.hpp"
#include "sftpovw/TempNames.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using sftpovw::OpError;
using sftpovw::ReplaceLevel;
using sftpovw_test::TestContext;

namespace {

constexpr int kSkipExitCode = 77;

std::optional<std::string> envValue(const char *key) {
    const char *raw = std::getenv(key);
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

bool parsePort(const std::optional<std::string> &raw, std::uint16_t &out) {
    if (!raw.has_value()) {
        out = 22;
        return true;
    }
    char *end = nullptr;
    const long n = std::strtol(raw->c_str(), &end, 10);
    if (*end != '\0' || n < 1 || n > 65535)
        return false;
    out = static_cast<std::uint16_t>(n);
    return true;
}

} // namespace

int main() {
    const auto host = envValue("SFTPOVW_IT_SFTP_HOST");
    const auto user = envValue("SFTPOVW_IT_SFTP_USER");
    const auto pass = envValue("SFTPOVW_IT_SFTP_PASS");
    const auto keyPath = envValue("SFTPOVW_IT_SFTP_KEY");
    const auto keyPassphrase = envValue("SFTPOVW_IT_SFTP_KEY_PASSPHRASE");
    const std::string remoteBase = envValue("SFTPOVW_IT_REMOTE_BASE").value_or("/tmp");

    if (!host.has_value() || !user.has_value() ||
        (!pass.has_value() && !keyPath.has_value())) {
        std::cout << "[SKIP] sftpovw_libssh2_integration_tests requires env vars: "
                  << "SFTPOVW_IT_SFTP_HOST, SFTPOVW_IT_SFTP_USER and one auth method "
                  << "(SFTPOVW_IT_SFTP_PASS or SFTPOVW_IT_SFTP_KEY)\n";
        return kSkipExitCode;
    }
    if (keyPath.has_value() && !fs::exists(*keyPath)) {
        std::cerr << "[FAIL] SFTPOVW_IT_SFTP_KEY does not exist: " << *keyPath << "\n";
        return EXIT_FAILURE;
    }
    std::uint16_t port = 22;
    if (!parsePort(envValue("SFTPOVW_IT_SFTP_PORT"), port)) {
        std::cerr << "[FAIL] SFTPOVW_IT_SFTP_PORT is invalid\n";
        return EXIT_FAILURE;
    }

    sftpovw::SessionOptions opt;
    opt.host = *host;
    opt.port = port;
    opt.username = *user;
    if (pass.has_value())
        opt.password = *pass;
    if (keyPath.has_value()) {
        opt.private_key_path = *keyPath;
        if (keyPassphrase.has_value())
            opt.private_key_passphrase = *keyPassphrase;
    }
    opt.known_hosts_policy = sftpovw::KnownHostsPolicy::Off;

    TestContext t;
    sftpovw_test::ScratchDir local("it");
    if (!local.ok()) {
        std::cerr << "[FAIL] could not create local scratch dir\n";
        return EXIT_FAILURE;
    }

    const std::string remote = sftpovw::joinRemotePath(
        remoteBase, "sftpovw-it-" + sftpovw_test::uniqueToken() + ".txt");
    const std::string payload = "hello world\n";

    sftpovw::Libssh2SftpSession backend;
    sftpovw::ScopedSession scoped(backend);
    std::string err;
    t.check(scoped.open(opt, err), "connect should succeed: " + err);
    if (t.failures != 0)
        return t.finish("sftpovw_libssh2_integration_tests");

    sftpovw::SftpSession &s = scoped.session();
    sftpovw::ReplaceEngine engine(s);

    err.clear();
    t.check(s.isDirectory(remoteBase, err), "remote base should be a directory");
    t.check(!s.isDirectory(remote, err) && err.empty(),
            "absent path is not a directory and not an error");

    // Every level, over an absent and then an existing destination.
    const ReplaceLevel levels[] = {
        ReplaceLevel::Unsafe, ReplaceLevel::RemoveFirst, ReplaceLevel::RenameAside,
        ReplaceLevel::StageAndRename, ReplaceLevel::StageTwoTemps};
    for (ReplaceLevel level : levels) {
        const std::string tag = "level " + std::to_string(static_cast<int>(level));
        for (int round = 0; round < 2; ++round) {
            const std::string body = payload + tag + " round " + std::to_string(round);
            std::istringstream in(body);
            std::uint64_t written = 0;
            OpError oe;
            t.check(engine.put(in, remote, body.size(), level, written, oe),
                    tag + " put should succeed: " + oe.describe());
            t.check(written == body.size(), tag + " put should report the size");

            const std::string localPath = local.file("down.txt");
            std::uint64_t got = 0;
            t.check(engine.get(remote, localPath, level, got, oe),
                    tag + " get should succeed: " + oe.describe());
            std::string back;
            t.check(sftpovw_test::readFile(localPath, back) && back == body,
                    tag + " content should round-trip");
        }
    }

    {
        std::vector<std::string> temps;
        OpError oe;
        t.check(sftpovw::listRemoteTemporaries(s, remote, temps, oe) && temps.empty(),
                "successful transfers should leave no temporaries");
    }

    // Remote digest (command fallback over libssh2) against the local one.
    {
        std::istringstream in(payload);
        std::uint64_t written = 0;
        OpError oe;
        t.check(engine.put(in, remote, payload.size(), ReplaceLevel::StageAndRename,
                           written, oe),
                "put before digest should succeed: " + oe.describe());

        const std::string localPath = local.file("digest.txt");
        t.check(sftpovw_test::writeFile(localPath, payload), "local copy should be written");

        sftpovw::Verifier verifier(s);
        sftpovw::DigestResult remoteDigest, localDigest;
        t.check(verifier.digest({remote}, remoteDigest, oe),
                "remote digest should succeed: " + oe.describe());
        t.check(sftpovw::digestLocal({localPath}, sftpovw::DigestAlgorithm::Sha1,
                                     localDigest, oe),
                "local digest should succeed");
        t.check(!remoteDigest[remote].empty() &&
                    remoteDigest[remote] == localDigest[localPath],
                "remote and local digests should agree");
    }

    std::string cleanupErr;
    if (!s.removeFile(remote, cleanupErr))
        std::cerr << "[WARN] cleanup of " << remote << " failed: " << cleanupErr << "\n";
    scoped.close();
    return t.finish("sftpovw_libssh2_integration_tests");
}
