// sftpovw command-line tool: staged put/get, remote and local digests, and
// discovery of temporaries left behind by interrupted transfers.
#include "sftpovw/Digest.hpp"
#include "sftpovw/Libssh2SftpSession.hpp"
#include "sftpovw/Logging.hpp"
#include "sftpovw/Replace.hpp"
#include "sftpovw/RuntimeEnv.hpp"
#include "sftpovw/ScopedSession.hpp"
#include "sftpovw/SshConfig.hpp"
#include "sftpovw/TempNames.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>

using namespace sftpovw;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

QTextStream& errStream() {
    static QTextStream s(stderr);
    return s;
}

void printJson(const QJsonDocument& doc) {
    QTextStream out(stdout);
    out << doc.toJson(QJsonDocument::Indented);
}

int usageError(const QCommandLineParser& parser, const QString& msg) {
    errStream() << "sftpovw: " << msg << "\n\n" << parser.helpText();
    errStream().flush();
    return kExitUsage;
}

int opFailure(const OpError& err) {
    qCWarning(ovwCli) << err.describe().c_str();
    errStream() << "sftpovw: " << QString::fromStdString(err.describe()) << "\n";
    errStream().flush();
    return kExitFailure;
}

std::vector<std::string> toStdList(const QStringList& list) {
    std::vector<std::string> out;
    out.reserve(static_cast<std::size_t>(list.size()));
    for (const auto& s : list)
        out.push_back(s.toStdString());
    return out;
}

QJsonObject digestsToJson(const DigestResult& result) {
    QJsonObject obj;
    for (const auto& kv : result)
        obj.insert(QString::fromStdString(kv.first), QString::fromStdString(kv.second));
    return obj;
}

QJsonArray pathsToJson(const std::vector<std::string>& paths) {
    QJsonArray arr;
    for (const auto& p : paths)
        arr.append(QString::fromStdString(p));
    return arr;
}

bool parsePolicy(const QString& value, KnownHostsPolicy& out) {
    const QString v = value.toLower();
    if (v == QLatin1String("strict"))
        out = KnownHostsPolicy::Strict;
    else if (v == QLatin1String("accept-new"))
        out = KnownHostsPolicy::AcceptNew;
    else if (v == QLatin1String("off"))
        out = KnownHostsPolicy::Off;
    else
        return false;
    return true;
}

// Connection parameters: command-line flags first, then ~/.ssh/config, then
// the environment.
bool buildSessionOptions(const QCommandLineParser& p, SessionOptions& opt,
                         QString& problem) {
    const std::string alias = p.value("host").toStdString();
    if (alias.empty()) {
        problem = QStringLiteral("--host is required for remote commands");
        return false;
    }
    const std::string cfgPath = expandUserPath(
        p.isSet("ssh-config") ? p.value("ssh-config").toStdString() : "~/.ssh/config");
    SshHostConfig cfg;
    std::string err;
    if (!lookupSshConfig(cfgPath, alias, cfg, err)) {
        problem = QString::fromStdString(err);
        return false;
    }

    opt.host = cfg.hostName;
    if (p.isSet("port")) {
        bool ok = false;
        const uint port = p.value("port").toUInt(&ok);
        if (!ok || port == 0 || port > 65535) {
            problem = QStringLiteral("invalid --port: ") + p.value("port");
            return false;
        }
        opt.port = static_cast<std::uint16_t>(port);
    } else if (cfg.port) {
        opt.port = *cfg.port;
    }

    if (p.isSet("user"))
        opt.username = p.value("user").toStdString();
    else if (cfg.user)
        opt.username = *cfg.user;
    else if (const char* u = std::getenv("USER"))
        opt.username = u;

    if (p.isSet("identity-file"))
        opt.private_key_path = expandUserPath(p.value("identity-file").toStdString());
    else if (cfg.identityFile)
        opt.private_key_path = expandUserPath(*cfg.identityFile);

    const std::string pass = envPassword();
    if (!pass.empty())
        opt.password = pass;

    if (p.isSet("known-hosts"))
        opt.known_hosts_path = expandUserPath(p.value("known-hosts").toStdString());
    if (p.isSet("known-hosts-policy") &&
        !parsePolicy(p.value("known-hosts-policy"), opt.known_hosts_policy)) {
        problem = QStringLiteral("invalid --known-hosts-policy: ") +
                  p.value("known-hosts-policy");
        return false;
    }
    return true;
}

bool parseLevel(const QCommandLineParser& p, ReplaceLevel& level, QString& problem) {
    if (!p.isSet("level")) {
        level = kDefaultReplaceLevel;
        return true;
    }
    bool ok = false;
    const int v = p.value("level").toInt(&ok);
    if (!ok || !replaceLevelFromInt(v, level)) {
        problem = QStringLiteral("invalid --level (0-4): ") + p.value("level");
        return false;
    }
    return true;
}

bool parseDigestOptions(const QCommandLineParser& p, DigestOptions& opt,
                        QString& problem) {
    std::string name = p.isSet("algo") ? p.value("algo").toLower().toStdString()
                                       : envDigestAlgorithm();
    if (name.empty())
        name = "sha1";
    if (!digestAlgorithmFromName(name, opt.algorithm)) {
        problem = QStringLiteral("unknown digest algorithm: ") + QString::fromStdString(name);
        return false;
    }
    if (p.isSet("digest-command"))
        opt.command = p.value("digest-command").toStdString();
    return true;
}

int runPut(SftpSession& session, const std::string& remote, const std::string& local,
           ReplaceLevel level) {
    OpError err;
    std::ifstream in(local, std::ios::binary);
    if (!in.is_open()) {
        err.set(ErrorKind::LocalIo, "cannot open " + local + " for reading");
        return opFailure(err);
    }
    std::error_code ec;
    const auto size = std::filesystem::file_size(local, ec);
    const std::uint64_t sizeHint = ec ? 0 : static_cast<std::uint64_t>(size);

    ReplaceEngine engine(session);
    std::uint64_t written = 0;
    if (!engine.put(in, remote, sizeHint, level, written, err))
        return opFailure(err);
    return kExitOk;
}

int runGet(SftpSession& session, const std::string& remote, const std::string& local,
           ReplaceLevel level) {
    ReplaceEngine engine(session);
    OpError err;
    std::uint64_t got = 0;
    if (!engine.get(remote, local, level, got, err))
        return opFailure(err);
    return kExitOk;
}

int runChecksum(SftpSession& session, const std::vector<std::string>& paths,
                const DigestOptions& dopt) {
    Verifier verifier(session, dopt);
    DigestResult result;
    OpError err;
    if (!verifier.digest(paths, result, err))
        return opFailure(err);
    for (const auto& p : missingDigests(paths, result))
        errStream() << "sftpovw: no digest for " << QString::fromStdString(p) << "\n";
    errStream().flush();
    printJson(QJsonDocument(digestsToJson(result)));
    return kExitOk;
}

int runSweep(SftpSession& session, const std::string& target, bool dryRun) {
    std::vector<std::string> temps;
    OpError err;
    if (!listRemoteTemporaries(session, target, temps, err))
        return opFailure(err);
    std::vector<std::string> removed;
    int status = kExitOk;
    for (const auto& t : temps) {
        if (dryRun) {
            removed.push_back(t);
            continue;
        }
        std::string e;
        if (!session.removeFile(t, e)) {
            qCWarning(ovwCli) << "cannot remove" << t.c_str() << ":" << e.c_str();
            status = kExitFailure;
            continue;
        }
        qCInfo(ovwCli) << "removed" << t.c_str();
        removed.push_back(t);
    }
    printJson(QJsonDocument(pathsToJson(removed)));
    return status;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("sftpovw"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Crash-consistent SFTP overwrite.\n\n"
        "Commands:\n"
        "  put REMOTE LOCAL         upload LOCAL to REMOTE\n"
        "  get REMOTE LOCAL         download REMOTE to LOCAL\n"
        "  checksum PATH...         remote digests (JSON)\n"
        "  checksum-local PATH...   local digests (JSON)\n"
        "  listtmp-remote PATH      remote temporaries of PATH (JSON)\n"
        "  listtmp-local PATH       local temporaries of PATH (JSON)\n"
        "  sweeptmp-remote PATH     delete remote temporaries of PATH"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("Command to run."));
    parser.addPositionalArgument(QStringLiteral("args"), QStringLiteral("Command arguments."),
                                 QStringLiteral("[args...]"));
    parser.addOptions({
        {{"H", "host"}, "Remote host or ~/.ssh/config alias.", "host"},
        {{"p", "port"}, "SSH port.", "port"},
        {{"u", "user"}, "Remote user.", "user"},
        {{"i", "identity-file"}, "Private key file.", "path"},
        {"ssh-config", "ssh config file (default ~/.ssh/config).", "path"},
        {"known-hosts", "known_hosts file (default ~/.ssh/known_hosts).", "path"},
        {"known-hosts-policy", "strict, accept-new or off.", "policy"},
        {{"l", "level"}, "Safety level 0-4 for put/get (default 3).", "level"},
        {{"a", "algo"}, "Digest algorithm: md5, sha1, sha224, sha256, sha384, sha512.",
         "algo"},
        {"digest-command", "Remote digest utility (default <algo>sum).", "command"},
        {"dry-run", "sweeptmp-remote: list only, delete nothing."},
        {"verbose", "Debug logging."},
        {{"q", "quiet"}, "Warnings and errors only."},
    });
    parser.process(app);

    if (parser.isSet("verbose") && parser.isSet("quiet"))
        return usageError(parser, QStringLiteral("--verbose and --quiet are exclusive"));
    configureLogging(parser.isSet("verbose") ? LogVerbosity::Verbose
                     : parser.isSet("quiet") ? LogVerbosity::Quiet
                                             : LogVerbosity::Normal);

    QStringList args = parser.positionalArguments();
    if (args.isEmpty())
        return usageError(parser, QStringLiteral("missing command"));
    const QString command = args.takeFirst();
    const std::vector<std::string> params = toStdList(args);

    QString problem;
    DigestOptions dopt;
    if (!parseDigestOptions(parser, dopt, problem))
        return usageError(parser, problem);

    // Local-only commands.
    if (command == QLatin1String("checksum-local")) {
        if (params.empty())
            return usageError(parser, QStringLiteral("checksum-local needs PATH..."));
        DigestResult result;
        OpError err;
        if (!digestLocal(params, dopt.algorithm, result, err))
            return opFailure(err);
        printJson(QJsonDocument(digestsToJson(result)));
        return kExitOk;
    }
    if (command == QLatin1String("listtmp-local")) {
        if (params.size() != 1)
            return usageError(parser, QStringLiteral("listtmp-local needs PATH"));
        std::vector<std::string> temps;
        OpError err;
        if (!listLocalTemporaries(params.front(), temps, err))
            return opFailure(err);
        printJson(QJsonDocument(pathsToJson(temps)));
        return kExitOk;
    }

    // Remote commands.
    const bool transfer = command == QLatin1String("put") || command == QLatin1String("get");
    if (transfer && params.size() != 2)
        return usageError(parser, command + QStringLiteral(" needs REMOTE LOCAL"));
    if (command == QLatin1String("checksum") && params.empty())
        return usageError(parser, QStringLiteral("checksum needs PATH..."));
    if ((command == QLatin1String("listtmp-remote") ||
         command == QLatin1String("sweeptmp-remote")) &&
        params.size() != 1)
        return usageError(parser, command + QStringLiteral(" needs PATH"));
    if (!transfer && command != QLatin1String("checksum") &&
        command != QLatin1String("listtmp-remote") &&
        command != QLatin1String("sweeptmp-remote"))
        return usageError(parser, QStringLiteral("unknown command: ") + command);

    ReplaceLevel level = kDefaultReplaceLevel;
    if (transfer && !parseLevel(parser, level, problem))
        return usageError(parser, problem);

    SessionOptions sopt;
    if (!buildSessionOptions(parser, sopt, problem))
        return usageError(parser, problem);

    Libssh2SftpSession backend;
    ScopedSession scoped(backend);
    std::string connErr;
    if (!scoped.open(sopt, connErr)) {
        OpError err;
        err.set(ErrorKind::NotConnected, "connect to " + sopt.host + ": " + connErr);
        return opFailure(err);
    }
    SftpSession& session = scoped.session();

    if (command == QLatin1String("put"))
        return runPut(session, params[0], params[1], level);
    if (command == QLatin1String("get"))
        return runGet(session, params[0], params[1], level);
    if (command == QLatin1String("checksum"))
        return runChecksum(session, params, dopt);
    if (command == QLatin1String("sweeptmp-remote"))
        return runSweep(session, params.front(), parser.isSet("dry-run"));

    std::vector<std::string> temps;
    OpError err;
    if (!listRemoteTemporaries(session, params.front(), temps, err))
        return opFailure(err);
    printJson(QJsonDocument(pathsToJson(temps)));
    return kExitOk;
}
