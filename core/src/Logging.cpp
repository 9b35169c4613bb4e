#include "sftpovw/Logging.hpp"
#include "sftpovw/RuntimeEnv.hpp"

#include <QString>

Q_LOGGING_CATEGORY(ovwReplace, "sftpovw.replace")
Q_LOGGING_CATEGORY(ovwNaming, "sftpovw.naming")
Q_LOGGING_CATEGORY(ovwDigest, "sftpovw.digest")
Q_LOGGING_CATEGORY(ovwSession, "sftpovw.session")
Q_LOGGING_CATEGORY(ovwCli, "sftpovw.cli")

namespace sftpovw {

void configureLogging(LogVerbosity verbosity) {
    if (debugLoggingForced())
        verbosity = LogVerbosity::Verbose;

    QString rules;
    switch (verbosity) {
    case LogVerbosity::Quiet:
        rules = QStringLiteral("sftpovw.*.debug=false\nsftpovw.*.info=false");
        break;
    case LogVerbosity::Normal:
        rules = QStringLiteral("sftpovw.*.debug=false\nsftpovw.*.info=true");
        break;
    case LogVerbosity::Verbose:
        rules = QStringLiteral("sftpovw.*.debug=true\nsftpovw.*.info=true");
        break;
    }
    QLoggingCategory::setFilterRules(rules);
    qSetMessagePattern(QStringLiteral(
        "%{time yyyy-MM-dd hh:mm:ss.zzz} %{type} %{category} %{message}"));
}

} // namespace sftpovw
