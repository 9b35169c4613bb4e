// Categorías de logging del core y de la CLI.
#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(ovwReplace)
Q_DECLARE_LOGGING_CATEGORY(ovwNaming)
Q_DECLARE_LOGGING_CATEGORY(ovwDigest)
Q_DECLARE_LOGGING_CATEGORY(ovwSession)
Q_DECLARE_LOGGING_CATEGORY(ovwCli)

namespace sftpovw {

enum class LogVerbosity { Quiet, Normal, Verbose };

// Instala reglas de filtro y el patrón de mensaje de las categorías sftpovw.*.
// SFTPOVW_DEBUG=1 tiene prioridad sobre la verbosidad pedida.
void configureLogging(LogVerbosity verbosity);

} // namespace sftpovw
