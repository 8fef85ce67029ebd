#include "cli/CliInternal.h"

#include <QCoreApplication>
#include <QLoggingCategory>

int main(int argc, char** argv)
{
  int exitCode = 0;
  {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("PairMirror"));
    QCoreApplication::setOrganizationName(QStringLiteral("pairmirror"));
    QCoreApplication::setApplicationVersion(QStringLiteral(PAIRMIRROR_VERSION));

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList args = app.arguments();
    if (!args.contains(QStringLiteral("--verbose")) && !args.contains(QStringLiteral("-v"))) {
      QLoggingCategory::setFilterRules(QStringLiteral("*.debug=false"));
    }

    exitCode = pairmirrorctl::runCommand(app, args, out, err);
  }
  return exitCode;
}
