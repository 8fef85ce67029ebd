#include "cli/CliInternal.h"

#include <QCoreApplication>

namespace pairmirrorctl {
int runCommand(QCoreApplication& app, QStringList args, QTextStream& out, QTextStream& err)
{
  Q_UNUSED(app);
  int exitCode = 0;

  do {
    if (args.contains(QStringLiteral("--version")) || args.contains(QStringLiteral("-V"))) {
      out << QCoreApplication::applicationVersion() << "\n";
      exitCode = 0;
      break;
    }
    if (args.size() < 2) {
      printUsage(out);
      exitCode = 2;
      break;
    }
    if (args.contains(QStringLiteral("--help")) || args.contains(QStringLiteral("-h")) || args.contains(QStringLiteral("help"))) {
      printUsage(out);
      exitCode = 0;
      break;
    }

    CliOptions options;
    if (!extractOptions(args, &options, err)) {
      exitCode = 2;
      break;
    }
    if (args.size() < 2) {
      printUsage(err);
      exitCode = 2;
      break;
    }

    const QString cmd = args.at(1).trimmed().toLower();
    if (cmd == QStringLiteral("version")) {
      out << QCoreApplication::applicationVersion() << "\n";
      exitCode = 0;
      break;
    }

    if (tryHandleLocalCommand(cmd, args, options, out, err, &exitCode)) {
      break;
    }
    if (tryHandleConfigCommand(cmd, args, options, out, err, &exitCode)) {
      break;
    }
    if (tryHandleSessionCommand(cmd, args, options, out, err, &exitCode)) {
      break;
    }

    err << "pairmirrorctl: unknown command: " << cmd << "\n";
    printUsage(err);
    exitCode = 2;
  } while (false);

  out.flush();
  err.flush();
  return exitCode;
}
} // namespace pairmirrorctl
