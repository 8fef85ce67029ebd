#include <QApplication>
#include <QCommandLineParser>

#include "MainWindow.h"
#include "backend/LogStore.h"

int main(int argc, char** argv)
{
  QApplication app(argc, argv);
  QApplication::setApplicationName(QStringLiteral("PairMirror"));
  QApplication::setOrganizationName(QStringLiteral("pairmirror"));
  QApplication::setApplicationVersion(QStringLiteral(PAIRMIRROR_VERSION));

  auto* logs = new LogStore(&app);
  logs->installQtMessageHandler();

  QCommandLineParser parser;
  parser.setApplicationDescription(QStringLiteral("PairMirror: wireless adb pairing and scrcpy launcher"));
  parser.addHelpOption();
  parser.addVersionOption();
  QCommandLineOption maxLinesOpt(QStringList{QStringLiteral("log-lines")},
                                 QStringLiteral("Number of log lines kept in memory"),
                                 QStringLiteral("n"),
                                 QStringLiteral("2000"));
  parser.addOption(maxLinesOpt);
  parser.process(app);

  bool ok = false;
  const int maxLines = parser.value(maxLinesOpt).toInt(&ok);
  if (ok && maxLines > 0) {
    logs->setMaxLines(maxLines);
  }

  int ret = 0;
  {
    MainWindow window(logs);
    window.resize(640, 720);
    window.show();
    ret = app.exec();
  }
  return ret;
}
