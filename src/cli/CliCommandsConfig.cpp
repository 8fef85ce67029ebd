#include "cli/CliInternal.h"

#include <QSettings>

namespace pairmirrorctl {
bool tryHandleConfigCommand(const QString& cmd, const QStringList& args, const CliOptions& options, QTextStream& out, QTextStream& err, int* exitCodeOut)
{
  bool handled = false;
  int exitCode = 0;
  do {
    if (cmd != QStringLiteral("config")) {
      break;
    }
    handled = true;

    const QString sub = args.size() >= 3 ? args.at(2).trimmed().toLower() : QStringLiteral("list");
    QSettings s;
    BridgeConfig cfg = loadBridgeConfig(s);

    if (sub == QStringLiteral("list")) {
      if (options.jsonOutput) {
        QJsonObject o;
        for (const QString& key : bridgeConfigKeys()) {
          o.insert(key, bridgeConfigValue(cfg, key));
        }
        printJson(out, o);
        break;
      }
      for (const QString& key : bridgeConfigKeys()) {
        out << key << " = " << bridgeConfigValue(cfg, key) << "\n";
      }
      break;
    }

    if (sub == QStringLiteral("get")) {
      if (args.size() != 4) {
        err << "pairmirrorctl: config get expects <key>\n";
        exitCode = 2;
        break;
      }
      const QString key = args.at(3).trimmed();
      if (!bridgeConfigKeys().contains(key)) {
        err << "pairmirrorctl: unknown config key: " << key << "\n";
        exitCode = 2;
        break;
      }
      if (options.jsonOutput) {
        QJsonObject o;
        o.insert(key, bridgeConfigValue(cfg, key));
        printJson(out, o);
      } else {
        out << bridgeConfigValue(cfg, key) << "\n";
      }
      break;
    }

    if (sub == QStringLiteral("set")) {
      if (args.size() < 5) {
        err << "pairmirrorctl: config set expects <key> <value>\n";
        exitCode = 2;
        break;
      }
      const QString key = args.at(3).trimmed();
      const QString value = args.mid(4).join(QLatin1Char(' '));
      QString error;
      if (!setBridgeConfigValue(cfg, key, value, &error)) {
        err << "pairmirrorctl: " << error << "\n";
        exitCode = 2;
        break;
      }
      saveBridgeConfig(s, cfg);
      s.sync();
      if (s.status() != QSettings::NoError) {
        err << "pairmirrorctl: failed to write settings to " << s.fileName() << "\n";
        exitCode = 1;
        break;
      }
      if (!options.jsonOutput) {
        out << key << " = " << bridgeConfigValue(cfg, key) << "\n";
      }
      break;
    }

    if (sub == QStringLiteral("reset")) {
      resetBridgeConfig(s);
      s.sync();
      if (s.status() != QSettings::NoError) {
        err << "pairmirrorctl: failed to write settings to " << s.fileName() << "\n";
        exitCode = 1;
      }
      break;
    }

    err << "pairmirrorctl: config expects list|get|set|reset\n";
    exitCode = 2;
  } while (false);

  if (!handled) {
    return false;
  }
  if (exitCodeOut) {
    *exitCodeOut = exitCode;
  }
  return true;
}
} // namespace pairmirrorctl
