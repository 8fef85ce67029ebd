#pragma once

#include <QString>
#include <QStringList>

class QSettings;

struct BridgeConfig final {
  static constexpr int kDefaultCommandTimeoutMs = 10000;
  static constexpr int kDefaultShutdownGraceMs = 1500;

  QString adbProgram = QStringLiteral("adb");
  QString mirrorProgram = QStringLiteral("scrcpy");
  QStringList mirrorExtraArgs;
  QString wellKnownPort = QStringLiteral("5555");
  int commandTimeoutMs = kDefaultCommandTimeoutMs;
  int shutdownGraceMs = kDefaultShutdownGraceMs;
};

BridgeConfig loadBridgeConfig(QSettings& s);
void saveBridgeConfig(QSettings& s, const BridgeConfig& cfg);
void resetBridgeConfig(QSettings& s);

// Keys accepted by `pairmirrorctl config get|set`.
QStringList bridgeConfigKeys();
bool setBridgeConfigValue(BridgeConfig& cfg, const QString& key, const QString& value, QString* errorOut = nullptr);
QString bridgeConfigValue(const BridgeConfig& cfg, const QString& key);

bool isValidPort(const QString& port);
