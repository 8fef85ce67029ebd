#include "BridgeConfig.h"

#include "settings/SettingsKeys.h"

#include <QSettings>

namespace {

constexpr int kMinTimeoutMs = 100;
constexpr int kMaxTimeoutMs = 10 * 60 * 1000;

int boundedInt(const QVariant& v, int fallback, int minValue, int maxValue)
{
  bool ok = false;
  const int i = v.toInt(&ok);
  if (!ok || i < minValue || i > maxValue) {
    return fallback;
  }
  return i;
}

QString nonEmptyOr(const QString& value, const QString& fallback)
{
  const QString t = value.trimmed();
  return t.isEmpty() ? fallback : t;
}

QStringList splitArgs(const QString& s)
{
  return s.split(QLatin1Char(' '), Qt::SkipEmptyParts);
}

} // namespace

bool isValidPort(const QString& port)
{
  bool ok = false;
  const int p = port.trimmed().toInt(&ok);
  return ok && p >= 1 && p <= 65535;
}

BridgeConfig loadBridgeConfig(QSettings& s)
{
  const BridgeConfig defaults;
  BridgeConfig cfg;

  cfg.adbProgram = nonEmptyOr(s.value(SettingsKeys::bridgeAdbProgram()).toString(), defaults.adbProgram);
  cfg.mirrorProgram = nonEmptyOr(s.value(SettingsKeys::mirrorProgram()).toString(), defaults.mirrorProgram);
  cfg.mirrorExtraArgs = s.value(SettingsKeys::mirrorExtraArgs()).toStringList();
  cfg.mirrorExtraArgs.removeAll(QString{});

  const QString port = s.value(SettingsKeys::bridgeWellKnownPort()).toString().trimmed();
  cfg.wellKnownPort = isValidPort(port) ? port : defaults.wellKnownPort;

  cfg.commandTimeoutMs =
      boundedInt(s.value(SettingsKeys::bridgeCommandTimeoutMs(), defaults.commandTimeoutMs), defaults.commandTimeoutMs, kMinTimeoutMs, kMaxTimeoutMs);
  cfg.shutdownGraceMs =
      boundedInt(s.value(SettingsKeys::sessionShutdownGraceMs(), defaults.shutdownGraceMs), defaults.shutdownGraceMs, 0, kMaxTimeoutMs);
  return cfg;
}

void saveBridgeConfig(QSettings& s, const BridgeConfig& cfg)
{
  s.setValue(SettingsKeys::bridgeAdbProgram(), cfg.adbProgram);
  s.setValue(SettingsKeys::mirrorProgram(), cfg.mirrorProgram);
  s.setValue(SettingsKeys::mirrorExtraArgs(), cfg.mirrorExtraArgs);
  s.setValue(SettingsKeys::bridgeWellKnownPort(), cfg.wellKnownPort);
  s.setValue(SettingsKeys::bridgeCommandTimeoutMs(), cfg.commandTimeoutMs);
  s.setValue(SettingsKeys::sessionShutdownGraceMs(), cfg.shutdownGraceMs);
}

void resetBridgeConfig(QSettings& s)
{
  s.remove(SettingsKeys::bridgeAdbProgram());
  s.remove(SettingsKeys::mirrorProgram());
  s.remove(SettingsKeys::mirrorExtraArgs());
  s.remove(SettingsKeys::bridgeWellKnownPort());
  s.remove(SettingsKeys::bridgeCommandTimeoutMs());
  s.remove(SettingsKeys::sessionShutdownGraceMs());
}

QStringList bridgeConfigKeys()
{
  return QStringList{
      SettingsKeys::bridgeAdbProgram(),
      SettingsKeys::bridgeCommandTimeoutMs(),
      SettingsKeys::bridgeWellKnownPort(),
      SettingsKeys::mirrorProgram(),
      SettingsKeys::mirrorExtraArgs(),
      SettingsKeys::sessionShutdownGraceMs(),
  };
}

bool setBridgeConfigValue(BridgeConfig& cfg, const QString& key, const QString& value, QString* errorOut)
{
  auto fail = [errorOut](const QString& msg) {
    if (errorOut) {
      *errorOut = msg;
    }
    return false;
  };

  const QString v = value.trimmed();
  if (key == SettingsKeys::bridgeAdbProgram()) {
    if (v.isEmpty()) {
      return fail(QStringLiteral("adb program must not be empty"));
    }
    cfg.adbProgram = v;
    return true;
  }
  if (key == SettingsKeys::mirrorProgram()) {
    if (v.isEmpty()) {
      return fail(QStringLiteral("mirror program must not be empty"));
    }
    cfg.mirrorProgram = v;
    return true;
  }
  if (key == SettingsKeys::mirrorExtraArgs()) {
    cfg.mirrorExtraArgs = splitArgs(v);
    return true;
  }
  if (key == SettingsKeys::bridgeWellKnownPort()) {
    if (!isValidPort(v)) {
      return fail(QStringLiteral("invalid port: %1").arg(v));
    }
    cfg.wellKnownPort = v;
    return true;
  }
  if (key == SettingsKeys::bridgeCommandTimeoutMs()) {
    bool ok = false;
    const int ms = v.toInt(&ok);
    if (!ok || ms < kMinTimeoutMs || ms > kMaxTimeoutMs) {
      return fail(QStringLiteral("timeout must be %1-%2 ms").arg(kMinTimeoutMs).arg(kMaxTimeoutMs));
    }
    cfg.commandTimeoutMs = ms;
    return true;
  }
  if (key == SettingsKeys::sessionShutdownGraceMs()) {
    bool ok = false;
    const int ms = v.toInt(&ok);
    if (!ok || ms < 0 || ms > kMaxTimeoutMs) {
      return fail(QStringLiteral("grace period must be 0-%1 ms").arg(kMaxTimeoutMs));
    }
    cfg.shutdownGraceMs = ms;
    return true;
  }
  return fail(QStringLiteral("unknown key: %1").arg(key));
}

QString bridgeConfigValue(const BridgeConfig& cfg, const QString& key)
{
  if (key == SettingsKeys::bridgeAdbProgram()) {
    return cfg.adbProgram;
  }
  if (key == SettingsKeys::mirrorProgram()) {
    return cfg.mirrorProgram;
  }
  if (key == SettingsKeys::mirrorExtraArgs()) {
    return cfg.mirrorExtraArgs.join(QLatin1Char(' '));
  }
  if (key == SettingsKeys::bridgeWellKnownPort()) {
    return cfg.wellKnownPort;
  }
  if (key == SettingsKeys::bridgeCommandTimeoutMs()) {
    return QString::number(cfg.commandTimeoutMs);
  }
  if (key == SettingsKeys::sessionShutdownGraceMs()) {
    return QString::number(cfg.shutdownGraceMs);
  }
  return {};
}
