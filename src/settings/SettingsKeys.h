#pragma once

#include <QString>

namespace SettingsKeys {
inline QString bridgeAdbProgram()
{
  return QStringLiteral("bridge/adbProgram");
}

inline QString bridgeCommandTimeoutMs()
{
  return QStringLiteral("bridge/commandTimeoutMs");
}

inline QString bridgeWellKnownPort()
{
  return QStringLiteral("bridge/wellKnownPort");
}

inline QString mirrorProgram()
{
  return QStringLiteral("mirror/program");
}

inline QString mirrorExtraArgs()
{
  return QStringLiteral("mirror/extraArgs");
}

inline QString sessionShutdownGraceMs()
{
  return QStringLiteral("session/shutdownGraceMs");
}

inline QString uiLastPairHost()
{
  return QStringLiteral("ui/lastPairHost");
}

inline QString uiLastConnectPort()
{
  return QStringLiteral("ui/lastConnectPort");
}
} // namespace SettingsKeys
