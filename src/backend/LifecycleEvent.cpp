#include "LifecycleEvent.h"

QString phaseName(Phase phase)
{
  switch (phase) {
    case Phase::Uninitialized:
      return QStringLiteral("uninitialized");
    case Phase::CheckingBridge:
      return QStringLiteral("checking-bridge");
    case Phase::Idle:
      return QStringLiteral("idle");
    case Phase::Pairing:
      return QStringLiteral("pairing");
    case Phase::Connecting:
      return QStringLiteral("connecting");
    case Phase::LaunchingMirror:
      return QStringLiteral("launching-mirror");
    case Phase::MirrorRunning:
      return QStringLiteral("mirror-running");
  }
  return QStringLiteral("unknown");
}

QString eventKindName(LifecycleEvent::Kind kind)
{
  switch (kind) {
    case LifecycleEvent::Kind::BridgeReady:
      return QStringLiteral("bridge-ready");
    case LifecycleEvent::Kind::BridgeUnavailable:
      return QStringLiteral("bridge-unavailable");
    case LifecycleEvent::Kind::CredentialChanged:
      return QStringLiteral("credential-changed");
    case LifecycleEvent::Kind::PhaseChanged:
      return QStringLiteral("phase-changed");
    case LifecycleEvent::Kind::Paired:
      return QStringLiteral("paired");
    case LifecycleEvent::Kind::Connected:
      return QStringLiteral("connected");
    case LifecycleEvent::Kind::MirrorStarted:
      return QStringLiteral("mirror-started");
    case LifecycleEvent::Kind::Error:
      return QStringLiteral("error");
    case LifecycleEvent::Kind::Log:
      return QStringLiteral("log");
  }
  return QStringLiteral("unknown");
}
