#pragma once

#include "backend/OutputClassifier.h"
#include "backend/PairingCredential.h"

#include <QMetaType>
#include <QString>

#include <cstdint>
#include <optional>

struct SessionAddress final {
  QString host;
  QString port;

  QString target() const { return QStringLiteral("%1:%2").arg(host, port); }

  bool operator==(const SessionAddress& other) const { return host == other.host && port == other.port; }
  bool operator!=(const SessionAddress& other) const { return !(*this == other); }
};

enum class Phase : uint8_t {
  Uninitialized = 0,
  CheckingBridge,
  Idle,
  Pairing,
  Connecting,
  LaunchingMirror,
  MirrorRunning,
};

QString phaseName(Phase phase);

struct ControllerState final {
  bool bridgeAvailable = false;
  Phase phase = Phase::Uninitialized;
  std::optional<SessionAddress> connectedAddress;
  qint64 mirrorPid = 0;
};

struct LifecycleEvent final {
  enum class Kind : uint8_t {
    BridgeReady = 0,
    BridgeUnavailable,
    CredentialChanged,
    PhaseChanged,
    Paired,
    Connected,
    MirrorStarted,
    Error,
    Log,
  };

  Kind kind = Kind::Log;
  quint64 sequence = 0;

  // Paired: host + well-known port. Connected: the connected address.
  SessionAddress address;
  QString serial;
  QString text;
  BridgeFailure failure;
  PairingCredential credential;
  ControllerState state;

  bool isFailure() const { return kind == Kind::Error || kind == Kind::BridgeUnavailable; }
};

QString eventKindName(LifecycleEvent::Kind kind);

// Observer contract the controller reports through. post() is called on the
// controller's thread; implementations must not block.
class LifecycleEventSink
{
public:
  virtual ~LifecycleEventSink() = default;
  virtual void post(const LifecycleEvent& event) = 0;
};

Q_DECLARE_METATYPE(Phase)
Q_DECLARE_METATYPE(SessionAddress)
Q_DECLARE_METATYPE(LifecycleEvent)
