#pragma once

#include "backend/BridgeConfig.h"
#include "backend/LifecycleEvent.h"
#include "backend/PairingCredential.h"
#include "backend/ProcessRunner.h"

#include <QString>
#include <QStringList>

#include <functional>
#include <memory>

// Pairing/connection state machine. Every operation runs to completion on the
// calling thread and reports through the sink; nothing throws to the caller.
class LifecycleController final
{
public:
  using LivenessCheck = std::function<bool(qint64 pid)>;

  LifecycleController(std::unique_ptr<ProcessRunner> runner, LifecycleEventSink* sink, BridgeConfig config = {});
  ~LifecycleController();

  LifecycleController(const LifecycleController&) = delete;
  LifecycleController& operator=(const LifecycleController&) = delete;

  const ControllerState& state() const { return m_state; }
  const PairingCredential& credential() const { return m_credential; }
  const BridgeConfig& config() const { return m_config; }

  void setLivenessCheck(LivenessCheck check);

  void checkBridge();
  // An empty password pairs with the current credential's password.
  void pair(const SessionAddress& address, const QString& password);
  void connect(const SessionAddress& address);
  void launchMirror();
  void regenerateCredential();

private:
  ProcessResult runAdb(const QStringList& args);

  void setPhase(Phase phase);
  Phase restingPhase();
  void settle();

  bool requireBridge(const QString& operation);

  void post(LifecycleEvent event);
  void log(const QString& text);
  void logOutput(const QString& output);
  void fail(const BridgeFailure& failure);
  void fail(FailureKind kind, const QString& reason, const QString& detail = {});

  std::unique_ptr<ProcessRunner> m_runner;
  LifecycleEventSink* m_sink = nullptr;
  BridgeConfig m_config;
  LivenessCheck m_livenessCheck;

  ControllerState m_state;
  PairingCredential m_credential;
  QString m_mirrorSerial;
  quint64 m_nextSequence = 1;
};
