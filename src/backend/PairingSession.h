#pragma once

#include "backend/BridgeConfig.h"
#include "backend/LifecycleEvent.h"
#include "backend/PairingCredential.h"
#include "backend/ProcessRunner.h"

#include <QObject>
#include <QString>
#include <QVector>

#include <memory>

class ControllerWorker;
class LogStore;
class QThread;

// Caller-facing side of the lifecycle controller. Every request is queued onto a
// private worker thread and returns immediately; events come back on the thread
// that owns the session, in emission order.
class PairingSession final : public QObject
{
  Q_OBJECT

public:
  explicit PairingSession(const BridgeConfig& config = {}, QObject* parent = nullptr);
  PairingSession(std::unique_ptr<ProcessRunner> runner, const BridgeConfig& config, QObject* parent = nullptr);
  ~PairingSession() override;

  PairingSession(const PairingSession&) = delete;
  PairingSession& operator=(const PairingSession&) = delete;

  const BridgeConfig& config() const { return m_config; }
  PairingCredential credential() const { return m_credential; }
  // Snapshot carried by the most recently delivered event.
  const ControllerState& state() const { return m_state; }
  bool isRunning() const;

  void checkBridge();
  void regenerate();
  void pair(const QString& host, const QString& port, const QString& password = {});
  void connectDevice(const QString& host, const QString& port);
  void launchMirror();

  // Observers are called on the session's thread, after eventDelivered().
  void addSink(LifecycleEventSink* sink);
  void removeSink(LifecycleEventSink* sink);

  void attachLogStore(LogStore* logs);

  // Stops the worker thread, waiting at most the configured grace period.
  // Returns false when the thread had to be abandoned mid-command.
  bool shutdown();

signals:
  void eventDelivered(const LifecycleEvent& event);

  void bridgeReady(QString version);
  void bridgeUnavailable(QString reason);
  void credentialChanged(PairingCredential credential);
  void phaseChanged(Phase phase);
  void paired(QString host, QString port);
  void connected(QString host, QString port);
  void mirrorStarted(QString serial);
  void errorOccurred(QString reason);
  void logMessage(QString text);

private:
  void start(std::unique_ptr<ProcessRunner> runner);
  void deliver(const LifecycleEvent& event);
  void logToStore(const LifecycleEvent& event);

  template <typename Fn>
  void enqueue(Fn fn);

  BridgeConfig m_config;
  QThread* m_thread = nullptr;
  ControllerWorker* m_worker = nullptr;

  PairingCredential m_credential;
  ControllerState m_state;

  QVector<LifecycleEventSink*> m_sinks;
  LogStore* m_logs = nullptr;
};
