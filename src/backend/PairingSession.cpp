#include "PairingSession.h"

#include "backend/ControllerWorker.h"
#include "backend/LogStore.h"

#include <QMetaObject>
#include <QThread>

#include <algorithm>
#include <utility>

PairingSession::PairingSession(const BridgeConfig& config, QObject* parent)
    : PairingSession(std::make_unique<QProcessRunner>(), config, parent)
{
}

PairingSession::PairingSession(std::unique_ptr<ProcessRunner> runner, const BridgeConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config)
{
  qRegisterMetaType<LifecycleEvent>("LifecycleEvent");
  qRegisterMetaType<PairingCredential>("PairingCredential");
  qRegisterMetaType<Phase>("Phase");
  start(std::move(runner));
}

PairingSession::~PairingSession()
{
  shutdown();
}

void PairingSession::start(std::unique_ptr<ProcessRunner> runner)
{
  m_worker = new ControllerWorker(std::move(runner), m_config);

  // Nothing runs on the worker yet, so reading the initial credential is safe.
  m_credential = m_worker->controller().credential();
  m_state = m_worker->controller().state();

  m_thread = new QThread();
  m_thread->setObjectName(QStringLiteral("pairmirror-controller"));
  m_worker->moveToThread(m_thread);
  connect(m_thread, &QThread::finished, m_worker, &QObject::deleteLater);
  connect(m_worker, &ControllerWorker::eventReady, this, &PairingSession::deliver, Qt::QueuedConnection);
  m_thread->start();
}

bool PairingSession::isRunning() const
{
  return m_thread && m_thread->isRunning();
}

template <typename Fn>
void PairingSession::enqueue(Fn fn)
{
  if (!m_worker || !isRunning()) {
    return;
  }
  ControllerWorker* worker = m_worker;
  QMetaObject::invokeMethod(
      worker, [worker, fn]() { fn(worker->controller()); }, Qt::QueuedConnection);
}

void PairingSession::checkBridge()
{
  enqueue([](LifecycleController& c) { c.checkBridge(); });
}

void PairingSession::regenerate()
{
  enqueue([](LifecycleController& c) { c.regenerateCredential(); });
}

void PairingSession::pair(const QString& host, const QString& port, const QString& password)
{
  const SessionAddress address{host.trimmed(), port.trimmed()};
  enqueue([address, password](LifecycleController& c) { c.pair(address, password); });
}

void PairingSession::connectDevice(const QString& host, const QString& port)
{
  const SessionAddress address{host.trimmed(), port.trimmed()};
  enqueue([address](LifecycleController& c) { c.connect(address); });
}

void PairingSession::launchMirror()
{
  enqueue([](LifecycleController& c) { c.launchMirror(); });
}

void PairingSession::addSink(LifecycleEventSink* sink)
{
  if (sink && !m_sinks.contains(sink)) {
    m_sinks.push_back(sink);
  }
}

void PairingSession::removeSink(LifecycleEventSink* sink)
{
  m_sinks.removeAll(sink);
}

void PairingSession::attachLogStore(LogStore* logs)
{
  m_logs = logs;
}

bool PairingSession::shutdown()
{
  if (!m_thread) {
    return true;
  }

  QThread* thread = m_thread;
  ControllerWorker* worker = m_worker;
  m_thread = nullptr;
  m_worker = nullptr;

  if (worker) {
    disconnect(worker, nullptr, this, nullptr);
  }
  thread->quit();
  if (thread->wait(static_cast<unsigned long>(std::max(0, m_config.shutdownGraceMs)))) {
    delete thread;
    return true;
  }

  // Still inside a blocking command. Let it run out its own timeout and clean up after itself.
  qWarning("PairingSession: controller thread still busy after %d ms, abandoning it", m_config.shutdownGraceMs);
  connect(thread, &QThread::finished, thread, &QObject::deleteLater);
  return false;
}

void PairingSession::deliver(const LifecycleEvent& event)
{
  m_state = event.state;

  emit eventDelivered(event);

  switch (event.kind) {
    case LifecycleEvent::Kind::BridgeReady:
      emit bridgeReady(event.text);
      break;
    case LifecycleEvent::Kind::BridgeUnavailable:
      emit bridgeUnavailable(event.failure.reason);
      break;
    case LifecycleEvent::Kind::CredentialChanged:
      m_credential = event.credential;
      emit credentialChanged(event.credential);
      break;
    case LifecycleEvent::Kind::PhaseChanged:
      emit phaseChanged(event.state.phase);
      break;
    case LifecycleEvent::Kind::Paired:
      emit paired(event.address.host, event.address.port);
      break;
    case LifecycleEvent::Kind::Connected:
      emit connected(event.address.host, event.address.port);
      break;
    case LifecycleEvent::Kind::MirrorStarted:
      emit mirrorStarted(event.serial);
      break;
    case LifecycleEvent::Kind::Error:
      emit errorOccurred(event.failure.reason);
      break;
    case LifecycleEvent::Kind::Log:
      emit logMessage(event.text);
      break;
  }

  logToStore(event);

  const auto sinks = m_sinks;
  for (LifecycleEventSink* sink : sinks) {
    sink->post(event);
  }
}

void PairingSession::logToStore(const LifecycleEvent& event)
{
  if (!m_logs) {
    return;
  }

  const QString source = QStringLiteral("bridge");
  switch (event.kind) {
    case LifecycleEvent::Kind::Log:
      m_logs->append(LogStore::Level::Info, source, event.text);
      break;
    case LifecycleEvent::Kind::Error:
    case LifecycleEvent::Kind::BridgeUnavailable:
      m_logs->append(LogStore::Level::Error,
                     source,
                     QStringLiteral("%1 [%2]").arg(event.failure.reason, failureKindName(event.failure.kind)));
      break;
    case LifecycleEvent::Kind::PhaseChanged:
      m_logs->append(LogStore::Level::Debug, source, QStringLiteral("phase: %1").arg(phaseName(event.state.phase)));
      break;
    case LifecycleEvent::Kind::BridgeReady:
      m_logs->append(LogStore::Level::Info, source, QStringLiteral("adb ready: %1").arg(event.text));
      break;
    case LifecycleEvent::Kind::CredentialChanged:
      m_logs->append(LogStore::Level::Info, source, QStringLiteral("QR ready: %1").arg(event.credential.qrPayload()));
      m_logs->append(LogStore::Level::Info, source, QStringLiteral("Manual pairing: %1").arg(event.credential.manualPairHint()));
      break;
    case LifecycleEvent::Kind::Paired:
      m_logs->append(LogStore::Level::Info, source, QStringLiteral("Paired; connect to %1").arg(event.address.target()));
      break;
    case LifecycleEvent::Kind::Connected:
      m_logs->append(LogStore::Level::Info, source, QStringLiteral("Connected to %1").arg(event.address.target()));
      break;
    case LifecycleEvent::Kind::MirrorStarted:
      m_logs->append(LogStore::Level::Info, source, QStringLiteral("scrcpy started for %1").arg(event.serial));
      break;
  }
}
