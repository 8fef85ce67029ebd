#include "LifecycleController.h"

#include "backend/DeviceSelector.h"
#include "backend/OutputClassifier.h"

#include <QStringList>

#include <utility>

LifecycleController::LifecycleController(std::unique_ptr<ProcessRunner> runner, LifecycleEventSink* sink, BridgeConfig config)
    : m_runner(std::move(runner))
    , m_sink(sink)
    , m_config(std::move(config))
    , m_livenessCheck(&processAlive)
    , m_credential(PairingCredential::generate())
{
}

LifecycleController::~LifecycleController() = default;

void LifecycleController::setLivenessCheck(LivenessCheck check)
{
  m_livenessCheck = check ? std::move(check) : LivenessCheck(&processAlive);
}

ProcessResult LifecycleController::runAdb(const QStringList& args)
{
  if (!m_runner) {
    ProcessResult r;
    r.spawnError = QStringLiteral("no process runner");
    return r;
  }
  return m_runner->run(m_config.adbProgram, args, m_config.commandTimeoutMs);
}

void LifecycleController::setPhase(Phase phase)
{
  if (m_state.phase == phase) {
    return;
  }
  m_state.phase = phase;

  LifecycleEvent e;
  e.kind = LifecycleEvent::Kind::PhaseChanged;
  e.text = phaseName(phase);
  post(std::move(e));
}

Phase LifecycleController::restingPhase()
{
  if (m_state.mirrorPid > 0) {
    if (m_livenessCheck && m_livenessCheck(m_state.mirrorPid)) {
      return Phase::MirrorRunning;
    }
    log(QStringLiteral("scrcpy (pid %1) has exited").arg(m_state.mirrorPid));
    m_state.mirrorPid = 0;
    m_mirrorSerial.clear();
  }
  return Phase::Idle;
}

void LifecycleController::settle()
{
  setPhase(restingPhase());
}

bool LifecycleController::requireBridge(const QString& operation)
{
  if (m_state.bridgeAvailable) {
    return true;
  }
  fail(FailureKind::GuardViolation,
       QStringLiteral("Cannot %1: adb is not available. Install platform-tools and re-run the adb check.").arg(operation));
  return false;
}

void LifecycleController::post(LifecycleEvent event)
{
  event.sequence = m_nextSequence++;
  event.state = m_state;
  if (m_sink) {
    m_sink->post(event);
  }
}

void LifecycleController::log(const QString& text)
{
  LifecycleEvent e;
  e.kind = LifecycleEvent::Kind::Log;
  e.text = text;
  post(std::move(e));
}

void LifecycleController::logOutput(const QString& output)
{
  const QString t = output.trimmed();
  if (!t.isEmpty()) {
    log(t);
  }
}

void LifecycleController::fail(const BridgeFailure& failure)
{
  LifecycleEvent e;
  e.kind = LifecycleEvent::Kind::Error;
  e.failure = failure;
  e.text = failure.reason;
  post(std::move(e));
}

void LifecycleController::fail(FailureKind kind, const QString& reason, const QString& detail)
{
  BridgeFailure f;
  f.kind = kind;
  f.reason = reason;
  f.detail = detail;
  fail(f);
}

void LifecycleController::checkBridge()
{
  setPhase(Phase::CheckingBridge);

  const ProcessResult version = runAdb({QStringLiteral("version")});
  const BridgeOutcome outcome = classifyBridgeVersion(version);
  if (!outcome.succeeded) {
    m_state.bridgeAvailable = false;
    logOutput(outcome.failure.detail);
    settle();

    LifecycleEvent e;
    e.kind = LifecycleEvent::Kind::BridgeUnavailable;
    e.failure = outcome.failure;
    e.text = outcome.failure.reason;
    post(std::move(e));
    return;
  }
  logOutput(version.combinedOutput);

  // The daemon may already be up; a failing start-server does not make adb unusable.
  const ProcessResult server = runAdb({QStringLiteral("start-server")});
  if (const auto f = timeoutOrSpawnError(server, BridgeOperation::VersionCheck)) {
    log(QStringLiteral("adb start-server: %1").arg(f->reason));
  } else if (server.exitCode != 0) {
    log(QStringLiteral("adb start-server exited with code %1: %2").arg(server.exitCode).arg(server.combinedOutput.simplified()));
  }

  m_state.bridgeAvailable = true;
  settle();

  LifecycleEvent e;
  e.kind = LifecycleEvent::Kind::BridgeReady;
  e.text = bridgeVersionLine(version.combinedOutput);
  post(std::move(e));
}

void LifecycleController::pair(const SessionAddress& address, const QString& password)
{
  if (!requireBridge(QStringLiteral("pair"))) {
    return;
  }

  const QString code = password.trimmed().isEmpty() ? m_credential.password : password.trimmed();

  setPhase(Phase::Pairing);
  log(QStringLiteral("Pairing with %1…").arg(address.target()));

  const ProcessResult r = runAdb({QStringLiteral("pair"), address.target(), code});
  logOutput(r.combinedOutput);
  const BridgeOutcome o = classifyPair(r);
  settle();

  if (!o.succeeded) {
    fail(o.failure);
    return;
  }

  // The pairing port is ephemeral; the data connection goes to the well-known port.
  LifecycleEvent e;
  e.kind = LifecycleEvent::Kind::Paired;
  e.address = SessionAddress{address.host, m_config.wellKnownPort};
  post(std::move(e));
}

void LifecycleController::connect(const SessionAddress& address)
{
  if (!requireBridge(QStringLiteral("connect"))) {
    return;
  }

  setPhase(Phase::Connecting);
  log(QStringLiteral("Connecting to %1…").arg(address.target()));

  const ProcessResult r = runAdb({QStringLiteral("connect"), address.target()});
  logOutput(r.combinedOutput);
  const BridgeOutcome o = classifyConnect(r);

  if (!o.succeeded) {
    settle();
    fail(o.failure);
    return;
  }

  m_state.connectedAddress = address;
  settle();

  LifecycleEvent e;
  e.kind = LifecycleEvent::Kind::Connected;
  e.address = address;
  post(std::move(e));
}

void LifecycleController::launchMirror()
{
  if (!requireBridge(QStringLiteral("start scrcpy"))) {
    return;
  }
  if (!m_state.connectedAddress.has_value()) {
    fail(FailureKind::GuardViolation, QStringLiteral("Not connected. Connect to a device before starting scrcpy."));
    return;
  }
  if (restingPhase() == Phase::MirrorRunning) {
    fail(FailureKind::GuardViolation,
         QStringLiteral("scrcpy is already running (pid %1). Close it before starting another.").arg(m_state.mirrorPid));
    return;
  }
  const SessionAddress target = *m_state.connectedAddress;

  setPhase(Phase::LaunchingMirror);

  const EnumerateOutcome listed = classifyEnumerateResult(runAdb({QStringLiteral("devices")}));
  if (!listed.succeeded) {
    settle();
    fail(listed.failure);
    return;
  }
  if (listed.devices.isEmpty()) {
    settle();
    fail(FailureKind::SelectionFailure, QStringLiteral("No devices connected. Please connect first."));
    return;
  }

  const std::optional<QString> serial = selectWirelessDevice(listed.devices, target.host);
  if (!serial) {
    settle();
    fail(FailureKind::SelectionFailure,
         QStringLiteral("Wireless device not found. Please connect first."),
         listed.devices.join(QLatin1Char('\n')));
    return;
  }

  QStringList args{QStringLiteral("--stay-awake"), QStringLiteral("-s"), *serial};
  args += m_config.mirrorExtraArgs;

  log(QStringLiteral("Starting scrcpy with device: %1...").arg(*serial));
  const DetachedStartResult start = m_runner ? m_runner->runDetached(m_config.mirrorProgram, args) : DetachedStartResult{};
  const BridgeOutcome o = classifyMirrorStart(start);
  if (!o.succeeded) {
    settle();
    fail(o.failure);
    return;
  }

  m_state.mirrorPid = start.pid;
  m_mirrorSerial = *serial;
  setPhase(Phase::MirrorRunning);

  LifecycleEvent e;
  e.kind = LifecycleEvent::Kind::MirrorStarted;
  e.serial = *serial;
  e.address = target;
  post(std::move(e));
}

void LifecycleController::regenerateCredential()
{
  m_credential = PairingCredential::generate();

  LifecycleEvent e;
  e.kind = LifecycleEvent::Kind::CredentialChanged;
  e.credential = m_credential;
  e.text = m_credential.qrPayload();
  post(std::move(e));
}
