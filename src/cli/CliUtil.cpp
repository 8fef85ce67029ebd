#include "cli/CliInternal.h"

#include "backend/PairingSession.h"

#include <QCoreApplication>
#include <QEventLoop>
#include <QJsonDocument>
#include <QSettings>
#include <QTimer>

namespace pairmirrorctl {
void printUsage(QTextStream& out)
{
  out << "pairmirrorctl\n"
         "\n"
         "Usage:\n"
         "  pairmirrorctl --version\n"
         "  pairmirrorctl qr\n"
         "  pairmirrorctl suggest\n"
         "  pairmirrorctl check\n"
         "  pairmirrorctl devices\n"
         "  pairmirrorctl pair <host> <pairing-port> [pairing-code] [--connect]\n"
         "  pairmirrorctl connect <host> [port]\n"
         "  pairmirrorctl mirror <host> [port]\n"
         "  pairmirrorctl config list\n"
         "  pairmirrorctl config get <key>\n"
         "  pairmirrorctl config set <key> <value>\n"
         "  pairmirrorctl config reset\n"
         "\n"
         "Options:\n"
         "  --json             Output machine-readable JSON (one object per line for session commands)\n"
         "  --verbose          Also print adb output and phase changes\n"
         "  --adb <path>       adb program for this run\n"
         "  --scrcpy <path>    scrcpy program for this run\n"
         "  --timeout-ms <ms>  Per-command timeout for this run\n"
         "\n"
         "Notes:\n"
         "  Without a pairing code, pair uses the password of the QR payload shown by `qr`;\n"
         "  credentials are not persisted, so that only works within one run.\n"
         "  After pairing, connect to the same host on port 5555 (or the port shown under\n"
         "  the device name in Wireless debugging).\n";
}

bool extractOptions(QStringList& args, CliOptions* options, QTextStream& err)
{
  CliOptions o;
  QStringList rest;
  rest.reserve(args.size());

  for (int i = 0; i < args.size(); ++i) {
    const QString a = args.at(i);
    if (i == 0) {
      rest.push_back(a);
      continue;
    }
    if (a == QStringLiteral("--json")) {
      o.jsonOutput = true;
      continue;
    }
    if (a == QStringLiteral("--verbose") || a == QStringLiteral("-v")) {
      o.verbose = true;
      continue;
    }
    if (a == QStringLiteral("--adb") || a == QStringLiteral("--scrcpy") || a == QStringLiteral("--timeout-ms")) {
      if (i + 1 >= args.size()) {
        err << "pairmirrorctl: " << a << " expects a value\n";
        return false;
      }
      const QString v = args.at(++i).trimmed();
      if (a == QStringLiteral("--adb")) {
        o.adbProgram = v;
      } else if (a == QStringLiteral("--scrcpy")) {
        o.mirrorProgram = v;
      } else {
        bool ok = false;
        const int ms = v.toInt(&ok);
        if (!ok || ms <= 0) {
          err << "pairmirrorctl: invalid --timeout-ms: " << v << "\n";
          return false;
        }
        o.timeoutMs = ms;
      }
      continue;
    }
    rest.push_back(a);
  }

  args = rest;
  if (options) {
    *options = o;
  }
  return true;
}

BridgeConfig effectiveConfig(const CliOptions& options)
{
  QSettings s;
  BridgeConfig cfg = loadBridgeConfig(s);
  if (options.adbProgram && !options.adbProgram->isEmpty()) {
    cfg.adbProgram = *options.adbProgram;
  }
  if (options.mirrorProgram && !options.mirrorProgram->isEmpty()) {
    cfg.mirrorProgram = *options.mirrorProgram;
  }
  if (options.timeoutMs) {
    cfg.commandTimeoutMs = *options.timeoutMs;
  }
  return cfg;
}

QJsonObject credentialToJson(const PairingCredential& c)
{
  QJsonObject o;
  o.insert(QStringLiteral("name"), c.name);
  o.insert(QStringLiteral("password"), c.password);
  o.insert(QStringLiteral("qrPayload"), c.qrPayload());
  return o;
}

QJsonObject stateToJson(const ControllerState& s)
{
  QJsonObject o;
  o.insert(QStringLiteral("bridgeAvailable"), s.bridgeAvailable);
  o.insert(QStringLiteral("phase"), phaseName(s.phase));
  if (s.connectedAddress) {
    o.insert(QStringLiteral("connectedHost"), s.connectedAddress->host);
    o.insert(QStringLiteral("connectedPort"), s.connectedAddress->port);
  }
  if (s.mirrorPid > 0) {
    o.insert(QStringLiteral("mirrorPid"), s.mirrorPid);
  }
  return o;
}

QJsonObject eventToJson(const LifecycleEvent& e)
{
  QJsonObject o;
  o.insert(QStringLiteral("event"), eventKindName(e.kind));
  o.insert(QStringLiteral("sequence"), static_cast<qint64>(e.sequence));
  switch (e.kind) {
    case LifecycleEvent::Kind::Paired:
    case LifecycleEvent::Kind::Connected:
      o.insert(QStringLiteral("host"), e.address.host);
      o.insert(QStringLiteral("port"), e.address.port);
      break;
    case LifecycleEvent::Kind::MirrorStarted:
      o.insert(QStringLiteral("serial"), e.serial);
      break;
    case LifecycleEvent::Kind::Error:
    case LifecycleEvent::Kind::BridgeUnavailable:
      o.insert(QStringLiteral("kind"), failureKindName(e.failure.kind));
      o.insert(QStringLiteral("reason"), e.failure.reason);
      if (!e.failure.detail.isEmpty()) {
        o.insert(QStringLiteral("detail"), e.failure.detail);
      }
      break;
    case LifecycleEvent::Kind::CredentialChanged:
      o.insert(QStringLiteral("credential"), credentialToJson(e.credential));
      break;
    case LifecycleEvent::Kind::BridgeReady:
    case LifecycleEvent::Kind::PhaseChanged:
    case LifecycleEvent::Kind::Log:
      o.insert(QStringLiteral("text"), e.text);
      break;
  }
  o.insert(QStringLiteral("state"), stateToJson(e.state));
  return o;
}

void printJson(QTextStream& out, const QJsonObject& obj)
{
  out << QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact)) << "\n";
}

bool isTerminalEvent(const LifecycleEvent& e)
{
  switch (e.kind) {
    case LifecycleEvent::Kind::BridgeReady:
    case LifecycleEvent::Kind::BridgeUnavailable:
    case LifecycleEvent::Kind::CredentialChanged:
    case LifecycleEvent::Kind::Paired:
    case LifecycleEvent::Kind::Connected:
    case LifecycleEvent::Kind::MirrorStarted:
    case LifecycleEvent::Kind::Error:
      return true;
    case LifecycleEvent::Kind::PhaseChanged:
    case LifecycleEvent::Kind::Log:
      break;
  }
  return false;
}

namespace {

void printEvent(const LifecycleEvent& e, const CliOptions& options, QTextStream& out, QTextStream& err)
{
  if (options.jsonOutput) {
    if (options.verbose || isTerminalEvent(e)) {
      printJson(out, eventToJson(e));
    }
    return;
  }

  switch (e.kind) {
    case LifecycleEvent::Kind::Log:
      if (options.verbose) {
        out << e.text << "\n";
      }
      break;
    case LifecycleEvent::Kind::PhaseChanged:
      if (options.verbose) {
        out << "phase: " << phaseName(e.state.phase) << "\n";
      }
      break;
    case LifecycleEvent::Kind::BridgeReady:
      if (options.verbose) {
        out << "adb ready: " << e.text << "\n";
      }
      break;
    case LifecycleEvent::Kind::BridgeUnavailable:
    case LifecycleEvent::Kind::Error:
      err << "pairmirrorctl: " << e.failure.reason << "\n";
      if (options.verbose && !e.failure.detail.isEmpty()) {
        err << e.failure.detail << "\n";
      }
      break;
    case LifecycleEvent::Kind::CredentialChanged:
      out << e.credential.qrPayload() << "\n";
      break;
    case LifecycleEvent::Kind::Paired:
      out << "Paired. Connect to " << e.address.target() << "\n";
      break;
    case LifecycleEvent::Kind::Connected:
      out << "Connected to " << e.address.target() << "\n";
      break;
    case LifecycleEvent::Kind::MirrorStarted:
      out << "scrcpy started for " << e.serial << "\n";
      break;
  }
  out.flush();
  err.flush();
}

} // namespace

int runSessionSteps(PairingSession& session,
                    const QVector<SessionStep>& steps,
                    const CliOptions& options,
                    QTextStream& out,
                    QTextStream& err,
                    std::function<void(const LifecycleEvent&)> onTerminal)
{
  // Generous bound: the controller enforces the real per-command timeout.
  const int stepBudgetMs = session.config().commandTimeoutMs * 3 + 5000;

  for (const SessionStep& step : steps) {
    std::optional<LifecycleEvent> terminal;

    QEventLoop loop;
    QTimer watchdog;
    watchdog.setSingleShot(true);
    QObject::connect(&watchdog, &QTimer::timeout, &loop, &QEventLoop::quit);
    const auto conn = QObject::connect(&session, &PairingSession::eventDelivered, &loop, [&](const LifecycleEvent& e) {
      printEvent(e, options, out, err);
      if (!terminal && isTerminalEvent(e)) {
        terminal = e;
        loop.quit();
      }
    });

    step(session);
    watchdog.start(stepBudgetMs);
    loop.exec();
    QObject::disconnect(conn);

    if (!terminal) {
      err << "pairmirrorctl: no answer from the controller within " << stepBudgetMs << " ms\n";
      return 1;
    }
    if (onTerminal) {
      onTerminal(*terminal);
    }
    if (terminal->isFailure()) {
      return 1;
    }
  }
  return 0;
}
} // namespace pairmirrorctl
