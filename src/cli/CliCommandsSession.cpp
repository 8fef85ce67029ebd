#include "cli/CliInternal.h"

#include "backend/PairingSession.h"

#include <cstdio>

namespace pairmirrorctl {
namespace {

bool parseTarget(const QStringList& args, int hostIndex, const QString& defaultPort, SessionAddress* out, QTextStream& err)
{
  const QString host = args.value(hostIndex).trimmed();
  const QString port = args.size() > hostIndex + 1 ? args.at(hostIndex + 1).trimmed() : defaultPort;
  if (host.isEmpty()) {
    err << "pairmirrorctl: missing host\n";
    return false;
  }
  if (!isValidPort(port)) {
    err << "pairmirrorctl: invalid port: " << port << "\n";
    return false;
  }
  out->host = host;
  out->port = port;
  return true;
}

} // namespace

bool tryHandleSessionCommand(const QString& cmd, const QStringList& argsIn, const CliOptions& options, QTextStream& out, QTextStream& err, int* exitCodeOut)
{
  if (cmd != QStringLiteral("check") && cmd != QStringLiteral("pair") && cmd != QStringLiteral("connect") && cmd != QStringLiteral("mirror")) {
    return false;
  }

  QStringList args = argsIn;
  const bool connectAfterPair = args.removeAll(QStringLiteral("--connect")) > 0;

  int exitCode = 0;
  do {
    const BridgeConfig cfg = effectiveConfig(options);
    QVector<SessionStep> steps;
    steps.push_back([](PairingSession& s) { s.checkBridge(); });

    // Filled from the Paired event when pairing is followed by a connect.
    SessionAddress pairedAddress;

    if (cmd == QStringLiteral("check")) {
      if (args.size() != 2) {
        err << "pairmirrorctl: check takes no arguments\n";
        exitCode = 2;
        break;
      }
    } else if (cmd == QStringLiteral("pair")) {
      if (args.size() < 4 || args.size() > 5) {
        err << "pairmirrorctl: pair expects <host> <pairing-port> [pairing-code]\n";
        exitCode = 2;
        break;
      }
      SessionAddress target;
      if (!parseTarget(args, 2, QString(), &target, err)) {
        exitCode = 2;
        break;
      }
      const QString code = args.value(4).trimmed();
      steps.push_back([target, code](PairingSession& s) { s.pair(target.host, target.port, code); });
      if (connectAfterPair) {
        steps.push_back([&pairedAddress](PairingSession& s) { s.connectDevice(pairedAddress.host, pairedAddress.port); });
      }
    } else if (cmd == QStringLiteral("connect") || cmd == QStringLiteral("mirror")) {
      if (args.size() < 3 || args.size() > 4) {
        err << "pairmirrorctl: " << cmd << " expects <host> [port]\n";
        exitCode = 2;
        break;
      }
      SessionAddress target;
      if (!parseTarget(args, 2, cfg.wellKnownPort, &target, err)) {
        exitCode = 2;
        break;
      }
      steps.push_back([target](PairingSession& s) { s.connectDevice(target.host, target.port); });
      if (cmd == QStringLiteral("mirror")) {
        steps.push_back([](PairingSession& s) { s.launchMirror(); });
      }
    }

    PairingSession session(cfg);

    if (cmd == QStringLiteral("pair") && args.size() == 4) {
      // No code given: pair with the password of this run's QR payload.
      const PairingCredential c = session.credential();
      if (options.jsonOutput) {
        printJson(out, credentialToJson(c));
      } else {
        out << "Scan this payload as a QR code from Wireless debugging > Pair device with QR code:\n";
        out << c.qrPayload() << "\n";
        out << "Press Enter once the phone is waiting to pair...\n";
      }
      out.flush();
      QTextStream in(stdin);
      in.readLine();
    }

    exitCode = runSessionSteps(session, steps, options, out, err, [&pairedAddress](const LifecycleEvent& e) {
      if (e.kind == LifecycleEvent::Kind::Paired) {
        pairedAddress = e.address;
      }
    });

    if (!session.shutdown()) {
      err << "pairmirrorctl: controller did not stop within " << cfg.shutdownGraceMs << " ms\n";
    }
  } while (false);

  if (exitCodeOut) {
    *exitCodeOut = exitCode;
  }
  return true;
}
} // namespace pairmirrorctl
