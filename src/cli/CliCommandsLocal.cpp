#include "cli/CliInternal.h"

#include "backend/DeviceSelector.h"
#include "backend/NetworkSuggestion.h"
#include "backend/OutputClassifier.h"
#include "backend/PairingCredential.h"
#include "backend/ProcessRunner.h"

#include <QJsonArray>

namespace pairmirrorctl {
bool tryHandleLocalCommand(const QString& cmd, const QStringList& args, const CliOptions& options, QTextStream& out, QTextStream& err, int* exitCodeOut)
{
  bool handled = false;
  int exitCode = 0;
  do {
    if (cmd == QStringLiteral("qr")) {
      handled = true;
      if (args.size() != 2) {
        err << "pairmirrorctl: qr takes no arguments\n";
        exitCode = 2;
        break;
      }
      const PairingCredential c = PairingCredential::generate();
      if (options.jsonOutput) {
        printJson(out, credentialToJson(c));
      } else {
        out << c.qrPayload() << "\n";
        out << "name:     " << c.name << "\n";
        out << "password: " << c.password << "\n";
      }
      break;
    }

    if (cmd == QStringLiteral("suggest")) {
      handled = true;
      const BridgeConfig cfg = effectiveConfig(options);
      const std::optional<NetworkSuggestion> suggestion = suggestNetworkTarget(cfg.wellKnownPort);
      if (!suggestion) {
        err << "pairmirrorctl: no local IPv4 address found\n";
        exitCode = 1;
        break;
      }
      const NetworkSuggestion& s = *suggestion;
      if (options.jsonOutput) {
        QJsonObject o;
        o.insert(QStringLiteral("localAddress"), s.localAddress);
        o.insert(QStringLiteral("suggestedHost"), s.suggestedHost);
        o.insert(QStringLiteral("pairingPort"), s.pairingPort);
        o.insert(QStringLiteral("connectPort"), s.connectPort);
        printJson(out, o);
        break;
      }
      out << "local address:  " << s.localAddress << "\n";
      out << "suggested host: " << s.suggestedHost << "\n";
      out << "pairing port:   " << s.pairingPort << "\n";
      out << "connect port:   " << s.connectPort << "\n";
      break;
    }

    if (cmd == QStringLiteral("devices")) {
      handled = true;
      const BridgeConfig cfg = effectiveConfig(options);
      QProcessRunner runner;
      const ProcessResult r = runner.run(cfg.adbProgram, {QStringLiteral("devices")}, cfg.commandTimeoutMs);
      const EnumerateOutcome outcome = classifyEnumerateResult(r);
      if (!outcome.succeeded) {
        err << "pairmirrorctl: " << outcome.failure.reason << "\n";
        exitCode = 1;
        break;
      }

      if (options.jsonOutput) {
        QJsonArray arr;
        for (const QString& id : outcome.devices) {
          QJsonObject o;
          o.insert(QStringLiteral("serial"), id);
          o.insert(QStringLiteral("wireless"), id.contains(QLatin1Char(':')));
          arr.push_back(o);
        }
        QJsonObject root;
        root.insert(QStringLiteral("devices"), arr);
        printJson(out, root);
        break;
      }
      if (outcome.devices.isEmpty()) {
        out << "no devices\n";
        break;
      }
      for (const QString& id : outcome.devices) {
        out << id << "\n";
      }
      break;
    }
  } while (false);

  if (!handled) {
    return false;
  }
  if (exitCodeOut) {
    *exitCodeOut = exitCode;
  }
  return true;
}
} // namespace pairmirrorctl
