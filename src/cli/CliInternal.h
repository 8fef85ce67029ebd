#pragma once

#include "backend/BridgeConfig.h"
#include "backend/LifecycleEvent.h"
#include "backend/PairingCredential.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QTextStream>
#include <QVector>

#include <functional>
#include <optional>

class PairingSession;
class QCoreApplication;

namespace pairmirrorctl {

struct CliOptions final {
  bool jsonOutput = false;
  bool verbose = false;
  std::optional<QString> adbProgram;
  std::optional<QString> mirrorProgram;
  std::optional<int> timeoutMs;
};

void printUsage(QTextStream& out);

// Strips global options out of `args`. Returns false (and reports to `err`) on a malformed option.
bool extractOptions(QStringList& args, CliOptions* options, QTextStream& err);
BridgeConfig effectiveConfig(const CliOptions& options);

QJsonObject credentialToJson(const PairingCredential& c);
QJsonObject stateToJson(const ControllerState& s);
QJsonObject eventToJson(const LifecycleEvent& e);
void printJson(QTextStream& out, const QJsonObject& obj);

bool isTerminalEvent(const LifecycleEvent& e);

using SessionStep = std::function<void(PairingSession&)>;

// Queues each step in turn and waits for its terminal event. Stops at the first
// failure. Returns the process exit code.
int runSessionSteps(PairingSession& session,
                    const QVector<SessionStep>& steps,
                    const CliOptions& options,
                    QTextStream& out,
                    QTextStream& err,
                    std::function<void(const LifecycleEvent&)> onTerminal = {});

bool tryHandleLocalCommand(const QString& cmd, const QStringList& args, const CliOptions& options, QTextStream& out, QTextStream& err, int* exitCodeOut);
bool tryHandleConfigCommand(const QString& cmd, const QStringList& args, const CliOptions& options, QTextStream& out, QTextStream& err, int* exitCodeOut);
bool tryHandleSessionCommand(const QString& cmd, const QStringList& args, const CliOptions& options, QTextStream& out, QTextStream& err, int* exitCodeOut);

int runCommand(QCoreApplication& app, QStringList args, QTextStream& out, QTextStream& err);
} // namespace pairmirrorctl
