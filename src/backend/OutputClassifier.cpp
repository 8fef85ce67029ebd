#include "OutputClassifier.h"

#include <QRegularExpression>

namespace {

const QString kReadyStatus = QStringLiteral("device");
const QString kDevicesHeader = QStringLiteral("List of devices attached");

QString timeoutReason(BridgeOperation operation)
{
  switch (operation) {
    case BridgeOperation::VersionCheck:
      return QStringLiteral("adb version timed out. Is the adb daemon responsive?");
    case BridgeOperation::Pair:
      return QStringLiteral("Pairing timed out. Please try again.");
    case BridgeOperation::Connect:
      return QStringLiteral("Connection timed out. Please try again.");
    case BridgeOperation::Enumerate:
      return QStringLiteral("Listing devices timed out. Please try again.");
    case BridgeOperation::Mirror:
      return QStringLiteral("scrcpy did not start in time.");
  }
  return QStringLiteral("Command timed out.");
}

QString spawnReason(BridgeOperation operation, const QString& error)
{
  switch (operation) {
    case BridgeOperation::VersionCheck:
      return QStringLiteral("adb not found in PATH. Install platform-tools and ensure 'adb' is in PATH.");
    case BridgeOperation::Pair:
      return QStringLiteral("adb pair error: %1").arg(error);
    case BridgeOperation::Connect:
      return QStringLiteral("adb connect error: %1").arg(error);
    case BridgeOperation::Enumerate:
      return QStringLiteral("adb devices error: %1").arg(error);
    case BridgeOperation::Mirror:
      return QStringLiteral("Failed to start scrcpy: %1").arg(error);
  }
  return error;
}

QString crashReason(BridgeOperation operation)
{
  switch (operation) {
    case BridgeOperation::VersionCheck:
      return QStringLiteral("adb version terminated abnormally.");
    case BridgeOperation::Pair:
      return QStringLiteral("adb pair terminated abnormally.");
    case BridgeOperation::Connect:
      return QStringLiteral("adb connect terminated abnormally.");
    case BridgeOperation::Enumerate:
      return QStringLiteral("adb devices terminated abnormally.");
    case BridgeOperation::Mirror:
      return QStringLiteral("scrcpy terminated abnormally.");
  }
  return QStringLiteral("Command terminated abnormally.");
}

bool isHeaderLine(const QString& line)
{
  return line.startsWith(kDevicesHeader, Qt::CaseInsensitive);
}

} // namespace

QString failureKindName(FailureKind kind)
{
  switch (kind) {
    case FailureKind::SpawnError:
      return QStringLiteral("spawn-error");
    case FailureKind::Timeout:
      return QStringLiteral("timeout");
    case FailureKind::ClassificationFailure:
      return QStringLiteral("classification-failure");
    case FailureKind::SelectionFailure:
      return QStringLiteral("selection-failure");
    case FailureKind::GuardViolation:
      return QStringLiteral("guard-violation");
  }
  return QStringLiteral("unknown");
}

BridgeOutcome BridgeOutcome::success()
{
  BridgeOutcome o;
  o.succeeded = true;
  return o;
}

BridgeOutcome BridgeOutcome::failed(FailureKind kind, QString reason, QString detail)
{
  BridgeOutcome o;
  o.succeeded = false;
  o.failure.kind = kind;
  o.failure.reason = std::move(reason);
  o.failure.detail = std::move(detail);
  return o;
}

std::optional<BridgeFailure> timeoutOrSpawnError(const ProcessResult& result, BridgeOperation operation)
{
  if (result.spawnError.has_value()) {
    BridgeFailure f;
    f.kind = FailureKind::SpawnError;
    f.reason = spawnReason(operation, *result.spawnError);
    f.detail = *result.spawnError;
    return f;
  }
  if (result.timedOut) {
    BridgeFailure f;
    f.kind = FailureKind::Timeout;
    f.reason = timeoutReason(operation);
    f.detail = result.combinedOutput;
    return f;
  }
  if (result.crashed) {
    BridgeFailure f;
    f.kind = FailureKind::SpawnError;
    f.reason = crashReason(operation);
    f.detail = result.combinedOutput;
    return f;
  }
  return std::nullopt;
}

BridgeOutcome classifyBridgeVersion(const ProcessResult& result)
{
  if (const auto f = timeoutOrSpawnError(result, BridgeOperation::VersionCheck)) {
    return BridgeOutcome::failed(f->kind, f->reason, f->detail);
  }
  if (result.exitCode != 0) {
    return BridgeOutcome::failed(FailureKind::ClassificationFailure,
                                 QStringLiteral("adb version failed (exit code %1).").arg(result.exitCode),
                                 result.combinedOutput);
  }
  return BridgeOutcome::success();
}

QString bridgeVersionLine(const QString& versionOutput)
{
  QString fallback;
  const QStringList lines = versionOutput.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
  for (const auto& line : lines) {
    const QString t = line.trimmed();
    if (t.startsWith(QStringLiteral("Android Debug Bridge"), Qt::CaseInsensitive)) {
      return t;
    }
    if (fallback.isEmpty()) {
      fallback = t;
    }
  }
  return fallback;
}

BridgeOutcome classifyPair(const ProcessResult& result)
{
  if (const auto f = timeoutOrSpawnError(result, BridgeOperation::Pair)) {
    return BridgeOutcome::failed(f->kind, f->reason, f->detail);
  }
  if (result.exitCode == 0 && result.combinedOutput.contains(QStringLiteral("successfully paired"), Qt::CaseInsensitive)) {
    return BridgeOutcome::success();
  }
  return BridgeOutcome::failed(FailureKind::ClassificationFailure,
                               QStringLiteral("Pairing failed. Check the pairing code and try again."),
                               result.combinedOutput);
}

BridgeOutcome classifyConnect(const ProcessResult& result)
{
  if (const auto f = timeoutOrSpawnError(result, BridgeOperation::Connect)) {
    return BridgeOutcome::failed(f->kind, f->reason, f->detail);
  }
  // adb exits 0 for some advisory failures ("failed to connect to ..."), so the text decides.
  if (result.exitCode == 0 && result.combinedOutput.contains(QStringLiteral("connected"), Qt::CaseInsensitive)) {
    return BridgeOutcome::success();
  }
  return BridgeOutcome::failed(FailureKind::ClassificationFailure,
                               QStringLiteral("adb connect failed. Ensure Wireless debugging is ON and same Wi-Fi."),
                               result.combinedOutput);
}

QStringList classifyEnumerate(const QString& output)
{
  const QStringList lines = output.split(QLatin1Char('\n'));

  int first = 1;
  for (int i = 0; i < lines.size(); ++i) {
    if (isHeaderLine(lines.at(i).trimmed())) {
      first = i + 1;
      break;
    }
  }

  static const QRegularExpression fieldSep(QStringLiteral("\\s+"));

  QStringList devices;
  for (int i = first; i < lines.size(); ++i) {
    const QString line = lines.at(i).trimmed();
    if (line.isEmpty() || line.startsWith(QLatin1Char('*'))) {
      continue;
    }
    const QStringList fields = line.split(fieldSep, Qt::SkipEmptyParts);
    if (fields.size() < 2) {
      continue;
    }
    if (fields.at(1) != kReadyStatus) {
      continue;
    }
    devices.push_back(fields.at(0));
  }
  return devices;
}

EnumerateOutcome classifyEnumerateResult(const ProcessResult& result)
{
  EnumerateOutcome o;
  if (const auto f = timeoutOrSpawnError(result, BridgeOperation::Enumerate)) {
    o.failure = *f;
    return o;
  }
  if (result.exitCode != 0) {
    o.failure.kind = FailureKind::ClassificationFailure;
    o.failure.reason = QStringLiteral("adb devices failed (exit code %1).").arg(result.exitCode);
    o.failure.detail = result.combinedOutput;
    return o;
  }
  o.succeeded = true;
  o.devices = classifyEnumerate(result.combinedOutput);
  return o;
}

BridgeOutcome classifyMirrorStart(const DetachedStartResult& start)
{
  if (start.started) {
    return BridgeOutcome::success();
  }
  if (start.programMissing) {
    return BridgeOutcome::failed(FailureKind::SpawnError,
                                 QStringLiteral("scrcpy not found in PATH. Install scrcpy and ensure it is in PATH."),
                                 start.error);
  }
  const QString err = start.error.isEmpty() ? QStringLiteral("unknown error") : start.error;
  return BridgeOutcome::failed(FailureKind::SpawnError, spawnReason(BridgeOperation::Mirror, err), start.error);
}
