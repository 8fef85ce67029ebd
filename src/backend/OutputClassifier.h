#pragma once

#include "backend/ProcessRunner.h"

#include <QMetaType>
#include <QString>
#include <QStringList>

#include <cstdint>
#include <optional>

enum class FailureKind : uint8_t {
  SpawnError = 0,
  Timeout = 1,
  ClassificationFailure = 2,
  SelectionFailure = 3,
  GuardViolation = 4,
};

QString failureKindName(FailureKind kind);

struct BridgeFailure final {
  FailureKind kind = FailureKind::ClassificationFailure;
  QString reason;
  // Raw tool output or spawn error text, for diagnostics only.
  QString detail;
};

Q_DECLARE_METATYPE(BridgeFailure)

enum class BridgeOperation : uint8_t {
  VersionCheck = 0,
  Pair = 1,
  Connect = 2,
  Enumerate = 3,
  Mirror = 4,
};

struct BridgeOutcome final {
  bool succeeded = false;
  BridgeFailure failure;

  static BridgeOutcome success();
  static BridgeOutcome failed(FailureKind kind, QString reason, QString detail = {});
};

struct EnumerateOutcome final {
  bool succeeded = false;
  QStringList devices;
  BridgeFailure failure;
};

std::optional<BridgeFailure> timeoutOrSpawnError(const ProcessResult& result, BridgeOperation operation);

BridgeOutcome classifyBridgeVersion(const ProcessResult& result);
// The "Android Debug Bridge version ..." line of `adb version` output, or the
// first non-blank line when no such line is present.
QString bridgeVersionLine(const QString& versionOutput);
BridgeOutcome classifyPair(const ProcessResult& result);
BridgeOutcome classifyConnect(const ProcessResult& result);

// Parses `adb devices` output. Only rows whose status is exactly "device" are kept,
// in output order.
QStringList classifyEnumerate(const QString& output);
EnumerateOutcome classifyEnumerateResult(const ProcessResult& result);

BridgeOutcome classifyMirrorStart(const DetachedStartResult& start);
