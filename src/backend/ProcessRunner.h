#pragma once

#include <QString>
#include <QStringList>

#include <optional>

struct ProcessResult final {
  int exitCode = -1;
  QString combinedOutput;
  bool timedOut = false;
  bool crashed = false;
  std::optional<QString> spawnError;

  bool exitedCleanly() const { return !timedOut && !crashed && !spawnError.has_value(); }
};

struct DetachedStartResult final {
  bool started = false;
  bool programMissing = false;
  qint64 pid = 0;
  QString error;
};

// Seam between the lifecycle controller and real child processes. Implementations
// must not throw and must not leave a child running when run() returns.
class ProcessRunner
{
public:
  virtual ~ProcessRunner() = default;

  virtual ProcessResult run(const QString& program, const QStringList& args, int timeoutMs) = 0;
  virtual DetachedStartResult runDetached(const QString& program, const QStringList& args) = 0;
};

// True while `pid` names a live process (kill with signal 0).
bool processAlive(qint64 pid);

class QProcessRunner final : public ProcessRunner
{
public:
  ProcessResult run(const QString& program, const QStringList& args, int timeoutMs) override;
  DetachedStartResult runDetached(const QString& program, const QStringList& args) override;

  static bool programExists(const QString& program);
};
