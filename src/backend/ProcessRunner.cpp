#include "ProcessRunner.h"

#include <QDir>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>

#include <algorithm>

#include <errno.h>
#include <signal.h>

namespace {

constexpr int kStartTimeoutMs = 3000;
constexpr int kReapTimeoutMs = 1000;

QString notFoundMessage(const QString& program)
{
  return QStringLiteral("%1: program not found").arg(program);
}

} // namespace

bool processAlive(qint64 pid)
{
  if (pid <= 0) {
    return false;
  }
  if (::kill(static_cast<pid_t>(pid), 0) == 0) {
    return true;
  }
  return errno == EPERM;
}

bool QProcessRunner::programExists(const QString& program)
{
  const QString p = program.trimmed();
  if (p.isEmpty()) {
    return false;
  }
  if (p.contains(QDir::separator()) || p.contains(QLatin1Char('/'))) {
    const QFileInfo fi(p);
    return fi.exists() && fi.isExecutable();
  }
  return !QStandardPaths::findExecutable(p).isEmpty();
}

ProcessResult QProcessRunner::run(const QString& program, const QStringList& args, int timeoutMs)
{
  ProcessResult r;
  if (!programExists(program)) {
    r.spawnError = notFoundMessage(program);
    return r;
  }

  QProcess p;
  p.setProgram(program);
  p.setArguments(args);
  p.setProcessChannelMode(QProcess::MergedChannels);
  p.start();

  if (!p.waitForStarted(kStartTimeoutMs)) {
    r.spawnError = p.errorString().isEmpty() ? QStringLiteral("failed to start %1").arg(program) : p.errorString();
    if (p.state() != QProcess::NotRunning) {
      p.kill();
      p.waitForFinished(kReapTimeoutMs);
    }
    return r;
  }

  if (!p.waitForFinished(std::max(0, timeoutMs))) {
    p.kill();
    p.waitForFinished(kReapTimeoutMs);
    r.timedOut = true;
    r.exitCode = -1;
    r.combinedOutput = QString::fromLocal8Bit(p.readAll()).trimmed();
    return r;
  }

  r.combinedOutput = QString::fromLocal8Bit(p.readAll()).trimmed();
  if (p.exitStatus() != QProcess::NormalExit) {
    r.crashed = true;
    r.exitCode = -1;
    return r;
  }
  r.exitCode = p.exitCode();
  return r;
}

DetachedStartResult QProcessRunner::runDetached(const QString& program, const QStringList& args)
{
  DetachedStartResult r;
  if (!programExists(program)) {
    r.programMissing = true;
    r.error = notFoundMessage(program);
    return r;
  }

  QProcess p;
  p.setProgram(program);
  p.setArguments(args);
  p.setStandardOutputFile(QProcess::nullDevice());
  p.setStandardErrorFile(QProcess::nullDevice());

  qint64 pid = 0;
  if (!p.startDetached(&pid)) {
    r.error = p.errorString().isEmpty() ? QStringLiteral("failed to start %1").arg(program) : p.errorString();
    return r;
  }
  r.started = true;
  r.pid = pid;
  return r;
}
