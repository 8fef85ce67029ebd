#include <gtest/gtest.h>

#include "TestSupport.h"
#include "backend/ProcessRunner.h"

#include <QElapsedTimer>

#include <unistd.h>

namespace {

const QString kShell = QStringLiteral("/bin/sh");

} // namespace

TEST(QProcessRunner, MergesStdoutAndStderr)
{
  QProcessRunner runner;
  const ProcessResult r = runner.run(kShell, {QStringLiteral("-c"), QStringLiteral("echo to-out; echo to-err 1>&2")}, 5000);
  ASSERT_TRUE(r.exitedCleanly());
  EXPECT_EQ(r.exitCode, 0);
  EXPECT_TRUE(r.combinedOutput.contains(QStringLiteral("to-out")));
  EXPECT_TRUE(r.combinedOutput.contains(QStringLiteral("to-err")));
}

TEST(QProcessRunner, ReportsExitCode)
{
  QProcessRunner runner;
  const ProcessResult r = runner.run(kShell, {QStringLiteral("-c"), QStringLiteral("echo nope; exit 3")}, 5000);
  EXPECT_TRUE(r.exitedCleanly());
  EXPECT_EQ(r.exitCode, 3);
  EXPECT_EQ(r.combinedOutput, QStringLiteral("nope"));
}

TEST(QProcessRunner, KillsCommandAfterTimeout)
{
  QProcessRunner runner;
  QElapsedTimer t;
  t.start();
  const ProcessResult r = runner.run(kShell, {QStringLiteral("-c"), QStringLiteral("sleep 5")}, 200);
  EXPECT_TRUE(r.timedOut);
  EXPECT_FALSE(r.exitedCleanly());
  EXPECT_LT(t.elapsed(), 3000);
}

TEST(QProcessRunner, MissingProgramIsSpawnError)
{
  QProcessRunner runner;
  const ProcessResult r = runner.run(QStringLiteral("/nonexistent/pairmirror-no-such-tool"), {}, 1000);
  ASSERT_TRUE(r.spawnError.has_value());
  EXPECT_FALSE(r.timedOut);

  const ProcessResult onPath = runner.run(QStringLiteral("pairmirror-no-such-tool-on-path"), {}, 1000);
  EXPECT_TRUE(onPath.spawnError.has_value());
}

TEST(QProcessRunner, DetachedStartOfMissingProgram)
{
  QProcessRunner runner;
  const DetachedStartResult r = runner.runDetached(QStringLiteral("pairmirror-no-such-mirror"), {});
  EXPECT_FALSE(r.started);
  EXPECT_TRUE(r.programMissing);
  EXPECT_EQ(r.pid, 0);
}

TEST(QProcessRunner, DetachedStartReturnsLivePid)
{
  QProcessRunner runner;
  const DetachedStartResult r = runner.runDetached(kShell, {QStringLiteral("-c"), QStringLiteral("sleep 2")});
  ASSERT_TRUE(r.started);
  ASSERT_GT(r.pid, 0);
  EXPECT_TRUE(processAlive(r.pid));
}

TEST(ProcessAlive, RejectsNonPositivePids)
{
  EXPECT_FALSE(processAlive(0));
  EXPECT_FALSE(processAlive(-1));
  EXPECT_TRUE(processAlive(static_cast<qint64>(::getpid())));
}

TEST(QProcessRunner, ProgramExists)
{
  EXPECT_TRUE(QProcessRunner::programExists(kShell));
  EXPECT_TRUE(QProcessRunner::programExists(QStringLiteral("sh")));
  EXPECT_FALSE(QProcessRunner::programExists(QString()));
  EXPECT_FALSE(QProcessRunner::programExists(QStringLiteral("/nonexistent/sh")));
}
