#include <gtest/gtest.h>

#include "TestSupport.h"
#include "backend/LogStore.h"

#include <QFile>
#include <QTemporaryDir>

TEST(LogStore, FormatsLevelAndSource)
{
  LogStore logs;
  QStringList added;
  QObject::connect(&logs, &LogStore::lineAdded, &logs, [&](const QString& line) { added << line; });

  logs.append(LogStore::Level::Warning, QStringLiteral("bridge"), QStringLiteral("adb start-server exited with code 1"));

  ASSERT_EQ(logs.lines().size(), 1);
  EXPECT_TRUE(logs.lines().front().endsWith(QStringLiteral("[W] bridge: adb start-server exited with code 1")));
  EXPECT_EQ(added, logs.lines());
}

TEST(LogStore, KeepsNewestLines)
{
  LogStore logs;
  logs.setMaxLines(3);
  for (int i = 0; i < 5; ++i) {
    logs.append(LogStore::Level::Info, QStringLiteral("t"), QString::number(i));
  }
  const QStringList lines = logs.lines();
  ASSERT_EQ(lines.size(), 3);
  EXPECT_TRUE(lines.front().endsWith(QStringLiteral(": 2")));
  EXPECT_TRUE(lines.back().endsWith(QStringLiteral(": 4")));
}

TEST(LogStore, SavesToFile)
{
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  LogStore logs;
  logs.append(LogStore::Level::Error, QStringLiteral("bridge"), QStringLiteral("Pairing timed out. Please try again."));

  const QString path = dir.filePath(QStringLiteral("out.log"));
  QString err;
  ASSERT_TRUE(logs.saveToFile(path, &err)) << err.toStdString();

  QFile f(path);
  ASSERT_TRUE(f.open(QIODevice::ReadOnly));
  EXPECT_TRUE(QString::fromUtf8(f.readAll()).contains(QStringLiteral("[E] bridge: Pairing timed out.")));

  EXPECT_FALSE(logs.saveToFile(dir.filePath(QStringLiteral("missing/dir/out.log")), &err));
  EXPECT_FALSE(err.isEmpty());
}

TEST(LogStore, ClearEmitsSignal)
{
  LogStore logs;
  bool cleared = false;
  QObject::connect(&logs, &LogStore::cleared, &logs, [&]() { cleared = true; });
  logs.append(LogStore::Level::Info, QStringLiteral("t"), QStringLiteral("x"));
  logs.clear();
  EXPECT_TRUE(cleared);
  EXPECT_TRUE(logs.lines().isEmpty());
}
