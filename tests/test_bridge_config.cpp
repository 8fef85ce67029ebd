#include <gtest/gtest.h>

#include "TestSupport.h"
#include "backend/BridgeConfig.h"
#include "settings/SettingsKeys.h"

#include <QSettings>
#include <QTemporaryDir>

namespace {

class BridgeConfigTest : public ::testing::Test
{
protected:
  void SetUp() override { ASSERT_TRUE(dir.isValid()); }

  QString path() const { return dir.filePath(QStringLiteral("pairmirror.ini")); }

  QTemporaryDir dir;
};

} // namespace

TEST_F(BridgeConfigTest, EmptySettingsGiveDefaults)
{
  QSettings s(path(), QSettings::IniFormat);
  const BridgeConfig cfg = loadBridgeConfig(s);
  EXPECT_EQ(cfg.adbProgram, QStringLiteral("adb"));
  EXPECT_EQ(cfg.mirrorProgram, QStringLiteral("scrcpy"));
  EXPECT_TRUE(cfg.mirrorExtraArgs.isEmpty());
  EXPECT_EQ(cfg.wellKnownPort, QStringLiteral("5555"));
  EXPECT_EQ(cfg.commandTimeoutMs, BridgeConfig::kDefaultCommandTimeoutMs);
  EXPECT_EQ(cfg.shutdownGraceMs, BridgeConfig::kDefaultShutdownGraceMs);
}

TEST_F(BridgeConfigTest, SaveThenLoad)
{
  BridgeConfig cfg;
  cfg.adbProgram = QStringLiteral("/opt/platform-tools/adb");
  cfg.mirrorExtraArgs = QStringList{QStringLiteral("--max-size"), QStringLiteral("1024")};
  cfg.commandTimeoutMs = 2500;
  {
    QSettings s(path(), QSettings::IniFormat);
    saveBridgeConfig(s, cfg);
  }
  QSettings s(path(), QSettings::IniFormat);
  const BridgeConfig loaded = loadBridgeConfig(s);
  EXPECT_EQ(loaded.adbProgram, cfg.adbProgram);
  EXPECT_EQ(loaded.mirrorExtraArgs, cfg.mirrorExtraArgs);
  EXPECT_EQ(loaded.commandTimeoutMs, 2500);
}

TEST_F(BridgeConfigTest, OutOfRangeValuesFallBack)
{
  QSettings s(path(), QSettings::IniFormat);
  s.setValue(SettingsKeys::bridgeCommandTimeoutMs(), 5);
  s.setValue(SettingsKeys::bridgeWellKnownPort(), QStringLiteral("99999"));
  s.setValue(SettingsKeys::bridgeAdbProgram(), QStringLiteral("   "));
  const BridgeConfig cfg = loadBridgeConfig(s);
  EXPECT_EQ(cfg.commandTimeoutMs, BridgeConfig::kDefaultCommandTimeoutMs);
  EXPECT_EQ(cfg.wellKnownPort, QStringLiteral("5555"));
  EXPECT_EQ(cfg.adbProgram, QStringLiteral("adb"));
}

TEST_F(BridgeConfigTest, ResetRemovesStoredValues)
{
  QSettings s(path(), QSettings::IniFormat);
  BridgeConfig cfg;
  cfg.mirrorProgram = QStringLiteral("scrcpy-nightly");
  saveBridgeConfig(s, cfg);
  resetBridgeConfig(s);
  EXPECT_FALSE(s.contains(SettingsKeys::mirrorProgram()));
  EXPECT_EQ(loadBridgeConfig(s).mirrorProgram, QStringLiteral("scrcpy"));
}

TEST(BridgeConfigValues, SetAndGetByKey)
{
  BridgeConfig cfg;
  QString err;
  ASSERT_TRUE(setBridgeConfigValue(cfg, SettingsKeys::mirrorExtraArgs(), QStringLiteral(" --no-audio   --max-fps 30 "), &err));
  EXPECT_EQ(cfg.mirrorExtraArgs, (QStringList{QStringLiteral("--no-audio"), QStringLiteral("--max-fps"), QStringLiteral("30")}));
  EXPECT_EQ(bridgeConfigValue(cfg, SettingsKeys::mirrorExtraArgs()), QStringLiteral("--no-audio --max-fps 30"));

  ASSERT_TRUE(setBridgeConfigValue(cfg, SettingsKeys::bridgeCommandTimeoutMs(), QStringLiteral("15000"), &err));
  EXPECT_EQ(bridgeConfigValue(cfg, SettingsKeys::bridgeCommandTimeoutMs()), QStringLiteral("15000"));

  EXPECT_EQ(bridgeConfigKeys().size(), 6);
  EXPECT_EQ(bridgeConfigValue(BridgeConfig{}, SettingsKeys::sessionShutdownGraceMs()), QStringLiteral("1500"));
}

TEST(BridgeConfigValues, RejectsBadValues)
{
  BridgeConfig cfg;
  QString err;
  EXPECT_FALSE(setBridgeConfigValue(cfg, SettingsKeys::bridgeWellKnownPort(), QStringLiteral("0"), &err));
  EXPECT_FALSE(err.isEmpty());
  EXPECT_FALSE(setBridgeConfigValue(cfg, SettingsKeys::bridgeCommandTimeoutMs(), QStringLiteral("fast"), &err));
  EXPECT_FALSE(setBridgeConfigValue(cfg, SettingsKeys::bridgeAdbProgram(), QString(), &err));
  EXPECT_FALSE(setBridgeConfigValue(cfg, QStringLiteral("bridge/nope"), QStringLiteral("1"), &err));
  EXPECT_TRUE(err.contains(QStringLiteral("unknown key")));
  EXPECT_EQ(cfg.wellKnownPort, QStringLiteral("5555"));
}

TEST(BridgeConfigValues, PortValidation)
{
  EXPECT_TRUE(isValidPort(QStringLiteral("5555")));
  EXPECT_TRUE(isValidPort(QStringLiteral(" 1 ")));
  EXPECT_TRUE(isValidPort(QStringLiteral("65535")));
  EXPECT_FALSE(isValidPort(QStringLiteral("65536")));
  EXPECT_FALSE(isValidPort(QStringLiteral("")));
  EXPECT_FALSE(isValidPort(QStringLiteral("55a5")));
}
