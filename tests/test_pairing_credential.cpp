#include <gtest/gtest.h>

#include "TestSupport.h"
#include "backend/PairingCredential.h"

#include <QSet>

namespace {

bool isAsciiAlnum(QChar c)
{
  const char16_t u = c.unicode();
  return (u >= u'A' && u <= u'Z') || (u >= u'a' && u <= u'z') || (u >= u'0' && u <= u'9');
}

} // namespace

TEST(PairingCredential, GeneratedFieldsHaveFixedLengthAndAlphabet)
{
  for (int i = 0; i < 1000; ++i) {
    const PairingCredential c = PairingCredential::generate();
    ASSERT_EQ(c.name.size(), PairingCredential::kNameLength);
    ASSERT_EQ(c.password.size(), PairingCredential::kPasswordLength);
    for (const QChar ch : c.name + c.password) {
      ASSERT_TRUE(isAsciiAlnum(ch)) << c.name.toStdString() << "/" << c.password.toStdString();
    }
    EXPECT_TRUE(c.isValid());
  }
}

TEST(PairingCredential, PayloadUsesWifiAdbFormat)
{
  PairingCredential c;
  c.name = QStringLiteral("AbC12");
  c.password = QStringLiteral("x9Y8z7");
  EXPECT_EQ(c.qrPayload(), QStringLiteral("WIFI:T:ADB;S:AbC12;P:x9Y8z7;;"));
  EXPECT_EQ(c.manualPairHint(), QStringLiteral("adb pair IP:PORT x9Y8z7"));
}

TEST(PairingCredential, PayloadNeverNeedsEscaping)
{
  for (int i = 0; i < 200; ++i) {
    const PairingCredential c = PairingCredential::generate();
    const QString p = c.qrPayload();
    // Only the framing separators may appear; fields never contain ; : or backslash.
    EXPECT_EQ(p.count(QLatin1Char(';')), 4);
    EXPECT_EQ(p.count(QLatin1Char(':')), 4);
    EXPECT_FALSE(p.contains(QLatin1Char('\\')));
  }
}

TEST(PairingCredential, IsValidRejectsEmptyAndPunctuation)
{
  PairingCredential c;
  EXPECT_FALSE(c.isValid());

  c.name = QStringLiteral("ab;cd");
  c.password = QStringLiteral("123456");
  EXPECT_FALSE(c.isValid());

  c.name = QStringLiteral("abcde");
  c.password = QStringLiteral("12 456");
  EXPECT_FALSE(c.isValid());

  c.password = QStringLiteral("123456");
  EXPECT_TRUE(c.isValid());
}

TEST(PairingCredential, SuccessiveCredentialsDoNotRepeat)
{
  QSet<QString> seen;
  for (int i = 0; i < 10000; ++i) {
    const PairingCredential c = PairingCredential::generate();
    const QString key = c.name + QLatin1Char('/') + c.password;
    ASSERT_FALSE(seen.contains(key)) << "repeat after " << i << " draws";
    seen.insert(key);
  }
}

TEST(PairingCredential, DrawsCoverWholeAlphabet)
{
  QSet<QChar> seen;
  for (int i = 0; i < 2000; ++i) {
    for (const QChar ch : PairingCredential::generate().password) {
      seen.insert(ch);
    }
  }
  EXPECT_EQ(seen.size(), 62);
}

TEST(PairingCredential, Equality)
{
  PairingCredential a;
  a.name = QStringLiteral("AAAAA");
  a.password = QStringLiteral("111111");
  PairingCredential b = a;
  EXPECT_EQ(a, b);
  b.password = QStringLiteral("111112");
  EXPECT_NE(a, b);
}
